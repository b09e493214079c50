#pragma once

#include "core/project.hpp"
#include <QString>
#include <chrono>
#include <cstddef>

class QSettings;

namespace atelier {

/**
 * EngineConfig - Tunables of the sync engine.
 *
 * Defaults match the remote per-document limit and the debounce used by the
 * desktop client. Read from QSettings group "sync", then overridden by the
 * ATELIER_SYNC_* environment variables.
 */
struct EngineConfig {
    std::chrono::milliseconds debounce{5000};
    std::chrono::milliseconds conflict_window{30000};
    std::size_t max_document_bytes = 1024 * 1024;
    bool auto_smart_merge = true;
    MergeStrategy remote_merge_strategy = MergeStrategy::Smart;

    // Names this installation in sync/{user}/devices/{id}; empty skips the record.
    QString device_id;
    QString device_name;
};

/**
 * Reads group "sync". A device id is generated and stored on first use.
 */
[[nodiscard]] EngineConfig load_engine_config(QSettings& settings);

// Environment only; used by tests and the CLI when no settings file exists.
[[nodiscard]] EngineConfig load_engine_config();

void apply_environment_overrides(EngineConfig& config);

void store_engine_config(QSettings& settings, const EngineConfig& config);

// ATELIER_DB_PATH, else <AppLocalDataLocation>/atelier.db.
[[nodiscard]] QString default_database_path();

} // namespace atelier
