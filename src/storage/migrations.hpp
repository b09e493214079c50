#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace atelier::storage {

/**
 * One schema step. down_sql may be empty when the step cannot be reverted.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

// Ordered by version.
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "initial_schema",
        .up_sql = R"SQL(
            -- Project metadata records, one JSON payload per project
            CREATE TABLE IF NOT EXISTS projects (
                id TEXT PRIMARY KEY,
                owner_id TEXT NOT NULL,
                payload TEXT NOT NULL,
                updated_at INTEGER NOT NULL DEFAULT 0,
                sync_version INTEGER NOT NULL DEFAULT 0
            );
            CREATE INDEX IF NOT EXISTS idx_projects_owner ON projects(owner_id);

            -- Working set of each project (lineage, styling map, wardrobe)
            CREATE TABLE IF NOT EXISTS project_states (
                project_id TEXT PRIMARY KEY,
                payload TEXT NOT NULL,
                updated_at INTEGER NOT NULL DEFAULT 0,
                sync_version INTEGER NOT NULL DEFAULT 0
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS project_states;
            DROP TABLE IF EXISTS projects;
        )SQL"
    },
    {
        .version = 2,
        .name = "sync_records",
        .up_sql = R"SQL(
            -- Digest of the last payload the remote store accepted
            CREATE TABLE IF NOT EXISTS sync_records (
                entity_id TEXT PRIMARY KEY,
                digest TEXT NOT NULL,
                remote_version INTEGER NOT NULL DEFAULT 0,
                synced_at INTEGER NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS sync_records;
        )SQL"
    },
    {
        .version = 3,
        .name = "wardrobe_library",
        .up_sql = R"SQL(
            -- Global wardrobe library, independent of any project
            CREATE TABLE IF NOT EXISTS wardrobe_library (
                id TEXT PRIMARY KEY,
                payload TEXT NOT NULL,
                updated_at INTEGER NOT NULL DEFAULT 0
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS wardrobe_library;
        )SQL"
    }
};

/**
 * MigrationRunner - Moves the Local Store schema between versions.
 *
 * Applied versions are recorded in schema_migrations. Each run happens in one
 * transaction; a failing step leaves the schema where it was and reports
 * ErrorCode::StorageFailure.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> migrate();
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    // Reverts the newest applied version; a no-op on an empty schema.
    [[nodiscard]] Result<void, Error> rollback();
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;
    
    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> run_rollback(const Migration& m);
    [[nodiscard]] Result<void, Error> set_version(int version);
};

/**
 * Bring a freshly opened Local Store database to the latest schema.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace atelier::storage

