#pragma once

#include "storage/database.hpp"
#include "core/project.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace atelier::storage {

/**
 * SyncRecord - What the remote store last accepted for an entity.
 */
struct SyncRecord {
    EntityId entity_id;
    std::string digest;          // hex BLAKE2b of the mapped remote payload
    int64_t remote_version = 0;
    Timestamp synced_at;

    bool operator==(const SyncRecord&) const = default;
};

/**
 * LocalStore - Durable cache of every project, its state and the global
 * wardrobe library.
 *
 * Calls are synchronous. Failures come back as StorageFailure; rows that no
 * longer decode come back as MalformedEntity.
 */
class LocalStore {
public:
    explicit LocalStore(Database& db) : db_(db) {}

    // Projects
    [[nodiscard]] Res<std::optional<Project>> get_project(const EntityId& id);
    [[nodiscard]] Res<std::vector<Project>> list_projects();
    [[nodiscard]] Res<std::vector<Project>> list_projects_for_owner(const std::string& owner_id);
    [[nodiscard]] Result<void, Error> put_project(const Project& project);

    // Project state
    [[nodiscard]] Res<std::optional<ProjectState>> get_state(const EntityId& project_id);
    [[nodiscard]] Res<std::vector<EntityId>> list_state_ids();
    [[nodiscard]] Result<void, Error> put_state(const ProjectState& state);

    /**
     * Remove the project, its state and its sync record in one transaction.
     * Removing an unknown id succeeds.
     */
    [[nodiscard]] Result<void, Error> remove_project(const EntityId& id);

    // Sync bookkeeping
    [[nodiscard]] Res<std::optional<SyncRecord>> get_sync_record(const EntityId& entity_id);
    [[nodiscard]] Result<void, Error> put_sync_record(const SyncRecord& record);
    [[nodiscard]] Result<void, Error> clear_sync_record(const EntityId& entity_id);

    // Global wardrobe library
    [[nodiscard]] Res<std::vector<WardrobeItem>> list_library();
    [[nodiscard]] Result<void, Error> put_library_item(const WardrobeItem& item);
    [[nodiscard]] Result<void, Error> remove_library_item(const EntityId& id);

private:
    Database& db_;

    [[nodiscard]] Res<Project> row_to_project(Statement& stmt);
    [[nodiscard]] Res<std::vector<Project>> collect_projects(Statement& stmt);
};

} // namespace atelier::storage
