#include "storage/local_store.hpp"

#include "core/codec.hpp"
#include "core/logging.hpp"

namespace atelier::storage {

namespace {

Error storage_failure(std::string_view op, const Error& cause) {
    return Error{ErrorCode::StorageFailure, std::string(op) + ": " + cause.message};
}

template<typename T>
Res<T> fail(std::string_view op, const Error& cause) {
    return Res<T>::err(storage_failure(op, cause));
}

Result<void, Error> fail_void(std::string_view op, const Error& cause) {
    return Result<void, Error>::err(storage_failure(op, cause));
}

Res<QJsonObject> parse_payload(const std::string& payload, std::string_view what) {
    auto parsed = parse_json_object(QByteArray::fromStdString(payload));
    if (parsed.is_err()) {
        return Res<QJsonObject>::err(Error{ErrorCode::MalformedEntity,
                                           std::string(what) + ": " + parsed.unwrap_err().message});
    }
    return parsed;
}

// Execute a write statement that returns no rows.
Result<void, Error> run(Statement& stmt, std::string_view op) {
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return fail_void(op, step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

} // namespace

// ============================================================================
// Projects
// ============================================================================

Res<Project> LocalStore::row_to_project(Statement& stmt) {
    auto object = parse_payload(stmt.column_text(0), "project row");
    if (object.is_err()) {
        return Res<Project>::err(object.unwrap_err());
    }
    return project_from_json(object.unwrap());
}

Res<std::vector<Project>> LocalStore::collect_projects(Statement& stmt) {
    std::vector<Project> projects;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return fail<std::vector<Project>>("list projects", step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        auto project = row_to_project(stmt);
        if (project.is_err()) {
            qCWarning(atelierStoreLog) << "Skipping unreadable project row:"
                                       << QString::fromStdString(project.unwrap_err().message);
            continue;
        }
        projects.push_back(std::move(project).unwrap());
    }
    return Res<std::vector<Project>>::ok(std::move(projects));
}

Res<std::optional<Project>> LocalStore::get_project(const EntityId& id) {
    auto stmt_result = db_.prepare("SELECT payload FROM projects WHERE id = ?;");
    if (stmt_result.is_err()) {
        return fail<std::optional<Project>>("get project", stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_text(1, id);
    if (bind_result.is_err()) {
        return fail<std::optional<Project>>("get project", bind_result.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return fail<std::optional<Project>>("get project", step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Res<std::optional<Project>>::ok(std::nullopt);
    }

    auto project = row_to_project(stmt);
    if (project.is_err()) {
        return Res<std::optional<Project>>::err(project.unwrap_err());
    }
    return Res<std::optional<Project>>::ok(std::move(project).unwrap());
}

Res<std::vector<Project>> LocalStore::list_projects() {
    auto stmt_result = db_.prepare("SELECT payload FROM projects ORDER BY updated_at DESC, id;");
    if (stmt_result.is_err()) {
        return fail<std::vector<Project>>("list projects", stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return collect_projects(stmt);
}

Res<std::vector<Project>> LocalStore::list_projects_for_owner(const std::string& owner_id) {
    auto stmt_result = db_.prepare(
        "SELECT payload FROM projects WHERE owner_id = ? ORDER BY updated_at DESC, id;");
    if (stmt_result.is_err()) {
        return fail<std::vector<Project>>("list projects", stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_text(1, owner_id);
    if (bind_result.is_err()) {
        return fail<std::vector<Project>>("list projects", bind_result.unwrap_err());
    }
    return collect_projects(stmt);
}

Result<void, Error> LocalStore::put_project(const Project& project) {
    if (project.id.empty()) {
        return Result<void, Error>::err(Error{ErrorCode::MalformedEntity, "project without id"});
    }

    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO projects (id, owner_id, payload, updated_at, sync_version)
        VALUES (?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            owner_id = excluded.owner_id,
            payload = excluded.payload,
            updated_at = excluded.updated_at,
            sync_version = excluded.sync_version;
    )SQL");
    if (stmt_result.is_err()) {
        return fail_void("put project", stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    const auto payload = to_compact_json(to_json(project)).toStdString();
    auto bind_result = stmt.bind_text(1, project.id)
                           .and_then([&] { return stmt.bind_text(2, project.owner_id); })
                           .and_then([&] { return stmt.bind_text(3, payload); })
                           .and_then([&] { return stmt.bind_int64(4, project.updated_at.millis()); })
                           .and_then([&] { return stmt.bind_int64(5, project.sync_version); });
    if (bind_result.is_err()) {
        return fail_void("put project", bind_result.unwrap_err());
    }
    return run(stmt, "put project");
}

// ============================================================================
// Project state
// ============================================================================

Res<std::optional<ProjectState>> LocalStore::get_state(const EntityId& project_id) {
    auto stmt_result = db_.prepare("SELECT payload FROM project_states WHERE project_id = ?;");
    if (stmt_result.is_err()) {
        return fail<std::optional<ProjectState>>("get state", stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_text(1, project_id);
    if (bind_result.is_err()) {
        return fail<std::optional<ProjectState>>("get state", bind_result.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return fail<std::optional<ProjectState>>("get state", step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Res<std::optional<ProjectState>>::ok(std::nullopt);
    }

    auto object = parse_payload(stmt.column_text(0), "state row " + project_id);
    if (object.is_err()) {
        return Res<std::optional<ProjectState>>::err(object.unwrap_err());
    }

    std::vector<Error> rejected;
    auto state = project_state_from_json(object.unwrap(), &rejected);
    for (const auto& error : rejected) {
        qCWarning(atelierStoreLog) << "Dropping unreadable history entry of" << QString::fromStdString(project_id)
                                   << ":" << QString::fromStdString(error.message);
    }
    if (state.is_err()) {
        return Res<std::optional<ProjectState>>::err(state.unwrap_err());
    }
    return Res<std::optional<ProjectState>>::ok(std::move(state).unwrap());
}

Res<std::vector<EntityId>> LocalStore::list_state_ids() {
    std::vector<EntityId> ids;
    auto query_result = db_.query("SELECT project_id FROM project_states ORDER BY project_id;",
                                  [&](Statement& stmt) { ids.push_back(stmt.column_text(0)); });
    if (query_result.is_err()) {
        return fail<std::vector<EntityId>>("list states", query_result.unwrap_err());
    }
    return Res<std::vector<EntityId>>::ok(std::move(ids));
}

Result<void, Error> LocalStore::put_state(const ProjectState& state) {
    if (state.id.empty()) {
        return Result<void, Error>::err(Error{ErrorCode::MalformedEntity, "project state without id"});
    }

    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO project_states (project_id, payload, updated_at, sync_version)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(project_id) DO UPDATE SET
            payload = excluded.payload,
            updated_at = excluded.updated_at,
            sync_version = excluded.sync_version;
    )SQL");
    if (stmt_result.is_err()) {
        return fail_void("put state", stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    const auto payload = to_compact_json(to_json(state)).toStdString();
    auto bind_result = stmt.bind_text(1, state.id)
                           .and_then([&] { return stmt.bind_text(2, payload); })
                           .and_then([&] { return stmt.bind_int64(3, state.updated_at.millis()); })
                           .and_then([&] { return stmt.bind_int64(4, state.sync_version); });
    if (bind_result.is_err()) {
        return fail_void("put state", bind_result.unwrap_err());
    }
    return run(stmt, "put state");
}

Result<void, Error> LocalStore::remove_project(const EntityId& id) {
    TransactionGuard tx(db_);
    if (!tx.is_active()) {
        return Result<void, Error>::err(Error{ErrorCode::StorageFailure,
                                              "remove project: " + db_.last_error()});
    }

    for (const char* sql : {"DELETE FROM project_states WHERE project_id = ?;",
                            "DELETE FROM sync_records WHERE entity_id = ?;",
                            "DELETE FROM projects WHERE id = ?;"}) {
        auto stmt_result = db_.prepare(sql);
        if (stmt_result.is_err()) {
            return fail_void("remove project", stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_text(1, id);
        if (bind_result.is_err()) {
            return fail_void("remove project", bind_result.unwrap_err());
        }
        auto run_result = run(stmt, "remove project");
        if (run_result.is_err()) {
            return run_result;
        }
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return fail_void("remove project", commit_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Sync records
// ============================================================================

Res<std::optional<SyncRecord>> LocalStore::get_sync_record(const EntityId& entity_id) {
    auto stmt_result = db_.prepare(
        "SELECT entity_id, digest, remote_version, synced_at FROM sync_records WHERE entity_id = ?;");
    if (stmt_result.is_err()) {
        return fail<std::optional<SyncRecord>>("get sync record", stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_text(1, entity_id);
    if (bind_result.is_err()) {
        return fail<std::optional<SyncRecord>>("get sync record", bind_result.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return fail<std::optional<SyncRecord>>("get sync record", step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Res<std::optional<SyncRecord>>::ok(std::nullopt);
    }

    return Res<std::optional<SyncRecord>>::ok(SyncRecord{
        .entity_id = stmt.column_text(0),
        .digest = stmt.column_text(1),
        .remote_version = stmt.column_int64(2),
        .synced_at = Timestamp(stmt.column_int64(3)),
    });
}

Result<void, Error> LocalStore::put_sync_record(const SyncRecord& record) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO sync_records (entity_id, digest, remote_version, synced_at)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(entity_id) DO UPDATE SET
            digest = excluded.digest,
            remote_version = excluded.remote_version,
            synced_at = excluded.synced_at;
    )SQL");
    if (stmt_result.is_err()) {
        return fail_void("put sync record", stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_text(1, record.entity_id)
                           .and_then([&] { return stmt.bind_text(2, record.digest); })
                           .and_then([&] { return stmt.bind_int64(3, record.remote_version); })
                           .and_then([&] { return stmt.bind_int64(4, record.synced_at.millis()); });
    if (bind_result.is_err()) {
        return fail_void("put sync record", bind_result.unwrap_err());
    }
    return run(stmt, "put sync record");
}

Result<void, Error> LocalStore::clear_sync_record(const EntityId& entity_id) {
    auto stmt_result = db_.prepare("DELETE FROM sync_records WHERE entity_id = ?;");
    if (stmt_result.is_err()) {
        return fail_void("clear sync record", stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_text(1, entity_id);
    if (bind_result.is_err()) {
        return fail_void("clear sync record", bind_result.unwrap_err());
    }
    return run(stmt, "clear sync record");
}

// ============================================================================
// Wardrobe library
// ============================================================================

Res<std::vector<WardrobeItem>> LocalStore::list_library() {
    std::vector<WardrobeItem> items;
    std::vector<Error> rejected;
    auto query_result = db_.query(
        "SELECT payload FROM wardrobe_library ORDER BY updated_at, id;",
        [&](Statement& stmt) {
            auto object = parse_payload(stmt.column_text(0), "wardrobe row");
            auto item = object.and_then([](const QJsonObject& o) { return wardrobe_item_from_json(o); });
            if (item.is_err()) {
                rejected.push_back(item.unwrap_err());
                return;
            }
            items.push_back(std::move(item).unwrap());
        });
    if (query_result.is_err()) {
        return fail<std::vector<WardrobeItem>>("list library", query_result.unwrap_err());
    }
    for (const auto& error : rejected) {
        qCWarning(atelierStoreLog) << "Skipping unreadable wardrobe row:" << QString::fromStdString(error.message);
    }
    return Res<std::vector<WardrobeItem>>::ok(std::move(items));
}

Result<void, Error> LocalStore::put_library_item(const WardrobeItem& item) {
    if (item.id.empty()) {
        return Result<void, Error>::err(Error{ErrorCode::MalformedEntity, "wardrobe item without id"});
    }

    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO wardrobe_library (id, payload, updated_at)
        VALUES (?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            payload = excluded.payload,
            updated_at = excluded.updated_at;
    )SQL");
    if (stmt_result.is_err()) {
        return fail_void("put library item", stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    const auto payload = to_compact_json(to_json(item)).toStdString();
    auto bind_result = stmt.bind_text(1, item.id)
                           .and_then([&] { return stmt.bind_text(2, payload); })
                           .and_then([&] { return stmt.bind_int64(3, item.updated_at.millis()); });
    if (bind_result.is_err()) {
        return fail_void("put library item", bind_result.unwrap_err());
    }
    return run(stmt, "put library item");
}

Result<void, Error> LocalStore::remove_library_item(const EntityId& id) {
    auto stmt_result = db_.prepare("DELETE FROM wardrobe_library WHERE id = ?;");
    if (stmt_result.is_err()) {
        return fail_void("remove library item", stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_text(1, id);
    if (bind_result.is_err()) {
        return fail_void("remove library item", bind_result.unwrap_err());
    }
    return run(stmt, "remove library item");
}

} // namespace atelier::storage
