#include "storage/migrations.hpp"

#include "core/logging.hpp"
#include "core/types.hpp"

#include <QString>

namespace atelier::storage {

namespace {

Error schema_error(const Migration& m, const char* action, const Error& cause) {
    return Error{ErrorCode::StorageFailure,
                 std::string(action) + " schema v" + std::to_string(m.version) + " (" + m.name +
                     "): " + cause.message};
}

} // namespace

Result<void, Error> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    return ensure_migrations_table()
        .and_then([&] { return db_.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;"); })
        .and_then([](Statement stmt) -> Result<int, Error> {
            auto row = stmt.step();
            if (row.is_err()) {
                return Result<int, Error>::err(row.unwrap_err());
            }
            return Result<int, Error>::ok(row.unwrap() ? stmt.column_int(0) : 0);
        });
}

Result<void, Error> MigrationRunner::set_version(int version) {
    const Migration* applied = nullptr;
    for (const auto& m : ALL_MIGRATIONS) {
        if (m.version == version) applied = &m;
    }

    auto prepared = db_.prepare(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (prepared.is_err()) {
        return Result<void, Error>::err(prepared.unwrap_err());
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_int(1, version)
                     .and_then([&] { return stmt.bind_text(2, applied ? applied->name : "unknown"); })
                     .and_then([&] { return stmt.bind_int64(3, Timestamp::now().millis()); });
    if (bound.is_err()) {
        return bound;
    }
    auto row = stmt.step();
    if (row.is_err()) {
        return Result<void, Error>::err(row.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> MigrationRunner::run_migration(const Migration& m) {
    auto applied = db_.execute(m.up_sql);
    if (applied.is_err()) {
        return Result<void, Error>::err(schema_error(m, "applying", applied.unwrap_err()));
    }
    qCInfo(atelierStoreLog) << "Applied schema" << m.version << QString::fromStdString(m.name);
    return set_version(m.version);
}

Result<void, Error> MigrationRunner::run_rollback(const Migration& m) {
    if (m.down_sql.empty()) {
        return Result<void, Error>::err(
            schema_error(m, "reverting", Error{"no down migration"}));
    }
    auto reverted = db_.execute(m.down_sql);
    if (reverted.is_err()) {
        return Result<void, Error>::err(schema_error(m, "reverting", reverted.unwrap_err()));
    }

    auto prepared = db_.prepare("DELETE FROM schema_migrations WHERE version = ?;");
    if (prepared.is_err()) {
        return Result<void, Error>::err(prepared.unwrap_err());
    }
    auto stmt = std::move(prepared).unwrap();
    auto bound = stmt.bind_int(1, m.version);
    if (bound.is_err()) {
        return bound;
    }
    auto row = stmt.step();
    if (row.is_err()) {
        return Result<void, Error>::err(row.unwrap_err());
    }
    qCInfo(atelierStoreLog) << "Reverted schema" << m.version << QString::fromStdString(m.name);
    return Result<void, Error>::ok();
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto version = current_version();
    if (version.is_err()) {
        return Result<void, Error>::err(version.unwrap_err());
    }
    const int from = version.unwrap();
    if (from >= target_version) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version <= from || m.version > target_version) continue;
            auto step = run_migration(m);
            if (step.is_err()) {
                return step;
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> MigrationRunner::rollback() {
    auto version = current_version();
    if (version.is_err()) {
        return Result<void, Error>::err(version.unwrap_err());
    }
    return version.unwrap() == 0 ? Result<void, Error>::ok() : rollback_to(version.unwrap() - 1);
}

Result<void, Error> MigrationRunner::rollback_to(int target_version) {
    auto version = current_version();
    if (version.is_err()) {
        return Result<void, Error>::err(version.unwrap_err());
    }
    const int from = version.unwrap();
    if (from <= target_version) {
        return Result<void, Error>::ok();
    }

    // Newest first.
    return db_.transaction([&]() -> Result<void, Error> {
        for (auto it = ALL_MIGRATIONS.rbegin(); it != ALL_MIGRATIONS.rend(); ++it) {
            if (it->version > from || it->version <= target_version) continue;
            auto step = run_rollback(*it);
            if (step.is_err()) {
                return step;
            }
        }
        return Result<void, Error>::ok();
    });
}

} // namespace atelier::storage
