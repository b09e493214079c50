#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/local_store.hpp"

using namespace atelier;
using namespace atelier::storage;

namespace {

ProjectState sample_state(const EntityId& id) {
    auto state = make_empty_state(id);
    state.model_description = "linen summer dress";
    state.selected_model_name = "Ava";
    auto root = create_root_item("gen-1000", HistoryItemType::ModelGeneration,
                                 "https://cdn.example/gen-1000.png", Timestamp(1000));
    auto child = create_child_item(root, "rev-2000", HistoryItemType::ModelRevision,
                                   "https://cdn.example/rev-2000.png", Timestamp(2000));
    auto look = create_child_item(root, "tryon-3000", HistoryItemType::TryOn,
                                  "https://cdn.example/tryon-3000.png", Timestamp(3000));
    state.generated_model_history = {root, child};
    state.styling_history["gen-1000"] = {look};
    state.updated_at = Timestamp(3000);
    state.sync_version = 4;
    return state;
}

} // namespace

TEST_CASE("Database basic operations", "[storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();

    SECTION("Execute creates table") {
        auto result = db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY);");
        REQUIRE(result.is_ok());
    }

    SECTION("Prepare and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1, 'Alice');").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (2, 'Bob');").is_ok());

        auto stmt = db.prepare("SELECT * FROM test ORDER BY id;").unwrap();

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 2);
        REQUIRE(stmt.column_text(1) == "Bob");

        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Transaction rollback on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            auto inserted = db.execute("INSERT INTO test VALUES (2);");
            if (inserted.is_err()) return inserted;
            return Result<void, Error>::err(Error{"forced error"});
        });

        REQUIRE(result.is_err());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);
    }
}

TEST_CASE("Migrations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    SECTION("Initial version is 0") {
        auto version = runner.current_version();
        REQUIRE(version.is_ok());
        REQUIRE(version.unwrap() == 0);
    }

    SECTION("Migrate to latest") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
        REQUIRE(MigrationRunner::latest_version() == 3);
    }

    SECTION("Migrate is idempotent") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Rollback drops the newest table") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.rollback().is_ok());
        REQUIRE(runner.current_version().unwrap() == 2);
        REQUIRE(db.execute("SELECT * FROM wardrobe_library;").is_err());
        REQUIRE(db.execute("SELECT * FROM sync_records;").is_ok());
    }

    SECTION("Rolling back to zero and migrating again") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.rollback_to(0).is_ok());
        REQUIRE(runner.current_version().unwrap() == 0);
        REQUIRE(db.execute("SELECT * FROM projects;").is_err());
        REQUIRE(runner.rollback().is_ok());

        REQUIRE(runner.migrate_to(2).is_ok());
        REQUIRE(runner.current_version().unwrap() == 2);
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == 3);
    }
}

TEST_CASE("LocalStore projects", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    LocalStore store(db);

    auto project = make_project("proj-1", "user-a", "Resort 2027", Timestamp(500));
    project.tags = {"resort", "linen"};
    project.status = ProjectStatus::InProgress;
    project.deadline = "2027-01-15";

    SECTION("Put and get round-trips every field") {
        REQUIRE(store.put_project(project).is_ok());
        auto loaded = store.get_project("proj-1");
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.unwrap().has_value());
        REQUIRE(*loaded.unwrap() == project);
    }

    SECTION("Unknown id is empty, not an error") {
        auto loaded = store.get_project("missing");
        REQUIRE(loaded.is_ok());
        REQUIRE_FALSE(loaded.unwrap().has_value());
    }

    SECTION("Listing by owner") {
        auto other = make_project("proj-2", "user-b", "Not mine", Timestamp(600));
        REQUIRE(store.put_project(project).is_ok());
        REQUIRE(store.put_project(other).is_ok());

        REQUIRE(store.list_projects().unwrap().size() == 2);
        auto mine = store.list_projects_for_owner("user-a").unwrap();
        REQUIRE(mine.size() == 1);
        REQUIRE(mine.front().id == "proj-1");
    }

    SECTION("Project without id is malformed") {
        project.id.clear();
        auto result = store.put_project(project);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorCode::MalformedEntity));
    }
}

TEST_CASE("LocalStore project state", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    LocalStore store(db);

    const auto state = sample_state("proj-1");

    SECTION("Put and get round-trips both partitions") {
        REQUIRE(store.put_state(state).is_ok());
        auto loaded = store.get_state("proj-1").unwrap();
        REQUIRE(loaded.has_value());
        REQUIRE(*loaded == state);
        REQUIRE(store.list_state_ids().unwrap() == std::vector<EntityId>{"proj-1"});
    }

    SECTION("Put replaces the previous snapshot") {
        REQUIRE(store.put_state(state).is_ok());
        auto updated = state;
        updated.revision_prompt = "shorter hem";
        updated.sync_version = 5;
        REQUIRE(store.put_state(updated).is_ok());
        REQUIRE(store.get_state("proj-1").unwrap()->revision_prompt == "shorter hem");
        REQUIRE(store.list_state_ids().unwrap().size() == 1);
    }

    SECTION("Corrupt payload comes back as malformed") {
        REQUIRE(db.execute("INSERT INTO project_states (project_id, payload) VALUES ('bad', '{nope');").is_ok());
        auto loaded = store.get_state("bad");
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.unwrap_err().is(ErrorCode::MalformedEntity));
    }

    SECTION("Remove project clears state and sync record") {
        REQUIRE(store.put_project(make_project("proj-1", "user-a", "T")).is_ok());
        REQUIRE(store.put_state(state).is_ok());
        REQUIRE(store.put_sync_record({"proj-1", "abc", 3, Timestamp(10)}).is_ok());

        REQUIRE(store.remove_project("proj-1").is_ok());
        REQUIRE_FALSE(store.get_project("proj-1").unwrap().has_value());
        REQUIRE_FALSE(store.get_state("proj-1").unwrap().has_value());
        REQUIRE_FALSE(store.get_sync_record("proj-1").unwrap().has_value());

        REQUIRE(store.remove_project("proj-1").is_ok());
    }
}

TEST_CASE("LocalStore sync records", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    LocalStore store(db);

    const SyncRecord record{"proj-1", "deadbeef", 7, Timestamp(1234)};
    REQUIRE(store.put_sync_record(record).is_ok());
    REQUIRE(store.get_sync_record("proj-1").unwrap() == record);

    auto newer = record;
    newer.remote_version = 8;
    REQUIRE(store.put_sync_record(newer).is_ok());
    REQUIRE(store.get_sync_record("proj-1").unwrap()->remote_version == 8);

    REQUIRE(store.clear_sync_record("proj-1").is_ok());
    REQUIRE_FALSE(store.get_sync_record("proj-1").unwrap().has_value());
}

TEST_CASE("LocalStore wardrobe library", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    LocalStore store(db);

    WardrobeItem blazer{"w-1", "Blazer", "outerwear", "https://cdn.example/blazer.png",
                        R"({"sku":"BLZ-01"})", std::nullopt, Timestamp(10)};
    WardrobeItem scarf{"w-2", "Scarf", "accessory", "https://cdn.example/scarf.png", "", std::nullopt,
                       Timestamp(20)};
    REQUIRE(store.put_library_item(blazer).is_ok());
    REQUIRE(store.put_library_item(scarf).is_ok());

    auto items = store.list_library().unwrap();
    REQUIRE(items.size() == 2);
    REQUIRE(items[0] == blazer);
    REQUIRE(items[1] == scarf);

    REQUIRE(store.remove_library_item("w-1").is_ok());
    REQUIRE(store.list_library().unwrap().size() == 1);
}
