#include <catch2/catch_test_macros.hpp>
#include "sync/merge_engine.hpp"

#include <QJsonArray>

using namespace atelier;
using namespace atelier::sync;

namespace {

HistoryItem item(const std::string& id, int64_t created, const std::string& url = "https://cdn.example/x.png") {
    return create_root_item(id, HistoryItemType::ModelGeneration, url, Timestamp(created));
}

ProjectState state_at(int64_t updated, const std::string& model_name) {
    auto state = make_empty_state("proj-1");
    state.selected_model_name = model_name;
    state.updated_at = Timestamp(updated);
    return state;
}

} // namespace

TEST_CASE("Lineage merge is a union by id", "[merge]") {
    const Lineage local{item("gen-1", 1), item("gen-3", 3)};
    const Lineage remote{item("gen-2", 2), item("gen-3", 3)};

    auto merged = merge_lineages(local, remote);
    REQUIRE(merged.size() == 3);
    REQUIRE(merged[0].id == "gen-1");
    REQUIRE(merged[1].id == "gen-2");
    REQUIRE(merged[2].id == "gen-3");
}

TEST_CASE("Lineage merge keeps the newer revision of a shared item", "[merge]") {
    auto local_copy = item("gen-1", 1);
    auto remote_copy = item("gen-1", 1);

    SECTION("Remote renamed later") {
        local_copy.updated_at = Timestamp(10);
        remote_copy.updated_at = Timestamp(20);
        remote_copy.name = "Hero";
        auto merged = merge_lineages({local_copy}, {remote_copy});
        REQUIRE(merged.size() == 1);
        REQUIRE(merged[0].name == std::string("Hero"));
    }

    SECTION("Equal revision keys keep the local copy") {
        local_copy.is_starred = true;
        auto merged = merge_lineages({local_copy}, {remote_copy});
        REQUIRE(merged[0].is_starred);
    }
}

TEST_CASE("Lineage merge never drops a local-only item", "[merge]") {
    const Lineage local{item("gen-1", 1), item("gen-5", 5)};
    auto merged = merge_lineages(local, {});
    REQUIRE(merged == local);
}

TEST_CASE("Styling merge unions roots and items", "[merge]") {
    StylingMap local;
    local["gen-1"] = {item("tryon-2", 2)};
    StylingMap remote;
    remote["gen-1"] = {item("tryon-3", 3)};
    remote["gen-9"] = {item("tryon-10", 10)};

    auto merged = merge_styling(local, remote);
    REQUIRE(merged.size() == 2);
    REQUIRE(merged["gen-1"].size() == 2);
    REQUIRE(merged["gen-9"].front().id == "tryon-10");
}

TEST_CASE("Wardrobe merge prefers the newer item", "[merge]") {
    std::vector<WardrobeItem> local{{"w-1", "Blazer", "outerwear", "u1", "", std::nullopt, Timestamp(5)}};
    std::vector<WardrobeItem> remote{{"w-1", "Blazer v2", "outerwear", "u2", "", std::nullopt, Timestamp(9)},
                                     {"w-2", "Scarf", "accessory", "u3", "", std::nullopt, Timestamp(1)}};

    auto merged = merge_wardrobes(local, remote);
    REQUIRE(merged.size() == 2);
    REQUIRE(merged[0].name == "Blazer v2");
    REQUIRE(merged[1].id == "w-2");
}

TEST_CASE("Smart merge takes scalars from the later side and flags the conflict", "[merge]") {
    // Local edit at t=0, remote edit at t=1, inside the conflict window.
    auto local = state_at(1000, "A");
    auto remote = state_at(1001, "B");
    local.sync_version = 3;
    remote.sync_version = 5;

    auto merged = merge_states(local, remote, MergeStrategy::Smart);
    REQUIRE(merged.selected_model_name == "B");
    REQUIRE(merged.updated_at == Timestamp(1001));
    REQUIRE(merged.sync_version == 6);

    auto conflicts = detect_conflicts(local, remote, std::chrono::milliseconds(30000), Timestamp(2000));
    REQUIRE(conflicts.size() == 1);
    REQUIRE(conflicts[0].field == "selectedModelName");
    REQUIRE(conflicts[0].local.toString() == "A");
    REQUIRE(conflicts[0].remote.toString() == "B");
    REQUIRE(conflicts[0].detected_at == Timestamp(2000));
}

TEST_CASE("Smart merge keeps local scalars when local is newer", "[merge]") {
    auto local = state_at(2000, "A");
    auto remote = state_at(1000, "B");
    local.generated_model_history = {item("gen-1", 1)};
    remote.generated_model_history = {item("gen-2", 2)};

    auto merged = merge_states(local, remote, MergeStrategy::Smart);
    REQUIRE(merged.selected_model_name == "A");
    REQUIRE(merged.generated_model_history.size() == 2);
}

TEST_CASE("Whole-snapshot strategies", "[merge]") {
    auto local = state_at(1000, "A");
    auto remote = state_at(5000, "B");
    local.generated_model_history = {item("gen-1", 1)};
    remote.generated_model_history = {item("gen-2", 2)};

    auto kept_local = merge_states(local, remote, MergeStrategy::PreferLocal);
    REQUIRE(kept_local.selected_model_name == "A");
    REQUIRE(kept_local.generated_model_history.size() == 1);
    REQUIRE(kept_local.updated_at == Timestamp(5000));

    auto kept_remote = merge_states(local, remote, MergeStrategy::PreferRemote);
    REQUIRE(kept_remote.selected_model_name == "B");
    REQUIRE(kept_remote.generated_model_history.front().id == "gen-2");
    REQUIRE(kept_remote.id == "proj-1");
}

TEST_CASE("Conflicts outside the window are not reported", "[merge]") {
    auto local = state_at(0, "A");
    auto remote = state_at(60000, "B");
    REQUIRE(detect_conflicts(local, remote, std::chrono::milliseconds(30000)).empty());
}

TEST_CASE("Lineage disagreements are reported regardless of time", "[merge]") {
    auto local = state_at(0, "A");
    auto remote = state_at(60000, "A");
    local.generated_model_history = {item("gen-1", 1), item("gen-2", 2)};
    remote.generated_model_history = {item("gen-2", 2), item("gen-3", 3)};

    auto conflicts = detect_conflicts(local, remote, std::chrono::milliseconds(30000));
    REQUIRE(conflicts.size() == 1);
    REQUIRE(conflicts[0].field == "generatedModelHistory");
    REQUIRE(conflicts[0].local.toArray() == QJsonArray{"gen-1"});
    REQUIRE(conflicts[0].remote.toArray() == QJsonArray{"gen-3"});
}

TEST_CASE("Project metadata merge", "[merge]") {
    auto local = make_project("proj-1", "user-a", "Local title", Timestamp(100));
    auto remote = make_project("proj-1", "user-a", "Remote title", Timestamp(50));
    local.updated_at = Timestamp(300);
    remote.updated_at = Timestamp(200);
    remote.sync_version = 4;

    auto merged = merge_projects(local, remote, MergeStrategy::Smart);
    REQUIRE(merged.title == "Local title");
    REQUIRE(merged.created_at == Timestamp(50));
    REQUIRE(merged.updated_at == Timestamp(300));
    REQUIRE(merged.sync_version == 5);
}
