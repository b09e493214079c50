#include <catch2/catch_test_macros.hpp>
#include "sync/remote_project.hpp"
#include "core/codec.hpp"

#include <QJsonArray>
#include <algorithm>

using namespace atelier;
using namespace atelier::sync;
using network::WriteOp;

namespace {

const std::string kUrl = "https://cdn.example/img.png";

struct Fixture {
    Project project = make_project("proj-1", "user-a", "Resort", Timestamp(100));
    ProjectState state = make_empty_state("proj-1");

    Fixture() {
        auto root = create_root_item("gen-1", HistoryItemType::ModelGeneration, kUrl, Timestamp(1));
        auto look = create_child_item(root, "tryon-2", HistoryItemType::TryOn, kUrl, Timestamp(2));
        state.generated_model_history = {root};
        state.styling_history["gen-1"] = {look};
        state.wardrobe = {{"w-1", "Blazer", "outerwear", kUrl, "", std::string("proj-1"), Timestamp(3)}};
        state.selected_model_name = "Ava";
        state.updated_at = Timestamp(900);
    }
};

const WriteOp* find_op(const network::WriteBatch& batch, WriteOp::Kind kind, const std::string& path) {
    const auto& ops = batch.ops();
    const auto it = std::find_if(ops.begin(), ops.end(), [&](const WriteOp& op) {
        return op.kind == kind && op.path == path;
    });
    return it == ops.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("Project document carries metadata and scalar state", "[remote]") {
    Fixture f;
    auto doc = project_document(f.project, f.state, 7);

    REQUIRE(doc.value("title").toString() == "Resort");
    REQUIRE(doc.value("ownerId").toString() == "user-a");
    REQUIRE(doc.value("selectedModelName").toString() == "Ava");
    REQUIRE(doc.value("updatedAt").toInteger() == 900);
    REQUIRE(doc.value("metadataUpdatedAt").toInteger() == 100);
    REQUIRE(doc.value("syncVersion").toInteger() == 7);
    REQUIRE(doc.value("stylingRootIds").toArray() == QJsonArray{"gen-1"});
    REQUIRE_FALSE(doc.contains("generatedModelHistory"));
    REQUIRE_FALSE(doc.contains("wardrobe"));
}

TEST_CASE("Project document decodes back", "[remote]") {
    Fixture f;
    auto decoded = decode_project_document("proj-1", project_document(f.project, f.state, 7)).unwrap();

    REQUIRE(decoded.project.title == "Resort");
    REQUIRE(decoded.project.updated_at == Timestamp(100));
    REQUIRE(decoded.state.id == "proj-1");
    REQUIRE(decoded.state.selected_model_name == "Ava");
    REQUIRE(decoded.state.updated_at == Timestamp(900));
    REQUIRE(decoded.state.sync_version == 7);
    REQUIRE(decoded.state.generated_model_history.empty());
    REQUIRE(decoded.styling_root_ids == std::vector<EntityId>{"gen-1"});
}

TEST_CASE("Push plan for a fresh project", "[remote]") {
    Fixture f;
    auto plan = plan_push(f.project, f.state, 1, RemoteListing{});

    REQUIRE(plan.report.items_written == 2);
    REQUIRE(plan.report.items_skipped == 0);
    REQUIRE(plan.report.orphans_removed == 0);
    REQUIRE(plan.batch.size() == 4);

    const auto* doc = find_op(plan.batch, WriteOp::Kind::Set, "projects/proj-1");
    REQUIRE(doc != nullptr);
    REQUIRE(doc->mode == network::WriteMode::Merge);

    const auto* item = find_op(plan.batch, WriteOp::Kind::Set, "projects/proj-1/history/gen-1");
    REQUIRE(item != nullptr);
    REQUIRE(item->mode == network::WriteMode::Replace);
    REQUIRE(find_op(plan.batch, WriteOp::Kind::Set, "projects/proj-1/styling/gen-1/tryon-2") != nullptr);
    REQUIRE(find_op(plan.batch, WriteOp::Kind::Set, "projects/proj-1/wardrobe/w-1") != nullptr);
}

TEST_CASE("Push plan removes remote orphans", "[remote]") {
    Fixture f;
    RemoteListing listing;
    listing.history_ids = {"gen-1", "gen-old"};
    listing.styling_ids["gen-1"] = {"tryon-2", "tryon-old"};
    listing.styling_ids["gen-gone"] = {"tryon-a", "tryon-b"};
    listing.wardrobe_ids = {"w-old"};

    auto plan = plan_push(f.project, f.state, 2, listing);
    REQUIRE(plan.report.orphans_removed == 5);
    REQUIRE(find_op(plan.batch, WriteOp::Kind::Remove, "projects/proj-1/history/gen-old") != nullptr);
    REQUIRE(find_op(plan.batch, WriteOp::Kind::Remove, "projects/proj-1/styling/gen-1/tryon-old") != nullptr);
    REQUIRE(find_op(plan.batch, WriteOp::Kind::Remove, "projects/proj-1/styling/gen-gone/tryon-b") != nullptr);
    REQUIRE(find_op(plan.batch, WriteOp::Kind::Remove, "projects/proj-1/wardrobe/w-old") != nullptr);
    REQUIRE(find_op(plan.batch, WriteOp::Kind::Remove, "projects/proj-1/history/gen-1") == nullptr);
}

TEST_CASE("Push plan skips items without an image", "[remote]") {
    Fixture f;
    auto blank = create_root_item("gen-9", HistoryItemType::ModelGeneration, "", Timestamp(9));
    f.state.generated_model_history.push_back(blank);

    RemoteListing listing;
    listing.history_ids = {"gen-9"};

    auto plan = plan_push(f.project, f.state, 3, listing);
    REQUIRE(plan.report.items_skipped == 1);
    REQUIRE(find_op(plan.batch, WriteOp::Kind::Set, "projects/proj-1/history/gen-9") == nullptr);
    // Still present locally, so the remote copy is not an orphan.
    REQUIRE(find_op(plan.batch, WriteOp::Kind::Remove, "projects/proj-1/history/gen-9") == nullptr);
}

TEST_CASE("Document paths", "[remote]") {
    using namespace network::paths;
    REQUIRE(styling("p", "r") == "projects/p/styling/r");
    REQUIRE(document(history("p"), "i") == "projects/p/history/i");
    REQUIRE(parent_of("projects/p/history/i") == "projects/p/history");
    REQUIRE(leaf_of("projects/p/history/i") == "i");
    REQUIRE(leaf_of("plain") == "plain");
}
