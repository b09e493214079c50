#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "sync/merge_engine.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace atelier;
using namespace atelier::sync;

namespace {

// Unique ids "gen-<n*10>"; a positive revision gives the item an update time
// newer than its creation.
rc::Gen<Lineage> gen_lineage(const std::string& side) {
    return rc::gen::map(
        rc::gen::container<std::vector<std::pair<int, int>>>(
            rc::gen::pair(rc::gen::inRange(1, 40), rc::gen::inRange(0, 5))),
        [side](const std::vector<std::pair<int, int>>& entries) {
            Lineage lineage;
            std::set<int> seen;
            for (const auto& [n, revision] : entries) {
                if (!seen.insert(n).second) continue;
                HistoryItem item;
                item.id = "gen-" + std::to_string(n * 10);
                item.base_model_id = item.id;
                item.image_url = "https://cdn.example/" + item.id + ".png";
                item.name = side;
                if (revision > 0) {
                    item.updated_at = Timestamp(n * 10 + revision);
                }
                lineage.push_back(std::move(item));
            }
            return lineage;
        });
}

std::set<EntityId> ids_of(const Lineage& lineage) {
    std::set<EntityId> ids;
    for (const auto& item : lineage) ids.insert(item.id);
    return ids;
}

std::set<EntityId> ids_of(const std::vector<WardrobeItem>& wardrobe) {
    std::set<EntityId> ids;
    for (const auto& item : wardrobe) ids.insert(item.id);
    return ids;
}

// A stored state: sorted lineages, non-empty styling roots, unique wardrobe
// ids, and updated_at drawn from a small range so both sides often tie.
ProjectState draw_state(const std::string& side) {
    auto state = make_empty_state("proj-1");
    state.model_description = *rc::gen::elementOf(std::vector<std::string>{"", "tall", "petite"});
    state.selected_model_name = *rc::gen::elementOf(std::vector<std::string>{"Ava", "Mia", ""});
    state.revision_prompt = side;
    state.has_saved_instance = *rc::gen::arbitrary<bool>();
    if (*rc::gen::arbitrary<bool>()) {
        state.current_history_item_id = "gen-" + std::to_string(*rc::gen::inRange(1, 40) * 10);
    }
    state.generation_settings_json = *rc::gen::elementOf(std::vector<std::string>{"", R"({"seed":1})", R"({"seed":2})"});
    state.generated_model_history = sorted_chronologically(*gen_lineage(side));

    const auto root_count = *rc::gen::inRange(0, 4);
    for (int r = 0; r < root_count; ++r) {
        auto lineage = *gen_lineage(side);
        if (lineage.empty()) continue;
        const auto root = "gen-" + std::to_string((r + 1) * 10);
        for (auto& item : lineage) {
            item.id = "tryon-" + item.id.substr(4);
            item.type = HistoryItemType::TryOn;
            item.parent_id = root;
            item.base_model_id = root;
        }
        state.styling_history[root] = sorted_chronologically(std::move(lineage));
    }

    std::set<int> seen;
    const auto wardrobe = *rc::gen::container<std::vector<std::pair<int, int>>>(
        rc::gen::pair(rc::gen::inRange(1, 20), rc::gen::inRange(0, 5)));
    for (const auto& [n, updated] : wardrobe) {
        if (!seen.insert(n).second) continue;
        state.wardrobe.push_back({"w-" + std::to_string(n), side, "tops", "https://cdn.example/w.png", "",
                                  std::string("proj-1"), Timestamp(updated)});
    }

    state.updated_at = Timestamp(*rc::gen::inRange(0, 5));
    state.sync_version = *rc::gen::inRange(0, 10);
    return state;
}

} // namespace

TEST_CASE("Property: merging a lineage with itself changes nothing", "[property][merge]") {
    REQUIRE(rc::check("merge(x, x) == sort(x)", [] {
        const auto lineage = *gen_lineage("local");
        RC_ASSERT(merge_lineages(lineage, lineage) == sorted_chronologically(lineage));
    }));
}

TEST_CASE("Property: merge never drops an item", "[property][merge]") {
    REQUIRE(rc::check("ids(merge(a, b)) == ids(a) | ids(b), each once", [] {
        const auto local = *gen_lineage("local");
        const auto remote = *gen_lineage("remote");
        const auto merged = merge_lineages(local, remote);

        auto expected = ids_of(local);
        const auto remote_ids = ids_of(remote);
        expected.insert(remote_ids.begin(), remote_ids.end());

        RC_ASSERT(merged.size() == expected.size());
        RC_ASSERT(ids_of(merged) == expected);
    }));
}

TEST_CASE("Property: merge keeps the newest revision in chronological order", "[property][merge]") {
    REQUIRE(rc::check("newer wins, ties keep local, result sorted", [] {
        const auto local = *gen_lineage("local");
        const auto remote = *gen_lineage("remote");
        const auto merged = merge_lineages(local, remote);

        std::map<EntityId, const HistoryItem*> remote_by_id;
        for (const auto& item : remote) remote_by_id.emplace(item.id, &item);

        for (const auto& item : local) {
            const auto* kept = find_item(merged, item.id);
            RC_ASSERT(kept != nullptr);
            const auto it = remote_by_id.find(item.id);
            if (it == remote_by_id.end()) {
                RC_ASSERT(*kept == item);
            } else if (revision_key(*it->second) > revision_key(item)) {
                RC_ASSERT(*kept == *it->second);
            } else {
                RC_ASSERT(*kept == item);
            }
        }

        RC_ASSERT(std::is_sorted(merged.begin(), merged.end(), [](const HistoryItem& a, const HistoryItem& b) {
            return order_key(a) < order_key(b);
        }));
    }));
}

TEST_CASE("Property: re-merging the same remote is idempotent", "[property][merge]") {
    REQUIRE(rc::check("merge(merge(a, b), b) == merge(a, b)", [] {
        const auto local = *gen_lineage("local");
        const auto remote = *gen_lineage("remote");
        const auto once = merge_lineages(local, remote);
        RC_ASSERT(merge_lineages(once, remote) == once);
    }));
}

TEST_CASE("Property: smart merge of a state with itself keeps its content", "[property][merge]") {
    REQUIRE(rc::check("same_content(merge_states(a, a, Smart), a)", [] {
        const auto state = draw_state("local");
        const auto merged = merge_states(state, state, MergeStrategy::Smart);
        RC_ASSERT(same_content(merged, state));
        RC_ASSERT(merged.sync_version == state.sync_version + 1);
    }));
}

TEST_CASE("Property: smart merge of two states drops no item", "[property][merge]") {
    REQUIRE(rc::check("every lineage, styling root and wardrobe keeps the union of ids", [] {
        const auto local = draw_state("local");
        const auto remote = draw_state("remote");
        const auto merged = merge_states(local, remote, MergeStrategy::Smart);

        auto primary = ids_of(local.generated_model_history);
        const auto remote_primary = ids_of(remote.generated_model_history);
        primary.insert(remote_primary.begin(), remote_primary.end());
        RC_ASSERT(ids_of(merged.generated_model_history) == primary);
        RC_ASSERT(merged.generated_model_history.size() == primary.size());

        std::set<EntityId> roots;
        for (const auto& [root, lineage] : local.styling_history) roots.insert(root);
        for (const auto& [root, lineage] : remote.styling_history) roots.insert(root);
        RC_ASSERT(merged.styling_history.size() == roots.size());
        for (const auto& root : roots) {
            std::set<EntityId> expected;
            for (const auto* side : {&local, &remote}) {
                const auto it = side->styling_history.find(root);
                if (it == side->styling_history.end()) continue;
                const auto ids = ids_of(it->second);
                expected.insert(ids.begin(), ids.end());
            }
            const auto& kept = merged.styling_history.at(root);
            RC_ASSERT(ids_of(kept) == expected);
            RC_ASSERT(kept.size() == expected.size());
            RC_ASSERT(kept == sorted_chronologically(kept));
        }

        auto wardrobe = ids_of(local.wardrobe);
        const auto remote_wardrobe = ids_of(remote.wardrobe);
        wardrobe.insert(remote_wardrobe.begin(), remote_wardrobe.end());
        RC_ASSERT(ids_of(merged.wardrobe) == wardrobe);
        RC_ASSERT(merged.wardrobe.size() == wardrobe.size());

        const auto& newer = remote.updated_at >= local.updated_at ? remote : local;
        RC_ASSERT(merged.revision_prompt == newer.revision_prompt);
        RC_ASSERT(merged.selected_model_name == newer.selected_model_name);
        RC_ASSERT(merged.updated_at == std::max(local.updated_at, remote.updated_at));
        RC_ASSERT(merged.sync_version == std::max(local.sync_version, remote.sync_version) + 1);
    }));
}
