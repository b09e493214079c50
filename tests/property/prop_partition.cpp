#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "sync/history_partitioner.hpp"
#include <algorithm>

using namespace atelier;
using namespace atelier::sync;

namespace {

const HistoryItemType kTypes[] = {
    HistoryItemType::ModelGeneration,
    HistoryItemType::ModelRevision,
    HistoryItemType::TryOn,
    HistoryItemType::TryOnRevision,
};

/**
 * A random lineage forest stored the way the partitioner expects: primary
 * types in generated_model_history, styling types keyed by their root.
 *
 * Each shape entry is (parent choice, type choice). A parent choice at or
 * above the node's index makes it a root; otherwise it picks an earlier node.
 */
ProjectState build_state(const std::vector<std::pair<int, int>>& shape) {
    auto state = make_empty_state("proj-1");
    Lineage all;
    for (size_t i = 0; i < shape.size(); ++i) {
        const auto [parent_choice, type_choice] = shape[i];
        const auto id = "n-" + std::to_string((i + 1) * 10);
        const auto at = Timestamp(static_cast<int64_t>((i + 1) * 10));

        HistoryItem item;
        if (static_cast<size_t>(parent_choice) >= i) {
            item = create_root_item(id, HistoryItemType::ModelGeneration, "https://cdn.example/" + id, at);
        } else {
            const auto& parent = all[static_cast<size_t>(parent_choice)];
            auto type = is_styling_type(parent.type)
                            ? HistoryItemType::TryOnRevision
                            : (type_choice == 0 ? HistoryItemType::ModelRevision : HistoryItemType::TryOn);
            item = create_child_item(parent, id, type, "https://cdn.example/" + id, at);
        }
        all.push_back(item);

        if (is_styling_type(item.type)) {
            state.styling_history[item.base_model_id].push_back(item);
        } else {
            state.generated_model_history.push_back(item);
        }
    }
    return state;
}

rc::Gen<std::vector<std::pair<int, int>>> gen_shape() {
    return rc::gen::container<std::vector<std::pair<int, int>>>(
        rc::gen::pair(rc::gen::inRange(0, 30), rc::gen::inRange(0, 2)));
}

} // namespace

TEST_CASE("Property: unify restores a partitioned lineage", "[property][partition]") {
    REQUIRE(rc::check("unify(partition(x)) == sort(x)", [] {
        // Few distinct timestamps, so primary and styling items often tie.
        const auto picks = *rc::gen::container<std::vector<std::pair<int, int>>>(
            rc::gen::pair(rc::gen::inRange(1, 6), rc::gen::inRange(0, 4)));

        Lineage lineage;
        for (size_t i = 0; i < picks.size(); ++i) {
            const auto [at, type] = picks[i];
            lineage.push_back(
                create_root_item("i-" + std::to_string(i), kTypes[type], "u", Timestamp(at)));
        }

        const auto parts = partition(lineage);
        RC_ASSERT(parts.primary.size() + parts.styling.size() == lineage.size());
        RC_ASSERT(std::all_of(parts.styling.begin(), parts.styling.end(),
                              [](const HistoryItem& item) { return is_styling_type(item.type); }));
        RC_ASSERT(unify(parts) == sorted_chronologically(lineage));
    }));
}

TEST_CASE("Property: removing a node keeps every lineage connected", "[property][partition]") {
    REQUIRE(rc::check("remove_node re-parents children and keeps roots consistent", [] {
        const auto shape = *gen_shape();
        RC_PRE(!shape.empty());
        auto state = build_state(shape);
        RC_ASSERT(validate_lineage(all_history_items(state)).is_ok());

        const auto before = all_history_items(state);
        const auto victim = before[*rc::gen::inRange<size_t>(0, before.size())];

        auto removed = remove_node(state, victim.id);
        RC_ASSERT(removed.is_ok());

        const auto after = all_history_items(state);
        RC_ASSERT(after.size() + 1 == before.size());
        RC_ASSERT(find_item(after, victim.id) == nullptr);
        RC_ASSERT(validate_lineage(after).is_ok());

        for (const auto& item : before) {
            if (!item.parent_id || *item.parent_id != victim.id) continue;
            const auto* moved = find_item(after, item.id);
            RC_ASSERT(moved != nullptr);
            RC_ASSERT(moved->parent_id == victim.parent_id);
        }

        for (const auto& [root, lineage] : state.styling_history) {
            for (const auto& item : lineage) {
                RC_ASSERT(item.base_model_id == root);
            }
        }
    }));
}
