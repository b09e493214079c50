#pragma once

#include "core/project.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace atelier::sync {

/**
 * The two physical partitions of one root's lineage.
 */
struct PartitionedLineage {
    Lineage primary;   // model-generation / model-revision
    Lineage styling;   // try-on / try-on-revision
};

[[nodiscard]] PartitionedLineage partition(const Lineage& lineage);

/**
 * Concatenate both partitions and sort by order key. Items with equal keys
 * in different partitions come out primary first.
 */
[[nodiscard]] Lineage unify(const PartitionedLineage& parts);

/**
 * Split `lineage` by type and merge it by id into the primary history and
 * styling_history[root_id]: known ids are updated in place, new ids are
 * appended.
 */
void save_unified(ProjectState& state, const EntityId& root_id, const Lineage& lineage);

/**
 * Primary items whose resolved root is `root_id`, plus the styling items of
 * that root, in chronological order.
 */
[[nodiscard]] Lineage load_unified(const ProjectState& state, const EntityId& root_id);

/**
 * What remove_node() took out, so the caller can delete the remote copy.
 */
struct RemovedNode {
    HistoryItem item;
    bool from_styling = false;
    EntityId styling_root;                 // partition key when from_styling
    std::vector<EntityId> reparented;      // former children
    std::vector<EntityId> rebased;         // items whose baseModelId changed
};

/**
 * Remove one item. Its children take over its parent, every baseModelId is
 * recomputed, and styling items whose root changed move to the new key.
 * A current_history_item_id pointing at the item moves to its parent.
 */
[[nodiscard]] Res<RemovedNode> remove_node(ProjectState& state, const EntityId& item_id);

/**
 * Roots holding styling entries plus every baseModelId of the primary
 * history; the styling collections worth looking for remotely.
 */
[[nodiscard]] std::vector<EntityId> styling_root_ids(const ProjectState& state);

} // namespace atelier::sync
