#pragma once

#include "core/project.hpp"
#include "core/types.hpp"
#include <QJsonValue>
#include <chrono>
#include <string>
#include <vector>

namespace atelier::sync {

/**
 * MergeConflict - A disagreement between two snapshots, for display only.
 *
 * Lineage disagreements use the field "generatedModelHistory" with the ids
 * present on one side only as arrays.
 */
struct MergeConflict {
    std::string field;
    QJsonValue local;
    QJsonValue remote;
    Timestamp detected_at;
};

/**
 * Union of two versions of one lineage keyed by id. On a shared id the
 * remote item replaces the local one only when its revision key is strictly
 * larger. The result is sorted chronologically.
 */
[[nodiscard]] Lineage merge_lineages(const Lineage& local, const Lineage& remote);

[[nodiscard]] StylingMap merge_styling(const StylingMap& local, const StylingMap& remote);

/**
 * Union by id, newer updated_at wins, local order then new remote items.
 */
[[nodiscard]] std::vector<WardrobeItem> merge_wardrobes(const std::vector<WardrobeItem>& local,
                                                        const std::vector<WardrobeItem>& remote);

/**
 * Reconcile two snapshots of one project state.
 *
 * PreferLocal / PreferRemote keep one side; Smart takes scalars from the
 * side with the larger updated_at (ties go to remote) and merges every
 * collection by id. In all strategies updated_at is the max of both sides
 * and sync_version is max + 1.
 */
[[nodiscard]] ProjectState merge_states(const ProjectState& local,
                                        const ProjectState& remote,
                                        MergeStrategy strategy);

/**
 * Same recency rule for project metadata records.
 */
[[nodiscard]] Project merge_projects(const Project& local,
                                     const Project& remote,
                                     MergeStrategy strategy);

/**
 * Scalar disagreements when both sides changed within `window` of each
 * other, plus the lineage id set difference regardless of the window.
 */
[[nodiscard]] std::vector<MergeConflict> detect_conflicts(const ProjectState& local,
                                                          const ProjectState& remote,
                                                          std::chrono::milliseconds window,
                                                          Timestamp now = Timestamp::now());

} // namespace atelier::sync
