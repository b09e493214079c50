#pragma once

#include "core/history.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atelier {

enum class ProjectStatus {
    Draft,
    InProgress,
    InReview,
    OnHold,
    Completed
};

[[nodiscard]] std::string_view to_string(ProjectStatus status) noexcept;
[[nodiscard]] std::optional<ProjectStatus> parse_project_status(std::string_view text) noexcept;

/**
 * MergeStrategy - How a local and a remote snapshot are reconciled.
 */
enum class MergeStrategy {
    PreferLocal,
    PreferRemote,
    Smart
};

[[nodiscard]] std::string_view to_string(MergeStrategy strategy) noexcept;
[[nodiscard]] std::optional<MergeStrategy> parse_merge_strategy(std::string_view text) noexcept;

/**
 * Project - Metadata record of a unit of creative work.
 *
 * Owned by exactly one identity. The working set lives in ProjectState.
 */
struct Project {
    EntityId id;
    std::string owner_id;
    std::string title;
    std::string description;
    std::string organization;
    std::vector<std::string> tags;
    ProjectStatus status = ProjectStatus::Draft;
    std::optional<std::string> deadline;     // calendar date, "YYYY-MM-DD"
    Timestamp created_at;
    Timestamp updated_at;
    int64_t sync_version = 0;

    bool operator==(const Project&) const = default;
};

/**
 * WardrobeItem - Reusable library asset.
 *
 * Catalogue attributes the engine does not interpret (sku, colorways, fit...)
 * travel untouched in `attributes_json`.
 */
struct WardrobeItem {
    EntityId id;
    std::string name;
    std::string category;
    std::string url;
    std::string attributes_json;
    std::optional<EntityId> project_id;      // nullopt = global library
    Timestamp updated_at;

    bool operator==(const WardrobeItem&) const = default;
};

using StylingMap = std::map<EntityId, Lineage>;

/**
 * ProjectState - The mutable working set attached to a Project.
 */
struct ProjectState {
    EntityId id;                             // same as the owning Project id
    std::string model_description;
    std::string revision_prompt;
    std::string selected_model_name;
    std::optional<EntityId> current_history_item_id;
    bool has_saved_instance = false;
    std::string generation_settings_json;    // opaque, compact JSON
    Lineage generated_model_history;         // primary partition
    StylingMap styling_history;              // root id -> styling partition
    std::vector<WardrobeItem> wardrobe;
    Timestamp updated_at;
    int64_t sync_version = 0;

    bool operator==(const ProjectState&) const = default;
};

/**
 * Content equality: every field except sync_version.
 */
[[nodiscard]] bool same_content(const ProjectState& a, const ProjectState& b);

/**
 * Every item of both partitions, primary lineage first.
 */
[[nodiscard]] Lineage all_history_items(const ProjectState& state);

[[nodiscard]] ProjectState make_empty_state(EntityId project_id);

[[nodiscard]] Project make_project(EntityId id,
                                   std::string owner_id,
                                   std::string title,
                                   Timestamp created_at = Timestamp::now());

} // namespace atelier
