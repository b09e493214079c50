#include "core/project.hpp"

namespace atelier {

std::string_view to_string(ProjectStatus status) noexcept {
    switch (status) {
        case ProjectStatus::Draft: return "Draft";
        case ProjectStatus::InProgress: return "In Progress";
        case ProjectStatus::InReview: return "In Review";
        case ProjectStatus::OnHold: return "On Hold";
        case ProjectStatus::Completed: return "Completed";
    }
    return "Draft";
}

std::optional<ProjectStatus> parse_project_status(std::string_view text) noexcept {
    if (text == "Draft") return ProjectStatus::Draft;
    if (text == "In Progress") return ProjectStatus::InProgress;
    if (text == "In Review") return ProjectStatus::InReview;
    if (text == "On Hold") return ProjectStatus::OnHold;
    if (text == "Completed") return ProjectStatus::Completed;
    return std::nullopt;
}

std::string_view to_string(MergeStrategy strategy) noexcept {
    switch (strategy) {
        case MergeStrategy::PreferLocal: return "prefer-local";
        case MergeStrategy::PreferRemote: return "prefer-remote";
        case MergeStrategy::Smart: return "smart";
    }
    return "smart";
}

std::optional<MergeStrategy> parse_merge_strategy(std::string_view text) noexcept {
    if (text == "prefer-local") return MergeStrategy::PreferLocal;
    if (text == "prefer-remote") return MergeStrategy::PreferRemote;
    if (text == "smart") return MergeStrategy::Smart;
    return std::nullopt;
}

bool same_content(const ProjectState& a, const ProjectState& b) {
    auto lhs = a;
    lhs.sync_version = b.sync_version;
    return lhs == b;
}

Lineage all_history_items(const ProjectState& state) {
    Lineage items = state.generated_model_history;
    for (const auto& [root, lineage] : state.styling_history) {
        items.insert(items.end(), lineage.begin(), lineage.end());
    }
    return items;
}

ProjectState make_empty_state(EntityId project_id) {
    ProjectState state;
    state.id = std::move(project_id);
    return state;
}

Project make_project(EntityId id,
                     std::string owner_id,
                     std::string title,
                     Timestamp created_at) {
    Project project;
    project.id = std::move(id);
    project.owner_id = std::move(owner_id);
    project.title = std::move(title);
    project.created_at = created_at;
    project.updated_at = created_at;
    return project;
}

} // namespace atelier
