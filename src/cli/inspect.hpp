#pragma once

#include "core/project.hpp"
#include "core/result.hpp"
#include "storage/local_store.hpp"
#include "sync/validation_gate.hpp"
#include <QString>
#include <string>
#include <vector>

namespace atelier::cli {

struct InspectOptions {
    bool includeIds = false;
};

// One line per project: "<title> [<status>] v<syncVersion>", in input order.
[[nodiscard]] QString format_project_list(const std::vector<Project>& projects,
                                          const InspectOptions& options = {});

// { "projects": [{ "id"?, "title", "status", "syncVersion", "updatedAt" }] }
[[nodiscard]] QString format_project_list_json(const std::vector<Project>& projects,
                                               const InspectOptions& options = {});

// Both partitions of a project as one forest, children indented under
// their parent. Items whose parent is missing are shown as roots.
[[nodiscard]] QString format_history_tree(const ProjectState& state,
                                          const InspectOptions& options = {});

[[nodiscard]] QString format_history_tree_json(const ProjectState& state,
                                               const InspectOptions& options = {});

struct ValidationFinding {
    EntityId project_id;
    std::string reason;
};

// Run the gate over every stored project state; unreadable rows are findings too.
[[nodiscard]] Res<std::vector<ValidationFinding>> validate_store(storage::LocalStore& store,
                                                                 const sync::ValidationGate& gate);

[[nodiscard]] QString format_findings(const std::vector<ValidationFinding>& findings);

} // namespace atelier::cli
