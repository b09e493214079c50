#include "sync/history_partitioner.hpp"

#include "core/logging.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>

namespace atelier::sync {

namespace {

void upsert(Lineage& target, const HistoryItem& item) {
    if (auto* existing = find_item(target, item.id)) {
        *existing = item;
    } else {
        target.push_back(item);
    }
}

// Ids whose parent chain passes through `ancestor_id`.
std::set<EntityId> descendants_of(const Lineage& all, const EntityId& ancestor_id) {
    std::unordered_map<std::string, const HistoryItem*> index;
    for (const auto& item : all) {
        index.emplace(item.id, &item);
    }

    std::set<EntityId> found;
    for (const auto& item : all) {
        if (item.id == ancestor_id) continue;
        const HistoryItem* current = &item;
        for (size_t hops = 0; hops <= all.size() && current->parent_id; ++hops) {
            if (*current->parent_id == ancestor_id) {
                found.insert(item.id);
                break;
            }
            const auto it = index.find(*current->parent_id);
            if (it == index.end()) break;
            current = it->second;
        }
    }
    return found;
}

} // namespace

PartitionedLineage partition(const Lineage& lineage) {
    PartitionedLineage parts;
    for (const auto& item : lineage) {
        (is_styling_type(item.type) ? parts.styling : parts.primary).push_back(item);
    }
    return parts;
}

Lineage unify(const PartitionedLineage& parts) {
    Lineage unified;
    unified.reserve(parts.primary.size() + parts.styling.size());
    unified.insert(unified.end(), parts.primary.begin(), parts.primary.end());
    unified.insert(unified.end(), parts.styling.begin(), parts.styling.end());
    sort_chronologically(unified);
    return unified;
}

void save_unified(ProjectState& state, const EntityId& root_id, const Lineage& lineage) {
    const auto parts = partition(lineage);
    for (const auto& item : parts.primary) {
        upsert(state.generated_model_history, item);
    }
    if (parts.styling.empty()) {
        return;
    }
    auto& styling = state.styling_history[root_id];
    for (const auto& item : parts.styling) {
        upsert(styling, item);
    }
}

Lineage load_unified(const ProjectState& state, const EntityId& root_id) {
    PartitionedLineage parts;
    for (const auto& item : state.generated_model_history) {
        auto root = resolve_root(state.generated_model_history, item.id);
        if (root.is_err()) {
            qCWarning(atelierSyncLog) << "Skipping history item" << QString::fromStdString(item.id) << ":"
                                      << QString::fromStdString(root.unwrap_err().message);
            continue;
        }
        if (root.unwrap() == root_id) {
            parts.primary.push_back(item);
        }
    }

    const auto styling = state.styling_history.find(root_id);
    if (styling != state.styling_history.end()) {
        parts.styling = styling->second;
    }
    return unify(parts);
}

Res<RemovedNode> remove_node(ProjectState& state, const EntityId& item_id) {
    ProjectState working = state;
    RemovedNode removed;

    auto take = [&](Lineage& lineage) -> bool {
        const auto it = std::find_if(lineage.begin(), lineage.end(),
                                     [&](const HistoryItem& item) { return item.id == item_id; });
        if (it == lineage.end()) return false;
        removed.item = *it;
        lineage.erase(it);
        return true;
    };

    const auto descendants = descendants_of(all_history_items(working), item_id);

    bool found = take(working.generated_model_history);
    if (!found) {
        for (auto& [root, lineage] : working.styling_history) {
            if (take(lineage)) {
                found = true;
                removed.from_styling = true;
                removed.styling_root = root;
                break;
            }
        }
    }
    if (!found) {
        return Res<RemovedNode>::err(Error{ErrorCode::NotFound, "no history item " + item_id});
    }

    const auto new_parent = removed.item.parent_id;
    auto reparent = [&](Lineage& lineage) {
        for (auto& item : lineage) {
            if (item.parent_id && *item.parent_id == item_id) {
                item.parent_id = new_parent;
                removed.reparented.push_back(item.id);
            }
        }
    };
    reparent(working.generated_model_history);
    for (auto& [root, lineage] : working.styling_history) {
        reparent(lineage);
    }

    // Only the removed node's descendants can have a different root now.
    const auto all = all_history_items(working);
    std::unordered_map<std::string, EntityId> new_roots;
    for (const auto& id : descendants) {
        auto root = resolve_root(all, id);
        if (root.is_err()) {
            return Res<RemovedNode>::err(root.unwrap_err());
        }
        new_roots.emplace(id, std::move(root).unwrap());
    }

    auto rebase = [&](HistoryItem& item) {
        const auto it = new_roots.find(item.id);
        if (it == new_roots.end() || item.base_model_id == it->second) return;
        item.base_model_id = it->second;
        removed.rebased.push_back(item.id);
    };
    for (auto& item : working.generated_model_history) {
        rebase(item);
    }

    StylingMap rekeyed;
    std::set<EntityId> received;
    for (auto& [root, lineage] : working.styling_history) {
        for (auto& item : lineage) {
            rebase(item);
            const bool moved = new_roots.count(item.id) > 0 && item.base_model_id != root;
            if (moved) received.insert(item.base_model_id);
            rekeyed[moved ? item.base_model_id : root].push_back(std::move(item));
        }
    }
    for (const auto& root : received) {
        sort_chronologically(rekeyed[root]);
    }
    working.styling_history = std::move(rekeyed);

    if (working.current_history_item_id && *working.current_history_item_id == item_id) {
        working.current_history_item_id = new_parent;
    }

    state = std::move(working);
    return Res<RemovedNode>::ok(std::move(removed));
}

std::vector<EntityId> styling_root_ids(const ProjectState& state) {
    std::set<EntityId> roots;
    for (const auto& [root, lineage] : state.styling_history) {
        if (!lineage.empty()) roots.insert(root);
    }
    for (const auto& item : state.generated_model_history) {
        if (!item.base_model_id.empty()) roots.insert(item.base_model_id);
    }
    return {roots.begin(), roots.end()};
}

} // namespace atelier::sync
