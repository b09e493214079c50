#include "sync/merge_engine.hpp"

#include "core/codec.hpp"
#include "core/logging.hpp"

#include <QJsonArray>
#include <algorithm>
#include <cstdlib>
#include <set>
#include <unordered_map>

namespace atelier::sync {

namespace {

int64_t next_sync_version(int64_t local, int64_t remote) {
    return std::max(local, remote) + 1;
}

void copy_scalars(ProjectState& into, const ProjectState& from) {
    into.model_description = from.model_description;
    into.revision_prompt = from.revision_prompt;
    into.selected_model_name = from.selected_model_name;
    into.current_history_item_id = from.current_history_item_id;
    into.has_saved_instance = from.has_saved_instance;
    into.generation_settings_json = from.generation_settings_json;
}

QJsonValue optional_value(const std::optional<std::string>& value) {
    return value ? QJsonValue(to_qstring(*value)) : QJsonValue(QJsonValue::Null);
}

QJsonValue settings_value(const std::string& json) {
    if (json.empty()) return QJsonValue(QJsonObject{});
    auto parsed = parse_json_object(QByteArray::fromStdString(json));
    return parsed.is_ok() ? QJsonValue(parsed.unwrap()) : QJsonValue(to_qstring(json));
}

} // namespace

Lineage merge_lineages(const Lineage& local, const Lineage& remote) {
    Lineage merged;
    merged.reserve(local.size() + remote.size());
    std::unordered_map<std::string, size_t> index;

    for (const auto& item : local) {
        const auto [it, inserted] = index.emplace(item.id, merged.size());
        if (inserted) {
            merged.push_back(item);
        }
    }

    for (const auto& item : remote) {
        const auto it = index.find(item.id);
        if (it == index.end()) {
            index.emplace(item.id, merged.size());
            merged.push_back(item);
            continue;
        }
        auto& existing = merged[it->second];
        if (revision_key(item) > revision_key(existing)) {
            existing = item;
        }
    }

    sort_chronologically(merged);
    return merged;
}

StylingMap merge_styling(const StylingMap& local, const StylingMap& remote) {
    StylingMap merged = local;
    for (const auto& [root, lineage] : remote) {
        const auto it = merged.find(root);
        if (it == merged.end()) {
            merged.emplace(root, sorted_chronologically(lineage));
        } else {
            it->second = merge_lineages(it->second, lineage);
        }
    }
    for (auto& [root, lineage] : merged) {
        if (remote.find(root) == remote.end()) {
            sort_chronologically(lineage);
        }
    }
    return merged;
}

std::vector<WardrobeItem> merge_wardrobes(const std::vector<WardrobeItem>& local,
                                          const std::vector<WardrobeItem>& remote) {
    std::vector<WardrobeItem> merged;
    merged.reserve(local.size() + remote.size());
    std::unordered_map<std::string, size_t> index;

    for (const auto& item : local) {
        if (index.emplace(item.id, merged.size()).second) {
            merged.push_back(item);
        }
    }
    for (const auto& item : remote) {
        const auto it = index.find(item.id);
        if (it == index.end()) {
            index.emplace(item.id, merged.size());
            merged.push_back(item);
        } else if (item.updated_at > merged[it->second].updated_at) {
            merged[it->second] = item;
        }
    }
    return merged;
}

ProjectState merge_states(const ProjectState& local,
                          const ProjectState& remote,
                          MergeStrategy strategy) {
    ProjectState merged;
    switch (strategy) {
        case MergeStrategy::PreferLocal:
            merged = local;
            break;
        case MergeStrategy::PreferRemote:
            merged = remote;
            merged.id = local.id.empty() ? remote.id : local.id;
            break;
        case MergeStrategy::Smart: {
            merged.id = local.id.empty() ? remote.id : local.id;
            const bool remote_newer = remote.updated_at >= local.updated_at;
            copy_scalars(merged, remote_newer ? remote : local);
            merged.generated_model_history =
                merge_lineages(local.generated_model_history, remote.generated_model_history);
            merged.styling_history = merge_styling(local.styling_history, remote.styling_history);
            merged.wardrobe = merge_wardrobes(local.wardrobe, remote.wardrobe);

            if (sync_debug_enabled()) {
                qCDebug(atelierMergeLog) << "smart merge" << QString::fromStdString(merged.id)
                                         << "scalars from" << (remote_newer ? "remote" : "local")
                                         << "history" << local.generated_model_history.size() << "+"
                                         << remote.generated_model_history.size() << "->"
                                         << merged.generated_model_history.size();
            }
            break;
        }
    }

    merged.updated_at = std::max(local.updated_at, remote.updated_at);
    merged.sync_version = next_sync_version(local.sync_version, remote.sync_version);
    return merged;
}

Project merge_projects(const Project& local, const Project& remote, MergeStrategy strategy) {
    Project merged;
    switch (strategy) {
        case MergeStrategy::PreferLocal:
            merged = local;
            break;
        case MergeStrategy::PreferRemote:
            merged = remote;
            break;
        case MergeStrategy::Smart:
            merged = remote.updated_at >= local.updated_at ? remote : local;
            break;
    }

    merged.id = local.id.empty() ? remote.id : local.id;
    if (merged.owner_id.empty()) {
        merged.owner_id = local.owner_id.empty() ? remote.owner_id : local.owner_id;
    }
    if (local.created_at.is_set() && remote.created_at.is_set()) {
        merged.created_at = std::min(local.created_at, remote.created_at);
    } else {
        merged.created_at = local.created_at.is_set() ? local.created_at : remote.created_at;
    }
    merged.updated_at = std::max(local.updated_at, remote.updated_at);
    merged.sync_version = next_sync_version(local.sync_version, remote.sync_version);
    return merged;
}

std::vector<MergeConflict> detect_conflicts(const ProjectState& local,
                                            const ProjectState& remote,
                                            std::chrono::milliseconds window,
                                            Timestamp now) {
    std::vector<MergeConflict> conflicts;

    const auto delta = std::llabs(local.updated_at.millis() - remote.updated_at.millis());
    if (delta < window.count()) {
        auto compare = [&](const char* field, const QJsonValue& l, const QJsonValue& r) {
            if (l != r) {
                conflicts.push_back(MergeConflict{field, l, r, now});
            }
        };
        compare("modelDescription", to_qstring(local.model_description), to_qstring(remote.model_description));
        compare("revisionPrompt", to_qstring(local.revision_prompt), to_qstring(remote.revision_prompt));
        compare("selectedModelName", to_qstring(local.selected_model_name), to_qstring(remote.selected_model_name));
        compare("currentHistoryItemId", optional_value(local.current_history_item_id),
                optional_value(remote.current_history_item_id));
        compare("hasSavedInstance", local.has_saved_instance, remote.has_saved_instance);
        compare("generationSettings", settings_value(local.generation_settings_json),
                settings_value(remote.generation_settings_json));
    }

    std::set<std::string> local_ids;
    std::set<std::string> remote_ids;
    for (const auto& item : local.generated_model_history) local_ids.insert(item.id);
    for (const auto& item : remote.generated_model_history) remote_ids.insert(item.id);

    QJsonArray only_local;
    QJsonArray only_remote;
    for (const auto& id : local_ids) {
        if (remote_ids.count(id) == 0) only_local.append(to_qstring(id));
    }
    for (const auto& id : remote_ids) {
        if (local_ids.count(id) == 0) only_remote.append(to_qstring(id));
    }
    if (!only_local.isEmpty() || !only_remote.isEmpty()) {
        conflicts.push_back(MergeConflict{"generatedModelHistory", only_local, only_remote, now});
    }

    if (!conflicts.empty()) {
        qCInfo(atelierMergeLog) << "Detected" << conflicts.size() << "conflicts for"
                                << QString::fromStdString(local.id);
    }
    return conflicts;
}

} // namespace atelier::sync
