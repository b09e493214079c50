#include "core/history.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace atelier {

std::string_view to_string(HistoryItemType type) noexcept {
    switch (type) {
        case HistoryItemType::ModelGeneration: return "model-generation";
        case HistoryItemType::ModelRevision: return "model-revision";
        case HistoryItemType::TryOn: return "try-on";
        case HistoryItemType::TryOnRevision: return "try-on-revision";
    }
    return "model-generation";
}

std::optional<HistoryItemType> parse_history_item_type(std::string_view text) noexcept {
    if (text == "model-generation") return HistoryItemType::ModelGeneration;
    if (text == "model-revision") return HistoryItemType::ModelRevision;
    if (text == "try-on") return HistoryItemType::TryOn;
    if (text == "try-on-revision") return HistoryItemType::TryOnRevision;
    return std::nullopt;
}

int64_t order_key(const HistoryItem& item) noexcept {
    if (item.created_at.is_set()) {
        return item.created_at.millis();
    }
    return id_suffix_millis(item.id);
}

int64_t revision_key(const HistoryItem& item) noexcept {
    if (item.updated_at.is_set()) {
        return item.updated_at.millis();
    }
    return order_key(item);
}

void sort_chronologically(Lineage& lineage) {
    std::stable_sort(lineage.begin(), lineage.end(),
                     [](const HistoryItem& a, const HistoryItem& b) {
                         const auto ka = order_key(a);
                         const auto kb = order_key(b);
                         return ka != kb ? ka < kb : a.id < b.id;
                     });
}

Lineage sorted_chronologically(Lineage lineage) {
    sort_chronologically(lineage);
    return lineage;
}

const HistoryItem* find_item(const Lineage& lineage, std::string_view id) noexcept {
    const auto it = std::find_if(lineage.begin(), lineage.end(),
                                 [&](const HistoryItem& item) { return item.id == id; });
    return it == lineage.end() ? nullptr : &*it;
}

HistoryItem* find_item(Lineage& lineage, std::string_view id) noexcept {
    const auto it = std::find_if(lineage.begin(), lineage.end(),
                                 [&](const HistoryItem& item) { return item.id == id; });
    return it == lineage.end() ? nullptr : &*it;
}

namespace {

using ParentIndex = std::unordered_map<std::string, const HistoryItem*>;

ParentIndex index_by_id(const Lineage& lineage) {
    ParentIndex index;
    index.reserve(lineage.size());
    for (const auto& item : lineage) {
        index.emplace(item.id, &item);
    }
    return index;
}

Res<EntityId> walk_to_root(const ParentIndex& index, std::string_view id) {
    std::string current(id);
    // A chain longer than the number of nodes must revisit one of them.
    for (size_t hops = 0; hops <= index.size(); ++hops) {
        const auto it = index.find(current);
        if (it == index.end() || !it->second->parent_id || it->second->parent_id->empty()) {
            return Res<EntityId>::ok(current);
        }
        const auto& parent = *it->second->parent_id;
        if (index.find(parent) == index.end()) {
            return Res<EntityId>::ok(current);
        }
        current = parent;
    }
    return Res<EntityId>::err(Error{ErrorCode::MalformedEntity,
                                    "lineage cycle reached from " + std::string(id)});
}

} // namespace

Res<EntityId> resolve_root(const Lineage& lineage, std::string_view id) {
    return walk_to_root(index_by_id(lineage), id);
}

Result<void, Error> validate_lineage(const Lineage& lineage) {
    std::unordered_set<std::string> seen;
    for (const auto& item : lineage) {
        if (item.id.empty()) {
            return Result<void, Error>::err(Error{ErrorCode::MalformedEntity,
                                                  "history item without id"});
        }
        if (!seen.insert(item.id).second) {
            return Result<void, Error>::err(Error{ErrorCode::MalformedEntity,
                                                  "duplicate history item " + item.id});
        }
    }

    const auto index = index_by_id(lineage);
    for (const auto& item : lineage) {
        auto root = walk_to_root(index, item.id);
        if (root.is_err()) {
            return Result<void, Error>::err(root.unwrap_err());
        }
        if (root.unwrap() != item.base_model_id) {
            return Result<void, Error>::err(Error{
                ErrorCode::MalformedEntity,
                "history item " + item.id + " has baseModelId " + item.base_model_id +
                    " but resolves to " + root.unwrap()});
        }
    }
    return Result<void, Error>::ok();
}

void infer_missing_type(HistoryItem& item, bool styling_partition) {
    const bool is_root = !item.parent_id || item.parent_id->empty();
    if (styling_partition) {
        item.type = is_root ? HistoryItemType::TryOn : HistoryItemType::TryOnRevision;
    } else {
        item.type = is_root ? HistoryItemType::ModelGeneration : HistoryItemType::ModelRevision;
    }
}

HistoryItem create_root_item(EntityId id,
                             HistoryItemType type,
                             std::string image_url,
                             Timestamp created_at) {
    HistoryItem item;
    item.base_model_id = id;
    item.id = std::move(id);
    item.type = type;
    item.image_url = std::move(image_url);
    item.created_at = created_at;
    return item;
}

HistoryItem create_child_item(const HistoryItem& parent,
                              EntityId id,
                              HistoryItemType type,
                              std::string image_url,
                              Timestamp created_at) {
    HistoryItem item;
    item.id = std::move(id);
    item.parent_id = parent.id;
    item.base_model_id = parent.base_model_id.empty() ? parent.id : parent.base_model_id;
    item.type = type;
    item.image_url = std::move(image_url);
    item.model_name = parent.model_name;
    item.created_at = created_at;
    return item;
}

HistoryItem with_name(HistoryItem item, std::optional<std::string> name) {
    item.name = std::move(name);
    item.updated_at = Timestamp::now();
    return item;
}

HistoryItem with_starred(HistoryItem item, bool starred) {
    item.is_starred = starred;
    item.updated_at = Timestamp::now();
    return item;
}

} // namespace atelier
