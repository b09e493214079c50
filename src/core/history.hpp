#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atelier {

/**
 * HistoryItemType - What produced a lineage node.
 *
 * Generation types live in the primary lineage, styling types live in the
 * per-root styling partition.
 */
enum class HistoryItemType {
    ModelGeneration,
    ModelRevision,
    TryOn,
    TryOnRevision
};

[[nodiscard]] std::string_view to_string(HistoryItemType type) noexcept;
[[nodiscard]] std::optional<HistoryItemType> parse_history_item_type(std::string_view text) noexcept;

[[nodiscard]] constexpr bool is_styling_type(HistoryItemType type) noexcept {
    return type == HistoryItemType::TryOn || type == HistoryItemType::TryOnRevision;
}

/**
 * HistoryItem - A node in the lineage forest of generated artifacts.
 */
struct HistoryItem {
    EntityId id;
    std::optional<EntityId> parent_id;
    HistoryItemType type = HistoryItemType::ModelGeneration;
    std::string image_url;               // external reference, or data: before externalization
    EntityId base_model_id;              // root ancestor id
    bool is_starred = false;
    std::optional<std::string> name;
    std::string prompt;
    std::string model_name;
    std::string settings_json;           // opaque generation settings, compact JSON
    std::vector<std::string> outfit_garment_ids;
    std::optional<std::string> source_template_id;
    Timestamp created_at;                // unset on legacy items, see order_key()
    Timestamp updated_at;                // set by rename/star

    bool operator==(const HistoryItem&) const = default;
};

using Lineage = std::vector<HistoryItem>;

// ============================================================================
// Ordering
// ============================================================================

/**
 * Chronological key: the explicit creation time, falling back to the
 * timestamp encoded in the id suffix.
 */
[[nodiscard]] int64_t order_key(const HistoryItem& item) noexcept;

/**
 * Recency key used for newer-wins comparisons between two versions of the
 * same item.
 */
[[nodiscard]] int64_t revision_key(const HistoryItem& item) noexcept;

/**
 * Chronological sort by order_key(), equal keys ordered by id.
 */
void sort_chronologically(Lineage& lineage);

[[nodiscard]] Lineage sorted_chronologically(Lineage lineage);

// ============================================================================
// Lineage structure
// ============================================================================

[[nodiscard]] const HistoryItem* find_item(const Lineage& lineage, std::string_view id) noexcept;
[[nodiscard]] HistoryItem* find_item(Lineage& lineage, std::string_view id) noexcept;

/**
 * Follow parent links from `id` to its root. A parent that is not part of the
 * lineage ends the walk at the last node found. The walk is bounded by the
 * lineage size; a cycle is reported as MalformedEntity.
 */
[[nodiscard]] Res<EntityId> resolve_root(const Lineage& lineage, std::string_view id);

/**
 * Check every node: unique ids, acyclic parent chains, and base_model_id
 * equal to the resolved root.
 */
[[nodiscard]] Result<void, Error> validate_lineage(const Lineage& lineage);

/**
 * Assign a type to legacy items that were stored before types existed.
 */
void infer_missing_type(HistoryItem& item, bool styling_partition);

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] HistoryItem create_root_item(EntityId id,
                                           HistoryItemType type,
                                           std::string image_url,
                                           Timestamp created_at = Timestamp::now());

[[nodiscard]] HistoryItem create_child_item(const HistoryItem& parent,
                                            EntityId id,
                                            HistoryItemType type,
                                            std::string image_url,
                                            Timestamp created_at = Timestamp::now());

[[nodiscard]] HistoryItem with_name(HistoryItem item, std::optional<std::string> name);

[[nodiscard]] HistoryItem with_starred(HistoryItem item, bool starred);

} // namespace atelier
