#pragma once

#include "core/project.hpp"
#include "core/result.hpp"
#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <string>
#include <string_view>
#include <vector>

namespace atelier {

/**
 * JSON codec for the data model.
 *
 * The wire format uses camelCase field names and millisecond timestamps; it
 * is the format of Local Store rows, Remote Store documents and patches.
 * Unset optional fields are omitted, not written as null.
 */

[[nodiscard]] inline QString to_qstring(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

[[nodiscard]] inline std::string to_std(const QString& text) {
    return text.toStdString();
}

[[nodiscard]] QByteArray to_compact_json(const QJsonObject& object);
[[nodiscard]] Res<QJsonObject> parse_json_object(const QByteArray& bytes);

// History items
[[nodiscard]] QJsonObject to_json(const HistoryItem& item);
[[nodiscard]] Res<HistoryItem> history_item_from_json(const QJsonObject& object,
                                                      bool styling_partition);

[[nodiscard]] QJsonArray lineage_to_json(const Lineage& lineage);

/**
 * Decode every well-formed item of `array`. Items that fail to decode are
 * left out and their errors appended to `rejected` when given.
 */
[[nodiscard]] Lineage lineage_from_json(const QJsonArray& array,
                                        bool styling_partition,
                                        std::vector<Error>* rejected = nullptr);

// Wardrobe
[[nodiscard]] QJsonObject to_json(const WardrobeItem& item);
[[nodiscard]] Res<WardrobeItem> wardrobe_item_from_json(const QJsonObject& object);

// Projects
[[nodiscard]] QJsonObject to_json(const Project& project);
[[nodiscard]] Res<Project> project_from_json(const QJsonObject& object);

// Project state
[[nodiscard]] QJsonObject to_json(const ProjectState& state);
[[nodiscard]] Res<ProjectState> project_state_from_json(const QJsonObject& object,
                                                        std::vector<Error>* rejected = nullptr);

} // namespace atelier
