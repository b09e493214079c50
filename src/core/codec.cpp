#include "core/codec.hpp"

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace atelier {

namespace {

const QStringList kWardrobeFields = {
    QStringLiteral("id"),
    QStringLiteral("name"),
    QStringLiteral("category"),
    QStringLiteral("url"),
    QStringLiteral("projectId"),
    QStringLiteral("updatedAt"),
};

Timestamp read_timestamp(const QJsonValue& value) {
    if (value.isDouble()) {
        return Timestamp(value.toInteger());
    }
    if (value.isString()) {
        const auto parsed = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
        if (parsed.isValid()) {
            return Timestamp(parsed.toMSecsSinceEpoch());
        }
    }
    return Timestamp{};
}

void write_timestamp(QJsonObject& object, const QString& key, Timestamp ts) {
    if (ts.is_set()) {
        object.insert(key, static_cast<qint64>(ts.millis()));
    }
}

std::optional<std::string> read_optional_string(const QJsonObject& object, const QString& key) {
    const auto value = object.value(key);
    if (!value.isString()) {
        return std::nullopt;
    }
    return to_std(value.toString());
}

std::vector<std::string> read_string_array(const QJsonValue& value) {
    std::vector<std::string> out;
    for (const auto& entry : value.toArray()) {
        if (entry.isString()) {
            out.push_back(to_std(entry.toString()));
        }
    }
    return out;
}

QJsonArray write_string_array(const std::vector<std::string>& values) {
    QJsonArray array;
    for (const auto& value : values) {
        array.append(to_qstring(value));
    }
    return array;
}

// Opaque JSON objects are held as canonical compact text so that equal
// content compares equal.
std::string read_opaque_object(const QJsonValue& value) {
    if (!value.isObject()) {
        return {};
    }
    return to_compact_json(value.toObject()).toStdString();
}

void write_opaque_object(QJsonObject& object, const QString& key, const std::string& json) {
    if (json.empty()) {
        return;
    }
    const auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(json));
    if (doc.isObject()) {
        object.insert(key, doc.object());
    }
}

Res<std::string> read_required_id(const QJsonObject& object, std::string_view what) {
    const auto value = object.value(QStringLiteral("id"));
    if (!value.isString() || value.toString().isEmpty()) {
        return Res<std::string>::err(Error{ErrorCode::MalformedEntity,
                                           std::string(what) + " without id"});
    }
    return Res<std::string>::ok(to_std(value.toString()));
}

} // namespace

QByteArray to_compact_json(const QJsonObject& object) {
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

Res<QJsonObject> parse_json_object(const QByteArray& bytes) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(bytes, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Res<QJsonObject>::err(Error{ErrorCode::MalformedEntity,
                                           "invalid JSON: " + to_std(parse_error.errorString())});
    }
    if (!doc.isObject()) {
        return Res<QJsonObject>::err(Error{ErrorCode::MalformedEntity,
                                           "JSON document is not an object"});
    }
    return Res<QJsonObject>::ok(doc.object());
}

// ============================================================================
// History items
// ============================================================================

QJsonObject to_json(const HistoryItem& item) {
    QJsonObject object;
    object.insert(QStringLiteral("id"), to_qstring(item.id));
    object.insert(QStringLiteral("parentId"),
                  item.parent_id ? QJsonValue(to_qstring(*item.parent_id)) : QJsonValue(QJsonValue::Null));
    object.insert(QStringLiteral("type"), to_qstring(to_string(item.type)));
    object.insert(QStringLiteral("imageUrl"), to_qstring(item.image_url));
    object.insert(QStringLiteral("baseModelId"), to_qstring(item.base_model_id));
    object.insert(QStringLiteral("isStarred"), item.is_starred);
    if (item.name) {
        object.insert(QStringLiteral("name"), to_qstring(*item.name));
    }
    object.insert(QStringLiteral("prompt"), to_qstring(item.prompt));
    object.insert(QStringLiteral("modelName"), to_qstring(item.model_name));
    write_opaque_object(object, QStringLiteral("settings"), item.settings_json);
    if (!item.outfit_garment_ids.empty()) {
        object.insert(QStringLiteral("outfitGarmentIds"), write_string_array(item.outfit_garment_ids));
    }
    if (item.source_template_id) {
        object.insert(QStringLiteral("sourceTemplateId"), to_qstring(*item.source_template_id));
    }
    write_timestamp(object, QStringLiteral("createdAt"), item.created_at);
    write_timestamp(object, QStringLiteral("updatedAt"), item.updated_at);
    return object;
}

Res<HistoryItem> history_item_from_json(const QJsonObject& object, bool styling_partition) {
    auto id = read_required_id(object, "history item");
    if (id.is_err()) {
        return Res<HistoryItem>::err(id.unwrap_err());
    }

    HistoryItem item;
    item.id = std::move(id).unwrap();
    item.parent_id = read_optional_string(object, QStringLiteral("parentId"));
    if (item.parent_id && item.parent_id->empty()) {
        item.parent_id.reset();
    }

    const auto type_text = to_std(object.value(QStringLiteral("type")).toString());
    if (type_text.empty()) {
        infer_missing_type(item, styling_partition);
    } else {
        const auto type = parse_history_item_type(type_text);
        if (!type) {
            return Res<HistoryItem>::err(Error{ErrorCode::MalformedEntity,
                                               "history item " + item.id + " has unknown type " + type_text});
        }
        item.type = *type;
    }

    item.image_url = to_std(object.value(QStringLiteral("imageUrl")).toString());
    item.base_model_id = to_std(object.value(QStringLiteral("baseModelId")).toString());
    item.is_starred = object.value(QStringLiteral("isStarred")).toBool(false);
    item.name = read_optional_string(object, QStringLiteral("name"));
    item.prompt = to_std(object.value(QStringLiteral("prompt")).toString());
    item.model_name = to_std(object.value(QStringLiteral("modelName")).toString());
    item.settings_json = read_opaque_object(object.value(QStringLiteral("settings")));
    item.outfit_garment_ids = read_string_array(object.value(QStringLiteral("outfitGarmentIds")));
    item.source_template_id = read_optional_string(object, QStringLiteral("sourceTemplateId"));
    item.created_at = read_timestamp(object.value(QStringLiteral("createdAt")));
    item.updated_at = read_timestamp(object.value(QStringLiteral("updatedAt")));
    return Res<HistoryItem>::ok(std::move(item));
}

QJsonArray lineage_to_json(const Lineage& lineage) {
    QJsonArray array;
    for (const auto& item : lineage) {
        array.append(to_json(item));
    }
    return array;
}

Lineage lineage_from_json(const QJsonArray& array,
                          bool styling_partition,
                          std::vector<Error>* rejected) {
    Lineage lineage;
    lineage.reserve(static_cast<size_t>(array.size()));
    for (const auto& entry : array) {
        if (!entry.isObject()) {
            if (rejected) {
                rejected->push_back(Error{ErrorCode::MalformedEntity, "history entry is not an object"});
            }
            continue;
        }
        auto item = history_item_from_json(entry.toObject(), styling_partition);
        if (item.is_err()) {
            if (rejected) rejected->push_back(item.unwrap_err());
            continue;
        }
        lineage.push_back(std::move(item).unwrap());
    }
    return lineage;
}

// ============================================================================
// Wardrobe
// ============================================================================

QJsonObject to_json(const WardrobeItem& item) {
    QJsonObject object;
    if (!item.attributes_json.empty()) {
        const auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(item.attributes_json));
        if (doc.isObject()) {
            object = doc.object();
        }
    }
    object.insert(QStringLiteral("id"), to_qstring(item.id));
    object.insert(QStringLiteral("name"), to_qstring(item.name));
    object.insert(QStringLiteral("category"), to_qstring(item.category));
    object.insert(QStringLiteral("url"), to_qstring(item.url));
    if (item.project_id) {
        object.insert(QStringLiteral("projectId"), to_qstring(*item.project_id));
    }
    write_timestamp(object, QStringLiteral("updatedAt"), item.updated_at);
    return object;
}

Res<WardrobeItem> wardrobe_item_from_json(const QJsonObject& object) {
    auto id = read_required_id(object, "wardrobe item");
    if (id.is_err()) {
        return Res<WardrobeItem>::err(id.unwrap_err());
    }

    WardrobeItem item;
    item.id = std::move(id).unwrap();
    item.name = to_std(object.value(QStringLiteral("name")).toString());
    item.category = to_std(object.value(QStringLiteral("category")).toString());
    item.url = to_std(object.value(QStringLiteral("url")).toString());
    item.project_id = read_optional_string(object, QStringLiteral("projectId"));
    item.updated_at = read_timestamp(object.value(QStringLiteral("updatedAt")));

    QJsonObject attributes = object;
    for (const auto& key : kWardrobeFields) {
        attributes.remove(key);
    }
    if (!attributes.isEmpty()) {
        item.attributes_json = to_compact_json(attributes).toStdString();
    }
    return Res<WardrobeItem>::ok(std::move(item));
}

// ============================================================================
// Projects
// ============================================================================

QJsonObject to_json(const Project& project) {
    QJsonObject object;
    object.insert(QStringLiteral("id"), to_qstring(project.id));
    object.insert(QStringLiteral("ownerId"), to_qstring(project.owner_id));
    object.insert(QStringLiteral("title"), to_qstring(project.title));
    object.insert(QStringLiteral("description"), to_qstring(project.description));
    object.insert(QStringLiteral("organization"), to_qstring(project.organization));
    object.insert(QStringLiteral("tags"), write_string_array(project.tags));
    object.insert(QStringLiteral("status"), to_qstring(to_string(project.status)));
    if (project.deadline) {
        object.insert(QStringLiteral("deadline"), to_qstring(*project.deadline));
    }
    write_timestamp(object, QStringLiteral("createdAt"), project.created_at);
    write_timestamp(object, QStringLiteral("updatedAt"), project.updated_at);
    object.insert(QStringLiteral("syncVersion"), static_cast<qint64>(project.sync_version));
    return object;
}

Res<Project> project_from_json(const QJsonObject& object) {
    auto id = read_required_id(object, "project");
    if (id.is_err()) {
        return Res<Project>::err(id.unwrap_err());
    }

    Project project;
    project.id = std::move(id).unwrap();
    project.owner_id = to_std(object.value(QStringLiteral("ownerId")).toString());
    project.title = to_std(object.value(QStringLiteral("title")).toString());
    project.description = to_std(object.value(QStringLiteral("description")).toString());
    project.organization = to_std(object.value(QStringLiteral("organization")).toString());
    project.tags = read_string_array(object.value(QStringLiteral("tags")));
    const auto status_text = to_std(object.value(QStringLiteral("status")).toString());
    project.status = parse_project_status(status_text).value_or(ProjectStatus::Draft);
    project.deadline = read_optional_string(object, QStringLiteral("deadline"));
    project.created_at = read_timestamp(object.value(QStringLiteral("createdAt")));
    project.updated_at = read_timestamp(object.value(QStringLiteral("updatedAt")));
    project.sync_version = object.value(QStringLiteral("syncVersion")).toInteger(0);
    return Res<Project>::ok(std::move(project));
}

// ============================================================================
// Project state
// ============================================================================

QJsonObject to_json(const ProjectState& state) {
    QJsonObject object;
    object.insert(QStringLiteral("id"), to_qstring(state.id));
    object.insert(QStringLiteral("modelDescription"), to_qstring(state.model_description));
    object.insert(QStringLiteral("revisionPrompt"), to_qstring(state.revision_prompt));
    object.insert(QStringLiteral("selectedModelName"), to_qstring(state.selected_model_name));
    object.insert(QStringLiteral("currentHistoryItemId"),
                  state.current_history_item_id ? QJsonValue(to_qstring(*state.current_history_item_id))
                                                : QJsonValue(QJsonValue::Null));
    object.insert(QStringLiteral("hasSavedInstance"), state.has_saved_instance);
    write_opaque_object(object, QStringLiteral("generationSettings"), state.generation_settings_json);
    object.insert(QStringLiteral("generatedModelHistory"), lineage_to_json(state.generated_model_history));

    QJsonObject styling;
    for (const auto& [root, lineage] : state.styling_history) {
        styling.insert(to_qstring(root), lineage_to_json(lineage));
    }
    object.insert(QStringLiteral("stylingHistory"), styling);

    QJsonArray wardrobe;
    for (const auto& item : state.wardrobe) {
        wardrobe.append(to_json(item));
    }
    object.insert(QStringLiteral("wardrobe"), wardrobe);

    write_timestamp(object, QStringLiteral("updatedAt"), state.updated_at);
    object.insert(QStringLiteral("syncVersion"), static_cast<qint64>(state.sync_version));
    return object;
}

Res<ProjectState> project_state_from_json(const QJsonObject& object, std::vector<Error>* rejected) {
    auto id = read_required_id(object, "project state");
    if (id.is_err()) {
        return Res<ProjectState>::err(id.unwrap_err());
    }

    ProjectState state;
    state.id = std::move(id).unwrap();
    state.model_description = to_std(object.value(QStringLiteral("modelDescription")).toString());
    state.revision_prompt = to_std(object.value(QStringLiteral("revisionPrompt")).toString());
    state.selected_model_name = to_std(object.value(QStringLiteral("selectedModelName")).toString());
    state.current_history_item_id = read_optional_string(object, QStringLiteral("currentHistoryItemId"));
    state.has_saved_instance = object.value(QStringLiteral("hasSavedInstance")).toBool(false);
    state.generation_settings_json = read_opaque_object(object.value(QStringLiteral("generationSettings")));
    state.generated_model_history = lineage_from_json(
        object.value(QStringLiteral("generatedModelHistory")).toArray(), false, rejected);

    const auto styling = object.value(QStringLiteral("stylingHistory")).toObject();
    for (auto it = styling.begin(); it != styling.end(); ++it) {
        auto lineage = lineage_from_json(it.value().toArray(), true, rejected);
        if (!lineage.empty()) {
            state.styling_history.emplace(to_std(it.key()), std::move(lineage));
        }
    }

    for (const auto& entry : object.value(QStringLiteral("wardrobe")).toArray()) {
        auto item = wardrobe_item_from_json(entry.toObject());
        if (item.is_err()) {
            if (rejected) rejected->push_back(item.unwrap_err());
            continue;
        }
        state.wardrobe.push_back(std::move(item).unwrap());
    }

    state.updated_at = read_timestamp(object.value(QStringLiteral("updatedAt")));
    state.sync_version = object.value(QStringLiteral("syncVersion")).toInteger(0);
    return Res<ProjectState>::ok(std::move(state));
}

} // namespace atelier
