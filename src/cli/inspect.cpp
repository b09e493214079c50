#include "cli/inspect.hpp"

#include "core/codec.hpp"

#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>
#include <QStringList>

namespace atelier::cli {

namespace {

[[nodiscard]] QString render_id_suffix(const std::string& id, bool includeIds) {
    return includeIds ? (QStringLiteral(" (") + to_qstring(id) + QStringLiteral(")")) : QString{};
}

[[nodiscard]] QString render_item_line(const HistoryItem& item, int depth, bool includeIds) {
    const auto indent = QString(depth * 2, QLatin1Char(' '));
    QString line = indent + QStringLiteral("- [") + to_qstring(to_string(item.type)) + QStringLiteral("] ");
    line += item.name ? to_qstring(*item.name) : to_qstring(item.id);
    if (item.is_starred) {
        line += QStringLiteral(" *");
    }
    if (item.name) {
        line += render_id_suffix(item.id, includeIds);
    }
    return line;
}

using ChildIndex = QHash<QString, QList<const HistoryItem*>>;

struct Forest {
    QList<const HistoryItem*> roots;
    ChildIndex children;
};

[[nodiscard]] Forest build_forest(const Lineage& items) {
    QSet<QString> ids;
    for (const auto& item : items) {
        ids.insert(to_qstring(item.id));
    }

    Forest forest;
    for (const auto& item : items) {
        const auto parent = item.parent_id ? to_qstring(*item.parent_id) : QString{};
        if (parent.isEmpty() || !ids.contains(parent)) {
            forest.roots.append(&item);
        } else {
            forest.children[parent].append(&item);
        }
    }
    return forest;
}

void render_subtree(QStringList& out,
                    const ChildIndex& children,
                    const HistoryItem& parent,
                    int depth,
                    bool includeIds,
                    QSet<QString>& path) {
    for (const auto* child : children.value(to_qstring(parent.id))) {
        out.append(render_item_line(*child, depth, includeIds));
        const auto id = to_qstring(child->id);
        if (path.contains(id)) {
            continue;
        }
        path.insert(id);
        render_subtree(out, children, *child, depth + 1, includeIds, path);
        path.remove(id);
    }
}

[[nodiscard]] QJsonObject item_to_json(const HistoryItem& item, bool includeIds) {
    QJsonObject obj;
    if (includeIds) {
        obj.insert(QStringLiteral("id"), to_qstring(item.id));
    }
    obj.insert(QStringLiteral("type"), to_qstring(to_string(item.type)));
    if (item.name) {
        obj.insert(QStringLiteral("name"), to_qstring(*item.name));
    }
    obj.insert(QStringLiteral("isStarred"), item.is_starred);
    obj.insert(QStringLiteral("children"), QJsonArray{});
    return obj;
}

[[nodiscard]] QJsonArray render_subtree_json(const ChildIndex& children,
                                             const HistoryItem& parent,
                                             bool includeIds,
                                             QSet<QString>& path) {
    QJsonArray out;
    for (const auto* child : children.value(to_qstring(parent.id))) {
        auto obj = item_to_json(*child, includeIds);
        const auto id = to_qstring(child->id);
        if (!path.contains(id)) {
            path.insert(id);
            obj.insert(QStringLiteral("children"), render_subtree_json(children, *child, includeIds, path));
            path.remove(id);
        }
        out.append(obj);
    }
    return out;
}

} // namespace

QString format_project_list(const std::vector<Project>& projects, const InspectOptions& options) {
    QStringList out;
    for (const auto& project : projects) {
        const auto title = project.title.empty() ? QStringLiteral("(untitled)") : to_qstring(project.title);
        out.append(title + QStringLiteral(" [") + to_qstring(to_string(project.status)) + QStringLiteral("] v")
                   + QString::number(project.sync_version) + render_id_suffix(project.id, options.includeIds));
    }
    return out.isEmpty() ? QString{} : out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_project_list_json(const std::vector<Project>& projects, const InspectOptions& options) {
    QJsonArray rows;
    for (const auto& project : projects) {
        QJsonObject obj;
        if (options.includeIds) {
            obj.insert(QStringLiteral("id"), to_qstring(project.id));
        }
        obj.insert(QStringLiteral("title"), to_qstring(project.title));
        obj.insert(QStringLiteral("status"), to_qstring(to_string(project.status)));
        obj.insert(QStringLiteral("syncVersion"), static_cast<qint64>(project.sync_version));
        obj.insert(QStringLiteral("updatedAt"), to_qstring(project.updated_at.to_iso_string()));
        rows.append(obj);
    }
    QJsonObject root;
    root.insert(QStringLiteral("projects"), rows);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString format_history_tree(const ProjectState& state, const InspectOptions& options) {
    const auto items = sorted_chronologically(all_history_items(state));
    const auto forest = build_forest(items);

    QStringList out;
    QSet<QString> path;
    for (const auto* root : forest.roots) {
        out.append(render_item_line(*root, 0, options.includeIds));
        const auto id = to_qstring(root->id);
        path.insert(id);
        render_subtree(out, forest.children, *root, 1, options.includeIds, path);
        path.remove(id);
    }
    return out.isEmpty() ? QString{} : out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_history_tree_json(const ProjectState& state, const InspectOptions& options) {
    const auto items = sorted_chronologically(all_history_items(state));
    const auto forest = build_forest(items);

    QJsonArray roots;
    QSet<QString> path;
    for (const auto* root : forest.roots) {
        auto obj = item_to_json(*root, options.includeIds);
        const auto id = to_qstring(root->id);
        path.insert(id);
        obj.insert(QStringLiteral("children"), render_subtree_json(forest.children, *root, options.includeIds, path));
        path.remove(id);
        roots.append(obj);
    }

    QJsonObject doc;
    doc.insert(QStringLiteral("projectId"), to_qstring(state.id));
    doc.insert(QStringLiteral("history"), roots);
    return QString::fromUtf8(QJsonDocument(doc).toJson(QJsonDocument::Indented));
}

Res<std::vector<ValidationFinding>> validate_store(storage::LocalStore& store, const sync::ValidationGate& gate) {
    auto ids = store.list_state_ids();
    if (ids.is_err()) {
        return Res<std::vector<ValidationFinding>>::err(ids.unwrap_err());
    }

    std::vector<ValidationFinding> findings;
    for (const auto& id : ids.unwrap()) {
        auto state = store.get_state(id);
        if (state.is_err()) {
            findings.push_back({id, state.unwrap_err().message});
            continue;
        }
        if (!state.unwrap()) continue;

        auto valid = gate.validate(to_json(*state.unwrap()));
        if (valid.is_err()) {
            findings.push_back({id, valid.unwrap_err().message});
        }
        auto structure = validate_lineage(all_history_items(*state.unwrap()));
        if (structure.is_err()) {
            findings.push_back({id, structure.unwrap_err().message});
        }
        for (const auto& item : all_history_items(*state.unwrap())) {
            auto check = sync::ValidationGate::check_history_item(item);
            if (check.is_err()) {
                findings.push_back({id, check.unwrap_err().message});
            }
        }
    }
    return Res<std::vector<ValidationFinding>>::ok(std::move(findings));
}

QString format_findings(const std::vector<ValidationFinding>& findings) {
    QStringList out;
    for (const auto& finding : findings) {
        out.append(to_qstring(finding.project_id) + QStringLiteral(": ") + to_qstring(finding.reason));
    }
    return out.isEmpty() ? QString{} : out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace atelier::cli
