#include "sync/remote_project.hpp"

#include "core/codec.hpp"
#include "core/logging.hpp"

#include <QJsonArray>
#include <memory>

namespace atelier::sync {

namespace {

using network::DocumentSnapshot;
using network::RemoteStore;
using network::WriteMode;

const QStringList kScalarStateFields = {
    QStringLiteral("modelDescription"),
    QStringLiteral("revisionPrompt"),
    QStringLiteral("selectedModelName"),
    QStringLiteral("currentHistoryItemId"),
    QStringLiteral("hasSavedInstance"),
    QStringLiteral("generationSettings"),
};

/**
 * Everything stored remotely for one project, undecoded.
 */
struct RawProject {
    std::optional<QJsonObject> document;
    std::vector<DocumentSnapshot> history;
    std::map<EntityId, std::vector<DocumentSnapshot>> styling;
    std::vector<DocumentSnapshot> wardrobe;
};

/**
 * Completion of N parallel calls; the first error wins.
 */
struct Join {
    size_t remaining = 0;
    std::optional<Error> error;
    std::function<void(std::optional<Error>)> finish;

    void arrive(const std::optional<Error>& e) {
        if (e && !error) error = e;
        if (--remaining == 0) finish(error);
    }
};

QJsonArray to_array(const std::vector<DocumentSnapshot>& docs) {
    QJsonArray array;
    for (const auto& doc : docs) {
        auto data = doc.data;
        if (!data.contains(QStringLiteral("id"))) {
            data.insert(QStringLiteral("id"), to_qstring(doc.id));
        }
        array.append(data);
    }
    return array;
}

Lineage decode_lineage(const std::vector<DocumentSnapshot>& docs, bool styling, const EntityId& project_id) {
    std::vector<Error> rejected;
    auto lineage = lineage_from_json(to_array(docs), styling, &rejected);
    for (const auto& error : rejected) {
        qCWarning(atelierRemoteLog) << "Skipping remote history document of" << to_qstring(project_id)
                                    << ":" << to_qstring(error.message);
    }
    sort_chronologically(lineage);
    return lineage;
}

std::set<EntityId> roots_of(const RawProject& raw, const std::vector<EntityId>& extra) {
    std::set<EntityId> roots(extra.begin(), extra.end());
    if (raw.document) {
        for (const auto& value : raw.document->value(QStringLiteral("stylingRootIds")).toArray()) {
            if (!value.toString().isEmpty()) roots.insert(to_std(value.toString()));
        }
    }
    for (const auto& doc : raw.history) {
        const auto base = doc.data.value(QStringLiteral("baseModelId")).toString();
        if (!base.isEmpty()) roots.insert(to_std(base));
    }
    return roots;
}

void fetch_raw(RemoteStore& store,
               const EntityId& project_id,
               std::vector<EntityId> extra_roots,
               std::function<void(Res<RawProject>)> done) {
    auto raw = std::make_shared<RawProject>();
    auto* s = &store;

    store.get(network::paths::project(project_id),
              [s, project_id, raw, extra_roots = std::move(extra_roots), done = std::move(done)](
                  Res<std::optional<QJsonObject>> document) mutable {
        if (document.is_err()) {
            done(Res<RawProject>::err(document.unwrap_err()));
            return;
        }
        raw->document = std::move(document).unwrap();

        s->list(network::paths::history(project_id),
                [s, project_id, raw, extra_roots = std::move(extra_roots), done = std::move(done)](
                    Res<std::vector<DocumentSnapshot>> history) mutable {
            if (history.is_err()) {
                done(Res<RawProject>::err(history.unwrap_err()));
                return;
            }
            raw->history = std::move(history).unwrap();

            const auto roots = roots_of(*raw, extra_roots);
            auto join = std::make_shared<Join>();
            join->remaining = roots.size() + 1;
            join->finish = [raw, done = std::move(done)](std::optional<Error> error) {
                if (error) {
                    done(Res<RawProject>::err(*error));
                    return;
                }
                done(Res<RawProject>::ok(std::move(*raw)));
            };

            for (const auto& root : roots) {
                s->list(network::paths::styling(project_id, root),
                        [raw, join, root](Res<std::vector<DocumentSnapshot>> docs) {
                    if (docs.is_err()) {
                        join->arrive(docs.unwrap_err());
                        return;
                    }
                    auto found = std::move(docs).unwrap();
                    if (!found.empty()) {
                        raw->styling[root] = std::move(found);
                    }
                    join->arrive(std::nullopt);
                });
            }

            s->list(network::paths::wardrobe(project_id),
                    [raw, join](Res<std::vector<DocumentSnapshot>> docs) {
                if (docs.is_err()) {
                    join->arrive(docs.unwrap_err());
                    return;
                }
                raw->wardrobe = std::move(docs).unwrap();
                join->arrive(std::nullopt);
            });
        });
    });
}

} // namespace

// ============================================================================
// Pure mapping
// ============================================================================

QJsonObject metadata_document(const Project& project, int64_t sync_version) {
    QJsonObject document = to_json(project);
    document.remove(QStringLiteral("updatedAt"));
    if (project.updated_at.is_set()) {
        document.insert(QStringLiteral("metadataUpdatedAt"), static_cast<qint64>(project.updated_at.millis()));
    }
    document.insert(QStringLiteral("syncVersion"), static_cast<qint64>(sync_version));
    return document;
}

QJsonObject project_document(const Project& project, const ProjectState& state, int64_t sync_version) {
    QJsonObject document = metadata_document(project, sync_version);

    const auto state_json = to_json(state);
    for (const auto& field : kScalarStateFields) {
        if (state_json.contains(field)) {
            document.insert(field, state_json.value(field));
        }
    }
    if (state.updated_at.is_set()) {
        document.insert(QStringLiteral("updatedAt"), static_cast<qint64>(state.updated_at.millis()));
    }

    QJsonArray roots;
    for (const auto& [root, lineage] : state.styling_history) {
        if (!lineage.empty()) roots.append(to_qstring(root));
    }
    document.insert(QStringLiteral("stylingRootIds"), roots);
    return document;
}

Res<RemoteProject> decode_project_document(const EntityId& project_id, const QJsonObject& document) {
    QJsonObject metadata = document;
    metadata.insert(QStringLiteral("id"), to_qstring(project_id));
    metadata.remove(QStringLiteral("updatedAt"));
    if (document.contains(QStringLiteral("metadataUpdatedAt"))) {
        metadata.insert(QStringLiteral("updatedAt"), document.value(QStringLiteral("metadataUpdatedAt")));
    }
    auto project = project_from_json(metadata);
    if (project.is_err()) {
        return Res<RemoteProject>::err(project.unwrap_err());
    }

    QJsonObject scalars;
    scalars.insert(QStringLiteral("id"), to_qstring(project_id));
    for (const auto& field : kScalarStateFields) {
        if (document.contains(field)) {
            scalars.insert(field, document.value(field));
        }
    }
    for (const auto& field : {QStringLiteral("updatedAt"), QStringLiteral("syncVersion")}) {
        if (document.contains(field)) {
            scalars.insert(field, document.value(field));
        }
    }
    auto state = project_state_from_json(scalars);
    if (state.is_err()) {
        return Res<RemoteProject>::err(state.unwrap_err());
    }

    RemoteProject remote;
    remote.project = std::move(project).unwrap();
    remote.state = std::move(state).unwrap();
    for (const auto& value : document.value(QStringLiteral("stylingRootIds")).toArray()) {
        remote.styling_root_ids.push_back(to_std(value.toString()));
    }
    return Res<RemoteProject>::ok(std::move(remote));
}

PushPlan plan_push(const Project& project,
                   const ProjectState& state,
                   int64_t sync_version,
                   const RemoteListing& existing) {
    PushPlan plan;
    plan.report.sync_version = sync_version;
    plan.batch.set(network::paths::project(state.id), project_document(project, state, sync_version),
                   WriteMode::Merge);

    auto write_lineage = [&](const std::string& collection,
                             const Lineage& lineage,
                             const std::set<std::string>* remote_ids) {
        std::set<std::string> local_ids;
        for (const auto& item : lineage) {
            local_ids.insert(item.id);
            auto check = ValidationGate::check_history_item(item);
            if (check.is_err()) {
                qCWarning(atelierSyncLog) << "Skipping" << to_qstring(collection) << "item:"
                                          << to_qstring(check.unwrap_err().message);
                ++plan.report.items_skipped;
                continue;
            }
            plan.batch.set(network::paths::document(collection, item.id), to_json(item), WriteMode::Replace);
            ++plan.report.items_written;
        }
        if (!remote_ids) return;
        for (const auto& id : *remote_ids) {
            if (local_ids.count(id) == 0) {
                plan.batch.remove(network::paths::document(collection, id));
                ++plan.report.orphans_removed;
            }
        }
    };

    write_lineage(network::paths::history(state.id), state.generated_model_history, &existing.history_ids);

    for (const auto& [root, lineage] : state.styling_history) {
        const auto it = existing.styling_ids.find(root);
        write_lineage(network::paths::styling(state.id, root), lineage,
                      it == existing.styling_ids.end() ? nullptr : &it->second);
    }
    for (const auto& [root, ids] : existing.styling_ids) {
        if (state.styling_history.count(root) > 0) continue;
        for (const auto& id : ids) {
            plan.batch.remove(network::paths::document(network::paths::styling(state.id, root), id));
            ++plan.report.orphans_removed;
        }
    }

    const auto wardrobe = network::paths::wardrobe(state.id);
    std::set<std::string> wardrobe_ids;
    for (const auto& item : state.wardrobe) {
        wardrobe_ids.insert(item.id);
        plan.batch.set(network::paths::document(wardrobe, item.id), to_json(item), WriteMode::Replace);
    }
    for (const auto& id : existing.wardrobe_ids) {
        if (wardrobe_ids.count(id) == 0) {
            plan.batch.remove(network::paths::document(wardrobe, id));
            ++plan.report.orphans_removed;
        }
    }
    return plan;
}

// ============================================================================
// Remote operations
// ============================================================================

void fetch_project(RemoteStore& store,
                   const EntityId& project_id,
                   const std::string& user_id,
                   FetchCallback done) {
    fetch_raw(store, project_id, {}, [project_id, user_id, done = std::move(done)](Res<RawProject> raw_result) {
        if (raw_result.is_err()) {
            done(Res<std::optional<RemoteProject>>::err(raw_result.unwrap_err()));
            return;
        }
        const auto& raw = raw_result.unwrap();
        if (!raw.document) {
            done(Res<std::optional<RemoteProject>>::ok(std::nullopt));
            return;
        }

        auto decoded = decode_project_document(project_id, *raw.document);
        if (decoded.is_err()) {
            done(Res<std::optional<RemoteProject>>::err(decoded.unwrap_err()));
            return;
        }
        auto remote = std::move(decoded).unwrap();
        if (!remote.project.owner_id.empty() && remote.project.owner_id != user_id) {
            done(Res<std::optional<RemoteProject>>::err(Error{
                ErrorCode::PermissionDenied, "project " + project_id + " belongs to another user"}));
            return;
        }

        remote.state.generated_model_history = decode_lineage(raw.history, false, project_id);
        for (const auto& [root, docs] : raw.styling) {
            auto lineage = decode_lineage(docs, true, project_id);
            if (!lineage.empty()) {
                remote.state.styling_history.emplace(root, std::move(lineage));
            }
        }
        for (const auto& doc : raw.wardrobe) {
            auto data = doc.data;
            if (!data.contains(QStringLiteral("id"))) data.insert(QStringLiteral("id"), to_qstring(doc.id));
            auto item = wardrobe_item_from_json(data);
            if (item.is_err()) {
                qCWarning(atelierRemoteLog) << "Skipping remote wardrobe document" << to_qstring(doc.id);
                continue;
            }
            remote.state.wardrobe.push_back(std::move(item).unwrap());
        }
        done(Res<std::optional<RemoteProject>>::ok(std::move(remote)));
    });
}

void fetch_listing(RemoteStore& store,
                   const EntityId& project_id,
                   std::vector<EntityId> local_roots,
                   std::function<void(Res<RemoteListing>)> done) {
    fetch_raw(store, project_id, std::move(local_roots), [done = std::move(done)](Res<RawProject> raw_result) {
        if (raw_result.is_err()) {
            done(Res<RemoteListing>::err(raw_result.unwrap_err()));
            return;
        }
        const auto& raw = raw_result.unwrap();
        RemoteListing listing;
        for (const auto& doc : raw.history) listing.history_ids.insert(doc.id);
        for (const auto& [root, docs] : raw.styling) {
            auto& ids = listing.styling_ids[root];
            for (const auto& doc : docs) ids.insert(doc.id);
        }
        for (const auto& doc : raw.wardrobe) listing.wardrobe_ids.insert(doc.id);
        done(Res<RemoteListing>::ok(std::move(listing)));
    });
}

void push_project(RemoteStore& store,
                  const ValidationGate& gate,
                  const Project& project,
                  const ProjectState& state,
                  int64_t sync_version,
                  PushCallback done) {
    auto* s = &store;
    fetch_listing(store, state.id, styling_root_ids(state),
                  [s, gate, project, state, sync_version, done = std::move(done)](Res<RemoteListing> listing) {
        if (listing.is_err()) {
            done(Res<PushReport>::err(listing.unwrap_err()));
            return;
        }

        auto plan = plan_push(project, state, sync_version, listing.unwrap());
        auto valid = gate.validate(plan.batch);
        if (valid.is_err()) {
            done(Res<PushReport>::err(valid.unwrap_err()));
            return;
        }

        const auto report = plan.report;
        s->commit(std::move(plan.batch), [report, done](Result<void, Error> result) {
            if (result.is_err()) {
                done(Res<PushReport>::err(result.unwrap_err()));
                return;
            }
            done(Res<PushReport>::ok(report));
        });
    });
}

void push_project_metadata(RemoteStore& store, const Project& project, int64_t sync_version, PushCallback done) {
    store.set(network::paths::project(project.id), metadata_document(project, sync_version), WriteMode::Merge,
              [sync_version, done = std::move(done)](Result<void, Error> result) {
        if (result.is_err()) {
            done(Res<PushReport>::err(result.unwrap_err()));
            return;
        }
        PushReport report;
        report.sync_version = sync_version;
        done(Res<PushReport>::ok(report));
    });
}

void delete_project(RemoteStore& store,
                    const EntityId& project_id,
                    std::vector<EntityId> local_roots,
                    std::function<void(Result<void, Error>)> done) {
    auto* s = &store;
    fetch_raw(store, project_id, std::move(local_roots),
              [s, project_id, done = std::move(done)](Res<RawProject> raw_result) {
        if (raw_result.is_err()) {
            done(Result<void, Error>::err(raw_result.unwrap_err()));
            return;
        }
        const auto& raw = raw_result.unwrap();

        network::WriteBatch batch;
        const auto history = network::paths::history(project_id);
        for (const auto& doc : raw.history) {
            batch.remove(network::paths::document(history, doc.id));
        }
        for (const auto& [root, docs] : raw.styling) {
            const auto styling = network::paths::styling(project_id, root);
            for (const auto& doc : docs) {
                batch.remove(network::paths::document(styling, doc.id));
            }
        }
        const auto wardrobe = network::paths::wardrobe(project_id);
        for (const auto& doc : raw.wardrobe) {
            batch.remove(network::paths::document(wardrobe, doc.id));
        }
        batch.remove(network::paths::project(project_id));

        qCInfo(atelierRemoteLog) << "Deleting project" << to_qstring(project_id) << "with"
                                 << batch.size() << "remote documents";
        s->commit(std::move(batch), std::move(done));
    });
}

void delete_history_item(RemoteStore& store,
                         const EntityId& project_id,
                         const RemovedNode& removed,
                         std::function<void(Result<void, Error>)> done) {
    const auto collection = removed.from_styling
                                ? network::paths::styling(project_id, removed.styling_root)
                                : network::paths::history(project_id);
    store.remove(network::paths::document(collection, removed.item.id), std::move(done));
}

void fetch_project_list(RemoteStore& store, const std::string& user_id, ProjectListCallback done) {
    store.query(std::string(network::paths::kProjects), QStringLiteral("ownerId"), QJsonValue(to_qstring(user_id)),
                [done = std::move(done)](Res<std::vector<DocumentSnapshot>> docs) {
        if (docs.is_err()) {
            done(Res<std::vector<Project>>::err(docs.unwrap_err()));
            return;
        }
        std::vector<Project> projects;
        for (const auto& doc : docs.unwrap()) {
            auto decoded = decode_project_document(doc.id, doc.data);
            if (decoded.is_err()) {
                qCWarning(atelierRemoteLog) << "Skipping remote project" << to_qstring(doc.id) << ":"
                                            << to_qstring(decoded.unwrap_err().message);
                continue;
            }
            projects.push_back(std::move(decoded).unwrap().project);
        }
        done(Res<std::vector<Project>>::ok(std::move(projects)));
    });
}

} // namespace atelier::sync
