#include "sync/sync_engine.hpp"

#include "core/codec.hpp"
#include "core/logging.hpp"
#include "crypto/digest.hpp"

#include <QJsonArray>
#include <QPointer>
#include <QSysInfo>
#include <algorithm>
#include <memory>
#include <set>

namespace atelier::sync {

std::string_view to_string(SyncStatus status) noexcept {
    switch (status) {
        case SyncStatus::Synced: return "synced";
        case SyncStatus::Pending: return "pending";
        case SyncStatus::Syncing: return "syncing";
        case SyncStatus::Error: return "error";
        case SyncStatus::Conflict: return "conflict";
        case SyncStatus::Offline: return "offline";
    }
    return "error";
}

namespace {

// A callback that outlived its engine or its session.
bool is_stale(const QPointer<SyncEngine>& self, uint64_t session) {
    return !self || self->session() != session;
}

Error session_closed(const EntityId& id) {
    return Error{ErrorCode::SessionClosed, "session ended before the operation on " + id + " completed"};
}

/**
 * Fingerprint of everything a push sends, syncVersion excluded.
 */
std::string payload_digest(const Project& project, const ProjectState& state) {
    auto document = project_document(project, state, 0);
    document.remove(QStringLiteral("syncVersion"));
    document.insert(QStringLiteral("generatedModelHistory"), lineage_to_json(state.generated_model_history));

    QJsonObject styling;
    for (const auto& [root, lineage] : state.styling_history) {
        styling.insert(to_qstring(root), lineage_to_json(lineage));
    }
    document.insert(QStringLiteral("stylingHistory"), styling);

    QJsonArray wardrobe;
    for (const auto& item : state.wardrobe) {
        wardrobe.append(to_json(item));
    }
    document.insert(QStringLiteral("wardrobe"), wardrobe);

    const auto bytes = to_compact_json(document);
    return crypto::digest_hex(std::string_view(bytes.constData(), static_cast<size_t>(bytes.size())));
}

struct InlinePayload {
    QByteArray bytes;
    QString content_type;
};

// "data:image/png;base64,iVBOR..." -> bytes + "image/png"
std::optional<InlinePayload> parse_data_url(const std::string& url) {
    const auto text = to_qstring(url);
    if (!is_inline_binary(text)) return std::nullopt;
    const auto comma = text.indexOf(QLatin1Char(','));
    if (comma < 0) return std::nullopt;

    const auto header = text.mid(5, comma - 5).split(QLatin1Char(';'));
    const auto payload = text.mid(comma + 1).toLatin1();

    InlinePayload parsed;
    parsed.content_type = header.value(0).isEmpty() ? QStringLiteral("application/octet-stream") : header.value(0);
    if (header.contains(QStringLiteral("base64"), Qt::CaseInsensitive)) {
        auto decoded = QByteArray::fromBase64Encoding(payload, QByteArray::AbortOnBase64DecodingErrors);
        if (!decoded) return std::nullopt;
        parsed.bytes = decoded.decoded;
    } else {
        parsed.bytes = QByteArray::fromPercentEncoding(payload);
    }
    return parsed;
}

int replace_image_urls(ProjectState& state, const std::map<std::string, std::string>& replacements) {
    int replaced = 0;
    auto swap = [&](std::string& url) {
        const auto it = replacements.find(url);
        if (it == replacements.end()) return;
        url = it->second;
        ++replaced;
    };
    for (auto& item : state.generated_model_history) swap(item.image_url);
    for (auto& [root, lineage] : state.styling_history) {
        for (auto& item : lineage) swap(item.image_url);
    }
    for (auto& item : state.wardrobe) swap(item.url);
    return replaced;
}

} // namespace

SyncEngine::SyncEngine(storage::LocalStore& local,
                       network::RemoteStore& remote,
                       network::BlobStore& blobs,
                       EngineConfig config,
                       QObject* parent)
    : QObject(parent)
    , local_(local)
    , remote_(remote)
    , blobs_(blobs)
    , config_(std::move(config))
    , gate_(config_.max_document_bytes)
    , queue_(std::make_unique<WriteQueue>(config_.debounce)) {
    queue_->set_dispatcher([this](const EntityId& id, WriteDone done) {
        push(id, std::move(done));
    });

    SubscriptionHandlers handlers;
    handlers.on_project = [this](const EntityId& id, const std::optional<QJsonObject>& document) {
        on_remote_project(id, document);
    };
    handlers.on_styling = [this](const EntityId& id, const EntityId& root_id, const Lineage& styling) {
        on_remote_styling(id, root_id, styling);
    };
    subscriptions_ = std::make_unique<SubscriptionManager>(remote_, std::move(handlers));
}

SyncEngine::~SyncEngine() {
    teardown();
}

// ============================================================================
// Session
// ============================================================================

Result<void, Error> SyncEngine::init(const network::Identity& identity) {
    if (identity.user_id.empty()) {
        return Result<void, Error>::err(Error{ErrorCode::PermissionDenied, "identity without a user id"});
    }
    if (identity_ && *identity_ == identity) {
        return Result<void, Error>::ok();
    }
    if (identity_) {
        teardown();
    }

    auto sodium = crypto::init();
    if (sodium.is_err()) {
        return sodium;
    }

    identity_ = identity;
    ++session_;
    qCInfo(atelierSyncLog) << "Sync session" << session_ << "started for" << to_qstring(identity.user_id);
    return Result<void, Error>::ok();
}

void SyncEngine::teardown() {
    if (!identity_) return;
    queue_->cancel_all();
    subscriptions_->close_all();
    withheld_.clear();
    statuses_.clear();
    identity_.reset();
    ++session_;
    qCInfo(atelierSyncLog) << "Sync session ended";
}

Result<void, Error> SyncEngine::require_session() const {
    if (!identity_) {
        return Result<void, Error>::err(Error{ErrorCode::SessionClosed, "no active sync session"});
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Local-first writes
// ============================================================================

Result<void, Error> SyncEngine::store_local(ProjectState& state) {
    if (state.id.empty()) {
        return Result<void, Error>::err(Error{ErrorCode::MalformedEntity, "project state without id"});
    }
    state.updated_at = Timestamp::now();
    return local_.put_state(state);
}

Result<void, Error> SyncEngine::queue_push(const ProjectState& state) {
    auto valid = ValidationGate::check_inline(to_json(state));
    if (valid.is_err()) {
        qCWarning(atelierSyncLog) << "Not queueing" << to_qstring(state.id) << ":"
                                  << to_qstring(valid.unwrap_err().message);
        set_status(state.id, SyncStatus::Error);
        return valid;
    }
    if (identity_) {
        queue_->enqueue(state.id);
        set_status(state.id, SyncStatus::Pending);
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SyncEngine::commit_local(ProjectState& state) {
    auto stored = store_local(state);
    if (stored.is_err()) {
        return stored;
    }
    return queue_push(state);
}

Res<ProjectState> SyncEngine::save_entity(const EntityId& id, const QJsonObject& patch) {
    auto current = local_.get_state(id);
    if (current.is_err()) {
        return Res<ProjectState>::err(current.unwrap_err());
    }
    const auto state = std::move(current).unwrap().value_or(make_empty_state(id));

    QJsonObject json = to_json(state);
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        json.insert(it.key(), it.value());
    }
    json.insert(QStringLiteral("id"), to_qstring(id));

    std::vector<Error> rejected;
    auto patched = project_state_from_json(json, &rejected);
    if (patched.is_err()) {
        return patched;
    }
    if (!rejected.empty()) {
        return Res<ProjectState>::err(Error{ErrorCode::MalformedEntity,
                                            "patch for " + id + ": " + rejected.front().message});
    }

    auto next = std::move(patched).unwrap();
    next.sync_version = state.sync_version;
    auto committed = commit_local(next);
    if (committed.is_err()) {
        return Res<ProjectState>::err(committed.unwrap_err());
    }
    return Res<ProjectState>::ok(std::move(next));
}

Result<void, Error> SyncEngine::save_state(ProjectState state) {
    return commit_local(state);
}

Result<void, Error> SyncEngine::save_project(Project project) {
    if (project.id.empty()) {
        return Result<void, Error>::err(Error{ErrorCode::MalformedEntity, "project without id"});
    }
    if (project.owner_id.empty() && identity_) {
        project.owner_id = identity_->user_id;
    }
    project.updated_at = Timestamp::now();
    if (!project.created_at.is_set()) {
        project.created_at = project.updated_at;
    }

    auto stored = local_.put_project(project);
    if (stored.is_err()) {
        return stored;
    }
    if (identity_) {
        queue_->enqueue(project.id);
        set_status(project.id, SyncStatus::Pending);
    }
    return Result<void, Error>::ok();
}

void SyncEngine::create_project(Project project, ProjectState state, std::function<void(Result<void, Error>)> done) {
    auto session = require_session();
    if (session.is_err()) {
        done(session);
        return;
    }
    if (state.id.empty()) {
        state.id = project.id;
    }
    if (project.id.empty() || state.id != project.id) {
        done(Result<void, Error>::err(Error{ErrorCode::MalformedEntity, "project and state ids differ"}));
        return;
    }

    if (project.owner_id.empty()) {
        project.owner_id = identity_->user_id;
    }
    project.updated_at = Timestamp::now();
    if (!project.created_at.is_set()) {
        project.created_at = project.updated_at;
    }
    auto stored = local_.put_project(project);
    if (stored.is_err()) {
        done(stored);
        return;
    }
    auto committed = commit_local(state);
    if (committed.is_err()) {
        done(committed);
        return;
    }

    qCInfo(atelierSyncLog) << "Created project" << to_qstring(project.id);
    force_flush(project.id, [done = std::move(done)](Res<FlushOutcome> flushed) {
        if (flushed.is_err()) {
            done(Result<void, Error>::err(flushed.unwrap_err()));
            return;
        }
        done(Result<void, Error>::ok());
    });
}

Result<void, Error> SyncEngine::save_unified_history(const EntityId& project_id,
                                                     const EntityId& root_id,
                                                     const Lineage& lineage) {
    auto current = local_.get_state(project_id);
    if (current.is_err()) {
        return Result<void, Error>::err(current.unwrap_err());
    }
    auto state = std::move(current).unwrap().value_or(make_empty_state(project_id));
    save_unified(state, root_id, lineage);
    return commit_local(state);
}

Res<Lineage> SyncEngine::load_unified_history(const EntityId& project_id, const EntityId& root_id) {
    auto current = local_.get_state(project_id);
    if (current.is_err()) {
        return Res<Lineage>::err(current.unwrap_err());
    }
    const auto& state = current.unwrap();
    if (!state) {
        return Res<Lineage>::err(Error{ErrorCode::NotFound, "no project state " + project_id});
    }
    return Res<Lineage>::ok(load_unified(*state, root_id));
}

// ============================================================================
// Push
// ============================================================================

void SyncEngine::push(const EntityId& id, WriteDone done) {
    if (!identity_) {
        done(Result<void, Error>::err(session_closed(id)));
        return;
    }

    auto stored_state = local_.get_state(id);
    if (stored_state.is_err()) {
        qCWarning(atelierStoreLog) << "Cannot push" << to_qstring(id) << ":"
                                   << to_qstring(stored_state.unwrap_err().message);
        set_status(id, SyncStatus::Error);
        done(Result<void, Error>::err(stored_state.unwrap_err()));
        return;
    }
    auto stored_project = local_.get_project(id);
    if (stored_project.is_err()) {
        qCWarning(atelierStoreLog) << "Cannot push" << to_qstring(id) << ":"
                                   << to_qstring(stored_project.unwrap_err().message);
        set_status(id, SyncStatus::Error);
        done(Result<void, Error>::err(stored_project.unwrap_err()));
        return;
    }
    if (!stored_state.unwrap() && !stored_project.unwrap()) {
        done(Result<void, Error>::err(Error{ErrorCode::NotFound, "nothing stored for " + id}));
        return;
    }

    const auto state = stored_state.unwrap().value_or(make_empty_state(id));
    auto project = stored_project.unwrap().value_or(make_project(id, identity_->user_id, "", state.updated_at));
    if (project.owner_id.empty()) {
        project.owner_id = identity_->user_id;
    }
    if (project.owner_id != identity_->user_id) {
        const Error error{ErrorCode::PermissionDenied, "project " + id + " is owned by " + project.owner_id};
        report_remote_failure(id, error);
        done(Result<void, Error>::err(error));
        return;
    }

    auto valid = ValidationGate::check_inline(to_json(state));
    if (valid.is_err()) {
        qCWarning(atelierSyncLog) << "Push of" << to_qstring(id) << "rejected:"
                                  << to_qstring(valid.unwrap_err().message);
        set_status(id, SyncStatus::Error);
        done(valid);
        return;
    }

    auto record = local_.get_sync_record(id);
    if (record.is_err()) {
        set_status(id, SyncStatus::Error);
        done(Result<void, Error>::err(record.unwrap_err()));
        return;
    }
    const auto& last = record.unwrap();
    const auto digest = payload_digest(project, state);
    if (last && last->digest == digest) {
        if (sync_debug_enabled()) {
            qCDebug(atelierSyncLog) << "Push of" << to_qstring(id) << "skipped, payload unchanged";
        }
        set_status(id, SyncStatus::Synced);
        done(Result<void, Error>::ok());
        return;
    }

    const int64_t version = std::max({state.sync_version, project.sync_version,
                                      last ? last->remote_version : int64_t{0}}) + 1;
    set_status(id, SyncStatus::Syncing);

    QPointer<SyncEngine> self(this);
    const auto session = session_;
    PushCallback on_pushed = [self, session, id, digest, done = std::move(done)](Res<PushReport> report) {
        if (is_stale(self, session)) {
            done(Result<void, Error>::err(session_closed(id)));
            return;
        }
        if (report.is_err()) {
            self->report_remote_failure(id, report.unwrap_err());
            done(Result<void, Error>::err(report.unwrap_err()));
            return;
        }

        const auto& pushed = report.unwrap();
        auto saved = self->local_.put_sync_record(
            storage::SyncRecord{id, digest, pushed.sync_version, Timestamp::now()});
        saved.inspect_err([&](const Error& error) {
            qCWarning(atelierStoreLog) << "Sync record of" << to_qstring(id)
                                       << "not saved:" << to_qstring(error.message);
        });

        qCInfo(atelierSyncLog) << "Pushed" << to_qstring(id) << "version" << pushed.sync_version
                               << "items" << pushed.items_written << "skipped" << pushed.items_skipped
                               << "orphans removed" << pushed.orphans_removed;
        self->set_status(id, self->queue_->is_pending(id) ? SyncStatus::Pending : SyncStatus::Synced);
        done(Result<void, Error>::ok());
    };

    if (!stored_state.unwrap()) {
        push_project_metadata(remote_, project, version, std::move(on_pushed));
        return;
    }
    push_project(remote_, gate_, project, state, version, std::move(on_pushed));
}

void SyncEngine::report_remote_failure(const EntityId& id, const Error& error) {
    if (error.is(ErrorCode::PermissionDenied)) {
        qCCritical(atelierSyncLog) << "Permission denied for" << to_qstring(id) << ":"
                                   << to_qstring(error.message) << "(not retried)";
        set_status(id, SyncStatus::Error);
    } else if (error.is(ErrorCode::RemoteUnavailable)) {
        qCWarning(atelierSyncLog) << "Remote store unavailable for" << to_qstring(id) << ":"
                                  << to_qstring(error.message);
        set_status(id, SyncStatus::Offline);
    } else {
        qCWarning(atelierSyncLog) << "Sync of" << to_qstring(id) << "failed:" << to_qstring(error.message);
        set_status(id, SyncStatus::Error);
    }
}

void SyncEngine::set_status(const EntityId& id, SyncStatus status) {
    if (sync_status(id) == status) {
        statuses_[id] = status;
        return;
    }
    statuses_[id] = status;
    emit syncStatusChanged(to_qstring(id), to_qstring(to_string(status)));
}

SyncStatus SyncEngine::sync_status(const EntityId& id) const {
    const auto it = statuses_.find(id);
    return it == statuses_.end() ? SyncStatus::Synced : it->second;
}

std::vector<MergeConflict> SyncEngine::pending_conflicts(const EntityId& id) const {
    const auto it = withheld_.find(id);
    return it == withheld_.end() ? std::vector<MergeConflict>{} : it->second.conflicts;
}

void SyncEngine::force_flush(const EntityId& id, std::function<void(Res<FlushOutcome>)> done) {
    auto session = require_session();
    if (session.is_err()) {
        done(Res<FlushOutcome>::err(session.unwrap_err()));
        return;
    }
    queue_->force_flush(id, std::move(done));
}

// ============================================================================
// Remote-origin changes
// ============================================================================

bool SyncEngine::adopt_project_record(const Project& remote) {
    auto local = local_.get_project(remote.id);
    if (local.is_err()) {
        qCWarning(atelierStoreLog) << "Cannot read project" << to_qstring(remote.id) << ":"
                                   << to_qstring(local.unwrap_err().message);
        return false;
    }

    Project merged = remote;
    if (const auto& current = local.unwrap()) {
        merged = merge_projects(*current, remote, MergeStrategy::Smart);
        auto comparable = merged;
        comparable.sync_version = current->sync_version;
        if (comparable == *current) return false;
    }

    auto stored = local_.put_project(merged);
    if (stored.is_err()) {
        qCWarning(atelierStoreLog) << "Cannot store project" << to_qstring(remote.id) << ":"
                                   << to_qstring(stored.unwrap_err().message);
        return false;
    }
    return true;
}

bool SyncEngine::apply_remote(const EntityId& id, RemoteProject remote) {
    auto current = local_.get_state(id);
    if (current.is_err()) {
        qCWarning(atelierStoreLog) << "Ignoring remote change of" << to_qstring(id) << ":"
                                   << to_qstring(current.unwrap_err().message);
        return false;
    }
    const bool project_changed = adopt_project_record(remote.project);

    const auto& local_state = current.unwrap();
    if (!local_state) {
        auto stored = local_.put_state(remote.state);
        if (stored.is_err()) {
            qCWarning(atelierStoreLog) << "Cannot store remote state of" << to_qstring(id);
            return false;
        }
        emit entityChanged(to_qstring(id));
        return true;
    }

    auto conflicts = detect_conflicts(*local_state, remote.state, config_.conflict_window);
    if (!config_.auto_smart_merge && !conflicts.empty()) {
        const auto count = static_cast<int>(conflicts.size());
        qCWarning(atelierMergeLog) << "Withholding remote changes of" << to_qstring(id) << "with"
                                   << count << "conflicts";
        withheld_[id] = Withheld{std::move(remote), std::move(conflicts)};
        set_status(id, SyncStatus::Conflict);
        emit conflictDetected(to_qstring(id), count);
        return false;
    }

    const auto merged = merge_states(*local_state, remote.state, config_.remote_merge_strategy);
    if (same_content(merged, *local_state)) {
        if (project_changed) emit entityChanged(to_qstring(id));
        return project_changed;
    }
    auto stored = local_.put_state(merged);
    if (stored.is_err()) {
        qCWarning(atelierStoreLog) << "Cannot store merged state of" << to_qstring(id) << ":"
                                   << to_qstring(stored.unwrap_err().message);
        return false;
    }
    emit entityChanged(to_qstring(id));
    return true;
}

void SyncEngine::on_remote_project(const EntityId& id, const std::optional<QJsonObject>& document) {
    if (!identity_) return;
    if (!document) {
        qCInfo(atelierSyncLog) << "Remote project" << to_qstring(id) << "is gone";
        return;
    }

    QPointer<SyncEngine> self(this);
    const auto session = session_;
    fetch_project(remote_, id, identity_->user_id,
                  [self, session, id](Res<std::optional<RemoteProject>> fetched) {
        if (is_stale(self, session)) return;
        if (fetched.is_err()) {
            if (fetched.unwrap_err().is(ErrorCode::PermissionDenied)) {
                self->report_remote_failure(id, fetched.unwrap_err());
            } else {
                qCWarning(atelierRemoteLog) << "Cannot read remote project" << to_qstring(id) << ":"
                                            << to_qstring(fetched.unwrap_err().message);
            }
            return;
        }
        auto remote = std::move(fetched).unwrap();
        if (!remote) return;
        self->apply_remote(id, std::move(*remote));
    });
}

void SyncEngine::on_remote_styling(const EntityId& id, const EntityId& root_id, const Lineage& styling) {
    if (!identity_) return;
    auto current = local_.get_state(id);
    if (current.is_err()) {
        qCWarning(atelierStoreLog) << "Ignoring remote styling of" << to_qstring(id) << ":"
                                   << to_qstring(current.unwrap_err().message);
        return;
    }
    auto state = std::move(current).unwrap();
    if (!state) return;

    Lineage existing;
    if (const auto it = state->styling_history.find(root_id); it != state->styling_history.end()) {
        existing = it->second;
    }
    auto merged = merge_lineages(existing, styling);
    if (merged.empty() || merged == existing) return;

    state->styling_history[root_id] = std::move(merged);
    auto stored = local_.put_state(*state);
    if (stored.is_err()) {
        qCWarning(atelierStoreLog) << "Cannot store remote styling of" << to_qstring(id) << ":"
                                   << to_qstring(stored.unwrap_err().message);
        return;
    }
    if (sync_debug_enabled()) {
        qCDebug(atelierMergeLog) << "Merged remote styling" << to_qstring(id) << "/" << to_qstring(root_id);
    }
    emit entityChanged(to_qstring(id));
}

// ============================================================================
// Remote-aware operations
// ============================================================================

void SyncEngine::load_entity(const EntityId& id, std::function<void(Res<ProjectState>)> done) {
    auto initial = local_.get_state(id);
    if (initial.is_err()) {
        done(Res<ProjectState>::err(initial.unwrap_err()));
        return;
    }
    auto local_state = std::move(initial).unwrap();
    if (!identity_) {
        if (local_state) {
            done(Res<ProjectState>::ok(std::move(*local_state)));
        } else {
            done(Res<ProjectState>::err(Error{ErrorCode::NotFound, "no project state " + id}));
        }
        return;
    }

    QPointer<SyncEngine> self(this);
    const auto session = session_;
    fetch_project(remote_, id, identity_->user_id,
                  [self, session, id, local_state, done = std::move(done)](
                      Res<std::optional<RemoteProject>> fetched) {
        if (is_stale(self, session)) {
            done(Res<ProjectState>::err(session_closed(id)));
            return;
        }
        if (fetched.is_err()) {
            const auto& error = fetched.unwrap_err();
            if (error.is(ErrorCode::PermissionDenied)) {
                self->report_remote_failure(id, error);
            } else {
                qCWarning(atelierSyncLog) << "Loading" << to_qstring(id) << "from local cache only:"
                                          << to_qstring(error.message);
            }
            if (local_state) {
                done(Res<ProjectState>::ok(*local_state));
            } else {
                done(Res<ProjectState>::err(error));
            }
            return;
        }

        auto remote = std::move(fetched).unwrap();
        if (!remote) {
            if (local_state) {
                done(Res<ProjectState>::ok(*local_state));
            } else {
                done(Res<ProjectState>::err(Error{ErrorCode::NotFound, "no project " + id}));
            }
            return;
        }

        // Local may have changed while the remote snapshot was assembled.
        auto fresh = self->local_.get_state(id);
        if (fresh.is_err()) {
            done(Res<ProjectState>::err(fresh.unwrap_err()));
            return;
        }
        self->adopt_project_record(remote->project);

        const auto& current = fresh.unwrap();
        ProjectState merged = current ? merge_states(*current, remote->state, MergeStrategy::Smart)
                                      : remote->state;
        if (current && same_content(merged, *current)) {
            done(Res<ProjectState>::ok(*current));
            return;
        }
        auto stored = self->local_.put_state(merged);
        if (stored.is_err()) {
            done(Res<ProjectState>::err(stored.unwrap_err()));
            return;
        }
        emit self->entityChanged(to_qstring(id));
        done(Res<ProjectState>::ok(std::move(merged)));
    });
}

void SyncEngine::delete_entity(const EntityId& id, std::function<void(Result<void, Error>)> done) {
    auto session = require_session();
    if (session.is_err()) {
        done(session);
        return;
    }
    auto project = local_.get_project(id);
    if (project.is_err()) {
        done(Result<void, Error>::err(project.unwrap_err()));
        return;
    }
    if (const auto& record = project.unwrap();
        record && !record->owner_id.empty() && record->owner_id != identity_->user_id) {
        const Error error{ErrorCode::PermissionDenied, "project " + id + " is owned by " + record->owner_id};
        report_remote_failure(id, error);
        done(Result<void, Error>::err(error));
        return;
    }

    std::vector<EntityId> roots;
    auto state = local_.get_state(id);
    if (state.is_ok() && state.unwrap()) {
        roots = styling_root_ids(*state.unwrap());
    }

    queue_->cancel(id);
    subscriptions_->close_project(id);
    withheld_.erase(id);

    QPointer<SyncEngine> self(this);
    const auto current_session = session_;
    queue_->when_idle(id, [self, current_session, id, roots, done = std::move(done)]() {
        if (is_stale(self, current_session)) {
            done(Result<void, Error>::err(session_closed(id)));
            return;
        }
        delete_project(self->remote_, id, roots,
                       [self, current_session, id, done](Result<void, Error> removed) {
            if (is_stale(self, current_session)) {
                done(Result<void, Error>::err(session_closed(id)));
                return;
            }
            if (removed.is_err()) {
                self->report_remote_failure(id, removed.unwrap_err());
                done(removed);
                return;
            }
            auto local = self->local_.remove_project(id);
            if (local.is_err()) {
                done(local);
                return;
            }
            self->statuses_.erase(id);
            qCInfo(atelierSyncLog) << "Deleted project" << to_qstring(id);
            emit self->entityDeleted(to_qstring(id));
            done(Result<void, Error>::ok());
        });
    });
}

void SyncEngine::delete_history_item(const EntityId& project_id,
                                     const EntityId& item_id,
                                     std::function<void(Res<RemovedNode>)> done) {
    auto loaded = local_.get_state(project_id);
    if (loaded.is_err()) {
        done(Res<RemovedNode>::err(loaded.unwrap_err()));
        return;
    }
    auto state = std::move(loaded).unwrap();
    if (!state) {
        done(Res<RemovedNode>::err(Error{ErrorCode::NotFound, "no project state " + project_id}));
        return;
    }

    auto removal = remove_node(*state, item_id);
    if (removal.is_err()) {
        done(Res<RemovedNode>::err(removal.unwrap_err()));
        return;
    }
    auto removed = std::move(removal).unwrap();
    auto stored = store_local(*state);
    if (stored.is_err()) {
        done(Res<RemovedNode>::err(stored.unwrap_err()));
        return;
    }
    qCInfo(atelierSyncLog) << "Removed history item" << to_qstring(item_id) << "from" << to_qstring(project_id)
                           << "reparented" << removed.reparented.size() << "rebased" << removed.rebased.size();
    emit entityChanged(to_qstring(project_id));

    if (!identity_) {
        done(Res<RemovedNode>::ok(std::move(removed)));
        return;
    }

    QPointer<SyncEngine> self(this);
    const auto session = session_;
    const auto pushed_state = *state;
    queue_->when_idle(project_id, [self, session, project_id, removed, pushed_state, done = std::move(done)]() {
        if (is_stale(self, session)) {
            done(Res<RemovedNode>::err(session_closed(project_id)));
            return;
        }
        sync::delete_history_item(self->remote_, project_id, removed,
                                  [self, session, project_id, removed, pushed_state, done](Result<void, Error> result) {
            if (is_stale(self, session)) {
                done(Res<RemovedNode>::err(session_closed(project_id)));
                return;
            }
            if (result.is_err()) {
                qCWarning(atelierSyncLog) << "Remote copy of" << to_qstring(removed.item.id)
                                          << "not deleted, the next push removes it:"
                                          << to_qstring(result.unwrap_err().message);
            }

            const auto& url = removed.item.image_url;
            if (!url.empty() && !is_inline_binary(to_qstring(url))) {
                self->blobs_.remove(url, [url](Result<void, Error> blob) {
                    blob.inspect_err([&](const Error& error) {
                        qCDebug(atelierRemoteLog) << "Blob" << to_qstring(url) << "not removed:"
                                                  << to_qstring(error.message);
                    });
                });
            }

            auto queued = self->queue_push(pushed_state);
            queued.inspect_err([&](const Error&) {
                qCWarning(atelierSyncLog) << "Project" << to_qstring(project_id)
                                          << "stays local until its inline images are uploaded";
            });
            done(Res<RemovedNode>::ok(removed));
        });
    });
}

Result<void, Error> SyncEngine::subscribe(const EntityId& project_id, const EntityId& root_id) {
    auto session = require_session();
    if (session.is_err()) {
        return session;
    }
    subscriptions_->subscribe(project_id, root_id);
    return Result<void, Error>::ok();
}

Res<ProjectState> SyncEngine::resolve_conflict(const EntityId& id, MergeStrategy strategy) {
    const auto it = withheld_.find(id);
    if (it == withheld_.end()) {
        return Res<ProjectState>::err(Error{ErrorCode::NotFound, "no withheld remote changes for " + id});
    }
    auto current = local_.get_state(id);
    if (current.is_err()) {
        return Res<ProjectState>::err(current.unwrap_err());
    }

    const auto remote = std::move(it->second.remote);
    withheld_.erase(it);

    const auto& local_state = current.unwrap();
    ProjectState merged = local_state ? merge_states(*local_state, remote.state, strategy) : remote.state;
    auto stored = local_.put_state(merged);
    if (stored.is_err()) {
        return Res<ProjectState>::err(stored.unwrap_err());
    }
    qCInfo(atelierMergeLog) << "Resolved conflict of" << to_qstring(id) << "with" << to_qstring(to_string(strategy));
    emit entityChanged(to_qstring(id));

    if (identity_ && !same_content(merged, remote.state)) {
        queue_->enqueue(id);
        set_status(id, SyncStatus::Pending);
    } else {
        set_status(id, SyncStatus::Synced);
    }
    return Res<ProjectState>::ok(std::move(merged));
}

void SyncEngine::sync_all(std::function<void(SyncAllReport)> done) {
    auto session = require_session();
    if (session.is_err()) {
        qCWarning(atelierSyncLog) << "sync_all without a session";
        done(SyncAllReport{});
        return;
    }

    std::set<EntityId> ids;
    auto state_ids = local_.list_state_ids();
    if (state_ids.is_err()) {
        qCWarning(atelierStoreLog) << "Cannot list project states:" << to_qstring(state_ids.unwrap_err().message);
        done(SyncAllReport{});
        return;
    }
    ids.insert(state_ids.unwrap().begin(), state_ids.unwrap().end());
    auto projects = local_.list_projects_for_owner(identity_->user_id);
    if (projects.is_ok()) {
        for (const auto& project : projects.unwrap()) ids.insert(project.id);
    }

    struct Pass {
        SyncAllReport report;
        size_t remaining = 0;
        std::function<void(SyncAllReport)> done;
    };
    auto pass = std::make_shared<Pass>();
    pass->report.total = static_cast<int>(ids.size());
    pass->remaining = ids.size();
    pass->done = std::move(done);
    if (ids.empty()) {
        record_device_sync(pass->report, std::move(pass->done));
        return;
    }

    QPointer<SyncEngine> self(this);
    const auto session = session_;
    for (const auto& id : ids) {
        queue_->force_flush(id, [self, session, pass, id](Res<FlushOutcome> outcome) {
            auto& report = pass->report;
            if (outcome.is_ok()) {
                ++(outcome.unwrap() == FlushOutcome::Dispatched ? report.synced : report.skipped);
            } else if (outcome.unwrap_err().is(ErrorCode::MalformedEntity)) {
                qCWarning(atelierSyncLog) << "Skipping malformed project" << to_qstring(id);
                ++report.skipped;
                report.malformed.push_back(id);
            } else {
                ++report.failed;
            }
            if (--pass->remaining > 0) return;
            qCInfo(atelierSyncLog) << "Synced" << report.synced << "of" << report.total << "projects,"
                                   << report.skipped << "skipped," << report.failed << "failed";
            if (is_stale(self, session)) {
                pass->done(report);
                return;
            }
            self->record_device_sync(report, std::move(pass->done));
        });
    }
}

void SyncEngine::record_device_sync(SyncAllReport report, std::function<void(SyncAllReport)> done) {
    if (report.failed > 0 || config_.device_id.isEmpty() || !identity_) {
        done(std::move(report));
        return;
    }

    QJsonObject record{
        {"deviceId", config_.device_id},
        {"deviceName", config_.device_name},
        {"platform", QSysInfo::prettyProductName()},
        {"lastSyncAt", static_cast<qint64>(Timestamp::now().millis())},
    };
    const auto path = network::paths::device(identity_->user_id, config_.device_id.toStdString());
    remote_.set(path, std::move(record), network::WriteMode::Merge,
                [report = std::move(report), done = std::move(done), path](Result<void, Error> written) mutable {
                    if (written.is_err()) {
                        qCWarning(atelierRemoteLog) << "Cannot record device sync at" << to_qstring(path) << ":"
                                                    << to_qstring(written.unwrap_err().message);
                    } else {
                        report.device_recorded = true;
                    }
                    done(std::move(report));
                });
}

void SyncEngine::externalize_inline_images(const EntityId& id, std::function<void(Res<int>)> done) {
    auto loaded = local_.get_state(id);
    if (loaded.is_err()) {
        done(Res<int>::err(loaded.unwrap_err()));
        return;
    }
    const auto& state = loaded.unwrap();
    if (!state) {
        done(Res<int>::err(Error{ErrorCode::NotFound, "no project state " + id}));
        return;
    }

    std::set<std::string> urls;
    for (const auto& item : all_history_items(*state)) {
        if (is_inline_binary(to_qstring(item.image_url))) urls.insert(item.image_url);
    }
    for (const auto& item : state->wardrobe) {
        if (is_inline_binary(to_qstring(item.url))) urls.insert(item.url);
    }
    if (urls.empty()) {
        done(Res<int>::ok(0));
        return;
    }

    struct Uploads {
        std::map<std::string, std::string> replacements;
        std::optional<Error> error;
        size_t remaining = 0;
        std::function<void(Res<int>)> done;
    };
    auto uploads = std::make_shared<Uploads>();
    uploads->remaining = urls.size();
    uploads->done = std::move(done);

    QPointer<SyncEngine> self(this);
    const auto session = session_;
    auto settle = [self, session, id, uploads]() {
        if (--uploads->remaining > 0) return;
        if (is_stale(self, session)) {
            uploads->done(Res<int>::err(session_closed(id)));
            return;
        }

        int replaced = 0;
        if (!uploads->replacements.empty()) {
            auto fresh = self->local_.get_state(id);
            if (fresh.is_err()) {
                uploads->done(Res<int>::err(fresh.unwrap_err()));
                return;
            }
            if (auto& current = fresh.unwrap()) {
                replaced = replace_image_urls(*current, uploads->replacements);
                auto stored = self->local_.put_state(*current);
                if (stored.is_err()) {
                    uploads->done(Res<int>::err(stored.unwrap_err()));
                    return;
                }
                emit self->entityChanged(to_qstring(id));
            }
        }
        qCInfo(atelierSyncLog) << "Externalized" << replaced << "inline images of" << to_qstring(id);
        if (uploads->error) {
            uploads->done(Res<int>::err(*uploads->error));
            return;
        }
        uploads->done(Res<int>::ok(replaced));
    };

    for (const auto& url : urls) {
        auto payload = parse_data_url(url);
        if (!payload) {
            if (!uploads->error) {
                uploads->error = Error{ErrorCode::MalformedEntity, "undecodable inline image in " + id};
            }
            settle();
            continue;
        }
        blobs_.upload(payload->bytes, payload->content_type, [uploads, url, settle](Res<std::string> reference) {
            if (reference.is_ok()) {
                uploads->replacements.emplace(url, reference.unwrap());
            } else if (!uploads->error) {
                uploads->error = reference.unwrap_err();
            }
            settle();
        });
    }
}

void SyncEngine::pull_project_list(std::function<void(Res<int>)> done) {
    auto session = require_session();
    if (session.is_err()) {
        done(Res<int>::err(session.unwrap_err()));
        return;
    }

    QPointer<SyncEngine> self(this);
    const auto current_session = session_;
    fetch_project_list(remote_, identity_->user_id,
                       [self, current_session, done = std::move(done)](Res<std::vector<Project>> projects) {
        if (is_stale(self, current_session)) {
            done(Res<int>::err(Error{ErrorCode::SessionClosed, "session ended before the project list arrived"}));
            return;
        }
        if (projects.is_err()) {
            if (projects.unwrap_err().is(ErrorCode::PermissionDenied)) {
                qCCritical(atelierSyncLog) << "Permission denied listing projects:"
                                           << to_qstring(projects.unwrap_err().message);
            }
            done(Res<int>::err(projects.unwrap_err()));
            return;
        }

        int stored = 0;
        for (const auto& project : projects.unwrap()) {
            if (self->adopt_project_record(project)) ++stored;
        }
        qCInfo(atelierSyncLog) << "Pulled" << projects.unwrap().size() << "remote projects," << stored << "stored";
        done(Res<int>::ok(stored));
    });
}

} // namespace atelier::sync
