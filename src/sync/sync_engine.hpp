#pragma once

#include "core/config.hpp"
#include "core/project.hpp"
#include "core/result.hpp"
#include "network/collaborators.hpp"
#include "network/remote_store.hpp"
#include "storage/local_store.hpp"
#include "sync/history_partitioner.hpp"
#include "sync/merge_engine.hpp"
#include "sync/remote_project.hpp"
#include "sync/subscription_manager.hpp"
#include "sync/validation_gate.hpp"
#include "sync/write_queue.hpp"
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace atelier::sync {

enum class SyncStatus {
    Synced,
    Pending,
    Syncing,
    Error,
    Conflict,
    Offline
};

[[nodiscard]] std::string_view to_string(SyncStatus status) noexcept;

/**
 * SyncAllReport - Outcome of one sync_all() pass.
 */
struct SyncAllReport {
    int total = 0;
    int synced = 0;
    int skipped = 0;     // malformed entities, or a write already in flight
    int failed = 0;
    std::vector<EntityId> malformed;
    bool device_recorded = false;
};

/**
 * SyncEngine - Replication of one identity's projects between the local
 * store and the remote store.
 *
 * Every mutation is written to the LocalStore synchronously and pushed
 * later through the WriteQueue. Remote pushes arrive through the
 * SubscriptionManager and only reach the LocalStore after a merge. Results
 * belonging to an ended session are discarded.
 */
class SyncEngine : public QObject {
    Q_OBJECT

public:
    SyncEngine(storage::LocalStore& local,
               network::RemoteStore& remote,
               network::BlobStore& blobs,
               EngineConfig config,
               QObject* parent = nullptr);
    ~SyncEngine() override;

    // ---- Session ----------------------------------------------------------

    /**
     * Start a session for `identity`. A running session for another
     * identity is torn down first.
     */
    [[nodiscard]] Result<void, Error> init(const network::Identity& identity);

    /**
     * Cancel pending writes, close every subscription and end the session.
     */
    void teardown();

    [[nodiscard]] bool is_active() const { return identity_.has_value(); }
    [[nodiscard]] const std::optional<network::Identity>& identity() const { return identity_; }
    [[nodiscard]] uint64_t session() const { return session_; }

    // ---- Local-first writes ----------------------------------------------

    /**
     * Shallow-merge `patch` (wire format) into the stored state, creating it
     * when missing, then queue a push.
     *
     * Writes that the ValidationGate rejects are kept locally but never
     * queued; the rejection is returned.
     */
    [[nodiscard]] Res<ProjectState> save_entity(const EntityId& id, const QJsonObject& patch);

    [[nodiscard]] Result<void, Error> save_state(ProjectState state);
    [[nodiscard]] Result<void, Error> save_project(Project project);

    /**
     * Store a new project and its state, then push immediately.
     */
    void create_project(Project project, ProjectState state, std::function<void(Result<void, Error>)> done);

    [[nodiscard]] Result<void, Error> save_unified_history(const EntityId& project_id,
                                                           const EntityId& root_id,
                                                           const Lineage& lineage);
    [[nodiscard]] Res<Lineage> load_unified_history(const EntityId& project_id, const EntityId& root_id);

    // ---- Remote-aware operations ----------------------------------------

    /**
     * Local snapshot, smart-merged with the remote one when it exists. Falls
     * back to the local snapshot when the remote store fails.
     */
    void load_entity(const EntityId& id, std::function<void(Res<ProjectState>)> done);

    /**
     * Cancel writes, close subscriptions, delete the remote documents and
     * collections, then the local rows.
     */
    void delete_entity(const EntityId& id, std::function<void(Result<void, Error>)> done);

    /**
     * Remove one history item with re-parenting, delete its remote document
     * and its blob (best effort), then queue a push.
     */
    void delete_history_item(const EntityId& project_id,
                             const EntityId& item_id,
                             std::function<void(Res<RemovedNode>)> done);

    void force_flush(const EntityId& id, std::function<void(Res<FlushOutcome>)> done);

    [[nodiscard]] Result<void, Error> subscribe(const EntityId& project_id, const EntityId& root_id);

    /**
     * Apply a withheld remote snapshot with `strategy`.
     */
    [[nodiscard]] Res<ProjectState> resolve_conflict(const EntityId& id, MergeStrategy strategy);

    /**
     * Push every locally stored project. Malformed ones are skipped.
     */
    void sync_all(std::function<void(SyncAllReport)> done);

    /**
     * Upload every inline image of a project and store the references
     * locally. Does not queue a push. Reports the number replaced.
     */
    void externalize_inline_images(const EntityId& id, std::function<void(Res<int>)> done);

    /**
     * Copy the identity's remote project records into the local store.
     * Reports the number of records stored.
     */
    void pull_project_list(std::function<void(Res<int>)> done);

    // ---- Inspection -------------------------------------------------------

    [[nodiscard]] SyncStatus sync_status(const EntityId& id) const;
    [[nodiscard]] std::vector<MergeConflict> pending_conflicts(const EntityId& id) const;
    [[nodiscard]] const EngineConfig& config() const { return config_; }
    [[nodiscard]] WriteQueue& write_queue() { return *queue_; }
    [[nodiscard]] SubscriptionManager& subscriptions() { return *subscriptions_; }

signals:
    void syncStatusChanged(const QString& entityId, const QString& status);
    void entityChanged(const QString& entityId);
    void entityDeleted(const QString& entityId);
    void conflictDetected(const QString& entityId, int conflictCount);

private:
    struct Withheld {
        RemoteProject remote;
        std::vector<MergeConflict> conflicts;
    };

    storage::LocalStore& local_;
    network::RemoteStore& remote_;
    network::BlobStore& blobs_;
    EngineConfig config_;
    ValidationGate gate_;
    std::unique_ptr<WriteQueue> queue_;
    std::unique_ptr<SubscriptionManager> subscriptions_;

    std::optional<network::Identity> identity_;
    uint64_t session_ = 0;
    std::map<EntityId, SyncStatus> statuses_;
    std::map<EntityId, Withheld> withheld_;

    [[nodiscard]] Result<void, Error> require_session() const;
    // Stamp updatedAt and store.
    [[nodiscard]] Result<void, Error> store_local(ProjectState& state);
    // Validate and enqueue; rejected states stay local.
    [[nodiscard]] Result<void, Error> queue_push(const ProjectState& state);
    [[nodiscard]] Result<void, Error> commit_local(ProjectState& state);
    bool adopt_project_record(const Project& remote);
    void set_status(const EntityId& id, SyncStatus status);
    void report_remote_failure(const EntityId& id, const Error& error);
    // Best-effort sync/{user}/devices/{id} write after a pass without failures.
    void record_device_sync(SyncAllReport report, std::function<void(SyncAllReport)> done);

    // Write queue dispatcher: push the freshest local snapshot of `id`.
    void push(const EntityId& id, WriteDone done);

    // Fold a remote snapshot into the local store. Returns true when stored.
    bool apply_remote(const EntityId& id, RemoteProject remote);
    void on_remote_project(const EntityId& id, const std::optional<QJsonObject>& document);
    void on_remote_styling(const EntityId& id, const EntityId& root_id, const Lineage& styling);
};

} // namespace atelier::sync
