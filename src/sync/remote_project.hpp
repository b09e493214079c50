#pragma once

#include "core/project.hpp"
#include "core/result.hpp"
#include "network/remote_store.hpp"
#include "sync/history_partitioner.hpp"
#include "sync/validation_gate.hpp"
#include <QJsonObject>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace atelier::sync {

/**
 * A project as stored remotely: the project document plus its history,
 * styling and wardrobe collections.
 */
struct RemoteProject {
    Project project;
    ProjectState state;
    std::vector<EntityId> styling_root_ids;   // as listed on the project document
};

/**
 * Document ids currently present in a project's collections.
 */
struct RemoteListing {
    std::set<std::string> history_ids;
    std::map<EntityId, std::set<std::string>> styling_ids;
    std::set<std::string> wardrobe_ids;
};

struct PushReport {
    int items_written = 0;
    int items_skipped = 0;
    int orphans_removed = 0;
    int64_t sync_version = 0;
};

struct PushPlan {
    network::WriteBatch batch;
    PushReport report;
};

// ============================================================================
// Pure mapping
// ============================================================================

/**
 * Metadata part of the project document. The metadata clock is written as
 * "metadataUpdatedAt".
 */
[[nodiscard]] QJsonObject metadata_document(const Project& project, int64_t sync_version);

/**
 * Project document: metadata, scalar state, stylingRootIds and syncVersion.
 * "updatedAt" is the state clock; the metadata clock is "metadataUpdatedAt".
 */
[[nodiscard]] QJsonObject project_document(const Project& project,
                                           const ProjectState& state,
                                           int64_t sync_version);

/**
 * Project and scalar state from a project document; lineages stay empty.
 */
[[nodiscard]] Res<RemoteProject> decode_project_document(const EntityId& project_id,
                                                         const QJsonObject& document);

/**
 * One atomic batch that makes the remote copy equal to the local one:
 * every valid item is written, every listed id with no local counterpart
 * is removed. Items failing ValidationGate::check_history_item are skipped.
 */
[[nodiscard]] PushPlan plan_push(const Project& project,
                                 const ProjectState& state,
                                 int64_t sync_version,
                                 const RemoteListing& existing);

// ============================================================================
// Remote operations
//
// `store` must outlive the callbacks. Results are delivered on the store's
// event loop.
// ============================================================================

using FetchCallback = std::function<void(Res<std::optional<RemoteProject>>)>;
using PushCallback = std::function<void(Res<PushReport>)>;
using ProjectListCallback = std::function<void(Res<std::vector<Project>>)>;

/**
 * Assemble the full remote snapshot. A missing project document yields
 * nullopt; a document owned by someone else yields PermissionDenied.
 */
void fetch_project(network::RemoteStore& store,
                   const EntityId& project_id,
                   const std::string& user_id,
                   FetchCallback done);

/**
 * List the remote collections of a project, looking at the styling roots of
 * the project document, of `local_roots`, and of the remote history.
 */
void fetch_listing(network::RemoteStore& store,
                   const EntityId& project_id,
                   std::vector<EntityId> local_roots,
                   std::function<void(Res<RemoteListing>)> done);

/**
 * Validate, plan and commit one push of a project.
 */
void push_project(network::RemoteStore& store,
                  const ValidationGate& gate,
                  const Project& project,
                  const ProjectState& state,
                  int64_t sync_version,
                  PushCallback done);

/**
 * Merge only the metadata into the project document. Used for projects whose
 * state is not cached locally, so remote collections are left alone.
 */
void push_project_metadata(network::RemoteStore& store,
                           const Project& project,
                           int64_t sync_version,
                           PushCallback done);

/**
 * Remove the project document and every document of its collections in one
 * batch.
 */
void delete_project(network::RemoteStore& store,
                    const EntityId& project_id,
                    std::vector<EntityId> local_roots,
                    std::function<void(Result<void, Error>)> done);

/**
 * Remove the remote copy of one history item.
 */
void delete_history_item(network::RemoteStore& store,
                         const EntityId& project_id,
                         const RemovedNode& removed,
                         std::function<void(Result<void, Error>)> done);

/**
 * Project metadata records owned by `user_id`.
 */
void fetch_project_list(network::RemoteStore& store,
                        const std::string& user_id,
                        ProjectListCallback done);

} // namespace atelier::sync
