#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atelier::network {

/**
 * Remote document layout.
 *
 *   projects/{id}                       metadata, scalar state, stylingRootIds
 *   projects/{id}/history/{item}        primary lineage
 *   projects/{id}/styling/{root}/{item} styling lineage of one root
 *   projects/{id}/wardrobe/{item}       project wardrobe
 *   sync/{user}/devices/{device}        last completed sync of one device
 */
namespace paths {

inline constexpr std::string_view kProjects = "projects";

[[nodiscard]] inline std::string project(std::string_view project_id) {
    return std::string(kProjects) + "/" + std::string(project_id);
}

[[nodiscard]] inline std::string history(std::string_view project_id) {
    return project(project_id) + "/history";
}

[[nodiscard]] inline std::string styling(std::string_view project_id, std::string_view root_id) {
    return project(project_id) + "/styling/" + std::string(root_id);
}

[[nodiscard]] inline std::string wardrobe(std::string_view project_id) {
    return project(project_id) + "/wardrobe";
}

[[nodiscard]] inline std::string device(std::string_view user_id, std::string_view device_id) {
    return "sync/" + std::string(user_id) + "/devices/" + std::string(device_id);
}

[[nodiscard]] inline std::string document(std::string_view collection, std::string_view id) {
    return std::string(collection) + "/" + std::string(id);
}

/**
 * Collection part of a document path ("a/b/c" -> "a/b").
 */
[[nodiscard]] inline std::string parent_of(std::string_view path) {
    const auto slash = path.rfind('/');
    return slash == std::string_view::npos ? std::string{} : std::string(path.substr(0, slash));
}

/**
 * Last segment of a path ("a/b/c" -> "c").
 */
[[nodiscard]] inline std::string leaf_of(std::string_view path) {
    const auto slash = path.rfind('/');
    return std::string(slash == std::string_view::npos ? path : path.substr(slash + 1));
}

} // namespace paths

enum class WriteMode {
    Merge,     // update the given top-level fields, keep the rest
    Replace
};

/**
 * WriteOp - One mutation of an atomic batch.
 */
struct WriteOp {
    enum class Kind { Set, Remove };

    Kind kind = Kind::Set;
    std::string path;
    QJsonObject data;
    WriteMode mode = WriteMode::Merge;
};

/**
 * WriteBatch - Mutations applied all-or-nothing by RemoteStore::commit().
 */
class WriteBatch {
public:
    WriteBatch& set(std::string path, QJsonObject data, WriteMode mode = WriteMode::Merge) {
        ops_.push_back(WriteOp{WriteOp::Kind::Set, std::move(path), std::move(data), mode});
        return *this;
    }

    WriteBatch& remove(std::string path) {
        ops_.push_back(WriteOp{WriteOp::Kind::Remove, std::move(path), {}, WriteMode::Replace});
        return *this;
    }

    [[nodiscard]] const std::vector<WriteOp>& ops() const { return ops_; }
    [[nodiscard]] size_t size() const { return ops_.size(); }
    [[nodiscard]] bool empty() const { return ops_.empty(); }

private:
    std::vector<WriteOp> ops_;
};

/**
 * DocumentSnapshot - A document as returned by list/query/watch.
 */
struct DocumentSnapshot {
    std::string id;      // last path segment
    QJsonObject data;
};

using WatchId = uint64_t;

using DoneCallback = std::function<void(Result<void, Error>)>;
using DocumentCallback = std::function<void(Res<std::optional<QJsonObject>>)>;
using CollectionCallback = std::function<void(Res<std::vector<DocumentSnapshot>>)>;
using DocumentObserver = std::function<void(const std::optional<QJsonObject>&)>;
using CollectionObserver = std::function<void(const std::vector<DocumentSnapshot>&)>;

/**
 * RemoteStore - Authoritative, multi-client document store.
 *
 * Every operation completes asynchronously on the caller's event loop.
 * Failures are reported as RemoteUnavailable or PermissionDenied. Watches
 * deliver the current snapshot once after registration and then on every
 * change until unwatch().
 */
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    virtual void get(const std::string& path, DocumentCallback done) = 0;
    virtual void set(const std::string& path, QJsonObject data, WriteMode mode, DoneCallback done) = 0;
    virtual void remove(const std::string& path, DoneCallback done) = 0;

    virtual void list(const std::string& collection, CollectionCallback done) = 0;
    virtual void query(const std::string& collection,
                       const QString& field,
                       const QJsonValue& equals,
                       CollectionCallback done) = 0;

    virtual void commit(WriteBatch batch, DoneCallback done) = 0;

    virtual WatchId watch_document(const std::string& path, DocumentObserver on_change) = 0;
    virtual WatchId watch_collection(const std::string& collection, CollectionObserver on_change) = 0;
    virtual void unwatch(WatchId id) = 0;
};

} // namespace atelier::network
