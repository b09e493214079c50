#include "network/memory_remote_store.hpp"

#include "core/logging.hpp"

#include <QTimer>
#include <algorithm>

namespace atelier::network {

MemoryRemoteStore::MemoryRemoteStore(QObject* parent)
    : QObject(parent) {
}

MemoryRemoteStore::~MemoryRemoteStore() = default;

void MemoryRemoteStore::schedule(std::function<void()> fn) {
    QTimer::singleShot(latency_, this, std::move(fn));
}

std::optional<Error> MemoryRemoteStore::read_failure() const {
    if (offline_) {
        return Error{ErrorCode::RemoteUnavailable, "remote store unreachable"};
    }
    return std::nullopt;
}

std::optional<Error> MemoryRemoteStore::take_write_failure() {
    if (offline_) {
        return Error{ErrorCode::RemoteUnavailable, "remote store unreachable"};
    }
    if (injected_failures_ > 0) {
        --injected_failures_;
        return Error{injected_code_, std::string("injected ") + std::string(error_code_name(injected_code_))};
    }
    return std::nullopt;
}

void MemoryRemoteStore::fail_next_writes(ErrorCode code, int count) {
    injected_code_ = code;
    injected_failures_ = count;
}

// "projects/p1/history/h1" -> "projects/p1"
std::string MemoryRemoteStore::entity_of(std::string_view path) {
    const auto first = path.find('/');
    if (first == std::string_view::npos) return std::string(path);
    const auto second = path.find('/', first + 1);
    return std::string(second == std::string_view::npos ? path : path.substr(0, second));
}

void MemoryRemoteStore::begin_write(const std::set<std::string>& entities) {
    ++write_count_;
    ++in_flight_total_;
    for (const auto& entity : entities) {
        ++writes_by_entity_[entity];
        const int now_in_flight = ++in_flight_by_entity_[entity];
        auto& peak = max_in_flight_by_entity_[entity];
        peak = std::max(peak, now_in_flight);
        emit writeStarted(QString::fromStdString(entity));
    }
}

void MemoryRemoteStore::end_write(const std::set<std::string>& entities, bool ok) {
    --in_flight_total_;
    for (const auto& entity : entities) {
        if (--in_flight_by_entity_[entity] == 0) {
            in_flight_by_entity_.erase(entity);
        }
        emit writeFinished(QString::fromStdString(entity), ok);
    }
}

int MemoryRemoteStore::write_count_for(std::string_view project_path) const {
    const auto it = writes_by_entity_.find(std::string(project_path));
    return it == writes_by_entity_.end() ? 0 : it->second;
}

int MemoryRemoteStore::max_concurrent_writes_for(std::string_view project_path) const {
    const auto it = max_in_flight_by_entity_.find(std::string(project_path));
    return it == max_in_flight_by_entity_.end() ? 0 : it->second;
}

// ============================================================================
// Reads
// ============================================================================

void MemoryRemoteStore::get(const std::string& path, DocumentCallback done) {
    auto failure = read_failure();
    schedule([this, path, failure, done = std::move(done)]() {
        if (failure) {
            done(Res<std::optional<QJsonObject>>::err(*failure));
            return;
        }
        done(Res<std::optional<QJsonObject>>::ok(peek(path)));
    });
}

void MemoryRemoteStore::list(const std::string& collection, CollectionCallback done) {
    auto failure = read_failure();
    schedule([this, collection, failure, done = std::move(done)]() {
        if (failure) {
            done(Res<std::vector<DocumentSnapshot>>::err(*failure));
            return;
        }
        done(Res<std::vector<DocumentSnapshot>>::ok(collection_snapshot(collection)));
    });
}

void MemoryRemoteStore::query(const std::string& collection,
                              const QString& field,
                              const QJsonValue& equals,
                              CollectionCallback done) {
    auto failure = read_failure();
    schedule([this, collection, field, equals, failure, done = std::move(done)]() {
        if (failure) {
            done(Res<std::vector<DocumentSnapshot>>::err(*failure));
            return;
        }
        auto docs = collection_snapshot(collection);
        docs.erase(std::remove_if(docs.begin(), docs.end(),
                                  [&](const DocumentSnapshot& doc) {
                                      return doc.data.value(field) != equals;
                                  }),
                   docs.end());
        done(Res<std::vector<DocumentSnapshot>>::ok(std::move(docs)));
    });
}

std::optional<QJsonObject> MemoryRemoteStore::peek(const std::string& path) const {
    const auto it = documents_.find(path);
    if (it == documents_.end()) return std::nullopt;
    return it->second;
}

std::vector<DocumentSnapshot> MemoryRemoteStore::peek_collection(const std::string& collection) const {
    return collection_snapshot(collection);
}

std::vector<DocumentSnapshot> MemoryRemoteStore::collection_snapshot(const std::string& collection) const {
    std::vector<DocumentSnapshot> docs;
    const auto prefix = collection + "/";
    for (auto it = documents_.lower_bound(prefix); it != documents_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        if (it->first.find('/', prefix.size()) != std::string::npos) continue;
        docs.push_back(DocumentSnapshot{paths::leaf_of(it->first), it->second});
    }
    return docs;
}

// ============================================================================
// Writes
// ============================================================================

void MemoryRemoteStore::set(const std::string& path, QJsonObject data, WriteMode mode, DoneCallback done) {
    run_write({WriteOp{WriteOp::Kind::Set, path, std::move(data), mode}}, std::move(done));
}

void MemoryRemoteStore::remove(const std::string& path, DoneCallback done) {
    run_write({WriteOp{WriteOp::Kind::Remove, path, {}, WriteMode::Replace}}, std::move(done));
}

void MemoryRemoteStore::commit(WriteBatch batch, DoneCallback done) {
    run_write(batch.ops(), std::move(done));
}

void MemoryRemoteStore::run_write(std::vector<WriteOp> ops, DoneCallback done) {
    std::set<std::string> entities;
    for (const auto& op : ops) {
        entities.insert(entity_of(op.path));
    }

    begin_write(entities);
    auto failure = take_write_failure();
    schedule([this, ops = std::move(ops), entities, failure, done = std::move(done)]() {
        if (failure) {
            end_write(entities, false);
            done(Result<void, Error>::err(*failure));
            return;
        }

        std::set<std::string> touched;
        for (const auto& op : ops) {
            apply(op, touched);
        }
        end_write(entities, true);
        done(Result<void, Error>::ok());
        notify(touched);
    });
}

void MemoryRemoteStore::apply(const WriteOp& op, std::set<std::string>& touched) {
    touched.insert(op.path);
    if (op.kind == WriteOp::Kind::Remove) {
        documents_.erase(op.path);
        return;
    }

    auto it = documents_.find(op.path);
    if (it == documents_.end() || op.mode == WriteMode::Replace) {
        documents_[op.path] = op.data;
        return;
    }
    for (auto field = op.data.begin(); field != op.data.end(); ++field) {
        it->second.insert(field.key(), field.value());
    }
}

void MemoryRemoteStore::inject_change(const std::string& path, QJsonObject data, WriteMode mode) {
    std::set<std::string> touched;
    apply(WriteOp{WriteOp::Kind::Set, path, std::move(data), mode}, touched);
    notify(touched);
}

void MemoryRemoteStore::inject_removal(const std::string& path) {
    std::set<std::string> touched;
    apply(WriteOp{WriteOp::Kind::Remove, path, {}, WriteMode::Replace}, touched);
    notify(touched);
}

// ============================================================================
// Watches
// ============================================================================

WatchId MemoryRemoteStore::watch_document(const std::string& path, DocumentObserver on_change) {
    const auto id = next_watch_id_++;
    watches_.emplace(id, Watch{false, path, std::move(on_change), {}});
    schedule([this, id]() {
        const auto it = watches_.find(id);
        if (it == watches_.end()) return;
        auto observer = it->second.on_document;
        observer(peek(it->second.path));
    });
    return id;
}

WatchId MemoryRemoteStore::watch_collection(const std::string& collection, CollectionObserver on_change) {
    const auto id = next_watch_id_++;
    watches_.emplace(id, Watch{true, collection, {}, std::move(on_change)});
    schedule([this, id]() {
        const auto it = watches_.find(id);
        if (it == watches_.end()) return;
        auto observer = it->second.on_collection;
        observer(collection_snapshot(it->second.path));
    });
    return id;
}

void MemoryRemoteStore::unwatch(WatchId id) {
    watches_.erase(id);
}

void MemoryRemoteStore::notify(const std::set<std::string>& touched) {
    if (touched.empty()) return;

    std::set<std::string> touched_collections;
    for (const auto& path : touched) {
        touched_collections.insert(paths::parent_of(path));
    }

    // Observers may unwatch (or watch) while being notified.
    std::vector<WatchId> ids;
    ids.reserve(watches_.size());
    for (const auto& [id, watch] : watches_) {
        ids.push_back(id);
    }

    for (const auto id : ids) {
        const auto it = watches_.find(id);
        if (it == watches_.end()) continue;
        if (it->second.is_collection) {
            if (touched_collections.count(it->second.path) == 0) continue;
            auto observer = it->second.on_collection;
            observer(collection_snapshot(it->second.path));
        } else {
            if (touched.count(it->second.path) == 0) continue;
            auto observer = it->second.on_document;
            observer(peek(it->second.path));
        }
    }

    if (sync_debug_enabled()) {
        qCDebug(atelierRemoteLog) << "notified watchers for" << touched.size() << "documents";
    }
}

} // namespace atelier::network
