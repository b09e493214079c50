#pragma once

#include "network/remote_store.hpp"
#include <QObject>
#include <QString>
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace atelier::network {

/**
 * MemoryRemoteStore - In-process RemoteStore driven by the Qt event loop.
 *
 * Every call completes from a zero (or configured) latency timer, so callers
 * see the same asynchrony as with a network backend. Used by tests and by
 * the CLI's offline mode. Besides the RemoteStore contract it offers fault
 * injection, simulated writes from other devices, and write accounting per
 * project ("projects/{id}").
 */
class MemoryRemoteStore : public QObject, public RemoteStore {
    Q_OBJECT

public:
    explicit MemoryRemoteStore(QObject* parent = nullptr);
    ~MemoryRemoteStore() override;

    void get(const std::string& path, DocumentCallback done) override;
    void set(const std::string& path, QJsonObject data, WriteMode mode, DoneCallback done) override;
    void remove(const std::string& path, DoneCallback done) override;
    void list(const std::string& collection, CollectionCallback done) override;
    void query(const std::string& collection,
               const QString& field,
               const QJsonValue& equals,
               CollectionCallback done) override;
    void commit(WriteBatch batch, DoneCallback done) override;
    WatchId watch_document(const std::string& path, DocumentObserver on_change) override;
    WatchId watch_collection(const std::string& collection, CollectionObserver on_change) override;
    void unwatch(WatchId id) override;

    // Simulation controls
    void set_latency(std::chrono::milliseconds latency) { latency_ = latency; }
    void set_offline(bool offline) { offline_ = offline; }
    void fail_next_writes(ErrorCode code, int count = 1);

    /**
     * Apply a change as if another client wrote it: no latency, no fault
     * injection, not counted as a write. Watchers are notified.
     */
    void inject_change(const std::string& path, QJsonObject data, WriteMode mode = WriteMode::Merge);
    void inject_removal(const std::string& path);

    // Inspection
    [[nodiscard]] std::optional<QJsonObject> peek(const std::string& path) const;
    [[nodiscard]] std::vector<DocumentSnapshot> peek_collection(const std::string& collection) const;
    [[nodiscard]] size_t document_count() const { return documents_.size(); }

    // Client write calls (set, remove, commit), successful or not.
    [[nodiscard]] int write_count() const { return write_count_; }
    [[nodiscard]] int write_count_for(std::string_view project_path) const;
    [[nodiscard]] int max_concurrent_writes_for(std::string_view project_path) const;
    [[nodiscard]] int in_flight_writes() const { return in_flight_total_; }
    [[nodiscard]] int active_watch_count() const { return static_cast<int>(watches_.size()); }

signals:
    void writeStarted(const QString& entity);
    void writeFinished(const QString& entity, bool ok);

private:
    struct Watch {
        bool is_collection = false;
        std::string path;
        DocumentObserver on_document;
        CollectionObserver on_collection;
    };

    std::map<std::string, QJsonObject> documents_;
    std::map<WatchId, Watch> watches_;
    WatchId next_watch_id_ = 1;

    std::chrono::milliseconds latency_{0};
    bool offline_ = false;
    ErrorCode injected_code_ = ErrorCode::RemoteUnavailable;
    int injected_failures_ = 0;

    int write_count_ = 0;
    int in_flight_total_ = 0;
    std::map<std::string, int> writes_by_entity_;
    std::map<std::string, int> in_flight_by_entity_;
    std::map<std::string, int> max_in_flight_by_entity_;

    void schedule(std::function<void()> fn);
    [[nodiscard]] std::optional<Error> read_failure() const;
    [[nodiscard]] std::optional<Error> take_write_failure();

    [[nodiscard]] static std::string entity_of(std::string_view path);
    void begin_write(const std::set<std::string>& entities);
    void end_write(const std::set<std::string>& entities, bool ok);

    // One write call with accounting, failure injection and notification.
    void run_write(std::vector<WriteOp> ops, DoneCallback done);

    void apply(const WriteOp& op, std::set<std::string>& touched);
    void notify(const std::set<std::string>& touched);
    [[nodiscard]] std::vector<DocumentSnapshot> collection_snapshot(const std::string& collection) const;
};

} // namespace atelier::network
