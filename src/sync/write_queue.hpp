#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <QObject>
#include <QString>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <vector>

class QTimer;

namespace atelier::sync {

enum class FlushOutcome {
    Dispatched,
    Skipped      // a write for the entity was already in flight
};

using WriteDone = std::function<void(Result<void, Error>)>;

/**
 * Performs one remote write for an entity and reports completion exactly
 * once. Called with the entity id only; the write reads the freshest local
 * snapshot itself.
 */
using WriteDispatcher = std::function<void(const EntityId& entity_id, WriteDone done)>;

/**
 * WriteQueue - Per-entity debounce with at most one write in flight.
 *
 * Idle -> Pending (timer armed) -> InFlight -> Idle. A mutation arriving in
 * flight re-arms the timer; when that timer fires before the write returns,
 * the dispatch waits for the completion instead of running concurrently.
 * Failed writes are not retried.
 */
class WriteQueue : public QObject {
    Q_OBJECT

public:
    explicit WriteQueue(std::chrono::milliseconds debounce, QObject* parent = nullptr);
    ~WriteQueue() override;

    void set_dispatcher(WriteDispatcher dispatcher) { dispatcher_ = std::move(dispatcher); }
    void set_debounce(std::chrono::milliseconds debounce) { debounce_ = debounce; }
    [[nodiscard]] std::chrono::milliseconds debounce() const { return debounce_; }

    /**
     * Note a mutation of `entity_id` and (re)start its debounce timer.
     */
    void enqueue(const EntityId& entity_id);

    /**
     * Cancel the timer and dispatch now. Reports Skipped without writing
     * when a write is already in flight; write errors go to `done`.
     */
    void force_flush(const EntityId& entity_id, std::function<void(Res<FlushOutcome>)> done);

    /**
     * Drop the pending write of one entity. An in-flight write completes.
     */
    void cancel(const EntityId& entity_id);

    /**
     * Stop every debounce timer without executing the writes.
     */
    void cancel_all();

    /**
     * Run `fn` once no write of `entity_id` is in flight.
     */
    void when_idle(const EntityId& entity_id, std::function<void()> fn);

    [[nodiscard]] bool is_pending(const EntityId& entity_id) const;
    [[nodiscard]] bool is_in_flight(const EntityId& entity_id) const;
    [[nodiscard]] size_t pending_count() const;

signals:
    void writeDispatched(const QString& entityId);
    void writeCompleted(const QString& entityId, bool ok);

private:
    struct TimerDeleter {
        void operator()(QTimer* timer) const;
    };

    struct Entry {
        std::unique_ptr<QTimer, TimerDeleter> timer;
        bool in_flight = false;
        bool deferred = false;
        std::vector<std::function<void()>> idle_waiters;
    };

    std::map<EntityId, Entry> entries_;
    std::chrono::milliseconds debounce_;
    WriteDispatcher dispatcher_;

    Entry& entry_for(const EntityId& entity_id);
    void on_timeout(const EntityId& entity_id);
    void dispatch(const EntityId& entity_id, WriteDone on_done);
    void finish(const EntityId& entity_id, bool ok);
    void release_if_idle(const EntityId& entity_id);
};

} // namespace atelier::sync
