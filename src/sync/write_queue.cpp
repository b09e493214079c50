#include "sync/write_queue.hpp"

#include "core/logging.hpp"

#include <QPointer>
#include <QTimer>

namespace atelier::sync {

void WriteQueue::TimerDeleter::operator()(QTimer* timer) const {
    if (timer) {
        timer->stop();
        timer->deleteLater();
    }
}

WriteQueue::WriteQueue(std::chrono::milliseconds debounce, QObject* parent)
    : QObject(parent)
    , debounce_(debounce) {
}

WriteQueue::~WriteQueue() = default;

WriteQueue::Entry& WriteQueue::entry_for(const EntityId& entity_id) {
    auto& entry = entries_[entity_id];
    if (!entry.timer) {
        entry.timer.reset(new QTimer(this));
        entry.timer->setSingleShot(true);
        connect(entry.timer.get(), &QTimer::timeout, this, [this, entity_id]() {
            on_timeout(entity_id);
        });
    }
    return entry;
}

void WriteQueue::enqueue(const EntityId& entity_id) {
    auto& entry = entry_for(entity_id);
    entry.timer->start(debounce_);
    if (sync_debug_enabled()) {
        qCDebug(atelierSyncLog) << "Queued write for" << QString::fromStdString(entity_id)
                                << (entry.in_flight ? "(write in flight)" : "");
    }
}

void WriteQueue::on_timeout(const EntityId& entity_id) {
    auto it = entries_.find(entity_id);
    if (it == entries_.end()) return;
    if (it->second.in_flight) {
        it->second.deferred = true;
        return;
    }
    dispatch(entity_id, nullptr);
}

void WriteQueue::force_flush(const EntityId& entity_id, std::function<void(Res<FlushOutcome>)> done) {
    auto& entry = entry_for(entity_id);
    if (entry.in_flight) {
        qCInfo(atelierSyncLog) << "Flush of" << QString::fromStdString(entity_id)
                               << "skipped, write already in flight";
        done(Res<FlushOutcome>::ok(FlushOutcome::Skipped));
        return;
    }
    entry.timer->stop();
    dispatch(entity_id, [done = std::move(done)](Result<void, Error> result) {
        if (result.is_err()) {
            done(Res<FlushOutcome>::err(result.unwrap_err()));
            return;
        }
        done(Res<FlushOutcome>::ok(FlushOutcome::Dispatched));
    });
}

void WriteQueue::dispatch(const EntityId& entity_id, WriteDone on_done) {
    auto& entry = entry_for(entity_id);
    entry.in_flight = true;
    entry.deferred = false;
    emit writeDispatched(QString::fromStdString(entity_id));

    if (!dispatcher_) {
        finish(entity_id, false);
        if (on_done) on_done(Result<void, Error>::err(Error{ErrorCode::SessionClosed, "no write dispatcher"}));
        return;
    }

    QPointer<WriteQueue> self(this);
    dispatcher_(entity_id, [self, entity_id, on_done = std::move(on_done)](Result<void, Error> result) {
        if (self) {
            self->finish(entity_id, result.is_ok());
        }
        if (on_done) on_done(std::move(result));
    });
}

void WriteQueue::finish(const EntityId& entity_id, bool ok) {
    auto it = entries_.find(entity_id);
    if (it == entries_.end()) return;
    auto& entry = it->second;
    entry.in_flight = false;
    emit writeCompleted(QString::fromStdString(entity_id), ok);

    if (entry.deferred) {
        dispatch(entity_id, nullptr);
        return;
    }

    auto waiters = std::move(entry.idle_waiters);
    entry.idle_waiters.clear();
    release_if_idle(entity_id);
    for (auto& waiter : waiters) {
        waiter();
    }
}

void WriteQueue::release_if_idle(const EntityId& entity_id) {
    auto it = entries_.find(entity_id);
    if (it == entries_.end()) return;
    const auto& entry = it->second;
    if (entry.in_flight || entry.deferred || entry.timer->isActive() || !entry.idle_waiters.empty()) {
        return;
    }
    entries_.erase(it);
}

void WriteQueue::cancel(const EntityId& entity_id) {
    auto it = entries_.find(entity_id);
    if (it == entries_.end()) return;
    it->second.timer->stop();
    it->second.deferred = false;
    release_if_idle(entity_id);
}

void WriteQueue::cancel_all() {
    std::vector<EntityId> ids;
    for (auto& [id, entry] : entries_) {
        entry.timer->stop();
        entry.deferred = false;
        ids.push_back(id);
    }
    for (const auto& id : ids) {
        release_if_idle(id);
    }
    qCInfo(atelierSyncLog) << "Cancelled pending writes," << entries_.size() << "still in flight";
}

void WriteQueue::when_idle(const EntityId& entity_id, std::function<void()> fn) {
    auto it = entries_.find(entity_id);
    if (it == entries_.end() || !it->second.in_flight) {
        fn();
        return;
    }
    it->second.idle_waiters.push_back(std::move(fn));
}

bool WriteQueue::is_pending(const EntityId& entity_id) const {
    const auto it = entries_.find(entity_id);
    if (it == entries_.end()) return false;
    return it->second.deferred || it->second.timer->isActive();
}

bool WriteQueue::is_in_flight(const EntityId& entity_id) const {
    const auto it = entries_.find(entity_id);
    return it != entries_.end() && it->second.in_flight;
}

size_t WriteQueue::pending_count() const {
    size_t count = 0;
    for (const auto& [id, entry] : entries_) {
        if (entry.deferred || entry.timer->isActive()) ++count;
    }
    return count;
}

} // namespace atelier::sync
