#include <catch2/catch_test_macros.hpp>
#include "sync/write_queue.hpp"

#include <QSignalSpy>
#include <QTest>
#include <QTimer>
#include <algorithm>
#include <optional>

using namespace atelier;
using namespace atelier::sync;
using namespace std::chrono_literals;

namespace {

/**
 * Dispatcher that records what it would push and completes after `latency`.
 */
struct RecordingWriter {
    std::map<EntityId, int> values;
    std::vector<std::pair<EntityId, int>> writes;
    int in_flight = 0;
    int max_in_flight = 0;
    std::chrono::milliseconds latency{0};
    std::optional<Error> failure;

    WriteDispatcher dispatcher() {
        return [this](const EntityId& id, WriteDone done) {
            writes.emplace_back(id, values[id]);
            max_in_flight = std::max(max_in_flight, ++in_flight);
            QTimer::singleShot(latency, [this, done = std::move(done)]() {
                --in_flight;
                if (failure) {
                    done(Result<void, Error>::err(*failure));
                } else {
                    done(Result<void, Error>::ok());
                }
            });
        };
    }
};

} // namespace

TEST_CASE("Write queue: rapid mutations coalesce into one write", "[integration][queue]") {
    RecordingWriter writer;
    WriteQueue queue(30ms);
    queue.set_dispatcher(writer.dispatcher());

    for (int value = 1; value <= 5; ++value) {
        writer.values["p1"] = value;
        queue.enqueue("p1");
    }
    REQUIRE(queue.is_pending("p1"));
    REQUIRE(writer.writes.empty());

    REQUIRE(QTest::qWaitFor([&] { return !writer.writes.empty(); }, 2000));
    QTest::qWait(80);
    REQUIRE(writer.writes.size() == 1);
    REQUIRE(writer.writes[0] == std::pair<EntityId, int>{"p1", 5});
    REQUIRE_FALSE(queue.is_pending("p1"));
    REQUIRE(queue.pending_count() == 0);
}

TEST_CASE("Write queue: entities debounce independently", "[integration][queue]") {
    RecordingWriter writer;
    WriteQueue queue(20ms);
    queue.set_dispatcher(writer.dispatcher());
    QSignalSpy completed(&queue, &WriteQueue::writeCompleted);

    queue.enqueue("p1");
    queue.enqueue("p2");
    REQUIRE(queue.pending_count() == 2);

    REQUIRE(QTest::qWaitFor([&] { return completed.count() == 2; }, 2000));
    REQUIRE(writer.writes.size() == 2);
    REQUIRE(completed.at(0).at(1).toBool());
}

TEST_CASE("Write queue: a mutation during a write waits for it", "[integration][queue]") {
    RecordingWriter writer;
    writer.latency = 150ms;
    WriteQueue queue(10ms);
    queue.set_dispatcher(writer.dispatcher());

    writer.values["p1"] = 1;
    queue.enqueue("p1");
    REQUIRE(QTest::qWaitFor([&] { return queue.is_in_flight("p1"); }, 2000));

    writer.values["p1"] = 2;
    queue.enqueue("p1");
    QTest::qWait(50);
    REQUIRE(writer.writes.size() == 1);
    REQUIRE(queue.is_pending("p1"));

    REQUIRE(QTest::qWaitFor([&] { return writer.writes.size() == 2; }, 2000));
    REQUIRE(QTest::qWaitFor([&] { return !queue.is_in_flight("p1"); }, 2000));
    REQUIRE(writer.max_in_flight == 1);
    REQUIRE(writer.writes[1].second == 2);
}

TEST_CASE("Write queue: force flush", "[integration][queue]") {
    RecordingWriter writer;
    writer.latency = 50ms;
    WriteQueue queue(5s);
    queue.set_dispatcher(writer.dispatcher());

    queue.enqueue("p1");

    std::optional<Res<FlushOutcome>> first;
    queue.force_flush("p1", [&](Res<FlushOutcome> outcome) { first = std::move(outcome); });
    REQUIRE(writer.writes.size() == 1);
    REQUIRE_FALSE(queue.is_pending("p1"));

    SECTION("Skipped while a write is in flight") {
        std::optional<Res<FlushOutcome>> second;
        queue.force_flush("p1", [&](Res<FlushOutcome> outcome) { second = std::move(outcome); });
        REQUIRE(second.has_value());
        REQUIRE(second->unwrap() == FlushOutcome::Skipped);
        REQUIRE(writer.writes.size() == 1);
    }

    REQUIRE(QTest::qWaitFor([&] { return first.has_value(); }, 2000));
    REQUIRE(first->unwrap() == FlushOutcome::Dispatched);
}

TEST_CASE("Write queue: failed writes are reported and not retried", "[integration][queue]") {
    RecordingWriter writer;
    writer.failure = Error{ErrorCode::RemoteUnavailable, "offline"};
    WriteQueue queue(5s);
    queue.set_dispatcher(writer.dispatcher());
    QSignalSpy completed(&queue, &WriteQueue::writeCompleted);

    std::optional<Res<FlushOutcome>> outcome;
    queue.force_flush("p1", [&](Res<FlushOutcome> result) { outcome = std::move(result); });
    REQUIRE(QTest::qWaitFor([&] { return outcome.has_value(); }, 2000));
    REQUIRE(outcome->is_err());
    REQUIRE(outcome->unwrap_err().is(ErrorCode::RemoteUnavailable));
    REQUIRE_FALSE(completed.at(0).at(1).toBool());

    QTest::qWait(50);
    REQUIRE(writer.writes.size() == 1);
    REQUIRE_FALSE(queue.is_pending("p1"));
}

TEST_CASE("Write queue: cancel drops pending writes", "[integration][queue]") {
    RecordingWriter writer;
    WriteQueue queue(20ms);
    queue.set_dispatcher(writer.dispatcher());

    queue.enqueue("p1");
    queue.enqueue("p2");
    queue.enqueue("p3");
    queue.cancel("p3");
    REQUIRE(queue.pending_count() == 2);

    queue.cancel_all();
    REQUIRE(queue.pending_count() == 0);
    QTest::qWait(80);
    REQUIRE(writer.writes.empty());
}

TEST_CASE("Write queue: when_idle waits for the write in flight", "[integration][queue]") {
    RecordingWriter writer;
    writer.latency = 40ms;
    WriteQueue queue(5s);
    queue.set_dispatcher(writer.dispatcher());

    bool ran_immediately = false;
    queue.when_idle("p1", [&] { ran_immediately = true; });
    REQUIRE(ran_immediately);

    queue.force_flush("p1", [](Res<FlushOutcome>) {});
    bool ran_after = false;
    queue.when_idle("p1", [&] { ran_after = true; });
    REQUIRE_FALSE(ran_after);
    REQUIRE(QTest::qWaitFor([&] { return ran_after; }, 2000));
    REQUIRE_FALSE(queue.is_in_flight("p1"));
}

TEST_CASE("Write queue: without a dispatcher writes end the session", "[integration][queue]") {
    WriteQueue queue(5s);
    std::optional<Res<FlushOutcome>> outcome;
    queue.force_flush("p1", [&](Res<FlushOutcome> result) { outcome = std::move(result); });
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->unwrap_err().is(ErrorCode::SessionClosed));
    REQUIRE_FALSE(queue.is_in_flight("p1"));
}
