#include <catch2/catch_test_macros.hpp>
#include "core/codec.hpp"
#include "network/memory_remote_store.hpp"
#include "sync/subscription_manager.hpp"

#include <QSignalSpy>
#include <QTest>
#include <optional>

using namespace atelier;
using namespace atelier::sync;
using network::MemoryRemoteStore;

namespace {

const std::string kUrl = "https://cdn.example/look.png";

struct Deliveries {
    std::vector<std::pair<EntityId, std::optional<QJsonObject>>> projects;
    std::vector<std::pair<EntityId, Lineage>> styling;   // root -> lineage

    SubscriptionHandlers handlers() {
        SubscriptionHandlers h;
        h.on_project = [this](const EntityId& id, const std::optional<QJsonObject>& document) {
            projects.emplace_back(id, document);
        };
        h.on_styling = [this](const EntityId&, const EntityId& root, const Lineage& lineage) {
            styling.emplace_back(root, lineage);
        };
        return h;
    }
};

void put_styling_item(MemoryRemoteStore& store, const HistoryItem& item) {
    store.inject_change(network::paths::document(network::paths::styling("p1", item.base_model_id), item.id),
                        to_json(item), network::WriteMode::Replace);
}

} // namespace

TEST_CASE("Subscriptions: styling watch delivers decoded lineages", "[integration][subscriptions]") {
    MemoryRemoteStore store;
    Deliveries deliveries;
    SubscriptionManager manager(store, deliveries.handlers());

    const auto root = create_root_item("gen-1", HistoryItemType::ModelGeneration, kUrl, Timestamp(1));
    const auto later = create_child_item(root, "tryon-30", HistoryItemType::TryOn, kUrl, Timestamp(30));
    const auto earlier = create_child_item(root, "tryon-20", HistoryItemType::TryOn, kUrl, Timestamp(20));
    put_styling_item(store, later);
    put_styling_item(store, earlier);

    QSignalSpy subscribed(&manager, &SubscriptionManager::subscribed);
    manager.subscribe("p1", "gen-1");
    REQUIRE(subscribed.count() == 1);
    REQUIRE(manager.is_subscribed("p1", "gen-1"));
    REQUIRE(store.active_watch_count() == 2);

    REQUIRE(QTest::qWaitFor([&] { return !deliveries.styling.empty(); }, 2000));
    const auto& [delivered_root, lineage] = deliveries.styling.front();
    REQUIRE(delivered_root == "gen-1");
    REQUIRE(lineage.size() == 2);
    REQUIRE(lineage[0].id == "tryon-20");
    REQUIRE(lineage[1].id == "tryon-30");

    SECTION("Malformed documents are dropped") {
        QJsonObject broken;
        broken.insert(QStringLiteral("type"), QStringLiteral("hologram"));
        store.inject_change("projects/p1/styling/gen-1/junk", broken, network::WriteMode::Replace);
        REQUIRE(deliveries.styling.size() == 2);
        REQUIRE(deliveries.styling.back().second.size() == 2);
    }
}

TEST_CASE("Subscriptions: roots of one project share the project watch", "[integration][subscriptions]") {
    MemoryRemoteStore store;
    Deliveries deliveries;
    SubscriptionManager manager(store, deliveries.handlers());

    manager.subscribe("p1", "gen-1");
    manager.subscribe("p1", "gen-2");
    manager.subscribe("p2", "");
    REQUIRE(manager.subscription_count() == 3);
    REQUIRE(manager.project_watch_count() == 2);
    // Two styling watches, two project watches; the empty root adds none.
    REQUIRE(store.active_watch_count() == 4);

    manager.unsubscribe("p1", "gen-1");
    REQUIRE(manager.project_watch_count() == 2);
    REQUIRE(store.active_watch_count() == 3);

    manager.unsubscribe("p1", "gen-2");
    REQUIRE(manager.project_watch_count() == 1);
    REQUIRE(store.active_watch_count() == 1);
}

TEST_CASE("Subscriptions: subscribing again replaces the watch", "[integration][subscriptions]") {
    MemoryRemoteStore store;
    Deliveries deliveries;
    SubscriptionManager manager(store, deliveries.handlers());

    manager.subscribe("p1", "gen-1");
    manager.subscribe("p1", "gen-1");
    REQUIRE(manager.subscription_count() == 1);
    REQUIRE(store.active_watch_count() == 2);

    // One initial styling snapshot: the first watch was removed before it fired.
    REQUIRE(QTest::qWaitFor([&] { return !deliveries.styling.empty(); }, 2000));
    QTest::qWait(20);
    REQUIRE(deliveries.styling.size() == 1);
}

TEST_CASE("Subscriptions: project document changes reach the handler", "[integration][subscriptions]") {
    MemoryRemoteStore store;
    Deliveries deliveries;
    SubscriptionManager manager(store, deliveries.handlers());
    QSignalSpy received(&manager, &SubscriptionManager::remoteChangeReceived);

    manager.subscribe("p1", "");
    REQUIRE(QTest::qWaitFor([&] { return deliveries.projects.size() == 1; }, 2000));
    REQUIRE_FALSE(deliveries.projects[0].second.has_value());

    QJsonObject doc;
    doc.insert(QStringLiteral("title"), QStringLiteral("Resort"));
    store.inject_change("projects/p1", doc);
    REQUIRE(deliveries.projects.size() == 2);
    REQUIRE(deliveries.projects[1].first == "p1");
    REQUIRE(deliveries.projects[1].second->value("title").toString() == "Resort");
    REQUIRE(received.count() == 2);
}

TEST_CASE("Subscriptions: closed watches stop delivering", "[integration][subscriptions]") {
    MemoryRemoteStore store;
    Deliveries deliveries;
    SubscriptionManager manager(store, deliveries.handlers());

    manager.subscribe("p1", "gen-1");
    manager.subscribe("p2", "gen-9");

    SECTION("Close one project") {
        manager.close_project("p1");
        REQUIRE_FALSE(manager.is_subscribed("p1", "gen-1"));
        REQUIRE(manager.is_subscribed("p2", "gen-9"));
        REQUIRE(store.active_watch_count() == 2);
    }

    SECTION("Close everything") {
        manager.close_all();
        REQUIRE(manager.subscription_count() == 0);
        REQUIRE(manager.project_watch_count() == 0);
        REQUIRE(store.active_watch_count() == 0);

        // Initial snapshots were scheduled before the close.
        QTest::qWait(20);
        const auto root = create_root_item("gen-1", HistoryItemType::ModelGeneration, kUrl, Timestamp(1));
        put_styling_item(store, create_child_item(root, "tryon-2", HistoryItemType::TryOn, kUrl, Timestamp(2)));
        REQUIRE(deliveries.styling.empty());
        REQUIRE(deliveries.projects.empty());
    }
}
