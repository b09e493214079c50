#pragma once

#include "core/project.hpp"
#include "network/remote_store.hpp"
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <functional>
#include <map>
#include <optional>
#include <utility>

namespace atelier::sync {

/**
 * Where remote pushes are delivered. Both are called on the store's event
 * loop, only for subscriptions that are still open.
 */
struct SubscriptionHandlers {
    std::function<void(const EntityId& project_id, const std::optional<QJsonObject>& document)> on_project;
    std::function<void(const EntityId& project_id, const EntityId& root_id, const Lineage& styling)> on_styling;
};

/**
 * SubscriptionManager - Live remote watches of open projects.
 *
 * One styling collection watch per (project, root) and one project document
 * watch per project, shared by all of that project's roots. Subscribing a
 * root again replaces its watch.
 */
class SubscriptionManager : public QObject {
    Q_OBJECT

public:
    SubscriptionManager(network::RemoteStore& remote, SubscriptionHandlers handlers, QObject* parent = nullptr);
    ~SubscriptionManager() override;

    /**
     * Watch styling root `root_id` of a project; an empty root watches only
     * the project document.
     */
    void subscribe(const EntityId& project_id, const EntityId& root_id);

    void unsubscribe(const EntityId& project_id, const EntityId& root_id);

    // Every watch of one project.
    void close_project(const EntityId& project_id);

    // Every watch. Required on session teardown and project switch.
    void close_all();

    [[nodiscard]] bool is_subscribed(const EntityId& project_id, const EntityId& root_id) const;
    [[nodiscard]] size_t subscription_count() const { return roots_.size(); }
    [[nodiscard]] size_t project_watch_count() const { return projects_.size(); }

signals:
    void subscribed(const QString& projectId, const QString& rootId);
    void remoteChangeReceived(const QString& projectId);

private:
    using Key = std::pair<EntityId, EntityId>;

    struct Watch {
        network::WatchId id = 0;
        uint64_t serial = 0;
    };

    struct ProjectWatch {
        Watch watch;
        int refs = 0;
    };

    network::RemoteStore& remote_;
    SubscriptionHandlers handlers_;
    std::map<Key, Watch> roots_;
    std::map<EntityId, ProjectWatch> projects_;
    uint64_t next_serial_ = 1;

    void retain_project(const EntityId& project_id);
    void release_project(const EntityId& project_id);
    void drop_root(std::map<Key, Watch>::iterator it);
};

} // namespace atelier::sync
