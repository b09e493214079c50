#include "sync/subscription_manager.hpp"

#include "core/codec.hpp"
#include "core/logging.hpp"

#include <QJsonArray>

namespace atelier::sync {

SubscriptionManager::SubscriptionManager(network::RemoteStore& remote,
                                         SubscriptionHandlers handlers,
                                         QObject* parent)
    : QObject(parent)
    , remote_(remote)
    , handlers_(std::move(handlers)) {
}

SubscriptionManager::~SubscriptionManager() {
    close_all();
}

void SubscriptionManager::subscribe(const EntityId& project_id, const EntityId& root_id) {
    const Key key{project_id, root_id};
    const auto existing = roots_.find(key);
    const bool replaced = existing != roots_.end();
    if (replaced) {
        if (existing->second.id != 0) remote_.unwatch(existing->second.id);
    } else {
        retain_project(project_id);
    }

    Watch watch;
    watch.serial = next_serial_++;
    if (!root_id.empty()) {
        const auto serial = watch.serial;
        watch.id = remote_.watch_collection(
            network::paths::styling(project_id, root_id),
            [this, key, serial](const std::vector<network::DocumentSnapshot>& docs) {
                const auto it = roots_.find(key);
                if (it == roots_.end() || it->second.serial != serial) return;

                QJsonArray array;
                for (const auto& doc : docs) {
                    auto data = doc.data;
                    if (!data.contains(QStringLiteral("id"))) data.insert(QStringLiteral("id"), to_qstring(doc.id));
                    array.append(data);
                }
                std::vector<Error> rejected;
                auto lineage = lineage_from_json(array, true, &rejected);
                if (!rejected.empty()) {
                    qCWarning(atelierRemoteLog) << "Ignored" << rejected.size() << "malformed styling documents of"
                                                << to_qstring(key.first) << "/" << to_qstring(key.second);
                }
                sort_chronologically(lineage);
                emit remoteChangeReceived(to_qstring(key.first));
                if (handlers_.on_styling) handlers_.on_styling(key.first, key.second, lineage);
            });
    }
    roots_[key] = watch;

    qCInfo(atelierSyncLog) << (replaced ? "Resubscribed" : "Subscribed")
                           << to_qstring(project_id) << "root" << to_qstring(root_id);
    emit subscribed(to_qstring(project_id), to_qstring(root_id));
}

void SubscriptionManager::retain_project(const EntityId& project_id) {
    auto& entry = projects_[project_id];
    if (entry.refs++ > 0) return;

    entry.watch.serial = next_serial_++;
    const auto serial = entry.watch.serial;
    entry.watch.id = remote_.watch_document(
        network::paths::project(project_id),
        [this, project_id, serial](const std::optional<QJsonObject>& document) {
            const auto it = projects_.find(project_id);
            if (it == projects_.end() || it->second.watch.serial != serial) return;
            emit remoteChangeReceived(to_qstring(project_id));
            if (handlers_.on_project) handlers_.on_project(project_id, document);
        });
}

void SubscriptionManager::release_project(const EntityId& project_id) {
    auto it = projects_.find(project_id);
    if (it == projects_.end()) return;
    if (--it->second.refs > 0) return;
    remote_.unwatch(it->second.watch.id);
    projects_.erase(it);
}

void SubscriptionManager::drop_root(std::map<Key, Watch>::iterator it) {
    const auto project_id = it->first.first;
    if (it->second.id != 0) {
        remote_.unwatch(it->second.id);
    }
    roots_.erase(it);
    release_project(project_id);
}

void SubscriptionManager::unsubscribe(const EntityId& project_id, const EntityId& root_id) {
    auto it = roots_.find(Key{project_id, root_id});
    if (it != roots_.end()) {
        drop_root(it);
    }
}

void SubscriptionManager::close_project(const EntityId& project_id) {
    auto it = roots_.lower_bound(Key{project_id, EntityId{}});
    while (it != roots_.end() && it->first.first == project_id) {
        auto next = std::next(it);
        drop_root(it);
        it = next;
    }
}

void SubscriptionManager::close_all() {
    if (roots_.empty() && projects_.empty()) return;
    qCInfo(atelierSyncLog) << "Closing" << roots_.size() << "subscriptions";
    for (const auto& [key, watch] : roots_) {
        if (watch.id != 0) remote_.unwatch(watch.id);
    }
    for (const auto& [id, project] : projects_) {
        remote_.unwatch(project.watch.id);
    }
    roots_.clear();
    projects_.clear();
}

bool SubscriptionManager::is_subscribed(const EntityId& project_id, const EntityId& root_id) const {
    return roots_.count(Key{project_id, root_id}) > 0;
}

} // namespace atelier::sync
