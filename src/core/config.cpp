#include "core/config.hpp"

#include "core/logging.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QSysInfo>
#include <QUuid>
#include <QtGlobal>

namespace atelier {

namespace {

constexpr auto kGroup = "sync";
constexpr auto kDebounceKey = "debounceMs";
constexpr auto kConflictWindowKey = "conflictWindowMs";
constexpr auto kMaxDocumentKey = "maxDocumentBytes";
constexpr auto kAutoMergeKey = "autoSmartMerge";
constexpr auto kStrategyKey = "remoteMergeStrategy";
constexpr auto kDeviceIdKey = "deviceId";
constexpr auto kDeviceNameKey = "deviceName";

// Expects the "sync" group to be open.
QString get_or_create_device_id(QSettings& settings) {
    const auto key = QString::fromLatin1(kDeviceIdKey);
    const auto stored = settings.value(key).toString();
    if (!QUuid::fromString(stored).isNull()) {
        return stored;
    }
    const auto id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    settings.setValue(key, id);
    return id;
}

bool parse_bool(const QString& text, bool fallback) {
    const auto lowered = text.trimmed().toLower();
    if (lowered == QStringLiteral("1") || lowered == QStringLiteral("true") ||
        lowered == QStringLiteral("on") || lowered == QStringLiteral("yes")) {
        return true;
    }
    if (lowered == QStringLiteral("0") || lowered == QStringLiteral("false") ||
        lowered == QStringLiteral("off") || lowered == QStringLiteral("no")) {
        return false;
    }
    return fallback;
}

void override_millis(const char* name, std::chrono::milliseconds& target) {
    if (!qEnvironmentVariableIsSet(name)) return;
    bool ok = false;
    const auto value = qEnvironmentVariable(name).toLongLong(&ok);
    if (!ok || value < 0) {
        qCWarning(atelierSyncLog) << "Ignoring invalid" << name << "=" << qEnvironmentVariable(name);
        return;
    }
    target = std::chrono::milliseconds(value);
}

} // namespace

EngineConfig load_engine_config(QSettings& settings) {
    EngineConfig config;
    settings.beginGroup(QString::fromLatin1(kGroup));
    config.debounce = std::chrono::milliseconds(
        settings.value(QString::fromLatin1(kDebounceKey),
                       static_cast<qlonglong>(config.debounce.count())).toLongLong());
    config.conflict_window = std::chrono::milliseconds(
        settings.value(QString::fromLatin1(kConflictWindowKey),
                       static_cast<qlonglong>(config.conflict_window.count())).toLongLong());
    config.max_document_bytes = static_cast<std::size_t>(
        settings.value(QString::fromLatin1(kMaxDocumentKey),
                       static_cast<qulonglong>(config.max_document_bytes)).toULongLong());
    config.auto_smart_merge =
        settings.value(QString::fromLatin1(kAutoMergeKey), config.auto_smart_merge).toBool();
    const auto strategy = settings.value(QString::fromLatin1(kStrategyKey)).toString();
    if (!strategy.isEmpty()) {
        config.remote_merge_strategy =
            parse_merge_strategy(strategy.toStdString()).value_or(config.remote_merge_strategy);
    }
    config.device_id = get_or_create_device_id(settings);
    config.device_name =
        settings.value(QString::fromLatin1(kDeviceNameKey), QSysInfo::machineHostName()).toString();
    settings.endGroup();

    apply_environment_overrides(config);
    return config;
}

EngineConfig load_engine_config() {
    EngineConfig config;
    apply_environment_overrides(config);
    return config;
}

void apply_environment_overrides(EngineConfig& config) {
    override_millis("ATELIER_SYNC_DEBOUNCE_MS", config.debounce);
    override_millis("ATELIER_SYNC_CONFLICT_WINDOW_MS", config.conflict_window);
    if (qEnvironmentVariableIsSet("ATELIER_SYNC_AUTO_MERGE")) {
        config.auto_smart_merge =
            parse_bool(qEnvironmentVariable("ATELIER_SYNC_AUTO_MERGE"), config.auto_smart_merge);
    }
}

void store_engine_config(QSettings& settings, const EngineConfig& config) {
    settings.beginGroup(QString::fromLatin1(kGroup));
    settings.setValue(QString::fromLatin1(kDebounceKey), static_cast<qlonglong>(config.debounce.count()));
    settings.setValue(QString::fromLatin1(kConflictWindowKey),
                      static_cast<qlonglong>(config.conflict_window.count()));
    settings.setValue(QString::fromLatin1(kMaxDocumentKey),
                      static_cast<qulonglong>(config.max_document_bytes));
    settings.setValue(QString::fromLatin1(kAutoMergeKey), config.auto_smart_merge);
    settings.setValue(QString::fromLatin1(kStrategyKey),
                      QString::fromLatin1(to_string(config.remote_merge_strategy).data(),
                                          static_cast<qsizetype>(to_string(config.remote_merge_strategy).size())));
    if (!config.device_name.isEmpty()) {
        settings.setValue(QString::fromLatin1(kDeviceNameKey), config.device_name);
    }
    settings.endGroup();
}

QString default_database_path() {
    const auto override_db = qEnvironmentVariable("ATELIER_DB_PATH");
    if (!override_db.isEmpty()) {
        return override_db;
    }
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QStringLiteral("atelier.db");
    }
    QDir().mkpath(base);
    return QDir(base).filePath(QStringLiteral("atelier.db"));
}

} // namespace atelier
