#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

namespace atelier {

Q_LOGGING_CATEGORY(atelierSyncLog, "atelier.sync")
Q_LOGGING_CATEGORY(atelierMergeLog, "atelier.merge")
Q_LOGGING_CATEGORY(atelierStoreLog, "atelier.store")
Q_LOGGING_CATEGORY(atelierRemoteLog, "atelier.remote")

namespace {

QString compute_log_file_path() {
    const auto override_path = qEnvironmentVariable("ATELIER_LOG_PATH");
    if (!override_path.isEmpty()) {
        return override_path;
    }
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/atelier.log"));
}

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    bool initialized = false;
    QtMessageHandler previous = nullptr;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void ensure_open(LoggerState& s) {
    if (s.initialized) return;
    s.initialized = true;

    const auto path = compute_log_file_path();
    if (path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        s.file.setFileName(QString{});
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        ensure_open(s);

        const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
        const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");
        const auto line = QStringLiteral("%1 %2 %3 %4\n")
                              .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);

        if (s.file.isOpen()) {
            s.file.write(line.toUtf8());
            s.file.flush();
        }
    }

    // Keep the console output of the previous handler.
    if (s.previous) {
        s.previous(type, ctx, msg);
    }
}

} // namespace

bool sync_debug_enabled() {
    static const bool enabled = qEnvironmentVariableIsSet("ATELIER_DEBUG_SYNC");
    return enabled;
}

void install_file_logging() {
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    state().previous = qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    return compute_log_file_path();
}

} // namespace atelier
