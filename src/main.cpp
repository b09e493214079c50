#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>

#include "cli/inspect.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "crypto/digest.hpp"
#include "storage/database.hpp"
#include "storage/local_store.hpp"
#include "storage/migrations.hpp"
#include "sync/validation_gate.hpp"

namespace {

int fail(const std::string& message) {
    QTextStream(stderr) << QString::fromStdString(message) << QLatin1Char('\n');
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("Atelier");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Atelier");
    app.setOrganizationDomain("atelier.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Atelier sync cache inspector"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets ATELIER_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption includeIdsOption(
        QStringList{QStringLiteral("ids")},
        QStringLiteral("Include IDs in output."));
    parser.addOption(includeIdsOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption projectIdOption(
        QStringList{QStringLiteral("id")},
        QStringLiteral("Project ID for 'history'."),
        QStringLiteral("projectId"));
    parser.addOption(projectIdOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets ATELIER_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("list | history | validate | config"));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("ATELIER_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(debugSyncOption)) {
        qputenv("ATELIER_DEBUG_SYNC", "1");
        QLoggingCategory::setFilterRules(QStringLiteral("atelier.*.debug=true\n"));
    }

    atelier::install_file_logging();
    qInfo() << "Atelier: logging to" << atelier::default_log_file_path();

    QSettings settings;
    const auto config = atelier::load_engine_config(settings);

    const auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QStringLiteral("list") : positional.first();

    if (command == QStringLiteral("config")) {
        QTextStream(stdout) << "debounceMs=" << config.debounce.count() << '\n'
                            << "conflictWindowMs=" << config.conflict_window.count() << '\n'
                            << "maxDocumentBytes=" << config.max_document_bytes << '\n'
                            << "autoSmartMerge=" << (config.auto_smart_merge ? "true" : "false") << '\n'
                            << "remoteMergeStrategy="
                            << QString::fromStdString(std::string(atelier::to_string(config.remote_merge_strategy)))
                            << '\n';
        return 0;
    }

    auto crypto_result = atelier::crypto::init();
    if (crypto_result.is_err()) {
        return fail("Failed to initialize crypto: " + crypto_result.unwrap_err().message);
    }

    const auto db_path = atelier::default_database_path();
    auto db_result = atelier::storage::Database::open(db_path.toStdString());
    if (db_result.is_err()) {
        return fail("Cannot open " + db_path.toStdString() + ": " + db_result.unwrap_err().message);
    }
    auto db = std::move(db_result).unwrap();
    auto migrated = atelier::storage::initialize_database(db);
    if (migrated.is_err()) {
        return fail("Cannot migrate " + db_path.toStdString() + ": " + migrated.unwrap_err().message);
    }
    atelier::storage::LocalStore store(db);

    const atelier::cli::InspectOptions options{.includeIds = parser.isSet(includeIdsOption)};

    if (command == QStringLiteral("list")) {
        auto projects = store.list_projects();
        if (projects.is_err()) {
            return fail(projects.unwrap_err().message);
        }
        QTextStream(stdout) << (parser.isSet(jsonOption)
                                    ? atelier::cli::format_project_list_json(projects.unwrap(), options)
                                    : atelier::cli::format_project_list(projects.unwrap(), options));
        return 0;
    }

    if (command == QStringLiteral("history")) {
        if (!parser.isSet(projectIdOption)) {
            return fail("history requires --id <projectId>");
        }
        const auto project_id = parser.value(projectIdOption).toStdString();
        auto state = store.get_state(project_id);
        if (state.is_err()) {
            return fail(state.unwrap_err().message);
        }
        if (!state.unwrap()) {
            return fail("no project state " + project_id);
        }
        QTextStream(stdout) << (parser.isSet(jsonOption)
                                    ? atelier::cli::format_history_tree_json(*state.unwrap(), options)
                                    : atelier::cli::format_history_tree(*state.unwrap(), options));
        return 0;
    }

    if (command == QStringLiteral("validate")) {
        const atelier::sync::ValidationGate gate(config.max_document_bytes);
        auto findings = atelier::cli::validate_store(store, gate);
        if (findings.is_err()) {
            return fail(findings.unwrap_err().message);
        }
        QTextStream(stdout) << atelier::cli::format_findings(findings.unwrap());
        return findings.unwrap().empty() ? 0 : 2;
    }

    return fail("unknown command: " + command.toStdString());
}
