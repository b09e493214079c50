#include <catch2/catch_test_macros.hpp>
#include "core/config.hpp"

#include <QSettings>
#include <QTemporaryDir>
#include <QUuid>

using namespace atelier;

namespace {

struct ScopedEnv {
    QByteArray name;

    ScopedEnv(const char* key, const QByteArray& value) : name(key) { qputenv(key, value); }
    ~ScopedEnv() { qunsetenv(name.constData()); }
};

} // namespace

TEST_CASE("Engine config defaults", "[config]") {
    const EngineConfig config;
    REQUIRE(config.debounce == std::chrono::milliseconds(5000));
    REQUIRE(config.conflict_window == std::chrono::milliseconds(30000));
    REQUIRE(config.max_document_bytes == 1024 * 1024);
    REQUIRE(config.auto_smart_merge);
    REQUIRE(config.remote_merge_strategy == MergeStrategy::Smart);
}

TEST_CASE("Engine config persists through QSettings", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath("atelier.ini"), QSettings::IniFormat);

    EngineConfig stored;
    stored.debounce = std::chrono::milliseconds(250);
    stored.max_document_bytes = 4096;
    stored.auto_smart_merge = false;
    stored.remote_merge_strategy = MergeStrategy::PreferRemote;
    store_engine_config(settings, stored);

    const auto loaded = load_engine_config(settings);
    REQUIRE(loaded.debounce == std::chrono::milliseconds(250));
    REQUIRE(loaded.conflict_window == stored.conflict_window);
    REQUIRE(loaded.max_document_bytes == 4096);
    REQUIRE_FALSE(loaded.auto_smart_merge);
    REQUIRE(loaded.remote_merge_strategy == MergeStrategy::PreferRemote);
}

TEST_CASE("Device identity is created once", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath("atelier.ini"), QSettings::IniFormat);

    const auto first = load_engine_config(settings);
    REQUIRE_FALSE(first.device_id.isEmpty());
    REQUIRE_FALSE(QUuid::fromString(first.device_id).isNull());
    REQUIRE(load_engine_config(settings).device_id == first.device_id);

    EngineConfig named = first;
    named.device_name = QStringLiteral("studio-mac");
    store_engine_config(settings, named);
    REQUIRE(load_engine_config(settings).device_name == QStringLiteral("studio-mac"));

    REQUIRE(load_engine_config().device_id.isEmpty());
}

TEST_CASE("Environment overrides settings", "[config]") {
    SECTION("Valid values apply") {
        ScopedEnv debounce("ATELIER_SYNC_DEBOUNCE_MS", "40");
        ScopedEnv merge("ATELIER_SYNC_AUTO_MERGE", "off");
        const auto config = load_engine_config();
        REQUIRE(config.debounce == std::chrono::milliseconds(40));
        REQUIRE_FALSE(config.auto_smart_merge);
    }

    SECTION("Invalid values are ignored") {
        ScopedEnv debounce("ATELIER_SYNC_DEBOUNCE_MS", "-3");
        ScopedEnv merge("ATELIER_SYNC_AUTO_MERGE", "maybe");
        const auto config = load_engine_config();
        REQUIRE(config.debounce == std::chrono::milliseconds(5000));
        REQUIRE(config.auto_smart_merge);
    }
}

TEST_CASE("Database path honours ATELIER_DB_PATH", "[config]") {
    ScopedEnv path("ATELIER_DB_PATH", "/tmp/atelier-test.db");
    REQUIRE(default_database_path() == QStringLiteral("/tmp/atelier-test.db"));
}

TEST_CASE("Merge strategy names", "[config]") {
    REQUIRE(parse_merge_strategy("prefer-local") == MergeStrategy::PreferLocal);
    REQUIRE(to_string(MergeStrategy::PreferRemote) == "prefer-remote");
    REQUIRE_FALSE(parse_merge_strategy("newest").has_value());
}
