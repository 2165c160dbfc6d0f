#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <rangeget/config/config_helpers.h>
#include <rangeget/config/downloader_config.h>
#include <rangeget/logging/logging.h>

#include "../../common/test_helpers_catch2.h"
#include "../../support/temp_dir_scope.hpp"

#include <spdlog/spdlog.h>

using namespace rangeget;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using rangeget::test::ScopedEnvVar;
using rangeget::test::write_file;
using rangeget::test_support::TempDirScope;

TEST_CASE("Config sections are parsed with comments and quotes", "[config]") {
    auto dir = TempDirScope::unique_under("rangeget-config");
    const auto path = write_file(dir.path() / "config.toml", R"(# rangeget
network.user_agent = "top-level/2.0"

[downloader]
threads = 16          # more parallelism
read_timeout_ms = 8000

[network]
proxy = "http://proxy.local:3128#not-a-comment"
)");

    auto downloader = config::parse_config_section(path, "downloader");
    CHECK(downloader["threads"] == "16");
    CHECK(downloader["read_timeout_ms"] == "8000");

    auto network = config::parse_config_section(path, "network");
    CHECK(network["proxy"] == "http://proxy.local:3128#not-a-comment");
    CHECK(network["user_agent"] == "top-level/2.0");

    CHECK(config::parse_config_value(path, "downloader", "threads") == "16");
    CHECK(config::parse_config_value(path, "downloader", "missing").empty());
    CHECK(config::parse_config_section(dir.path() / "absent.toml", "downloader").empty());
}

TEST_CASE("Config directory honors XDG_CONFIG_HOME", "[config]") {
    ScopedEnvVar xdg("XDG_CONFIG_HOME", std::string("/tmp/xdg-home"));
    CHECK(config::get_config_dir() == std::filesystem::path("/tmp/xdg-home/rangeget"));
    CHECK(config::get_config_path() == std::filesystem::path("/tmp/xdg-home/rangeget/config.toml"));
    CHECK(config::get_config_path("/etc/rangeget.toml") == "/etc/rangeget.toml");
}

TEST_CASE("Engine config loads overrides and validates them", "[config]") {
    auto dir = TempDirScope::unique_under("rangeget-engine-config");
    ScopedEnvVar env("RANGEGET_CONFIG", std::nullopt);
    ScopedEnvVar level("RANGEGET_LOG_LEVEL", std::nullopt);

    SECTION("Defaults when no file exists") {
        ScopedEnvVar xdg("XDG_CONFIG_HOME", dir.path().string());
        auto cfg = config::loadEngineConfig();
        REQUIRE(cfg.ok());
        CHECK(cfg.value().defaultThreads == config::kDefaultThreads);
        CHECK(cfg.value().transfer.speedFloorBps == 300 * 1024);
        CHECK(cfg.value().transfer.relaxSpeedAfterAttempts == 3);
        CHECK(cfg.value().transfer.checkpointEveryChunks == 16);
        CHECK(cfg.value().finishedHistory == 256);
        CHECK(cfg.value().logging.level == "info");
    }

    SECTION("Values from every section") {
        const auto path = write_file(dir.path() / "c.toml", R"(
[downloader]
threads = 12
connect_timeout_ms = 2500
speed_floor_bps = 1024
relax_speed_after_attempts = 5
checkpoint_every_chunks = 8
finished_history = 10

[network]
user_agent = "custom/1"
tls_insecure = true
rate_limit_global_bps = 1048576

[logging]
level = "debug"
)");
        auto cfg = config::loadEngineConfig(path);
        REQUIRE(cfg.ok());
        const auto& c = cfg.value();
        CHECK(c.defaultThreads == 12);
        CHECK(c.transfer.connectTimeout == 2500ms);
        CHECK(c.transfer.speedFloorBps == 1024);
        CHECK(c.transfer.relaxSpeedAfterAttempts == 5);
        CHECK(c.transfer.checkpointEveryChunks == 8);
        CHECK(c.finishedHistory == 10);
        CHECK(c.userAgent == "custom/1");
        CHECK(c.tls.insecure);
        CHECK(c.rateLimit.globalBps == 1048576);
        CHECK(c.logging.level == "debug");

        auto req = config::makeRequestOptions(c);
        CHECK(req.userAgent == "custom/1");
        CHECK(req.connectTimeout == 2500ms);
        CHECK(req.tls.insecure);
    }

    SECTION("RANGEGET_CONFIG and RANGEGET_LOG_LEVEL") {
        const auto path = write_file(dir.path() / "env.toml", "[downloader]\nthreads = 3\n");
        ScopedEnvVar cfgEnv("RANGEGET_CONFIG", path.string());
        ScopedEnvVar levelEnv("RANGEGET_LOG_LEVEL", std::string("warn"));
        auto cfg = config::loadEngineConfig();
        REQUIRE(cfg.ok());
        CHECK(cfg.value().defaultThreads == 3);
        CHECK(cfg.value().logging.level == "warn");
    }

    SECTION("Malformed number") {
        const auto path = write_file(dir.path() / "bad.toml", "[downloader]\nthreads = many\n");
        auto cfg = config::loadEngineConfig(path);
        REQUIRE_FALSE(cfg.ok());
        CHECK(cfg.error().code == downloader::ErrorCode::ParseError);
        CHECK_THAT(cfg.error().message, ContainsSubstring("threads"));
    }

    SECTION("Out-of-range thread count") {
        const auto path = write_file(dir.path() / "range.toml", "[downloader]\nthreads = 65\n");
        auto cfg = config::loadEngineConfig(path);
        REQUIRE_FALSE(cfg.ok());
        CHECK(cfg.error().code == downloader::ErrorCode::ConfigError);
    }

    SECTION("Missing explicit file") {
        auto cfg = config::loadEngineConfig(dir.path() / "nope.toml");
        REQUIRE_FALSE(cfg.ok());
        CHECK(cfg.error().code == downloader::ErrorCode::ConfigError);
    }
}

TEST_CASE("validateConfig rejects inconsistent policies", "[config]") {
    config::EngineConfig cfg;
    REQUIRE(config::validateConfig(cfg).ok());

    SECTION("Zero threads") {
        cfg.defaultThreads = 0;
    }
    SECTION("Backoff cap below base") {
        cfg.transfer.retryBackoffMax = 10ms;
        cfg.transfer.retryBackoffBase = 100ms;
    }
    SECTION("Checkpoint interval of zero") {
        cfg.transfer.checkpointEveryChunks = 0;
    }
    SECTION("Empty finished history") {
        cfg.finishedHistory = 0;
    }
    SECTION("Relaxation point below one") {
        cfg.transfer.relaxSpeedAfterAttempts = 0;
    }
    SECTION("Unknown log level") {
        cfg.logging.level = "chatty";
    }

    auto r = config::validateConfig(cfg);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == downloader::ErrorCode::ConfigError);
}

TEST_CASE("Log levels parse case-insensitively", "[config][logging]") {
    CHECK(logging::parseLevel("DEBUG") == spdlog::level::debug);
    CHECK(logging::parseLevel("warning") == spdlog::level::warn);
    CHECK(logging::parseLevel("err") == spdlog::level::err);
    CHECK(logging::parseLevel("off") == spdlog::level::off);
    CHECK_FALSE(logging::parseLevel("loud").has_value());
}

TEST_CASE("Logging writes to a rotating file when configured", "[config][logging]") {
    auto dir = TempDirScope::unique_under("rangeget-logging");
    logging::LoggingConfig cfg;
    cfg.level = "debug";
    cfg.file = dir.path() / "logs" / "rangeget.log";
    cfg.loggerName = "rangeget-test-file";

    REQUIRE(logging::init(cfg).ok());
    spdlog::info("hello from the test");
    spdlog::default_logger()->flush();
    CHECK_THAT(rangeget::test::read_file(cfg.file), ContainsSubstring("hello from the test"));
    CHECK(spdlog::get_level() == spdlog::level::debug);

    logging::LoggingConfig bad;
    bad.level = "nonsense";
    CHECK_FALSE(logging::init(bad).ok());

    logging::LoggingConfig console;
    console.level = "warn";
    console.loggerName = "rangeget-test-console";
    REQUIRE(logging::init(console).ok());
}
