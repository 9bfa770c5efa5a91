#include <catch2/catch_test_macros.hpp>

#include <chartfetch/config/config_helpers.h>
#include <chartfetch/config/downloader_config.h>

#include <spdlog/spdlog.h>

#include "../../support/temp_dir_scope.hpp"

#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>

using namespace chartfetch;
using namespace chartfetch::config;
using chartfetch::test_support::TempDirScope;
using chartfetch::test_support::write_text;

namespace {

// Sets an environment variable for the lifetime of the scope.
class EnvGuard {
public:
    EnvGuard(std::string name, const std::string& value) : name_(std::move(name)) {
        if (const char* old = std::getenv(name_.c_str()))
            previous_ = old;
        ::setenv(name_.c_str(), value.c_str(), 1);
    }
    ~EnvGuard() {
        if (previous_)
            ::setenv(name_.c_str(), previous_->c_str(), 1);
        else
            ::unsetenv(name_.c_str());
    }

private:
    std::string name_;
    std::optional<std::string> previous_;
};

} // namespace

TEST_CASE("numeric config parsing", "[config]") {
    CHECK(parse_u64("42") == std::optional<std::uint64_t>{42});
    CHECK(parse_u64("  7 ") == std::optional<std::uint64_t>{7});
    CHECK_FALSE(parse_u64("").has_value());
    CHECK_FALSE(parse_u64("12abc").has_value());
    CHECK_FALSE(parse_u64("-1").has_value());

    CHECK(parse_double("1.5") == std::optional<double>{1.5});
    CHECK_FALSE(parse_double("1.5x").has_value());
    CHECK_FALSE(parse_double("nope").has_value());
}

TEST_CASE("parse_config_value reads sectioned TOML keys", "[config]") {
    auto tmp = TempDirScope::unique_under("chartfetch-cfg");
    const auto file = tmp / "config.toml";
    write_text(file, "# chartfetch\n"
                     "[downloader]\n"
                     "charts_dir = \"/srv/charts\"\n"
                     "max_attempts = 6 # inline comment\n"
                     "\n"
                     "[logging]\n"
                     "level = 'debug'\n");

    CHECK(parse_config_value(file, "downloader", "charts_dir") == "/srv/charts");
    CHECK(parse_config_value(file, "downloader", "max_attempts") == "6");
    CHECK(parse_config_value(file, "logging", "level") == "debug");
    CHECK(parse_config_value(file, "logging", "charts_dir").empty());
    CHECK(parse_config_value(tmp / "missing.toml", "downloader", "charts_dir").empty());
}

TEST_CASE("loadDownloaderConfig applies file values and keeps defaults", "[config]") {
    auto tmp = TempDirScope::unique_under("chartfetch-cfg");
    const auto file = tmp / "config.toml";
    const auto charts = tmp / "charts";
    write_text(file, "[downloader]\n"
                     "charts_dir = \"" + charts.string() + "\"\n"
                     "max_attempts = 6\n"
                     "initial_backoff_ms = 500\n"
                     "jitter = 0.25\n"
                     "connect_timeout_ms = 1000\n"
                     "max_concurrent = 0\n"
                     "disk_safety_factor = oops\n"
                     "[integrity]\n"
                     "store_file = \"" + (tmp / "hashes.json").string() + "\"\n"
                     "[logging]\n"
                     "level = warn\n");

    auto cfg = loadDownloaderConfig(file);
    CHECK(cfg.chartsDir == charts);
    CHECK(cfg.retry.maxAttempts == 6);
    CHECK(cfg.retry.initialBackoff == std::chrono::milliseconds(500));
    CHECK(cfg.retry.jitter == 0.25);
    CHECK(cfg.timeouts.connect == std::chrono::milliseconds(1000));
    CHECK(cfg.timeouts.receive == std::chrono::minutes(10));
    CHECK(cfg.maxConcurrent == 1);
    CHECK(cfg.disk.safetyFactor == 1.1);
    CHECK(cfg.integrityStoreFile == tmp / "hashes.json");
    CHECK(cfg.resumeStateFile == charts / "resume_state.json");
    CHECK(cfg.logLevel == "warn");
}

TEST_CASE("out-of-range integers keep their defaults", "[config]") {
    auto tmp = TempDirScope::unique_under("chartfetch-cfg");
    const auto file = tmp / "config.toml";
    write_text(file, "[downloader]\n"
                     "max_attempts = 4294967297\n"
                     "max_concurrent = 3\n"
                     "receive_timeout_ms = 18446744073709551615\n");

    auto cfg = loadDownloaderConfig(file);
    CHECK(cfg.retry.maxAttempts == 4);
    CHECK(cfg.maxConcurrent == 3);
    CHECK(cfg.timeouts.receive == std::chrono::minutes(10));

    SECTION("values just past int range are rejected too") {
        write_text(file, "[downloader]\nmax_attempts = 3000000000\n");
        CHECK(loadDownloaderConfig(file).retry.maxAttempts == 4);
    }

    SECTION("environment attempts are range-checked") {
        EnvGuard attempts("CHARTFETCH_MAX_ATTEMPTS", "4294967297");
        CHECK(loadDownloaderConfig(file).retry.maxAttempts == 4);
    }
}

TEST_CASE("environment overrides win over the config file", "[config][env]") {
    auto tmp = TempDirScope::unique_under("chartfetch-cfg");
    const auto file = tmp / "config.toml";
    write_text(file, "[downloader]\nmax_attempts = 2\n");

    EnvGuard dir("CHARTFETCH_CHARTS_DIR", (tmp / "env-charts").string());
    EnvGuard level("CHARTFETCH_LOG_LEVEL", "trace");

    SECTION("valid attempts") {
        EnvGuard attempts("CHARTFETCH_MAX_ATTEMPTS", "9");
        auto cfg = loadDownloaderConfig(file);
        CHECK(cfg.retry.maxAttempts == 9);
        CHECK(cfg.chartsDir == tmp / "env-charts");
        CHECK(cfg.resumeStateFile == tmp / "env-charts" / "resume_state.json");
        CHECK(cfg.logLevel == "trace");
    }

    SECTION("zero attempts is ignored") {
        EnvGuard attempts("CHARTFETCH_MAX_ATTEMPTS", "0");
        auto cfg = loadDownloaderConfig(file);
        CHECK(cfg.retry.maxAttempts == 2);
    }
}

TEST_CASE("apply_log_level", "[config][logging]") {
    const auto before = spdlog::get_level();
    CHECK(apply_log_level("DEBUG"));
    CHECK(spdlog::get_level() == spdlog::level::debug);
    CHECK(apply_log_level("warning"));
    CHECK(spdlog::get_level() == spdlog::level::warn);
    CHECK_FALSE(apply_log_level("chatty"));
    CHECK(spdlog::get_level() == spdlog::level::warn);
    spdlog::set_level(before);
}
