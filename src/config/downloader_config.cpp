#include <chartfetch/config/config_helpers.h>
#include <chartfetch/config/downloader_config.h>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <type_traits>

namespace chartfetch::config {

namespace {

template <typename T, typename Parse>
void read_key(const std::filesystem::path& path, const std::string& section, const std::string& key,
              T& out, Parse parse) {
    const auto raw = parse_config_value(path, section, key);
    if (raw.empty())
        return;
    auto v = parse(raw);
    if (!v) {
        spdlog::warn("Config: ignoring invalid value '{}' for {}.{}", raw, section, key);
        return;
    }
    if constexpr (std::is_integral_v<T>) {
        if (*v > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            spdlog::warn("Config: ignoring out-of-range value '{}' for {}.{}", raw, section, key);
            return;
        }
    }
    out = static_cast<T>(*v);
}

void read_ms(const std::filesystem::path& path, const std::string& key,
             std::chrono::milliseconds& out) {
    const auto raw = parse_config_value(path, "downloader", key);
    if (raw.empty())
        return;
    if (auto v = parse_u64(raw);
        v && *v <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        out = std::chrono::milliseconds(static_cast<std::int64_t>(*v));
    } else {
        spdlog::warn("Config: ignoring invalid value '{}' for downloader.{}", raw, key);
    }
}

} // namespace

downloader::DownloaderConfig loadDownloaderConfig(const std::filesystem::path& config_path) {
    downloader::DownloaderConfig cfg;
    const auto dataDir = get_data_dir();
    cfg.chartsDir = dataDir / "charts";
    cfg.integrityStoreFile = dataDir / "integrity.json";

    std::error_code ec;
    const bool haveFile = !config_path.empty() && std::filesystem::exists(config_path, ec);
    if (haveFile) {
        const std::string s = "downloader";
        if (auto dir = parse_config_value(config_path, s, "charts_dir"); !dir.empty())
            cfg.chartsDir = expand_tilde(dir);
        if (auto suffix = parse_config_value(config_path, s, "partial_suffix"); !suffix.empty())
            cfg.partialSuffix = suffix;

        read_key(config_path, s, "max_attempts", cfg.retry.maxAttempts, parse_u64);
        read_ms(config_path, "initial_backoff_ms", cfg.retry.initialBackoff);
        read_key(config_path, s, "backoff_multiplier", cfg.retry.multiplier, parse_double);
        read_ms(config_path, "max_backoff_ms", cfg.retry.maxBackoff);
        read_key(config_path, s, "jitter", cfg.retry.jitter, parse_double);

        read_ms(config_path, "connect_timeout_ms", cfg.timeouts.connect);
        read_ms(config_path, "receive_timeout_ms", cfg.timeouts.receive);
        read_ms(config_path, "send_timeout_ms", cfg.timeouts.send);

        read_key(config_path, s, "max_chart_bytes", cfg.disk.maxChartBytes, parse_u64);
        read_key(config_path, s, "disk_reserve_bytes", cfg.disk.reserveBytes, parse_u64);
        read_key(config_path, s, "disk_safety_factor", cfg.disk.safetyFactor, parse_double);
        read_key(config_path, s, "max_concurrent", cfg.maxConcurrent, parse_u64);

        if (auto store = parse_config_value(config_path, "integrity", "store_file");
            !store.empty())
            cfg.integrityStoreFile = expand_tilde(store);
        if (auto level = parse_config_value(config_path, "logging", "level"); !level.empty())
            cfg.logLevel = level;
    } else if (!config_path.empty()) {
        spdlog::debug("Config file {} not found; using defaults", config_path.string());
    }

    applyEnvironmentOverrides(cfg);

    if (cfg.retry.maxAttempts < 1)
        cfg.retry.maxAttempts = 1;
    if (cfg.maxConcurrent == 0)
        cfg.maxConcurrent = 1;
    cfg.resumeStateFile = cfg.chartsDir / "resume_state.json";
    return cfg;
}

downloader::DownloaderConfig loadDownloaderConfig() {
    return loadDownloaderConfig(get_config_path());
}

void applyEnvironmentOverrides(downloader::DownloaderConfig& cfg) {
    if (const char* dir = std::getenv("CHARTFETCH_CHARTS_DIR"); dir && *dir) {
        cfg.chartsDir = expand_tilde(dir);
    }
    if (const char* attempts = std::getenv("CHARTFETCH_MAX_ATTEMPTS"); attempts && *attempts) {
        if (auto v = parse_u64(attempts);
            v && *v > 0 && *v <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            cfg.retry.maxAttempts = static_cast<int>(*v);
        } else {
            spdlog::warn("Ignoring CHARTFETCH_MAX_ATTEMPTS='{}'", attempts);
        }
    }
    if (const char* level = std::getenv("CHARTFETCH_LOG_LEVEL"); level && *level) {
        cfg.logLevel = level;
    }
}

} // namespace chartfetch::config
