#pragma once

#include <chartfetch/downloader/downloader.hpp>

#include <filesystem>

namespace chartfetch::config {

/**
 * Build a DownloaderConfig from the [downloader], [integrity] and [logging] sections of
 * config_path, then apply CHARTFETCH_* environment overrides. Missing files, keys or
 * unparseable values keep the defaults:
 *   charts_dir            <data dir>/charts
 *   integrity.store_file  <data dir>/integrity.json
 *   resume state          <charts_dir>/resume_state.json
 */
downloader::DownloaderConfig loadDownloaderConfig(const std::filesystem::path& config_path);

// Same, reading get_config_path().
downloader::DownloaderConfig loadDownloaderConfig();

// CHARTFETCH_CHARTS_DIR, CHARTFETCH_MAX_ATTEMPTS, CHARTFETCH_LOG_LEVEL
void applyEnvironmentOverrides(downloader::DownloaderConfig& cfg);

} // namespace chartfetch::config
