#pragma once

#include <chartfetch/core/types.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chartfetch::metrics {

/**
 * Aggregate view over every closed download record.
 */
struct MetricsSnapshot {
    std::uint64_t successCount{0};
    std::uint64_t failureCount{0};
    std::map<std::string, std::uint64_t> failureByCategory;
    double averageDurationSeconds{0.0};
    double medianDurationSeconds{0.0};
    std::uint64_t retryCount{0};
};

nlohmann::json toJson(const MetricsSnapshot& snapshot);

/**
 * Per-chart timing ledger. Closed records are append-only; snapshot() is a pure
 * projection recomputed on demand. Safe for concurrent use by transfers of
 * different chart ids.
 */
class DownloadMetricsCollector {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    DownloadMetricsCollector();
    explicit DownloadMetricsCollector(NowFn now);

    DownloadMetricsCollector(const DownloadMetricsCollector&) = delete;
    DownloadMetricsCollector& operator=(const DownloadMetricsCollector&) = delete;

    // Opens a timing record, replacing any unfinished one for the same id.
    void start(std::string_view chartId);

    // Returns false when no record was open for the id (counted with zero duration).
    bool completeSuccess(std::string_view chartId);
    bool completeFailure(std::string_view chartId, std::string_view category);

    void incrementRetry(std::string_view chartId);

    [[nodiscard]] MetricsSnapshot snapshot() const;

    // Drops the ledger, open records and retry tallies.
    void reset();

    [[nodiscard]] std::size_t openRecords() const;

private:
    struct ClosedRecord {
        ChartId chartId;
        bool success{false};
        std::string category;
        double durationSeconds{0.0};
    };

    bool close(std::string_view chartId, bool success, std::string_view category);

    NowFn now_;
    std::unordered_map<ChartId, Clock::time_point> open_;
    std::vector<ClosedRecord> ledger_;
    std::unordered_map<ChartId, std::uint64_t> retries_;
    mutable std::mutex mutex_;
};

} // namespace chartfetch::metrics
