#include <chartfetch/metrics/download_metrics_collector.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>

namespace chartfetch::metrics {

nlohmann::json toJson(const MetricsSnapshot& snapshot) {
    nlohmann::json j;
    j["successCount"] = snapshot.successCount;
    j["failureCount"] = snapshot.failureCount;
    j["failureByCategory"] = nlohmann::json::object();
    for (const auto& [category, count] : snapshot.failureByCategory) {
        j["failureByCategory"][category] = count;
    }
    j["averageDurationSeconds"] = snapshot.averageDurationSeconds;
    j["medianDurationSeconds"] = snapshot.medianDurationSeconds;
    j["retryCount"] = snapshot.retryCount;
    return j;
}

DownloadMetricsCollector::DownloadMetricsCollector()
    : DownloadMetricsCollector([] { return Clock::now(); }) {}

DownloadMetricsCollector::DownloadMetricsCollector(NowFn now) : now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
}

void DownloadMetricsCollector::start(std::string_view chartId) {
    const auto t = now_();
    std::lock_guard lk(mutex_);
    auto [it, inserted] = open_.insert_or_assign(std::string(chartId), t);
    if (!inserted) {
        spdlog::debug("Metrics: restarting unfinished record for {}", it->first);
    }
}

bool DownloadMetricsCollector::completeSuccess(std::string_view chartId) {
    return close(chartId, true, {});
}

bool DownloadMetricsCollector::completeFailure(std::string_view chartId,
                                               std::string_view category) {
    return close(chartId, false, category.empty() ? std::string_view{"unknown"} : category);
}

bool DownloadMetricsCollector::close(std::string_view chartId, bool success,
                                     std::string_view category) {
    const auto t = now_();
    std::lock_guard lk(mutex_);
    auto it = open_.find(std::string(chartId));
    if (it == open_.end()) {
        // Still counted so outcome totals match the number of completions
        spdlog::debug("Metrics: no open record for {}, recording zero duration", chartId);
        ledger_.push_back(ClosedRecord{std::string(chartId), success, std::string(category), 0.0});
        return false;
    }
    const auto elapsed = std::chrono::duration<double>(t - it->second).count();
    ledger_.push_back(ClosedRecord{it->first, success, std::string(category),
                                   std::max(0.0, elapsed)});
    open_.erase(it);
    return true;
}

void DownloadMetricsCollector::incrementRetry(std::string_view chartId) {
    std::lock_guard lk(mutex_);
    ++retries_[std::string(chartId)];
}

MetricsSnapshot DownloadMetricsCollector::snapshot() const {
    MetricsSnapshot snap;
    std::vector<double> durations;
    {
        std::lock_guard lk(mutex_);
        durations.reserve(ledger_.size());
        for (const auto& rec : ledger_) {
            if (rec.success) {
                ++snap.successCount;
            } else {
                ++snap.failureCount;
                ++snap.failureByCategory[rec.category];
            }
            durations.push_back(rec.durationSeconds);
        }
        for (const auto& [id, count] : retries_) {
            snap.retryCount += count;
        }
    }

    if (durations.empty())
        return snap;

    snap.averageDurationSeconds =
        std::accumulate(durations.begin(), durations.end(), 0.0) /
        static_cast<double>(durations.size());

    std::sort(durations.begin(), durations.end());
    const auto mid = durations.size() / 2;
    snap.medianDurationSeconds = (durations.size() % 2 == 1)
                                     ? durations[mid]
                                     : (durations[mid - 1] + durations[mid]) / 2.0;
    return snap;
}

void DownloadMetricsCollector::reset() {
    std::lock_guard lk(mutex_);
    open_.clear();
    ledger_.clear();
    retries_.clear();
}

std::size_t DownloadMetricsCollector::openRecords() const {
    std::lock_guard lk(mutex_);
    return open_.size();
}

} // namespace chartfetch::metrics
