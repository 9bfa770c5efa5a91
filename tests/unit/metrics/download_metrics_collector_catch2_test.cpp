#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chartfetch/metrics/download_metrics_collector.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace chartfetch::metrics;
using Catch::Approx;

namespace {

// Manually advanced clock for deterministic durations.
struct FakeClock {
    std::atomic<std::int64_t> ms{0};
    DownloadMetricsCollector::NowFn fn() {
        return [this] {
            return DownloadMetricsCollector::Clock::time_point(std::chrono::milliseconds(ms.load()));
        };
    }
    void advance(std::chrono::milliseconds d) { ms += d.count(); }
};

} // namespace

TEST_CASE("snapshot aggregates closed records", "[metrics]") {
    FakeClock clock;
    DownloadMetricsCollector metrics(clock.fn());

    metrics.start("A");
    clock.advance(std::chrono::seconds(2));
    CHECK(metrics.completeSuccess("A"));

    metrics.start("B");
    clock.advance(std::chrono::seconds(1));
    metrics.incrementRetry("B");
    CHECK(metrics.completeFailure("B", "network"));

    auto snap = metrics.snapshot();
    CHECK(snap.successCount == 1);
    CHECK(snap.failureCount == 1);
    CHECK(snap.failureByCategory.size() == 1);
    CHECK(snap.failureByCategory["network"] == 1);
    CHECK(snap.retryCount == 1);
    CHECK(snap.averageDurationSeconds == Approx(1.5));
    CHECK(snap.medianDurationSeconds == Approx(1.5));
    CHECK(metrics.openRecords() == 0);

    auto j = toJson(snap);
    CHECK(j["successCount"] == 1);
    CHECK(j["failureByCategory"]["network"] == 1);
    CHECK(j["retryCount"] == 1);
}

TEST_CASE("median with an odd number of records", "[metrics]") {
    FakeClock clock;
    DownloadMetricsCollector metrics(clock.fn());
    for (int secs : {5, 1, 3}) {
        const auto id = "chart" + std::to_string(secs);
        metrics.start(id);
        clock.advance(std::chrono::seconds(secs));
        metrics.completeSuccess(id);
    }
    auto snap = metrics.snapshot();
    CHECK(snap.medianDurationSeconds == Approx(3.0));
    CHECK(snap.averageDurationSeconds == Approx(3.0));
}

TEST_CASE("empty collector reports zeros", "[metrics]") {
    DownloadMetricsCollector metrics;
    auto snap = metrics.snapshot();
    CHECK(snap.successCount == 0);
    CHECK(snap.failureCount == 0);
    CHECK(snap.failureByCategory.empty());
    CHECK(snap.averageDurationSeconds == 0.0);
    CHECK(snap.medianDurationSeconds == 0.0);
    CHECK(snap.retryCount == 0);
}

TEST_CASE("completion without start and retries without records", "[metrics]") {
    FakeClock clock;
    DownloadMetricsCollector metrics(clock.fn());

    metrics.incrementRetry("never-started");
    CHECK_FALSE(metrics.completeFailure("never-started", "timeout"));
    CHECK_FALSE(metrics.completeFailure("other", ""));

    auto snap = metrics.snapshot();
    CHECK(snap.failureCount == 2);
    CHECK(snap.failureByCategory["timeout"] == 1);
    CHECK(snap.failureByCategory["unknown"] == 1);
    CHECK(snap.retryCount == 1);
    CHECK(snap.averageDurationSeconds == 0.0);
}

TEST_CASE("restarting an open record replaces its start time", "[metrics]") {
    FakeClock clock;
    DownloadMetricsCollector metrics(clock.fn());
    metrics.start("A");
    clock.advance(std::chrono::seconds(10));
    metrics.start("A");
    clock.advance(std::chrono::seconds(1));
    metrics.completeSuccess("A");
    CHECK(metrics.snapshot().averageDurationSeconds == Approx(1.0));
}

TEST_CASE("reset clears everything", "[metrics]") {
    DownloadMetricsCollector metrics;
    metrics.start("A");
    metrics.start("B");
    metrics.completeSuccess("A");
    metrics.incrementRetry("B");
    metrics.reset();
    auto snap = metrics.snapshot();
    CHECK(snap.successCount + snap.failureCount == 0);
    CHECK(snap.retryCount == 0);
    CHECK(metrics.openRecords() == 0);
}

TEST_CASE("concurrent transfers of different ids", "[metrics][concurrency]") {
    DownloadMetricsCollector metrics;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&metrics, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const auto id = "T" + std::to_string(t) + "-" + std::to_string(i);
                metrics.start(id);
                metrics.incrementRetry(id);
                if (i % 2 == 0)
                    metrics.completeSuccess(id);
                else
                    metrics.completeFailure(id, "server");
            }
        });
    }
    for (auto& th : threads)
        th.join();

    auto snap = metrics.snapshot();
    CHECK(snap.successCount + snap.failureCount == kThreads * kPerThread);
    CHECK(snap.failureByCategory["server"] == snap.failureCount);
    CHECK(snap.retryCount == kThreads * kPerThread);
    CHECK(metrics.openRecords() == 0);
}
