#pragma once

#include <chartfetch/downloader/downloader.hpp>
#include <chartfetch/integrity/chart_integrity_registry.h>
#include <chartfetch/integrity/chart_verifier.h>
#include <chartfetch/metrics/download_metrics_collector.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace chartfetch::downloader {

/**
 * Per-call options.
 */
struct DownloadOptions {
    // Defaults to <chartsDir>/<fileNameFromUrl(url, chartId)>
    std::optional<std::filesystem::path> destinationPath{};

    // When set, the completed partial must hash to this value (case-insensitive)
    std::optional<std::string> expectedSha256{};

    ProgressCallback onProgress{};

    // Cancelling this stops the call. cancel(chartId) stops only the current call
    // and leaves this token usable for later calls.
    CancellationToken cancel{};
};

/**
 * Outcome of a finalized download. An integrity mismatch is reported here, not as
 * an error; the artifact stays on disk and the caller decides what to do.
 */
struct DownloadResult {
    ChartId chartId;
    std::filesystem::path path;
    std::uint64_t sizeBytes{0};
    HexDigest sha256;
    int attempts{1};
    bool resumed{false};
    std::chrono::milliseconds elapsed{0};
    std::optional<integrity::VerificationStatus> verification{};
    std::optional<integrity::IntegrityMismatch> integrityMismatch{};
};

/**
 * One entry of a batch.
 */
struct DownloadRequest {
    ChartId chartId;
    std::string url;
    DownloadOptions options{};
};

/**
 * Counters produced by recoverDownloads().
 */
struct RecoveryReport {
    std::size_t scanned{0};
    std::size_t orphansRemoved{0};
    std::size_t completedCleared{0};
    std::size_t emptyPartialsRemoved{0};
    std::size_t normalized{0};
    std::size_t resumable{0};
};

/**
 * Resumable, retried, integrity-checked chart downloads.
 *
 * - At most one active transfer per chart id; a second call is rejected with
 *   OperationInProgress. Different ids run independently.
 * - Transient failures (network, timeout, 5xx) are retried with jittered
 *   exponential backoff; disk, size, checksum and 4xx failures are terminal.
 * - Every call is reported to the metrics collector: start, one incrementRetry per
 *   retry, and exactly one completeSuccess/completeFailure.
 */
class ChartDownloader {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds, const CancellationToken&)>;

    ChartDownloader(ITransport& transport, metrics::DownloadMetricsCollector& metrics,
                    DownloaderConfig config = {},
                    integrity::ChartIntegrityRegistry* registry = nullptr,
                    IResumeStore* resumeStore = nullptr);
    ~ChartDownloader();

    ChartDownloader(const ChartDownloader&) = delete;
    ChartDownloader& operator=(const ChartDownloader&) = delete;

    /**
     * Preflight HEAD + disk check, then stream the full body into the partial file,
     * retrying transient failures. On success the partial is renamed onto the
     * destination and resume data is cleared.
     */
    Result<DownloadResult> downloadChart(std::string_view chartId, std::string_view url,
                                         const DownloadOptions& options = {});

    /**
     * Continue an interrupted transfer. Probes range support with "bytes=0-0" (once
     * per chart), appends "bytes=<downloaded>-" to the partial when supported and
     * otherwise restarts from byte 0. An empty url reuses the recorded one.
     */
    Result<DownloadResult> resumeDownload(std::string_view chartId, std::string_view url = {},
                                          const DownloadOptions& options = {});

    [[nodiscard]] std::optional<ResumeData> getResumeData(std::string_view chartId) const;

    /**
     * Signal the in-flight transfer for chartId. The partial file is kept unless
     * discardPartial is set. With no transfer in flight and discardPartial set, the
     * partial and resume data are removed immediately. Returns true when a transfer
     * was signalled.
     */
    bool cancel(std::string_view chartId, bool discardPartial = false);

    // Forget resume data and delete the partial file. Fails while a transfer is active.
    Result<void> clearResumeData(std::string_view chartId);

    // Reload persisted resume data and reconcile it with the filesystem.
    Result<RecoveryReport> recoverDownloads();

    /**
     * Run independent downloads on up to maxConcurrent worker threads (0 uses the
     * configured value). Results are in request order.
     */
    std::vector<Result<DownloadResult>> downloadMany(const std::vector<DownloadRequest>& requests,
                                                     std::size_t maxConcurrent = 0);

    // Cancel everything in flight and refuse new work.
    void dispose();

    [[nodiscard]] bool isActive(std::string_view chartId) const;
    [[nodiscard]] std::vector<ChartId> activeDownloads() const;
    [[nodiscard]] const DownloaderConfig& config() const noexcept { return config_; }

    // Test seams
    void setSpaceProbe(SpaceProbe probe);
    void setSleepFunction(SleepFn sleep);

private:
    struct ActiveTransfer {
        CancellationToken token;
        bool discardOnCancel{false};
    };

    class TransferGuard;
    struct TransferContext;

    Result<DownloadResult> runFullDownload(TransferContext& ctx);
    Result<DownloadResult> runResume(TransferContext& ctx);

    Result<void> preflight(TransferContext& ctx);
    Result<void> attemptFullTransfer(TransferContext& ctx);
    Result<RangeSupport> probeRange(TransferContext& ctx);
    Result<void> attemptAppend(TransferContext& ctx);
    Result<void> appendUntilComplete(TransferContext& ctx);
    Result<void> retrying(TransferContext& ctx, const char* what,
                          const std::function<Result<void>()>& attempt);

    Result<DownloadResult> finalize(TransferContext& ctx);
    Result<DownloadResult> fail(TransferContext& ctx, const Error& error);

    std::filesystem::path resolveDestination(std::string_view chartId, std::string_view url,
                                             const DownloadOptions& options) const;

    void emitProgress(TransferContext& ctx, std::uint64_t bytes, ProgressStage stage);
    void updateResume(const ChartId& chartId, const std::function<void(ResumeData&)>& mutate,
                      bool persistNow = true);
    void syncDownloadedBytes(TransferContext& ctx);
    void persist(const ResumeData& data);
    void forget(const ChartId& chartId);
    double nextUnitRandom();

    ITransport& transport_;
    metrics::DownloadMetricsCollector& metrics_;
    DownloaderConfig config_;
    integrity::ChartIntegrityRegistry* registry_;
    IResumeStore* resumeStore_;
    SpaceProbe spaceProbe_;
    SleepFn sleep_;

    mutable std::mutex mutex_; // guards active_, resume_, disposed_
    std::map<ChartId, ActiveTransfer> active_;
    std::map<ChartId, ResumeData> resume_;
    bool disposed_{false};

    std::mutex rngMutex_;
    std::mt19937_64 rng_;
};

} // namespace chartfetch::downloader
