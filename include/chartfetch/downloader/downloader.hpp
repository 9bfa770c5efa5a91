#pragma once

/*
 * chartfetch Downloader - Public Types and Collaborator Interfaces (C++20)
 *
 * This header defines the data types and abstract interfaces shared by the chart
 * download orchestrator (ChartDownloader) and its collaborators. It contains no
 * orchestration logic.
 *
 * Design principles:
 * - Partial artifacts live next to their destination ("<dest><suffix>") so the
 *   final step is an atomic rename on the same filesystem
 * - Every transfer is cancellable at chunk boundaries
 * - Transport, resume persistence and disk-space probing are injectable seams
 */

#include <chartfetch/core/types.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chartfetch::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Whether the origin honours byte ranges. Unknown until a range probe has run;
 * once known it is reused for later resumes of the same chart.
 */
enum class RangeSupport { Unknown, Supported, Unsupported };

/**
 * Per-chart lifecycle: Idle -> Preflight -> Transferring -> {Completed | Failed | Resuming}.
 */
enum class TransferState { Idle, Preflight, Transferring, Resuming, Verifying, Completed, Failed };

/**
 * Progress stages reported to callers.
 */
enum class ProgressStage { Preflight, Probing, Downloading, Verifying, Finalizing };

const char* toString(RangeSupport support) noexcept;
const char* toString(TransferState state) noexcept;

inline constexpr std::string_view kDefaultPartialSuffix = ".part";

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Status line and headers of a HEAD or GET exchange.
 */
struct HttpResponse {
    int statusCode{0};
    std::vector<Header> headers;

    // Case-insensitive header lookup; first match wins.
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
    [[nodiscard]] std::optional<std::uint64_t> contentLength() const;
};

/**
 * Parsed "Content-Range: bytes <start>-<end>/<total>" (total may be "*").
 */
struct ContentRange {
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::optional<std::uint64_t> total{};
};

std::optional<ContentRange> parseContentRange(std::string_view value);

/**
 * Map a final HTTP status to an error code (Success for 2xx).
 * 5xx and 408/429 are ServerError (retryable); other 4xx are HttpError.
 */
ErrorCode classifyHttpStatus(int statusCode) noexcept;

/**
 * Per-call timeouts tuned for long-haul transfers over degraded links.
 */
struct TransportTimeouts {
    std::chrono::milliseconds connect{30'000};
    std::chrono::milliseconds receive{600'000};
    std::chrono::milliseconds send{300'000};
};

/**
 * Limits a transport derives from TransportTimeouts. The receive budget is the
 * longest tolerated stall between body chunks; a transfer that keeps making
 * progress is never cut off, so overall is always zero (unlimited).
 */
struct TransferDeadlines {
    std::chrono::milliseconds connect{0};
    std::chrono::milliseconds overall{0};
    std::chrono::seconds stallWindow{1}; // abort below 1 byte/s for this long
};

TransferDeadlines transferDeadlines(const TransportTimeouts& timeouts) noexcept;

/**
 * Shared cancellation flag. Copies observe the same state.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    // A fresh token that also reports cancellation once parent is cancelled.
    // Cancelling the child leaves parent untouched.
    [[nodiscard]] static CancellationToken childOf(const CancellationToken& parent) {
        CancellationToken child;
        child.parent_ = std::make_shared<const CancellationToken>(parent);
        return child;
    }

    void cancel() const noexcept { state_->store(true, std::memory_order_release); }
    [[nodiscard]] bool isCancelled() const noexcept {
        return state_->load(std::memory_order_acquire) || (parent_ && parent_->isCancelled());
    }

private:
    std::shared_ptr<std::atomic<bool>> state_;
    std::shared_ptr<const CancellationToken> parent_;
};

/**
 * Retry/backoff policy (defaults match the chart-download profile).
 * maxAttempts counts the first try.
 */
struct RetryPolicy {
    int maxAttempts{4};
    std::chrono::milliseconds initialBackoff{2000};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{300'000};
    double jitter{0.15}; // +/- fraction of the computed delay
};

/**
 * Delay before retry number retryIndex (0-based). unitRandom in [0,1) selects the
 * jitter offset; 0.5 yields the un-jittered delay.
 */
std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, int retryIndex,
                                       double unitRandom) noexcept;

/**
 * Preflight disk-space heuristic.
 */
struct DiskPolicy {
    std::uint64_t maxChartBytes{5ull * 1024ull * 1024ull * 1024ull}; // 5 GiB
    std::uint64_t reserveBytes{100ull * 1024ull * 1024ull};          // 100 MiB
    double safetyFactor{1.1};
};

/**
 * Reports bytes available to an unprivileged writer on the filesystem holding path.
 */
using SpaceProbe = std::function<Result<std::uint64_t>(const std::filesystem::path&)>;

/**
 * Returns Success or StorageFull with a descriptive message.
 */
Result<void> checkDiskSpace(const DiskPolicy& policy, std::uint64_t projectedBytes,
                            const std::filesystem::path& directory, const SpaceProbe& probe);

/**
 * Downloader configuration.
 */
struct DownloaderConfig {
    std::filesystem::path chartsDir{"charts"};
    std::string partialSuffix{kDefaultPartialSuffix};
    RetryPolicy retry{};
    TransportTimeouts timeouts{};
    DiskPolicy disk{};
    std::size_t maxConcurrent{2};
    std::filesystem::path integrityStoreFile{};
    std::filesystem::path resumeStateFile{};
    std::string logLevel{"info"};
};

/**
 * Resume bookkeeping for one chart. downloadedBytes tracks the byte length of
 * partialFilePath; the record is removed when the chart is finalized.
 */
struct ResumeData {
    ChartId chartId;
    std::string url;
    std::filesystem::path destinationPath;
    std::filesystem::path partialFilePath;
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    RangeSupport supportsRange{RangeSupport::Unknown};
    int attempts{0};
    std::optional<std::string> expectedSha256{};
    std::optional<ErrorCode> lastError{};
    TimePoint lastAttempt{};
    TransferState state{TransferState::Idle};
};

/**
 * Streaming progress event for one chart. downloadedBytes never decreases within a
 * call and fraction is capped at 1.0.
 */
struct ProgressEvent {
    ChartId chartId;
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    double fraction{0.0};
    ProgressStage stage{ProgressStage::Downloading};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
// Receives body chunks together with the status line and headers they belong to.
// Returning an error aborts the transfer and get() reports that error.
using ByteSink =
    std::function<Result<void>(const HttpResponse& response, std::span<const std::byte> chunk)>;
// (bytesReceivedSoFar, total if known) as reported by the transport
using TransferProgress =
    std::function<void(std::uint64_t received, std::optional<std::uint64_t> total)>;

// ==========================
// Collaborator interfaces
// ==========================

/**
 * HTTP transport abstraction. All calls honour the cancellation token promptly and
 * report cancellation as ErrorCode::OperationCancelled.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual Result<HttpResponse> head(std::string_view url, const TransportTimeouts& timeouts,
                                      const CancellationToken& cancel) = 0;

    /**
     * GET with an optional "Range" header value (e.g. "bytes=0-0"). The body is
     * streamed to sink; the returned response carries the final status and headers.
     * Bodies of error responses (status >= 400) are not delivered to sink. The
     * response passed to sink is complete by the time the first chunk arrives.
     */
    virtual Result<HttpResponse> get(std::string_view url,
                                     const std::optional<std::string>& rangeHeader,
                                     const ByteSink& sink, const TransportTimeouts& timeouts,
                                     const CancellationToken& cancel) = 0;

    /**
     * Stream the whole body into destPath (truncating it). HTTP errors are mapped
     * with classifyHttpStatus().
     */
    virtual Result<void> downloadFile(std::string_view url, const std::filesystem::path& destPath,
                                      const TransferProgress& onProgress,
                                      const TransportTimeouts& timeouts,
                                      const CancellationToken& cancel) = 0;
};

/**
 * Persistence for ResumeData across process restarts.
 */
class IResumeStore {
public:
    virtual ~IResumeStore() = default;

    virtual Result<std::vector<ResumeData>> loadAll() = 0;
    virtual Result<void> save(const ResumeData& data) = 0;
    virtual void remove(std::string_view chartId) = 0;
};

// ======================
// Utility path builders
// ======================

/**
 * "<destination><suffix>", e.g. charts/US5WA50M.zip.part
 */
[[nodiscard]] inline std::filesystem::path partialPathFor(const std::filesystem::path& destination,
                                                          std::string_view suffix) {
    auto p = destination;
    p += std::string(suffix.empty() ? kDefaultPartialSuffix : suffix);
    return p;
}

/**
 * Last path segment of the URL when it looks like a file name, else "<chartId>.zip".
 */
[[nodiscard]] std::string fileNameFromUrl(std::string_view url, std::string_view chartId);

// ======================
// Factories
// ======================

std::unique_ptr<ITransport> makeCurlTransport();
std::unique_ptr<IResumeStore> makeInMemoryResumeStore();
std::unique_ptr<IResumeStore> makeJsonResumeStore(const std::filesystem::path& path);

// statvfs-backed SpaceProbe
Result<std::uint64_t> availableDiskSpace(const std::filesystem::path& path);

} // namespace chartfetch::downloader
