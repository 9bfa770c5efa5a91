/*
 * chartfetch/src/downloader/chart_downloader.cpp
 *
 * ChartDownloader:
 * - Preflight HEAD for size, then a disk-space heuristic before any body bytes
 * - Full transfer into "<dest>.part" via ITransport::downloadFile
 * - Resume: one "bytes=0-0" probe per chart, then "bytes=<n>-" appended to the partial
 * - Transient failures retried with jittered exponential backoff
 * - Optional expected SHA-256, atomic finalize, first-load integrity capture/compare
 * - Every call recorded in the metrics collector
 */

#include <chartfetch/downloader/chart_downloader.h>
#include <chartfetch/downloader/partial_file.h>
#include <chartfetch/integrity/sha256.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <utility>

namespace chartfetch::downloader {

namespace fs = std::filesystem;

namespace {

void cancellableSleep(std::chrono::milliseconds delay, const CancellationToken& token) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + delay;
    while (!token.isCancelled()) {
        const auto now = clock::now();
        if (now >= deadline)
            return;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(50)));
    }
}

Error cancelledError(const ChartId& chartId) {
    return Error{ErrorCode::OperationCancelled, "Download of " + chartId + " cancelled"};
}

} // namespace

// ---- per-call state ----

struct ChartDownloader::TransferContext {
    ChartId chartId;
    std::string url;
    fs::path destination;
    fs::path partial;
    DownloadOptions options;
    CancellationToken token;
    std::optional<std::uint64_t> totalBytes;
    std::uint64_t reportedBytes{0}; // progress high-water mark
    int attempts{1};
    bool resumed{false};
    bool rangeRejected{false};
    bool sizeReprobeUsed{false};
    std::chrono::steady_clock::time_point started{std::chrono::steady_clock::now()};
};

// Registers the call as the single active transfer for its chart id.
class ChartDownloader::TransferGuard {
public:
    TransferGuard(ChartDownloader& owner, ChartId chartId, CancellationToken token)
        : owner_(owner), chartId_(std::move(chartId)) {
        std::lock_guard lk(owner_.mutex_);
        if (owner_.disposed_) {
            error_ = Error{ErrorCode::InvalidState, "Downloader has been disposed"};
            return;
        }
        auto [it, inserted] =
            owner_.active_.try_emplace(chartId_, ActiveTransfer{std::move(token), false});
        if (!inserted) {
            error_ = Error{ErrorCode::OperationInProgress,
                           "A download for " + chartId_ + " is already in progress"};
            return;
        }
        held_ = true;
    }

    ~TransferGuard() {
        if (!held_)
            return;
        std::lock_guard lk(owner_.mutex_);
        owner_.active_.erase(chartId_);
    }

    TransferGuard(const TransferGuard&) = delete;
    TransferGuard& operator=(const TransferGuard&) = delete;

    bool held() const { return held_; }
    const Error& error() const { return error_; }

private:
    ChartDownloader& owner_;
    ChartId chartId_;
    bool held_{false};
    Error error_;
};

// ---- construction ----

ChartDownloader::ChartDownloader(ITransport& transport, metrics::DownloadMetricsCollector& metrics,
                                 DownloaderConfig config,
                                 integrity::ChartIntegrityRegistry* registry,
                                 IResumeStore* resumeStore)
    : transport_(transport), metrics_(metrics), config_(std::move(config)), registry_(registry),
      resumeStore_(resumeStore), spaceProbe_(&availableDiskSpace), sleep_(&cancellableSleep),
      rng_(std::random_device{}()) {
    if (config_.partialSuffix.empty())
        config_.partialSuffix = std::string(kDefaultPartialSuffix);
    if (config_.retry.maxAttempts < 1)
        config_.retry.maxAttempts = 1;
}

ChartDownloader::~ChartDownloader() {
    dispose();
}

void ChartDownloader::setSpaceProbe(SpaceProbe probe) {
    spaceProbe_ = std::move(probe);
}

void ChartDownloader::setSleepFunction(SleepFn sleep) {
    sleep_ = sleep ? std::move(sleep) : SleepFn(&cancellableSleep);
}

// ---- public operations ----

Result<DownloadResult> ChartDownloader::downloadChart(std::string_view chartId,
                                                      std::string_view url,
                                                      const DownloadOptions& options) {
    if (chartId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty chart id"};
    }
    if (url.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty URL"};
    }

    const auto token = CancellationToken::childOf(options.cancel);
    TransferGuard guard(*this, ChartId(chartId), token);
    if (!guard.held()) {
        spdlog::warn("Rejected download of {}: {}", chartId, guard.error().message);
        return guard.error();
    }

    TransferContext ctx;
    ctx.chartId = ChartId(chartId);
    ctx.url = std::string(url);
    ctx.options = options;
    ctx.token = token;
    ctx.destination = resolveDestination(chartId, url, options);
    ctx.partial = partialPathFor(ctx.destination, config_.partialSuffix);

    metrics_.start(ctx.chartId);
    spdlog::info("Downloading chart {} from {} -> {}", ctx.chartId, ctx.url,
                 ctx.destination.string());
    try {
        return runFullDownload(ctx);
    } catch (const std::exception& e) {
        return fail(ctx, Error{ErrorCode::Unknown, std::string("Unexpected error: ") + e.what()});
    }
}

Result<DownloadResult> ChartDownloader::resumeDownload(std::string_view chartId,
                                                       std::string_view url,
                                                       const DownloadOptions& options) {
    if (chartId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty chart id"};
    }

    const auto token = CancellationToken::childOf(options.cancel);
    TransferGuard guard(*this, ChartId(chartId), token);
    if (!guard.held()) {
        spdlog::warn("Rejected resume of {}: {}", chartId, guard.error().message);
        return guard.error();
    }

    TransferContext ctx;
    ctx.chartId = ChartId(chartId);
    ctx.options = options;
    ctx.token = token;
    ctx.resumed = true;

    const auto existing = getResumeData(chartId);
    if (existing) {
        ctx.url = url.empty() ? existing->url : std::string(url);
        if (options.destinationPath) {
            ctx.destination = *options.destinationPath;
        } else if (!existing->destinationPath.empty()) {
            ctx.destination = existing->destinationPath;
        } else {
            ctx.destination = resolveDestination(chartId, ctx.url, options);
        }
        ctx.partial = existing->partialFilePath.empty()
                          ? partialPathFor(ctx.destination, config_.partialSuffix)
                          : existing->partialFilePath;
        ctx.totalBytes = existing->totalBytes;
        if (!ctx.options.expectedSha256)
            ctx.options.expectedSha256 = existing->expectedSha256;
    } else {
        ctx.url = std::string(url);
        ctx.destination = resolveDestination(chartId, url, options);
        ctx.partial = partialPathFor(ctx.destination, config_.partialSuffix);
    }

    if (ctx.url.empty()) {
        return Error{ErrorCode::InvalidArgument, "No URL known for chart " + ctx.chartId};
    }
    std::error_code ec;
    if (!fs::is_regular_file(ctx.partial, ec)) {
        return Error{ErrorCode::NotFound, "No partial download for " + ctx.chartId + " at " +
                                              ctx.partial.string()};
    }

    metrics_.start(ctx.chartId);
    spdlog::info("Resuming chart {} from {} ({} bytes on disk)", ctx.chartId, ctx.url,
                 fileSizeOrZero(ctx.partial));
    try {
        return runResume(ctx);
    } catch (const std::exception& e) {
        return fail(ctx, Error{ErrorCode::Unknown, std::string("Unexpected error: ") + e.what()});
    }
}

std::optional<ResumeData> ChartDownloader::getResumeData(std::string_view chartId) const {
    std::lock_guard lk(mutex_);
    auto it = resume_.find(std::string(chartId));
    if (it == resume_.end())
        return std::nullopt;
    return it->second;
}

bool ChartDownloader::cancel(std::string_view chartId, bool discardPartial) {
    const ChartId id(chartId);
    std::optional<fs::path> partial;
    {
        std::lock_guard lk(mutex_);
        auto it = active_.find(id);
        if (it != active_.end()) {
            it->second.discardOnCancel = it->second.discardOnCancel || discardPartial;
            it->second.token.cancel();
            spdlog::info("Cancellation requested for {}{}", id,
                         discardPartial ? " (discarding partial)" : "");
            return true;
        }
        if (!discardPartial)
            return false;
        auto rit = resume_.find(id);
        if (rit != resume_.end()) {
            partial = rit->second.partialFilePath;
            resume_.erase(rit);
        }
    }
    if (partial && !partial->empty())
        removeFileQuietly(*partial);
    if (resumeStore_)
        resumeStore_->remove(id);
    return false;
}

Result<void> ChartDownloader::clearResumeData(std::string_view chartId) {
    const ChartId id(chartId);
    std::optional<fs::path> partial;
    {
        std::lock_guard lk(mutex_);
        if (active_.count(id) != 0) {
            return Error{ErrorCode::OperationInProgress,
                         "Cannot clear resume data while " + id + " is downloading"};
        }
        auto it = resume_.find(id);
        if (it != resume_.end()) {
            partial = it->second.partialFilePath;
            resume_.erase(it);
        }
    }
    if (partial && !partial->empty())
        removeFileQuietly(*partial);
    if (resumeStore_)
        resumeStore_->remove(id);
    spdlog::debug("Cleared resume data for {}", id);
    return {};
}

Result<RecoveryReport> ChartDownloader::recoverDownloads() {
    if (!resumeStore_) {
        return Error{ErrorCode::NotInitialized, "No resume store configured"};
    }
    auto loaded = resumeStore_->loadAll();
    if (!loaded) {
        return loaded.error();
    }

    RecoveryReport report;
    for (auto& data : loaded.value()) {
        ++report.scanned;
        if (isActive(data.chartId))
            continue;

        std::error_code ec;
        const bool finalExists =
            !data.destinationPath.empty() && fs::exists(data.destinationPath, ec);
        const bool partialExists =
            !data.partialFilePath.empty() && fs::is_regular_file(data.partialFilePath, ec);

        if (finalExists) {
            if (partialExists)
                removeFileQuietly(data.partialFilePath);
            forget(data.chartId);
            ++report.completedCleared;
            continue;
        }
        if (!partialExists) {
            forget(data.chartId);
            ++report.orphansRemoved;
            continue;
        }
        const auto size = fileSizeOrZero(data.partialFilePath);
        if (size == 0) {
            removeFileQuietly(data.partialFilePath);
            forget(data.chartId);
            ++report.emptyPartialsRemoved;
            continue;
        }
        if (size != data.downloadedBytes) {
            spdlog::debug("Recovery: {} recorded {} bytes, partial holds {}", data.chartId,
                          data.downloadedBytes, size);
            data.downloadedBytes = size;
            ++report.normalized;
        }
        data.state = data.lastError ? TransferState::Failed : TransferState::Idle;
        {
            std::lock_guard lk(mutex_);
            resume_[data.chartId] = data;
        }
        persist(data);
        ++report.resumable;
    }

    spdlog::info("Recovered {} resumable download(s) ({} orphaned, {} already complete, {} empty)",
                 report.resumable, report.orphansRemoved, report.completedCleared,
                 report.emptyPartialsRemoved);
    return report;
}

std::vector<Result<DownloadResult>>
ChartDownloader::downloadMany(const std::vector<DownloadRequest>& requests,
                              std::size_t maxConcurrent) {
    std::vector<Result<DownloadResult>> out;
    if (requests.empty())
        return out;

    const std::size_t limit = maxConcurrent != 0 ? maxConcurrent : config_.maxConcurrent;
    const std::size_t workers = std::clamp<std::size_t>(limit, 1, requests.size());

    std::vector<std::optional<Result<DownloadResult>>> slots(requests.size());
    std::atomic<std::size_t> next{0};
    auto work = [&] {
        for (;;) {
            const auto i = next.fetch_add(1);
            if (i >= requests.size())
                return;
            const auto& req = requests[i];
            slots[i] = downloadChart(req.chartId, req.url, req.options);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers - 1);
    for (std::size_t w = 1; w < workers; ++w)
        pool.emplace_back(work);
    work();
    for (auto& t : pool)
        t.join();

    out.reserve(slots.size());
    for (auto& slot : slots)
        out.push_back(std::move(*slot));
    return out;
}

void ChartDownloader::dispose() {
    std::lock_guard lk(mutex_);
    if (!disposed_ && !active_.empty()) {
        spdlog::info("Disposing downloader; cancelling {} active transfer(s)", active_.size());
    }
    disposed_ = true;
    for (auto& [id, transfer] : active_)
        transfer.token.cancel();
}

bool ChartDownloader::isActive(std::string_view chartId) const {
    std::lock_guard lk(mutex_);
    return active_.count(std::string(chartId)) != 0;
}

std::vector<ChartId> ChartDownloader::activeDownloads() const {
    std::lock_guard lk(mutex_);
    std::vector<ChartId> ids;
    ids.reserve(active_.size());
    for (const auto& [id, transfer] : active_)
        ids.push_back(id);
    return ids;
}

// ---- full download path ----

Result<DownloadResult> ChartDownloader::runFullDownload(TransferContext& ctx) {
    updateResume(ctx.chartId, [&](ResumeData& d) {
        d.url = ctx.url;
        d.destinationPath = ctx.destination;
        d.partialFilePath = ctx.partial;
        d.downloadedBytes = fileSizeOrZero(ctx.partial);
        d.expectedSha256 = ctx.options.expectedSha256;
        d.lastError.reset();
        d.lastAttempt = std::chrono::system_clock::now();
        d.state = TransferState::Preflight;
    });

    if (auto r = preflight(ctx); !r) {
        return fail(ctx, r.error());
    }

    updateResume(ctx.chartId, [](ResumeData& d) { d.state = TransferState::Transferring; }, false);
    if (auto r = retrying(ctx, "download", [&] { return attemptFullTransfer(ctx); }); !r) {
        return fail(ctx, r.error());
    }
    return finalize(ctx);
}

Result<void> ChartDownloader::preflight(TransferContext& ctx) {
    emitProgress(ctx, 0, ProgressStage::Preflight);

    std::optional<std::uint64_t> length;
    auto r = retrying(ctx, "preflight", [&]() -> Result<void> {
        auto resp = transport_.head(ctx.url, config_.timeouts, ctx.token);
        if (!resp) {
            return resp.error();
        }
        const int status = resp.value().statusCode;
        if (status == 405 || status == 501) {
            spdlog::debug("HEAD not supported for {} (HTTP {}); size unknown", ctx.url, status);
            return {};
        }
        if (const auto code = classifyHttpStatus(status); code != ErrorCode::Success) {
            return Error{code, "HEAD " + ctx.url + " returned HTTP " + std::to_string(status)};
        }
        length = resp.value().contentLength();
        return {};
    });
    if (!r) {
        return r;
    }

    if (!length) {
        spdlog::debug("No content length for {}; skipping disk-space check", ctx.chartId);
        return {};
    }
    ctx.totalBytes = length;
    updateResume(ctx.chartId, [&](ResumeData& d) { d.totalBytes = length; });

    auto dir = ctx.destination.parent_path();
    if (dir.empty())
        dir = ".";
    if (auto disk = checkDiskSpace(config_.disk, *length, dir, spaceProbe_); !disk) {
        spdlog::error("Refusing to download {}: {}", ctx.chartId, disk.error().message);
        return disk;
    }
    return {};
}

Result<void> ChartDownloader::attemptFullTransfer(TransferContext& ctx) {
    auto onProgress = [&](std::uint64_t received, std::optional<std::uint64_t> total) {
        if (!ctx.totalBytes && total)
            ctx.totalBytes = total;
        updateResume(
            ctx.chartId,
            [&](ResumeData& d) {
                d.downloadedBytes = std::max(d.downloadedBytes, received);
                if (!d.totalBytes)
                    d.totalBytes = ctx.totalBytes;
            },
            false);
        emitProgress(ctx, received, ProgressStage::Downloading);
    };

    if (ctx.partial.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(ctx.partial.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Cannot create " + ctx.partial.parent_path().string() +
                                                 ": " + ec.message()};
        }
    }

    auto r = transport_.downloadFile(ctx.url, ctx.partial, onProgress, config_.timeouts,
                                     ctx.token);
    syncDownloadedBytes(ctx);
    if (!r) {
        return r;
    }

    const auto size = fileSizeOrZero(ctx.partial);
    if (ctx.totalBytes && size < *ctx.totalBytes) {
        return Error{ErrorCode::NetworkError, "Transfer ended after " + std::to_string(size) +
                                                  " of " + std::to_string(*ctx.totalBytes) +
                                                  " bytes"};
    }
    if (ctx.totalBytes && size > *ctx.totalBytes) {
        return Error{ErrorCode::SizeMismatch, "Received " + std::to_string(size) +
                                                  " bytes but server reported " +
                                                  std::to_string(*ctx.totalBytes)};
    }
    return {};
}

// ---- resume path ----

Result<DownloadResult> ChartDownloader::runResume(TransferContext& ctx) {
    RangeSupport support = RangeSupport::Unknown;
    updateResume(ctx.chartId, [&](ResumeData& d) {
        d.url = ctx.url;
        d.destinationPath = ctx.destination;
        d.partialFilePath = ctx.partial;
        d.downloadedBytes = fileSizeOrZero(ctx.partial);
        d.expectedSha256 = ctx.options.expectedSha256;
        d.lastError.reset();
        d.lastAttempt = std::chrono::system_clock::now();
        d.state = TransferState::Resuming;
        support = d.supportsRange;
    });

    if (support == RangeSupport::Unknown) {
        auto probed = probeRange(ctx);
        if (!probed) {
            return fail(ctx, probed.error());
        }
        support = probed.value();
    } else {
        spdlog::debug("Reusing known range support for {}: {}", ctx.chartId, toString(support));
    }

    if (support == RangeSupport::Supported) {
        if (auto r = appendUntilComplete(ctx); !r) {
            return fail(ctx, r.error());
        }
        if (!ctx.rangeRejected) {
            return finalize(ctx);
        }
    }

    spdlog::info("Server for {} does not honour byte ranges; restarting from byte 0",
                 ctx.chartId);
    ctx.resumed = false;
    removeFileQuietly(ctx.partial);
    updateResume(ctx.chartId, [](ResumeData& d) {
        d.downloadedBytes = 0;
        d.state = TransferState::Transferring;
    });
    if (auto r = retrying(ctx, "download", [&] { return attemptFullTransfer(ctx); }); !r) {
        return fail(ctx, r.error());
    }
    return finalize(ctx);
}

Result<RangeSupport> ChartDownloader::probeRange(TransferContext& ctx) {
    emitProgress(ctx, ctx.reportedBytes, ProgressStage::Probing);

    RangeSupport support = RangeSupport::Unknown;
    auto r = retrying(ctx, "range probe", [&]() -> Result<void> {
        ByteSink discard = [](const HttpResponse&, std::span<const std::byte>) -> Result<void> {
            return {};
        };
        auto resp = transport_.get(ctx.url, std::string("bytes=0-0"), discard, config_.timeouts,
                                   ctx.token);
        if (!resp) {
            return resp.error();
        }
        const auto& response = resp.value();
        if (classifyHttpStatus(response.statusCode) == ErrorCode::ServerError) {
            return Error{ErrorCode::ServerError,
                         "Range probe returned HTTP " + std::to_string(response.statusCode)};
        }
        std::optional<ContentRange> range;
        if (auto h = response.header("Content-Range"))
            range = parseContentRange(*h);

        if (response.statusCode == 206 && range) {
            support = RangeSupport::Supported;
            if (range->total)
                ctx.totalBytes = range->total;
        } else {
            support = RangeSupport::Unsupported;
            if (response.statusCode == 200) {
                if (auto len = response.contentLength())
                    ctx.totalBytes = len;
            }
        }
        return {};
    });
    if (!r) {
        return r.error();
    }

    updateResume(ctx.chartId, [&](ResumeData& d) {
        d.supportsRange = support;
        if (ctx.totalBytes)
            d.totalBytes = ctx.totalBytes;
    });
    spdlog::info("Range probe for {}: {} (total {})", ctx.chartId, toString(support),
                 ctx.totalBytes ? std::to_string(*ctx.totalBytes) : std::string("unknown"));
    return support;
}

Result<void> ChartDownloader::appendUntilComplete(TransferContext& ctx) {
    for (;;) {
        if (auto r = retrying(ctx, "append", [&] { return attemptAppend(ctx); }); !r) {
            return r;
        }
        if (ctx.rangeRejected)
            return {};

        const auto local = fileSizeOrZero(ctx.partial);
        if (!ctx.totalBytes || local == *ctx.totalBytes)
            return {};

        const auto sizeError = Error{
            ErrorCode::SizeMismatch, "Partial for " + ctx.chartId + " holds " +
                                         std::to_string(local) + " bytes but server reports " +
                                         std::to_string(*ctx.totalBytes)};
        if (ctx.sizeReprobeUsed) {
            return sizeError;
        }
        ctx.sizeReprobeUsed = true;
        spdlog::warn("{}; re-probing range support once", sizeError.message);

        auto probed = probeRange(ctx);
        if (!probed) {
            return probed.error();
        }
        if (probed.value() != RangeSupport::Supported) {
            return sizeError;
        }
        if (!ctx.totalBytes || local == *ctx.totalBytes)
            return {};
        if (local > *ctx.totalBytes) {
            return Error{ErrorCode::SizeMismatch,
                         "Partial for " + ctx.chartId + " is larger than the advertised total"};
        }
        // Fewer bytes than advertised: append the remainder on the next pass
    }
}

Result<void> ChartDownloader::attemptAppend(TransferContext& ctx) {
    auto opened = PartialFileWriter::open(ctx.partial);
    if (!opened) {
        return opened.error();
    }
    auto& writer = opened.value();
    const auto offset = writer.startOffset();
    if (ctx.totalBytes && offset >= *ctx.totalBytes) {
        return writer.close();
    }

    const std::string range = "bytes=" + std::to_string(offset) + "-";

    // Only a 206 for [offset, ...) may touch the partial. Anything else stops the
    // transfer before its body is written.
    bool checked = false;
    std::optional<int> refusedStatus;
    std::optional<std::uint64_t> limit = ctx.totalBytes;
    ByteSink sink = [&](const HttpResponse& response,
                        std::span<const std::byte> chunk) -> Result<void> {
        if (ctx.token.isCancelled()) {
            return cancelledError(ctx.chartId);
        }
        if (response.statusCode >= 400) {
            return {};
        }
        if (!checked) {
            std::optional<ContentRange> cr;
            if (auto h = response.header("Content-Range"))
                cr = parseContentRange(*h);
            if (response.statusCode != 206 || (cr && cr->start != offset)) {
                refusedStatus = response.statusCode;
                return Error{ErrorCode::InvalidState,
                             "Response to " + range + " is not the requested range"};
            }
            if (cr && cr->total)
                limit = cr->total;
            checked = true;
        }
        const auto now = offset + writer.bytesWritten() + chunk.size();
        if (limit && now > *limit) {
            return Error{ErrorCode::SizeMismatch, "Server sent more than " +
                                                      std::to_string(*limit) + " bytes for " +
                                                      ctx.chartId};
        }
        if (auto r = writer.append(chunk); !r) {
            return r;
        }
        updateResume(ctx.chartId, [&](ResumeData& d) { d.downloadedBytes = now; }, false);
        emitProgress(ctx, now, ProgressStage::Downloading);
        return {};
    };

    auto resp = transport_.get(ctx.url, range, sink, config_.timeouts, ctx.token);
    auto closed = writer.close();
    if (refusedStatus) {
        syncDownloadedBytes(ctx);
        if (!closed) {
            return closed;
        }
        spdlog::warn("Server did not honour {} for {} (HTTP {}); range support withdrawn", range,
                     ctx.chartId, *refusedStatus);
        ctx.rangeRejected = true;
        updateResume(ctx.chartId,
                     [](ResumeData& d) { d.supportsRange = RangeSupport::Unsupported; });
        return {};
    }
    if (!resp) {
        syncDownloadedBytes(ctx);
        return resp.error();
    }
    if (!closed) {
        syncDownloadedBytes(ctx);
        return closed;
    }

    const auto& response = resp.value();
    if (response.statusCode == 206) {
        std::optional<ContentRange> cr;
        if (auto h = response.header("Content-Range"))
            cr = parseContentRange(*h);
        if (cr && cr->start != offset) {
            spdlog::warn("Server returned range starting at {} for {} (asked {}); restarting",
                         cr->start, ctx.chartId, offset);
            if (auto t = truncateFile(ctx.partial, offset); !t) {
                return t;
            }
            ctx.rangeRejected = true;
        } else if (cr && cr->total) {
            ctx.totalBytes = cr->total;
        }
        updateResume(ctx.chartId, [&](ResumeData& d) {
            if (ctx.rangeRejected)
                d.supportsRange = RangeSupport::Unsupported;
            if (ctx.totalBytes)
                d.totalBytes = ctx.totalBytes;
        });
        syncDownloadedBytes(ctx);
        return {};
    }

    // Anything else: drop whatever was appended for this request
    if (auto t = truncateFile(ctx.partial, offset); !t) {
        return t;
    }
    syncDownloadedBytes(ctx);

    if (response.statusCode == 416) {
        // Nothing left past offset; the size check decides
        return {};
    }
    if (response.statusCode >= 200 && response.statusCode < 300) {
        spdlog::warn("Server answered ranged request for {} with HTTP {}; range support withdrawn",
                     ctx.chartId, response.statusCode);
        ctx.rangeRejected = true;
        updateResume(ctx.chartId,
                     [](ResumeData& d) { d.supportsRange = RangeSupport::Unsupported; });
        return {};
    }
    const auto code = classifyHttpStatus(response.statusCode);
    return Error{code, "Ranged GET for " + ctx.chartId + " returned HTTP " +
                           std::to_string(response.statusCode)};
}

// ---- retry loop ----

Result<void> ChartDownloader::retrying(TransferContext& ctx, const char* what,
                                       const std::function<Result<void>()>& attempt) {
    const int maxAttempts = config_.retry.maxAttempts;
    for (;;) {
        if (ctx.token.isCancelled()) {
            return cancelledError(ctx.chartId);
        }
        auto r = attempt();
        if (r) {
            return r;
        }
        const Error err = r.error();
        if (err.code == ErrorCode::OperationCancelled || ctx.token.isCancelled()) {
            return cancelledError(ctx.chartId);
        }
        if (!isRetryable(err.code)) {
            return r;
        }
        if (ctx.attempts >= maxAttempts) {
            spdlog::warn("{} for {} failed after {} attempt(s): {}", what, ctx.chartId,
                         ctx.attempts, err.message);
            return r;
        }

        syncDownloadedBytes(ctx);
        const auto delay = backoffDelay(config_.retry, ctx.attempts - 1, nextUnitRandom());
        ++ctx.attempts;
        updateResume(ctx.chartId, [&](ResumeData& d) {
            ++d.attempts;
            d.lastError = err.code;
            d.lastAttempt = std::chrono::system_clock::now();
        });
        metrics_.incrementRetry(ctx.chartId);
        spdlog::warn("{} for {} failed ({}); attempt {}/{} in {} ms", what, ctx.chartId,
                     err.message, ctx.attempts, maxAttempts, delay.count());
        sleep_(delay, ctx.token);
    }
}

// ---- completion ----

Result<DownloadResult> ChartDownloader::finalize(TransferContext& ctx) {
    updateResume(ctx.chartId, [](ResumeData& d) { d.state = TransferState::Verifying; }, false);

    std::error_code ec;
    if (!fs::is_regular_file(ctx.partial, ec)) {
        return fail(ctx, Error{ErrorCode::FileNotFound,
                               "Partial file vanished before finalize: " + ctx.partial.string()});
    }
    const auto size = fileSizeOrZero(ctx.partial);
    emitProgress(ctx, size, ProgressStage::Verifying);

    auto digest = integrity::sha256File(ctx.partial);
    if (!digest) {
        return fail(ctx, digest.error());
    }
    if (ctx.options.expectedSha256 &&
        !integrity::digestEquals(*ctx.options.expectedSha256, digest.value())) {
        spdlog::error("Checksum mismatch for {}: expected {} got {}", ctx.chartId,
                      *ctx.options.expectedSha256, digest.value());
        removeFileQuietly(ctx.partial);
        return fail(ctx, Error{ErrorCode::HashMismatch,
                               "SHA-256 of " + ctx.chartId + " does not match expected value"});
    }

    emitProgress(ctx, size, ProgressStage::Finalizing);
    if (auto r = finalizePartial(ctx.partial, ctx.destination); !r) {
        return fail(ctx, r.error());
    }
    forget(ctx.chartId);

    DownloadResult result;
    result.chartId = ctx.chartId;
    result.path = ctx.destination;
    result.sizeBytes = size;
    result.sha256 = digest.value();
    result.attempts = ctx.attempts;
    result.resumed = ctx.resumed;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - ctx.started);

    if (registry_) {
        auto outcome = integrity::verifyChartDigest(*registry_, ctx.chartId, result.sha256);
        if (outcome) {
            result.verification = outcome.value().status;
            result.integrityMismatch = outcome.value().mismatch;
        } else {
            spdlog::warn("Integrity registry update for {} failed: {}", ctx.chartId,
                         outcome.error().message);
        }
    }

    metrics_.completeSuccess(ctx.chartId);
    spdlog::info("Chart {} ready at {} ({} bytes, {} attempt(s){})", ctx.chartId,
                 result.path.string(), result.sizeBytes, result.attempts,
                 result.resumed ? ", resumed" : "");
    return result;
}

Result<DownloadResult> ChartDownloader::fail(TransferContext& ctx, const Error& error) {
    bool discard = false;
    {
        std::lock_guard lk(mutex_);
        auto it = active_.find(ctx.chartId);
        if (it != active_.end())
            discard = it->second.discardOnCancel;
    }

    if (error.code == ErrorCode::OperationCancelled && discard) {
        removeFileQuietly(ctx.partial);
        forget(ctx.chartId);
        spdlog::info("Download of {} cancelled; partial discarded", ctx.chartId);
    } else {
        updateResume(ctx.chartId, [&](ResumeData& d) {
            d.downloadedBytes = fileSizeOrZero(ctx.partial);
            d.lastError = error.code;
            d.lastAttempt = std::chrono::system_clock::now();
            d.state = TransferState::Failed;
        });
        if (error.code == ErrorCode::OperationCancelled) {
            spdlog::info("Download of {} cancelled; partial kept at {}", ctx.chartId,
                         ctx.partial.string());
        } else {
            spdlog::error("Download of {} failed [{}]: {}", ctx.chartId,
                          failureCategory(error.code), error.message);
        }
    }

    metrics_.completeFailure(ctx.chartId, failureCategory(error.code));
    return error;
}

// ---- helpers ----

fs::path ChartDownloader::resolveDestination(std::string_view chartId, std::string_view url,
                                             const DownloadOptions& options) const {
    if (options.destinationPath)
        return *options.destinationPath;
    return config_.chartsDir / fileNameFromUrl(url, chartId);
}

void ChartDownloader::emitProgress(TransferContext& ctx, std::uint64_t bytes,
                                   ProgressStage stage) {
    ctx.reportedBytes = std::max(ctx.reportedBytes, bytes);
    if (!ctx.options.onProgress)
        return;

    ProgressEvent ev;
    ev.chartId = ctx.chartId;
    ev.downloadedBytes = ctx.reportedBytes;
    ev.totalBytes = ctx.totalBytes;
    if (ctx.totalBytes && *ctx.totalBytes > 0) {
        ev.fraction = std::min(1.0, static_cast<double>(ctx.reportedBytes) /
                                        static_cast<double>(*ctx.totalBytes));
    }
    ev.stage = stage;
    try {
        ctx.options.onProgress(ev);
    } catch (const std::exception& e) {
        spdlog::warn("Progress callback for {} threw: {}", ctx.chartId, e.what());
    }
}

void ChartDownloader::updateResume(const ChartId& chartId,
                                   const std::function<void(ResumeData&)>& mutate,
                                   bool persistNow) {
    ResumeData snapshot;
    {
        std::lock_guard lk(mutex_);
        auto& d = resume_[chartId];
        if (d.chartId.empty())
            d.chartId = chartId;
        mutate(d);
        if (persistNow)
            snapshot = d;
    }
    if (persistNow)
        persist(snapshot);
}

void ChartDownloader::syncDownloadedBytes(TransferContext& ctx) {
    const auto size = fileSizeOrZero(ctx.partial);
    updateResume(ctx.chartId, [&](ResumeData& d) { d.downloadedBytes = size; });
}

void ChartDownloader::persist(const ResumeData& data) {
    if (!resumeStore_)
        return;
    if (auto r = resumeStore_->save(data); !r) {
        spdlog::warn("Failed to persist resume state for {}: {}", data.chartId,
                     r.error().message);
    }
}

void ChartDownloader::forget(const ChartId& chartId) {
    {
        std::lock_guard lk(mutex_);
        resume_.erase(chartId);
    }
    if (resumeStore_)
        resumeStore_->remove(chartId);
}

double ChartDownloader::nextUnitRandom() {
    std::lock_guard lk(rngMutex_);
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
}

} // namespace chartfetch::downloader
