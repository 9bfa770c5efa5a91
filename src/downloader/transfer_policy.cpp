/*
 * chartfetch/src/downloader/transfer_policy.cpp
 *
 * Pure helpers shared by the orchestrator and transports: header parsing,
 * HTTP status classification, backoff computation and the disk-space heuristic.
 */

#include <chartfetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace chartfetch::downloader {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim_view(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

std::optional<std::uint64_t> parse_u64(std::string_view s) {
    s = trim_view(s);
    if (s.empty())
        return std::nullopt;
    std::uint64_t v{0};
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || p != s.data() + s.size())
        return std::nullopt;
    return v;
}

} // namespace

const char* toString(RangeSupport support) noexcept {
    switch (support) {
        case RangeSupport::Unknown:
            return "unknown";
        case RangeSupport::Supported:
            return "supported";
        case RangeSupport::Unsupported:
            return "unsupported";
    }
    return "unknown";
}

const char* toString(TransferState state) noexcept {
    switch (state) {
        case TransferState::Idle:
            return "idle";
        case TransferState::Preflight:
            return "preflight";
        case TransferState::Transferring:
            return "transferring";
        case TransferState::Resuming:
            return "resuming";
        case TransferState::Verifying:
            return "verifying";
        case TransferState::Completed:
            return "completed";
        case TransferState::Failed:
            return "failed";
    }
    return "idle";
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    for (const auto& h : headers) {
        if (iequals(h.name, name))
            return h.value;
    }
    return std::nullopt;
}

std::optional<std::uint64_t> HttpResponse::contentLength() const {
    auto v = header("Content-Length");
    if (!v)
        return std::nullopt;
    return parse_u64(*v);
}

std::optional<ContentRange> parseContentRange(std::string_view value) {
    value = trim_view(value);
    constexpr std::string_view unit = "bytes";
    if (value.size() <= unit.size() || !iequals(value.substr(0, unit.size()), unit))
        return std::nullopt;
    value = trim_view(value.substr(unit.size()));

    const auto dash = value.find('-');
    const auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash)
        return std::nullopt;

    auto start = parse_u64(value.substr(0, dash));
    auto end = parse_u64(value.substr(dash + 1, slash - dash - 1));
    if (!start || !end || *end < *start)
        return std::nullopt;

    ContentRange cr;
    cr.start = *start;
    cr.end = *end;
    const auto totalText = trim_view(value.substr(slash + 1));
    if (totalText != "*") {
        auto total = parse_u64(totalText);
        if (!total || *total <= *end)
            return std::nullopt;
        cr.total = *total;
    }
    return cr;
}

ErrorCode classifyHttpStatus(int statusCode) noexcept {
    if (statusCode >= 200 && statusCode < 300)
        return ErrorCode::Success;
    if (statusCode >= 500 || statusCode == 408 || statusCode == 429)
        return ErrorCode::ServerError;
    if (statusCode >= 400)
        return ErrorCode::HttpError;
    // 1xx/3xx as a final status means redirects were exhausted or the origin misbehaved
    return ErrorCode::HttpError;
}

std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, int retryIndex,
                                       double unitRandom) noexcept {
    const double base = static_cast<double>(policy.initialBackoff.count()) *
                        std::pow(policy.multiplier, static_cast<double>(std::max(0, retryIndex)));
    const double capped = std::min(base, static_cast<double>(policy.maxBackoff.count()));
    const double u = std::clamp(unitRandom, 0.0, 1.0);
    const double jittered = capped * (1.0 + policy.jitter * (2.0 * u - 1.0));
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::max(0.0, jittered)));
}

TransferDeadlines transferDeadlines(const TransportTimeouts& timeouts) noexcept {
    TransferDeadlines limits;
    limits.connect = timeouts.connect;
    limits.overall = std::chrono::milliseconds{0};
    limits.stallWindow = std::max(std::chrono::seconds{1},
                                  std::chrono::duration_cast<std::chrono::seconds>(timeouts.receive));
    return limits;
}

Result<void> checkDiskSpace(const DiskPolicy& policy, std::uint64_t projectedBytes,
                            const std::filesystem::path& directory, const SpaceProbe& probe) {
    if (projectedBytes > policy.maxChartBytes) {
        return Error{ErrorCode::StorageFull,
                     "Reported size " + std::to_string(projectedBytes) +
                         " bytes exceeds the per-chart limit of " +
                         std::to_string(policy.maxChartBytes) + " bytes"};
    }
    if (!probe) {
        return {};
    }
    auto available = probe(directory);
    if (!available) {
        // Space could not be determined; the size ceiling above still applies
        spdlog::warn("Disk space probe failed for {}: {}", directory.string(),
                     available.error().message);
        return {};
    }
    const double needed =
        static_cast<double>(projectedBytes) * policy.safetyFactor +
        static_cast<double>(policy.reserveBytes);
    if (needed > static_cast<double>(available.value())) {
        return Error{ErrorCode::StorageFull,
                     "Need ~" + std::to_string(static_cast<std::uint64_t>(needed)) +
                         " bytes but only " + std::to_string(available.value()) +
                         " available under " + directory.string()};
    }
    return {};
}

std::string fileNameFromUrl(std::string_view url, std::string_view chartId) {
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos)
        url = url.substr(0, cut);
    auto scheme = url.find("://");
    if (scheme != std::string_view::npos)
        url = url.substr(scheme + 3);
    auto slash = url.rfind('/');
    std::string_view last = slash == std::string_view::npos ? std::string_view{} : url.substr(slash + 1);
    if (!last.empty() && last.find('.') != std::string_view::npos && last != "." && last != "..") {
        return std::string(last);
    }
    return std::string(chartId) + ".zip";
}

} // namespace chartfetch::downloader
