#include <chartfetch/integrity/chart_verifier.h>
#include <chartfetch/integrity/sha256.h>

#include <spdlog/spdlog.h>

namespace chartfetch::integrity {

Result<VerificationOutcome> verifyChartDigest(ChartIntegrityRegistry& registry,
                                              std::string_view chartId, std::string_view sha256) {
    VerificationOutcome out;
    out.computedSha256 = std::string(sha256);

    if (auto mismatch = registry.compare(chartId, sha256)) {
        spdlog::warn("Integrity mismatch for {}: expected {} got {}", mismatch->chartId,
                     mismatch->expected, mismatch->actual);
        out.status = VerificationStatus::Mismatch;
        out.mismatch = std::move(mismatch);
        return out;
    }

    // compare() is silent both for a match and for a missing record
    auto captured = registry.captureFirstLoad(chartId, sha256);
    if (!captured) {
        return captured.error();
    }
    if (captured.value()) {
        out.status = VerificationStatus::FirstLoadCaptured;
        return out;
    }
    // A record appeared between compare() and capture; judge against it
    if (auto late = registry.compare(chartId, sha256)) {
        out.status = VerificationStatus::Mismatch;
        out.mismatch = std::move(late);
        return out;
    }
    out.status = VerificationStatus::Verified;
    return out;
}

Result<VerificationOutcome> verifyChartFile(ChartIntegrityRegistry& registry,
                                            std::string_view chartId,
                                            const std::filesystem::path& path) {
    auto digest = sha256File(path);
    if (!digest) {
        return digest.error();
    }
    return verifyChartDigest(registry, chartId, digest.value());
}

} // namespace chartfetch::integrity
