#pragma once

#include <chartfetch/core/types.h>
#include <chartfetch/integrity/chart_integrity_registry.h>

#include <filesystem>
#include <optional>
#include <string_view>

namespace chartfetch::integrity {

enum class VerificationStatus {
    FirstLoadCaptured, // no prior expectation; computed hash is now trusted
    Verified,          // matches the stored expectation
    Mismatch           // differs from the stored expectation
};

struct VerificationOutcome {
    VerificationStatus status{VerificationStatus::Verified};
    HexDigest computedSha256;
    std::optional<IntegrityMismatch> mismatch;
};

/**
 * Compare an already computed digest against the registry, capturing it when the
 * chart has never been seen. A mismatch is an outcome, not an error.
 */
Result<VerificationOutcome> verifyChartDigest(ChartIntegrityRegistry& registry,
                                              std::string_view chartId, std::string_view sha256);

// Hash the file, then verifyChartDigest().
Result<VerificationOutcome> verifyChartFile(ChartIntegrityRegistry& registry,
                                            std::string_view chartId,
                                            const std::filesystem::path& path);

} // namespace chartfetch::integrity
