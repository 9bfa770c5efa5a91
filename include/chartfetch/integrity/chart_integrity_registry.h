#pragma once

#include <chartfetch/core/types.h>
#include <chartfetch/storage/key_value_store.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace chartfetch::integrity {

/**
 * Trusted expectation for one chart artifact.
 */
struct IntegrityRecord {
    ChartId chartId;
    HexDigest expectedSha256;
    TimePoint capturedAt{};
};

/**
 * Produced by compare() when a record exists and the observed hash differs.
 * Both digests keep the casing they were supplied with.
 */
struct IntegrityMismatch {
    ChartId chartId;
    HexDigest expected;
    HexDigest actual;
};

nlohmann::json toJson(const IntegrityMismatch& mismatch);

/**
 * In-memory map chartId -> expected SHA-256, written through to a durable
 * IKeyValueStore under "<keyPrefix><chartId>". The registry is the only writer
 * of its key namespace. All operations are serialized against each other.
 */
class ChartIntegrityRegistry {
public:
    static constexpr std::string_view kDefaultKeyPrefix = "chart_integrity_";

    explicit ChartIntegrityRegistry(storage::IKeyValueStore& store,
                                    std::string keyPrefix = std::string(kDefaultKeyPrefix));

    ChartIntegrityRegistry(const ChartIntegrityRegistry&) = delete;
    ChartIntegrityRegistry& operator=(const ChartIntegrityRegistry&) = delete;

    /**
     * Load every persisted entry under the key prefix. Entries whose value is not
     * a string are skipped with a warning. Never fails; returns the number loaded.
     */
    std::size_t initialize();

    // Bulk in-memory load, no persistence.
    void seed(const std::map<ChartId, HexDigest>& entries);

    /**
     * Record the hash observed on first load. No-op (returns false) when a record
     * already exists; an established expectation is never overwritten here.
     */
    Result<bool> captureFirstLoad(std::string_view chartId, std::string_view sha256);

    // Create or replace, writing through to the store unconditionally.
    Result<void> upsert(std::string_view chartId, std::string_view sha256);

    [[nodiscard]] std::optional<IntegrityRecord> get(std::string_view chartId) const;

    /**
     * nullopt when no record exists (first load) or when the digests match
     * case-insensitively; otherwise the mismatch.
     */
    [[nodiscard]] std::optional<IntegrityMismatch> compare(std::string_view chartId,
                                                           std::string_view actualSha256) const;

    // Drop all records and every persisted key under the prefix.
    Result<void> clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const std::string& keyPrefix() const { return keyPrefix_; }
    [[nodiscard]] std::string storageKey(std::string_view chartId) const;

private:
    storage::IKeyValueStore& store_;
    std::string keyPrefix_;
    std::unordered_map<ChartId, IntegrityRecord> records_;
    mutable std::shared_mutex mutex_;
};

} // namespace chartfetch::integrity
