#include <chartfetch/integrity/chart_integrity_registry.h>
#include <chartfetch/integrity/sha256.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <mutex>
#include <set>

namespace chartfetch::integrity {

nlohmann::json toJson(const IntegrityMismatch& mismatch) {
    return nlohmann::json{{"chartId", mismatch.chartId},
                          {"expected", mismatch.expected},
                          {"actual", mismatch.actual}};
}

ChartIntegrityRegistry::ChartIntegrityRegistry(storage::IKeyValueStore& store,
                                               std::string keyPrefix)
    : store_(store), keyPrefix_(std::move(keyPrefix)) {}

std::string ChartIntegrityRegistry::storageKey(std::string_view chartId) const {
    std::string key = keyPrefix_;
    key.append(chartId);
    return key;
}

std::size_t ChartIntegrityRegistry::initialize() {
    std::unique_lock lk(mutex_);
    std::size_t loaded = 0;
    for (const auto& key : store_.keysWithPrefix(keyPrefix_)) {
        auto chartId = key.substr(keyPrefix_.size());
        if (chartId.empty())
            continue;
        auto value = store_.get(key);
        if (!value) {
            spdlog::warn("Integrity registry: skipping corrupt entry '{}': {}", key,
                         value.error().message);
            continue;
        }
        if (!value.value())
            continue;
        records_[chartId] = IntegrityRecord{chartId, *value.value(),
                                            std::chrono::system_clock::now()};
        ++loaded;
    }
    spdlog::debug("Integrity registry: loaded {} persisted hash(es)", loaded);
    return loaded;
}

void ChartIntegrityRegistry::seed(const std::map<ChartId, HexDigest>& entries) {
    std::unique_lock lk(mutex_);
    const auto now = std::chrono::system_clock::now();
    for (const auto& [id, hash] : entries) {
        records_[id] = IntegrityRecord{id, hash, now};
    }
}

Result<bool> ChartIntegrityRegistry::captureFirstLoad(std::string_view chartId,
                                                      std::string_view sha256) {
    if (chartId.empty()) {
        return Error{ErrorCode::InvalidArgument, "captureFirstLoad: empty chart id"};
    }
    std::unique_lock lk(mutex_);
    std::string id(chartId);
    if (records_.find(id) != records_.end()) {
        return false;
    }
    auto wr = store_.set(storageKey(chartId), sha256);
    if (!wr) {
        return wr.error();
    }
    records_[id] = IntegrityRecord{id, std::string(sha256), std::chrono::system_clock::now()};
    spdlog::info("Captured first-load hash for {}", id);
    return true;
}

Result<void> ChartIntegrityRegistry::upsert(std::string_view chartId, std::string_view sha256) {
    if (chartId.empty()) {
        return Error{ErrorCode::InvalidArgument, "upsert: empty chart id"};
    }
    std::unique_lock lk(mutex_);
    std::string id(chartId);
    auto it = records_.find(id);
    auto wr = store_.set(storageKey(chartId), sha256);
    if (!wr) {
        spdlog::warn("Integrity registry: could not persist hash for {}: {}", id,
                     wr.error().message);
        return wr;
    }
    if (it != records_.end() && it->second.expectedSha256 != sha256) {
        spdlog::info("Replacing expected hash for {}", id);
    }
    records_[id] = IntegrityRecord{id, std::string(sha256), std::chrono::system_clock::now()};
    return {};
}

std::optional<IntegrityRecord> ChartIntegrityRegistry::get(std::string_view chartId) const {
    std::shared_lock lk(mutex_);
    auto it = records_.find(std::string(chartId));
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

std::optional<IntegrityMismatch>
ChartIntegrityRegistry::compare(std::string_view chartId, std::string_view actualSha256) const {
    std::shared_lock lk(mutex_);
    auto it = records_.find(std::string(chartId));
    if (it == records_.end())
        return std::nullopt;
    if (digestEquals(it->second.expectedSha256, actualSha256))
        return std::nullopt;
    return IntegrityMismatch{it->second.chartId, it->second.expectedSha256,
                             std::string(actualSha256)};
}

Result<void> ChartIntegrityRegistry::clear() {
    std::unique_lock lk(mutex_);
    std::set<ChartId> kept;
    Result<void> status;
    for (const auto& key : store_.keysWithPrefix(keyPrefix_)) {
        auto r = store_.remove(key);
        if (!r) {
            spdlog::warn("Integrity registry: failed to remove '{}': {}", key, r.error().message);
            kept.insert(key.substr(keyPrefix_.size()));
            status = r.error();
        }
    }
    // Entries still on disk stay in memory so both views agree
    std::erase_if(records_, [&](const auto& entry) { return !kept.contains(entry.first); });
    return status;
}

std::size_t ChartIntegrityRegistry::size() const {
    std::shared_lock lk(mutex_);
    return records_.size();
}

} // namespace chartfetch::integrity
