/*
 * chartfetch/src/downloader/resume_store.cpp
 *
 * ResumeData persistence:
 * - InMemoryResumeStore: per-run table guarded by a shared_mutex
 * - JsonResumeStore: same table mirrored to a JSON document, rewritten atomically
 *   (<file>.tmp + rename) on every change
 */

#include <chartfetch/downloader/downloader.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chartfetch::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr std::array<std::pair<ErrorCode, std::string_view>, 12> kPersistedErrors{{
    {ErrorCode::NetworkError, "network"},
    {ErrorCode::Timeout, "timeout"},
    {ErrorCode::ServerError, "server"},
    {ErrorCode::HttpError, "http"},
    {ErrorCode::StorageFull, "disk"},
    {ErrorCode::SizeMismatch, "size"},
    {ErrorCode::HashMismatch, "checksum"},
    {ErrorCode::OperationCancelled, "cancelled"},
    {ErrorCode::IoError, "io"},
    {ErrorCode::FileNotFound, "fileNotFound"},
    {ErrorCode::InvalidArgument, "invalidArgument"},
    {ErrorCode::Unknown, "unknown"},
}};

std::string_view errorName(ErrorCode code) {
    for (const auto& [c, name] : kPersistedErrors) {
        if (c == code)
            return name;
    }
    return "unknown";
}

ErrorCode errorFromName(std::string_view name) {
    for (const auto& [c, n] : kPersistedErrors) {
        if (n == name)
            return c;
    }
    return ErrorCode::Unknown;
}

json toJson(const ResumeData& d) {
    json j;
    j["chartId"] = d.chartId;
    j["url"] = d.url;
    j["destinationPath"] = d.destinationPath.string();
    j["partialFilePath"] = d.partialFilePath.string();
    j["downloadedBytes"] = d.downloadedBytes;
    j["totalBytes"] = d.totalBytes ? json(*d.totalBytes) : json(nullptr);
    switch (d.supportsRange) {
        case RangeSupport::Unknown:
            j["supportsRange"] = nullptr;
            break;
        case RangeSupport::Supported:
            j["supportsRange"] = true;
            break;
        case RangeSupport::Unsupported:
            j["supportsRange"] = false;
            break;
    }
    j["attempts"] = d.attempts;
    j["expectedSha256"] = d.expectedSha256 ? json(*d.expectedSha256) : json(nullptr);
    j["lastError"] = d.lastError ? json(std::string(errorName(*d.lastError))) : json(nullptr);
    j["lastAttemptMs"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                             d.lastAttempt.time_since_epoch())
                             .count();
    return j;
}

std::optional<ResumeData> fromJson(const json& j) {
    if (!j.is_object() || !j.contains("chartId") || !j["chartId"].is_string())
        return std::nullopt;
    ResumeData d;
    d.chartId = j["chartId"].get<std::string>();
    d.url = j.value("url", std::string{});
    d.destinationPath = j.value("destinationPath", std::string{});
    d.partialFilePath = j.value("partialFilePath", std::string{});
    d.downloadedBytes = j.value("downloadedBytes", std::uint64_t{0});
    if (j.contains("totalBytes") && j["totalBytes"].is_number_unsigned())
        d.totalBytes = j["totalBytes"].get<std::uint64_t>();
    if (j.contains("supportsRange") && j["supportsRange"].is_boolean())
        d.supportsRange = j["supportsRange"].get<bool>() ? RangeSupport::Supported
                                                          : RangeSupport::Unsupported;
    d.attempts = j.value("attempts", 0);
    if (j.contains("expectedSha256") && j["expectedSha256"].is_string())
        d.expectedSha256 = j["expectedSha256"].get<std::string>();
    if (j.contains("lastError") && j["lastError"].is_string())
        d.lastError = errorFromName(j["lastError"].get<std::string>());
    d.lastAttempt = TimePoint{std::chrono::milliseconds(j.value("lastAttemptMs", std::int64_t{0}))};
    d.state = d.lastError ? TransferState::Failed : TransferState::Idle;
    return d;
}

} // namespace

class InMemoryResumeStore : public IResumeStore {
public:
    Result<std::vector<ResumeData>> loadAll() override {
        std::shared_lock lk(mutex_);
        std::vector<ResumeData> out;
        out.reserve(table_.size());
        for (const auto& [id, data] : table_)
            out.push_back(data);
        return out;
    }

    Result<void> save(const ResumeData& data) override {
        if (data.chartId.empty()) {
            return Error{ErrorCode::InvalidArgument, "ResumeStore.save: empty chart id"};
        }
        std::unique_lock lk(mutex_);
        table_[data.chartId] = data;
        return persistLocked();
    }

    void remove(std::string_view chartId) override {
        std::unique_lock lk(mutex_);
        if (table_.erase(std::string(chartId)) == 0)
            return;
        if (auto r = persistLocked(); !r) {
            spdlog::warn("ResumeStore: failed to persist removal of {}: {}", chartId,
                         r.error().message);
        }
    }

protected:
    virtual Result<void> persistLocked() { return {}; }

    std::map<ChartId, ResumeData> table_;
    mutable std::shared_mutex mutex_;
};

class JsonResumeStore final : public InMemoryResumeStore {
public:
    explicit JsonResumeStore(fs::path path) : path_(std::move(path)) { loadFromDisk(); }

private:
    void loadFromDisk() {
        std::error_code ec;
        if (!fs::exists(path_, ec))
            return;
        std::ifstream in(path_);
        json root = json::parse(in, nullptr, /*allow_exceptions=*/false);
        if (root.is_discarded() || !root.is_object()) {
            spdlog::warn("ResumeStore: ignoring unreadable state file {}", path_.string());
            return;
        }
        const auto it = root.find("resumeData");
        if (it == root.end() || !it->is_object())
            return;
        for (const auto& [id, value] : it->items()) {
            if (auto d = fromJson(value)) {
                table_[d->chartId] = std::move(*d);
            } else {
                spdlog::warn("ResumeStore: skipping malformed entry '{}'", id);
            }
        }
        spdlog::debug("ResumeStore: loaded {} entries from {}", table_.size(), path_.string());
    }

    Result<void> persistLocked() override {
        json entries = json::object();
        for (const auto& [id, data] : table_)
            entries[id] = toJson(data);
        json root;
        root["resumeData"] = std::move(entries);

        std::error_code ec;
        if (path_.has_parent_path())
            fs::create_directories(path_.parent_path(), ec);
        auto tmp = path_;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                return Error{ErrorCode::IoError, "Cannot write " + tmp.string()};
            }
            out << root.dump(2);
            if (!out.good()) {
                return Error{ErrorCode::IoError, "Short write to " + tmp.string()};
            }
        }
        fs::rename(tmp, path_, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "rename " + tmp.string() + " -> " + path_.string() + ": " + ec.message()};
        }
        return {};
    }

    fs::path path_;
};

std::unique_ptr<IResumeStore> makeInMemoryResumeStore() {
    return std::make_unique<InMemoryResumeStore>();
}

std::unique_ptr<IResumeStore> makeJsonResumeStore(const std::filesystem::path& path) {
    return std::make_unique<JsonResumeStore>(path);
}

} // namespace chartfetch::downloader
