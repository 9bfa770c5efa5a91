/*
 * chartfetch/src/storage/json_key_value_store.cpp
 *
 * File-backed IKeyValueStore.
 * File layout (single JSON object):
 * {
 *   "chart_integrity_US5WA50M": "9f86d081884c7d65...",
 *   "chart_integrity_US3WA01M": "60303ae22b998861..."
 * }
 * Every mutation rewrites the whole object to "<path>.tmp" and renames it over
 * the target so a crash never leaves a half-written file behind.
 */

#include <chartfetch/storage/key_value_store.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <mutex>
#include <system_error>

namespace chartfetch::storage {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

json loadObject(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return json::object();
    }
    std::ifstream in(path);
    if (!in) {
        spdlog::warn("KeyValueStore: cannot open {} for read, starting empty", path.string());
        return json::object();
    }
    try {
        json root;
        in >> root;
        if (!root.is_object()) {
            spdlog::warn("KeyValueStore: {} is not a JSON object, starting empty", path.string());
            return json::object();
        }
        return root;
    } catch (const json::exception& ex) {
        spdlog::warn("KeyValueStore: {} is corrupt ({}), starting empty", path.string(), ex.what());
        return json::object();
    }
}

} // namespace

JsonFileKeyValueStore::JsonFileKeyValueStore(fs::path path) : path_(std::move(path)) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            spdlog::warn("KeyValueStore: failed to create {}: {}", path_.parent_path().string(),
                         ec.message());
        }
    }
    root_ = loadObject(path_);
}

Result<std::optional<std::string>> JsonFileKeyValueStore::get(std::string_view key) const {
    std::shared_lock lk(mutex_);
    auto it = root_.find(std::string(key));
    if (it == root_.end()) {
        return std::optional<std::string>{std::nullopt};
    }
    if (!it->is_string()) {
        return Error{ErrorCode::InvalidData, "Value for '" + std::string(key) + "' is not a string"};
    }
    return std::optional<std::string>{it->get<std::string>()};
}

Result<void> JsonFileKeyValueStore::set(std::string_view key, std::string_view value) {
    if (key.empty()) {
        return Error{ErrorCode::InvalidArgument, "KeyValueStore.set: empty key"};
    }
    std::unique_lock lk(mutex_);
    const std::string k(key);
    std::optional<nlohmann::json> previous;
    if (auto it = root_.find(k); it != root_.end())
        previous = *it;
    root_[k] = std::string(value);
    auto r = flushLocked();
    if (!r) {
        // Memory must keep matching the file
        if (previous)
            root_[k] = std::move(*previous);
        else
            root_.erase(k);
    }
    return r;
}

Result<void> JsonFileKeyValueStore::remove(std::string_view key) {
    std::unique_lock lk(mutex_);
    const std::string k(key);
    auto it = root_.find(k);
    if (it == root_.end()) {
        return {};
    }
    nlohmann::json previous = *it;
    root_.erase(k);
    auto r = flushLocked();
    if (!r) {
        root_[k] = std::move(previous);
    }
    return r;
}

std::vector<std::string> JsonFileKeyValueStore::keysWithPrefix(std::string_view prefix) const {
    std::shared_lock lk(mutex_);
    std::vector<std::string> out;
    for (auto it = root_.begin(); it != root_.end(); ++it) {
        const auto& k = it.key();
        if (k.compare(0, prefix.size(), prefix) == 0) {
            out.push_back(k);
        }
    }
    return out;
}

Result<void> JsonFileKeyValueStore::flushLocked() const {
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "Failed to open " + tmp.string() + " for write"};
        }
        out << root_.dump(2);
        if (!out.good()) {
            return Error{ErrorCode::IoError, "Failed to write " + tmp.string()};
        }
    }
    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Error{ErrorCode::IoError, "rename() failed for " + path_.string()};
    }
    return {};
}

std::unique_ptr<IKeyValueStore> makeJsonFileKeyValueStore(const fs::path& path) {
    return std::make_unique<JsonFileKeyValueStore>(path);
}

} // namespace chartfetch::storage
