#pragma once

#include <chartfetch/core/types.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace chartfetch::storage {

/**
 * Durable string-keyed store used for state that must survive restarts.
 *
 * get() distinguishes three cases:
 *  - key absent            -> value() == std::nullopt
 *  - key holds a string    -> value() == the string
 *  - key holds a non-string -> error ErrorCode::InvalidData
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    virtual Result<std::optional<std::string>> get(std::string_view key) const = 0;
    virtual Result<void> set(std::string_view key, std::string_view value) = 0;
    virtual Result<void> remove(std::string_view key) = 0;
    virtual std::vector<std::string> keysWithPrefix(std::string_view prefix) const = 0;
};

/**
 * Volatile store for tests and ephemeral sessions. Values are JSON so callers can
 * plant non-string entries with putRaw().
 */
class MemoryKeyValueStore final : public IKeyValueStore {
public:
    MemoryKeyValueStore() = default;
    explicit MemoryKeyValueStore(std::map<std::string, nlohmann::json> initial);

    Result<std::optional<std::string>> get(std::string_view key) const override;
    Result<void> set(std::string_view key, std::string_view value) override;
    Result<void> remove(std::string_view key) override;
    std::vector<std::string> keysWithPrefix(std::string_view prefix) const override;

    void putRaw(std::string key, nlohmann::json value);
    [[nodiscard]] std::size_t size() const;

private:
    std::map<std::string, nlohmann::json> entries_;
    mutable std::shared_mutex mutex_;
};

/**
 * JSON object on disk, rewritten atomically (temp file + rename) on every mutation.
 * A missing or unparsable file loads as an empty object.
 */
class JsonFileKeyValueStore final : public IKeyValueStore {
public:
    explicit JsonFileKeyValueStore(std::filesystem::path path);

    Result<std::optional<std::string>> get(std::string_view key) const override;
    Result<void> set(std::string_view key, std::string_view value) override;
    Result<void> remove(std::string_view key) override;
    std::vector<std::string> keysWithPrefix(std::string_view prefix) const override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    Result<void> flushLocked() const;

    std::filesystem::path path_;
    nlohmann::json root_;
    mutable std::shared_mutex mutex_;
};

std::unique_ptr<IKeyValueStore> makeMemoryKeyValueStore();
std::unique_ptr<IKeyValueStore> makeJsonFileKeyValueStore(const std::filesystem::path& path);

} // namespace chartfetch::storage
