#include <chartfetch/storage/key_value_store.h>

#include <mutex>

namespace chartfetch::storage {

MemoryKeyValueStore::MemoryKeyValueStore(std::map<std::string, nlohmann::json> initial)
    : entries_(std::move(initial)) {}

Result<std::optional<std::string>> MemoryKeyValueStore::get(std::string_view key) const {
    std::shared_lock lk(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return std::optional<std::string>{std::nullopt};
    }
    if (!it->second.is_string()) {
        return Error{ErrorCode::InvalidData, "Value for '" + std::string(key) + "' is not a string"};
    }
    return std::optional<std::string>{it->second.get<std::string>()};
}

Result<void> MemoryKeyValueStore::set(std::string_view key, std::string_view value) {
    if (key.empty()) {
        return Error{ErrorCode::InvalidArgument, "KeyValueStore.set: empty key"};
    }
    std::unique_lock lk(mutex_);
    entries_[std::string(key)] = std::string(value);
    return {};
}

Result<void> MemoryKeyValueStore::remove(std::string_view key) {
    std::unique_lock lk(mutex_);
    (void)entries_.erase(std::string(key));
    return {};
}

std::vector<std::string> MemoryKeyValueStore::keysWithPrefix(std::string_view prefix) const {
    std::shared_lock lk(mutex_);
    std::vector<std::string> out;
    for (auto it = entries_.lower_bound(std::string(prefix)); it != entries_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0)
            break;
        out.push_back(it->first);
    }
    return out;
}

void MemoryKeyValueStore::putRaw(std::string key, nlohmann::json value) {
    std::unique_lock lk(mutex_);
    entries_[std::move(key)] = std::move(value);
}

std::size_t MemoryKeyValueStore::size() const {
    std::shared_lock lk(mutex_);
    return entries_.size();
}

std::unique_ptr<IKeyValueStore> makeMemoryKeyValueStore() {
    return std::make_unique<MemoryKeyValueStore>();
}

} // namespace chartfetch::storage
