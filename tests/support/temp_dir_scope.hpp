#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace chartfetch::test_support {

// Owns a unique directory under the system temp dir; removed recursively on destruction.
class TempDirScope {
public:
    explicit TempDirScope(std::filesystem::path root) : root_(std::move(root)) {}
    TempDirScope(const TempDirScope&) = delete;
    TempDirScope& operator=(const TempDirScope&) = delete;
    TempDirScope(TempDirScope&& other) noexcept : root_(std::exchange(other.root_, {})) {}
    TempDirScope& operator=(TempDirScope&&) = delete;

    ~TempDirScope() {
        if (root_.empty())
            return;
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& path() const { return root_; }
    std::filesystem::path operator/(const std::string& child) const { return root_ / child; }

    static TempDirScope unique_under(const std::string& base_name) {
        auto root = std::filesystem::temp_directory_path() / make_unique_component(base_name);
        std::error_code ec;
        std::filesystem::create_directories(root, ec);
        return TempDirScope(root);
    }

private:
    static std::string make_unique_component(const std::string& base_name) {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        auto counter = counter_.fetch_add(1, std::memory_order_relaxed);
        return base_name + "-" + std::to_string(now) + "-" + std::to_string(tid) + "-" +
               std::to_string(counter);
    }

    std::filesystem::path root_;
    static inline std::atomic<std::uint64_t> counter_{0};
};

// Deterministic payload: byte i is (seed + i) mod 251.
inline std::vector<std::byte> make_payload(std::size_t size, unsigned seed = 7) {
    std::vector<std::byte> out(size);
    for (std::size_t i = 0; i < size; ++i)
        out[i] = static_cast<std::byte>((seed + i) % 251);
    return out;
}

inline void write_file(const std::filesystem::path& p, const std::vector<std::byte>& data,
                       bool append = false) {
    if (p.has_parent_path())
        std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

inline void write_text(const std::filesystem::path& p, const std::string& text) {
    if (p.has_parent_path())
        std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::trunc);
    out << text;
}

inline std::vector<std::byte> read_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<std::byte> out(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i)
        out[i] = static_cast<std::byte>(raw[i]);
    return out;
}

} // namespace chartfetch::test_support
