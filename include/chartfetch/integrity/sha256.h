#pragma once

#include <chartfetch/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace chartfetch::integrity {

/**
 * Streaming SHA-256 calculator (OpenSSL EVP).
 * finalize() returns the lower-case hex digest and re-arms the hasher for reuse.
 */
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;

    void reset();
    void update(std::span<const std::byte> data);
    Result<HexDigest> finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Hash a whole file in DEFAULT_BUFFER_SIZE blocks.
Result<HexDigest> sha256File(const std::filesystem::path& path);

// Hash an in-memory buffer.
HexDigest sha256Hex(std::span<const std::byte> data);

// ASCII case-insensitive equality for hex digests.
bool digestEquals(std::string_view a, std::string_view b) noexcept;

} // namespace chartfetch::integrity
