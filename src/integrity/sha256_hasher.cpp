/*
 * chartfetch/src/integrity/sha256_hasher.cpp
 *
 * SHA-256 via OpenSSL's EVP interface.
 *
 * Dependencies:
 * - OpenSSL::Crypto (linked by CMake in the chartfetch_integrity target)
 */

#include <chartfetch/integrity/sha256.h>

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <fstream>
#include <system_error>
#include <vector>

namespace chartfetch::integrity {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

} // namespace

struct Sha256Hasher::Impl {
    EvpMdCtx ctx{};
    bool ready{false};

    void init() {
        ctx = EvpMdCtx{};
        ready = ctx && EVP_DigestInit_ex(ctx.ctx, EVP_sha256(), nullptr) == 1;
    }
};

Sha256Hasher::Sha256Hasher() : pImpl(std::make_unique<Impl>()) {
    pImpl->init();
}

Sha256Hasher::~Sha256Hasher() = default;
Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;

void Sha256Hasher::reset() {
    pImpl->init();
}

void Sha256Hasher::update(std::span<const std::byte> data) {
    if (!pImpl->ready || data.empty())
        return;
    if (EVP_DigestUpdate(pImpl->ctx.ctx, data.data(), data.size()) != 1) {
        pImpl->ready = false;
    }
}

Result<HexDigest> Sha256Hasher::finalize() {
    if (!pImpl->ready) {
        return Error{ErrorCode::InternalError, "SHA-256 context unavailable"};
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
    unsigned md_len = 0;
    if (EVP_DigestFinal_ex(pImpl->ctx.ctx, md_buf.data(), &md_len) != 1) {
        pImpl->ready = false;
        return Error{ErrorCode::InternalError, "EVP_DigestFinal_ex failed"};
    }
    auto hex = to_hex_lower(md_buf.data(), md_len);
    pImpl->init();
    return hex;
}

Result<HexDigest> sha256File(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error{ErrorCode::FileNotFound, "Cannot hash missing file: " + path.string()};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open for hashing: " + path.string()};
    }
    Sha256Hasher hasher;
    std::vector<char> buffer(DEFAULT_BUFFER_SIZE);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if (got > 0) {
            hasher.update(std::span<const std::byte>(reinterpret_cast<const std::byte*>(buffer.data()),
                                                     static_cast<std::size_t>(got)));
        }
    }
    if (!in.eof()) {
        return Error{ErrorCode::IoError, "Read failed while hashing: " + path.string()};
    }
    return hasher.finalize();
}

HexDigest sha256Hex(std::span<const std::byte> data) {
    Sha256Hasher hasher;
    hasher.update(data);
    auto r = hasher.finalize();
    return r ? r.value() : HexDigest{};
}

bool digestEquals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace chartfetch::integrity
