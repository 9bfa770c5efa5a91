/*
 * chartfetch/src/downloader/partial_file.cpp
 *
 * Partial artifact handling:
 * - Append-only writer positioned at the current end of "<dest>.part"
 * - Atomic rename into the destination when on the same filesystem
 * - EXDEV fallback: copy + fsync + replace
 * - statvfs-based free space probe
 */

#include <chartfetch/downloader/downloader.hpp>
#include <chartfetch/downloader/partial_file.h>

#include <spdlog/spdlog.h>

#include <system_error>

#include <fcntl.h>
#include <sys/statvfs.h>
#include <unistd.h>

namespace chartfetch::downloader {

namespace fs = std::filesystem;

namespace {

Result<void> fsync_path(const fs::path& p, bool directory) {
    int fd = ::open(p.c_str(), directory ? (O_RDONLY | O_DIRECTORY) : O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return {};
}

Result<void> copy_file_fsync_replace(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "copy " + src.string() + " -> " + dst.string() + " failed: " + ec.message()};
    }
    if (auto r = fsync_path(dst, false); !r) {
        return r;
    }
    return fsync_path(dst.parent_path(), true);
}

} // namespace

// ---------- PartialFileWriter ----------

PartialFileWriter::PartialFileWriter(fs::path path, std::ofstream out, std::uint64_t start)
    : path_(std::move(path)), out_(std::move(out)), startOffset_(start) {}

Result<PartialFileWriter> PartialFileWriter::open(const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create directory " + path.parent_path().string()};
        }
    }
    const auto start = fileSizeOrZero(path);
    std::ofstream out(path, std::ios::binary | std::ios::out | std::ios::app);
    if (!out.good()) {
        return Error{ErrorCode::IoError, "Failed to open partial for append: " + path.string()};
    }
    return PartialFileWriter(path, std::move(out), start);
}

Result<void> PartialFileWriter::append(std::span<const std::byte> data) {
    if (data.empty())
        return {};
    out_.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!out_.good()) {
        return Error{ErrorCode::IoError, "write failed on: " + path_.string()};
    }
    written_ += data.size();
    return {};
}

Result<void> PartialFileWriter::close() {
    if (!out_.is_open())
        return {};
    out_.flush();
    const bool ok = out_.good();
    out_.close();
    if (!ok) {
        return Error{ErrorCode::IoError, "flush failed on: " + path_.string()};
    }
    return {};
}

// ---------- free helpers ----------

std::uint64_t fileSizeOrZero(const fs::path& path) noexcept {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return 0;
    const auto sz = fs::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(sz);
}

Result<void> truncateFile(const fs::path& path, std::uint64_t size) {
    std::error_code ec;
    fs::resize_file(path, size, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "resize " + path.string() + " failed: " + ec.message()};
    }
    return {};
}

bool removeFileQuietly(const fs::path& path) {
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) {
        spdlog::debug("Failed to remove {}: {}", path.string(), ec.message());
    }
    return removed;
}

Result<void> finalizePartial(const fs::path& partial, const fs::path& destination) {
    std::error_code ec;
    if (destination.has_parent_path()) {
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create directory " + destination.parent_path().string()};
        }
    }
    if (auto r = fsync_path(partial, false); !r) {
        return Error{r.error().code, "Failed to fsync partial: " + partial.string()};
    }

    fs::rename(partial, destination, ec);
    if (ec) {
        if (ec != std::errc::cross_device_link) {
            return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                                 partial.string() + " to " +
                                                 destination.string()};
        }
        spdlog::warn("Cross-device rename detected; performing copy+fsync+replace for {}",
                     destination.string());
        if (auto r = copy_file_fsync_replace(partial, destination); !r) {
            return r;
        }
        removeFileQuietly(partial);
        return {};
    }

    if (destination.has_parent_path()) {
        if (auto r = fsync_path(destination.parent_path(), true); !r) {
            spdlog::debug("fsync on {} failed (continuing)", destination.parent_path().string());
        }
    }
    return {};
}

Result<std::uint64_t> availableDiskSpace(const fs::path& path) {
    // Walk up to the nearest existing ancestor; the charts directory may not exist yet
    fs::path probe = path.empty() ? fs::current_path() : path;
    std::error_code ec;
    while (!probe.empty() && !fs::exists(probe, ec)) {
        auto parent = probe.parent_path();
        if (parent == probe)
            break;
        probe = parent;
    }
    if (probe.empty())
        probe = ".";

    struct statvfs st {};
    if (::statvfs(probe.c_str(), &st) != 0) {
        return Error{ErrorCode::IoError, "statvfs failed for " + probe.string()};
    }
    return static_cast<std::uint64_t>(st.f_bavail) * static_cast<std::uint64_t>(st.f_frsize);
}

} // namespace chartfetch::downloader
