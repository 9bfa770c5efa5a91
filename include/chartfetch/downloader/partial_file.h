#pragma once

#include <chartfetch/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>

namespace chartfetch::downloader {

/**
 * Appends to a partial artifact opened at its current end. The file is created when
 * missing. bytesWritten() counts only what this writer appended.
 */
class PartialFileWriter {
public:
    static Result<PartialFileWriter> open(const std::filesystem::path& path);

    PartialFileWriter(PartialFileWriter&&) noexcept = default;
    PartialFileWriter& operator=(PartialFileWriter&&) noexcept = default;

    Result<void> append(std::span<const std::byte> data);
    Result<void> close();

    [[nodiscard]] std::uint64_t startOffset() const noexcept { return startOffset_; }
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return written_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    PartialFileWriter(std::filesystem::path path, std::ofstream out, std::uint64_t start);

    std::filesystem::path path_;
    std::ofstream out_;
    std::uint64_t startOffset_{0};
    std::uint64_t written_{0};
};

// Size of a regular file, 0 when it does not exist.
std::uint64_t fileSizeOrZero(const std::filesystem::path& path) noexcept;

// Shrink (or extend) a file to exactly size bytes.
Result<void> truncateFile(const std::filesystem::path& path, std::uint64_t size);

// Best-effort delete; returns true when something was removed.
bool removeFileQuietly(const std::filesystem::path& path);

/**
 * fsync the partial, rename it over destination (copy + fsync on EXDEV), then fsync
 * the parent directory. Parent directories are created as needed.
 */
Result<void> finalizePartial(const std::filesystem::path& partial,
                             const std::filesystem::path& destination);

} // namespace chartfetch::downloader
