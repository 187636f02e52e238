// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/disk/error.hpp>
#include <cstdint>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace clipfetch::disk {

// Copy buffer size for appending one file to another
constexpr std::size_t COPY_BUFFER_SIZE = 256 * 1024; // 256 KB

enum class OpenMode {
    truncate,   // create or empty the file
    append,     // create or keep existing bytes, write at the end
};

// Sequential POSIX file writer. Not thread-safe; one owner at a time.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Open file for writing, creating parent directories
    [[nodiscard]] std::error_code open(const std::filesystem::path& path, OpenMode mode) noexcept;

    // Write the whole buffer (retries short writes and EINTR)
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;
    [[nodiscard]] std::error_code write(std::string_view data) noexcept {
        return write(data.data(), data.size());
    }

    // Append the full contents of another file
    [[nodiscard]] std::error_code append_file(const std::filesystem::path& source) noexcept;

    // fsync
    [[nodiscard]] std::error_code sync() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return written_; }

private:
    int fd_{-1};
    std::filesystem::path path_;
    std::uint64_t written_{0};
};

// Write `data` to `path` and fsync before returning
[[nodiscard]] std::error_code write_file_synced(const std::filesystem::path& path,
                                                std::string_view data) noexcept;

// Replace `path` with `data` so readers see either the old or the new contents:
// write to "<path>.tmp", fsync, rename over `path`.
[[nodiscard]] std::error_code write_file_atomic(const std::filesystem::path& path,
                                                std::string_view data) noexcept;

// rename(2) wrapper
[[nodiscard]] std::error_code rename_file(const std::filesystem::path& from,
                                          const std::filesystem::path& to) noexcept;

} // namespace clipfetch::disk
