// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/disk/file_writer.hpp>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace clipfetch::disk {

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , path_(std::move(other.path_))
    , written_(std::exchange(other.written_, 0)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
        written_ = std::exchange(other.written_, 0);
    }
    return *this;
}

std::error_code FileWriter::open(const std::filesystem::path& path, OpenMode mode) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return from_errno(ec.value(), DiskErrc::invalid_path);
        }
    }

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= (mode == OpenMode::append) ? O_APPEND : O_TRUNC;

    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) {
        return from_errno(errno, DiskErrc::write_error);
    }

    fd_ = fd;
    written_ = 0;
    try {
        path_ = path;
    } catch (const std::bad_alloc&) {
        close();
        return make_error_code(DiskErrc::write_error);
    }
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    auto* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::write(fd_, p, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno, DiskErrc::write_error);
        }
        p += n;
        size -= static_cast<std::size_t>(n);
        written_ += static_cast<std::uint64_t>(n);
    }
    return {};
}

std::error_code FileWriter::append_file(const std::filesystem::path& source) noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    int in = ::open(source.c_str(), O_RDONLY | O_CLOEXEC);
    if (in < 0) {
        return from_errno(errno, DiskErrc::read_error);
    }

    std::error_code result;
    try {
        std::vector<char> buffer(COPY_BUFFER_SIZE);
        for (;;) {
            ssize_t n = ::read(in, buffer.data(), buffer.size());
            if (n < 0) {
                if (errno == EINTR) continue;
                result = from_errno(errno, DiskErrc::read_error);
                break;
            }
            if (n == 0) break;
            if (auto ec = write(buffer.data(), static_cast<std::size_t>(n))) {
                result = ec;
                break;
            }
        }
    } catch (const std::bad_alloc&) {
        result = make_error_code(DiskErrc::read_error);
    }

    ::close(in);
    return result;
}

std::error_code FileWriter::sync() noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
        return from_errno(errno, DiskErrc::sync_failed);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

//=============================================================================
// Helpers
//=============================================================================

std::error_code write_file_synced(const std::filesystem::path& path, std::string_view data) noexcept {
    FileWriter writer;
    if (auto ec = writer.open(path, OpenMode::truncate)) return ec;
    if (auto ec = writer.write(data)) return ec;
    if (auto ec = writer.sync()) return ec;
    writer.close();
    return {};
}

std::error_code write_file_atomic(const std::filesystem::path& path, std::string_view data) noexcept {
    std::filesystem::path tmp;
    try {
        tmp = path;
        tmp += ".tmp";
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }

    if (auto ec = write_file_synced(tmp, data)) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return ec;
    }
    return rename_file(tmp, path);
}

std::error_code rename_file(const std::filesystem::path& from, const std::filesystem::path& to) noexcept {
    if (std::rename(from.c_str(), to.c_str()) != 0) {
        return from_errno(errno, DiskErrc::rename_failed);
    }
    return {};
}

} // namespace clipfetch::disk
