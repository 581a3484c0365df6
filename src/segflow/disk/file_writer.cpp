// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/disk/file_writer.hpp>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace segflow::disk {

std::error_code errno_to_error_code(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:       return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:        return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:       return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:       return make_error_code(DiskErrc::invalid_path);
        case EEXIST:       return make_error_code(DiskErrc::file_exists);
        case EBADF:        return make_error_code(DiskErrc::handle_invalid);
        default:           return make_error_code(fallback);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_))
    , written_(other.written_) {
    other.fd_ = -1;
    other.written_ = 0;
}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        written_ = other.written_;
        other.fd_ = -1;
        other.written_ = 0;
    }
    return *this;
}

std::error_code FileWriter::open(std::string_view path) noexcept {
    if (fd_ >= 0) {
        return make_error_code(DiskErrc::file_exists);
    }
    if (path.empty()) {
        return make_error_code(DiskErrc::invalid_path);
    }

    path_ = path;
    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }

    fd_ = fd;
    written_ = 0;
    return {};
}

std::error_code FileWriter::append(std::span<const std::byte> data) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const std::byte* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd_, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno, DiskErrc::write_error);
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
        written_ += static_cast<std::uint64_t>(n);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd_) != 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    return {};
}

std::error_code FileWriter::close() noexcept {
    if (fd_ < 0) {
        return {};
    }

    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    return {};
}

} // namespace segflow::disk
