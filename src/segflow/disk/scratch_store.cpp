// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/disk/scratch_store.hpp>
#include <cerrno>
#include <filesystem>
#include <new>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace segflow::disk {

namespace {

// Closes the descriptor on scope exit unless released
struct FdGuard {
    int fd{-1};

    explicit FdGuard(int f) noexcept : fd(f) {}
    ~FdGuard() { if (fd >= 0) ::close(fd); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int release() noexcept {
        int f = fd;
        fd = -1;
        return f;
    }
};

std::error_code write_all(int fd, std::span<const std::byte> data) noexcept {
    const std::byte* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno, DiskErrc::write_error);
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return {};
}

} // namespace

//=============================================================================
// DirectoryScratchStore
//=============================================================================

DirectoryScratchStore::DirectoryScratchStore(std::string directory)
    : directory_(std::move(directory)) {}

std::error_code DirectoryScratchStore::prepare() noexcept {
    if (directory_.empty()) {
        return make_error_code(DiskErrc::invalid_path);
    }

    std::error_code ec;
    created_ = std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return ec;
    }
    if (!std::filesystem::is_directory(directory_, ec)) {
        return make_error_code(DiskErrc::invalid_path);
    }
    return {};
}

std::error_code DirectoryScratchStore::discard() noexcept {
    if (!created_) {
        return {};
    }
    std::error_code ec;
    std::filesystem::remove(directory_, ec);
    if (!ec) {
        created_ = false;
    }
    return ec;
}

std::expected<std::string, std::error_code>
DirectoryScratchStore::store(std::uint32_t index, std::span<const std::byte> data) noexcept {
    std::string path;
    try {
        path = directory_ + "/segment-" + std::to_string(index) + "-XXXXXX";
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::allocation_failed));
    }

    FdGuard file(::mkstemp(path.data()));
    if (file.fd < 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::write_error));
    }

    auto ec = write_all(file.fd, data);
    if (!ec && ::close(file.release()) != 0) {
        ec = errno_to_error_code(errno, DiskErrc::write_error);
    }
    if (ec) {
        ::unlink(path.c_str());
        return std::unexpected(ec);
    }

    return path;
}

std::expected<std::vector<std::byte>, std::error_code>
DirectoryScratchStore::read(const std::string& key) noexcept {
    FdGuard file(::open(key.c_str(), O_RDONLY | O_CLOEXEC));
    if (file.fd < 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
    }

    struct stat st{};
    if (::fstat(file.fd, &st) != 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
    }

    std::vector<std::byte> data;
    try {
        data.resize(static_cast<std::size_t>(st.st_size));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::allocation_failed));
    }

    std::size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::read(file.fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
        }
        if (n == 0) {
            // File shrank underneath us
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }
        offset += static_cast<std::size_t>(n);
    }

    return data;
}

std::error_code DirectoryScratchStore::remove(const std::string& key) noexcept {
    if (::unlink(key.c_str()) != 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    return {};
}

//=============================================================================
// MemoryScratchStore
//=============================================================================

std::expected<std::string, std::error_code>
MemoryScratchStore::store(std::uint32_t index, std::span<const std::byte> data) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string key = "mem://segment-" + std::to_string(index) + "-" + std::to_string(next_id_++);
        entries_.emplace(key, std::vector<std::byte>(data.begin(), data.end()));
        return key;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::allocation_failed));
    }
}

std::expected<std::vector<std::byte>, std::error_code>
MemoryScratchStore::read(const std::string& key) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::unexpected(make_error_code(DiskErrc::file_not_found));
        }
        return it->second;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::allocation_failed));
    }
}

std::error_code MemoryScratchStore::remove(const std::string& key) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(key) == 0) {
        return make_error_code(DiskErrc::file_not_found);
    }
    return {};
}

std::size_t MemoryScratchStore::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace segflow::disk
