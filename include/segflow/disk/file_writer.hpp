// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace segflow::disk {

// Append-only output file. Owned by a single merge thread.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create or truncate the file
    [[nodiscard]] std::error_code open(std::string_view path) noexcept;

    // Append bytes at the end of the file
    [[nodiscard]] std::error_code append(std::span<const std::byte> data) noexcept;

    // Flush kernel buffers to disk
    [[nodiscard]] std::error_code flush() noexcept;

    // Close file
    [[nodiscard]] std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t written() const noexcept { return written_; }

private:
    int fd_{-1};
    std::string path_;
    std::uint64_t written_{0};
};

} // namespace segflow::disk
