// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace segflow::disk {

// Temporary per-segment storage between fetch and merge.
//
// An entry is created by exactly one worker and, once its key has been
// handed over, read and removed by the merge thread only. Implementations
// must allow concurrent calls on different entries.
class ScratchStore {
public:
    virtual ~ScratchStore() = default;

    // Persist one segment. The entry is complete and closed on return;
    // on failure nothing is left behind.
    [[nodiscard]] virtual std::expected<std::string, std::error_code>
    store(std::uint32_t index, std::span<const std::byte> data) noexcept = 0;

    [[nodiscard]] virtual std::expected<std::vector<std::byte>, std::error_code>
    read(const std::string& key) noexcept = 0;

    [[nodiscard]] virtual std::error_code remove(const std::string& key) noexcept = 0;
};

// One file per entry inside a directory. Keys are file paths.
class DirectoryScratchStore final : public ScratchStore {
public:
    explicit DirectoryScratchStore(std::string directory);

    // Create the directory if missing
    [[nodiscard]] std::error_code prepare() noexcept;

    // Remove the directory again if prepare() created it and it is empty
    [[nodiscard]] std::error_code discard() noexcept;

    [[nodiscard]] bool created() const noexcept { return created_; }

    [[nodiscard]] std::expected<std::string, std::error_code>
    store(std::uint32_t index, std::span<const std::byte> data) noexcept override;

    [[nodiscard]] std::expected<std::vector<std::byte>, std::error_code>
    read(const std::string& key) noexcept override;

    [[nodiscard]] std::error_code remove(const std::string& key) noexcept override;

    [[nodiscard]] const std::string& directory() const noexcept { return directory_; }

private:
    std::string directory_;
    bool created_{false};
};

// Entries held in memory
class MemoryScratchStore final : public ScratchStore {
public:
    [[nodiscard]] std::expected<std::string, std::error_code>
    store(std::uint32_t index, std::span<const std::byte> data) noexcept override;

    [[nodiscard]] std::expected<std::vector<std::byte>, std::error_code>
    read(const std::string& key) noexcept override;

    [[nodiscard]] std::error_code remove(const std::string& key) noexcept override;

    // Number of live entries
    [[nodiscard]] std::size_t size() const noexcept;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::byte>> entries_;
    std::uint64_t next_id_{0};
};

} // namespace segflow::disk
