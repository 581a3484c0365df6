// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/core/error.hpp>
#include <segflow/core/segment.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <expected>

namespace segflow::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }

    [[nodiscard]] const std::string& full() const noexcept { return str_; }
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    // Last path component, "stream" when the path has none
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
};

// Placeholder replaced by the segment index in templated base URLs
constexpr std::string_view SEGMENT_INDEX_PLACEHOLDER = "{index}";

// Request URL for one segment of a stream.
// "{index}" in the base is replaced by the index; otherwise "sq=<index>"
// is appended to the query string.
[[nodiscard]] std::string segment_url(std::string_view base_url, SegmentIndex index);

} // namespace segflow::core
