// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace segflow::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    too_many_redirects,
    http_status,
    not_found,
    server_error,
    invalid_url,
    invalid_output,
    invalid_thread_count,
    invalid_retry_policy,
    invalid_total,
    invalid_segment,
    duplicate_outcome,
    stream_sealed,
    not_started,
    merge_failed,
    config_error,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "segflow::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::refused:              return "Connection refused";
            case DownloadErrc::dns_error:            return "DNS resolution failed";
            case DownloadErrc::ssl_error:            return "SSL/TLS error";
            case DownloadErrc::too_many_redirects:   return "Too many redirects";
            case DownloadErrc::http_status:          return "Unexpected HTTP status";
            case DownloadErrc::not_found:            return "Resource not found (404)";
            case DownloadErrc::server_error:         return "Server error (5xx)";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::invalid_output:       return "Invalid output path";
            case DownloadErrc::invalid_thread_count: return "Thread count must be at least 1";
            case DownloadErrc::invalid_retry_policy: return "Invalid retry policy";
            case DownloadErrc::invalid_total:        return "Segment total can only grow";
            case DownloadErrc::invalid_segment:      return "Segment index was never dispensed";
            case DownloadErrc::duplicate_outcome:    return "Segment already has an outcome";
            case DownloadErrc::stream_sealed:        return "Stream has already ended";
            case DownloadErrc::not_started:          return "Download not started";
            case DownloadErrc::merge_failed:         return "Merge failed";
            case DownloadErrc::config_error:         return "Invalid configuration";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace segflow::core

namespace std {

template<>
struct is_error_code_enum<segflow::core::DownloadErrc> : true_type {};

} // namespace std
