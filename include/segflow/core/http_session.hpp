// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>
#include <map>
#include <vector>

namespace segflow::core {

// HTTP response. Non-2xx statuses are responses, not errors.
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // Lower-case names
    std::vector<std::byte> body;

    [[nodiscard]] bool ok() const noexcept { return status_code >= 200 && status_code < 300; }

    // Header value or empty
    [[nodiscard]] std::string_view header(std::string_view name) const noexcept;
};

// Request primitive used by the downloader.
// Implementations must be safe to call from several worker threads at once.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // GET with body. Transport failures (DNS, connect, reset, timeout) are errors.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const std::string& url) noexcept = 0;

    // HEAD, headers only
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept = 0;
};

// HTTP status to error code for a failed attempt
[[nodiscard]] std::error_code status_to_error(std::int32_t status_code) noexcept;

// libcurl-backed transport
class HttpSession final : public HttpTransport {
public:
    HttpSession();
    explicit HttpSession(std::string user_agent);
    ~HttpSession() override;

    // Non-copyable, non-movable (shared by worker threads)
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept override;

    [[nodiscard]] const std::string& user_agent() const noexcept { return user_agent_; }

    // Global initialization (call once at startup, before any thread uses curl)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    perform(const std::string& url, bool with_body) noexcept;

    std::string user_agent_;
};

} // namespace segflow::core
