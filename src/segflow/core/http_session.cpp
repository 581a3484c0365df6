// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/core/http_session.hpp>
#include <segflow/core/config.hpp>
#include <curl/curl.h>
#include <cctype>
#include <cstring>
#include <new>
#include <string>

namespace segflow::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// Header callback, collects "name: value" lines with lower-case names
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<std::vector<std::byte>*>(userdata);
    if (!body) return 0;

    std::size_t total = size * nitems;
    const std::size_t offset = body->size();
    try {
        body->resize(offset + total);
    } catch (const std::bad_alloc&) {
        return 0;  // Out of memory, abort the transfer
    }
    std::memcpy(body->data() + offset, ptr, total);
    return total;
}

std::error_code curl_to_error_code(CURLcode code) noexcept {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:  return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:        return make_error_code(DownloadErrc::refused);
        case CURLE_OPERATION_TIMEDOUT:     return make_error_code(DownloadErrc::timeout);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION: return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:     return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:          return make_error_code(DownloadErrc::invalid_url);
        default:                           return make_error_code(DownloadErrc::network_error);
    }
}

} // namespace

std::string_view HttpResponse::header(std::string_view name) const noexcept {
    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    auto it = headers.find(lower_name);
    return it == headers.end() ? std::string_view{} : std::string_view{it->second};
}

std::error_code status_to_error(std::int32_t status_code) noexcept {
    if (status_code >= 200 && status_code < 300) return {};
    if (status_code == 404) return make_error_code(DownloadErrc::not_found);
    if (status_code >= 500) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::http_status);
}

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession()
    : user_agent_(DEFAULT_USER_AGENT) {}

HttpSession::HttpSession(std::string user_agent)
    : user_agent_(std::move(user_agent)) {}

HttpSession::~HttpSession() = default;

std::expected<HttpResponse, std::error_code>
HttpSession::get(const std::string& url) noexcept {
    return perform(url, true);
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    return perform(url, false);
}

std::expected<HttpResponse, std::error_code>
HttpSession::perform(const std::string& url, bool with_body) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    if (!user_agent_.empty()) {
        curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, user_agent_.c_str());
    }

    if (with_body) {
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &response.body);
    } else {
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    }

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));
    curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);
    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        return std::unexpected(curl_to_error_code(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace segflow::core
