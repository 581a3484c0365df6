// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace segflow::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    // Parse scheme
    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    std::string lower_scheme;
    lower_scheme.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        lower_scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }
    url.scheme_ = std::move(lower_scheme);

    auto rest_start = scheme_end + 3; // Skip "://"

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) {
        path_start = url_str.length();
    }

    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }

    auto fragment_start = url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }

    // host_end is at the first of: /, ?, #, or end
    auto host_end = std::min({path_start, query_start, fragment_start});

    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto bracket_start = url_str.find('[', authority_start);
    if (bracket_start != std::string_view::npos && bracket_start < host_end) {
        // IPv6 literal [::1]:port
        auto bracket_end = url_str.find(']', bracket_start);
        if (bracket_end == std::string_view::npos || bracket_end >= host_end) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        url.host_ = std::string(url_str.substr(bracket_start, bracket_end - bracket_start + 1));
        if (bracket_end + 1 < host_end && url_str[bracket_end + 1] == ':') {
            url.port_ = std::string(url_str.substr(bracket_end + 2, host_end - bracket_end - 2));
        }
    } else {
        auto colon_pos = url_str.find(':', authority_start);
        if (colon_pos != std::string_view::npos && colon_pos < host_end) {
            url.host_ = std::string(url_str.substr(authority_start, colon_pos - authority_start));
            url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
        } else {
            url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
        }
    }

    if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < url_str.length() && query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    for (char c : url.port_) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
    }

    url.str_ = std::string(url_str);
    return url;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    std::string name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    if (name.empty()) {
        return "stream";
    }
    return name;
}

//=============================================================================
// Segment URLs
//=============================================================================

std::string segment_url(std::string_view base_url, SegmentIndex index) {
    const std::string number = std::to_string(index);
    std::string result;

    auto pos = base_url.find(SEGMENT_INDEX_PLACEHOLDER);
    if (pos != std::string_view::npos) {
        result.reserve(base_url.size() + number.size());
        std::size_t start = 0;
        while (pos != std::string_view::npos) {
            result.append(base_url.substr(start, pos - start));
            result += number;
            start = pos + SEGMENT_INDEX_PLACEHOLDER.size();
            pos = base_url.find(SEGMENT_INDEX_PLACEHOLDER, start);
        }
        result.append(base_url.substr(start));
        return result;
    }

    // Keep any fragment at the end
    auto fragment = base_url.find('#');
    std::string_view head = base_url.substr(0, fragment);
    std::string_view tail = fragment == std::string_view::npos
        ? std::string_view{} : base_url.substr(fragment);

    result.reserve(base_url.size() + number.size() + 4);
    result.append(head);
    if (head.find('?') == std::string_view::npos) {
        result += '?';
    } else if (head.back() != '?' && head.back() != '&') {
        result += '&';
    }
    result += "sq=";
    result += number;
    result.append(tail);
    return result;
}

} // namespace segflow::core
