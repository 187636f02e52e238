// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace clipfetch::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        url.scheme_.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            auto c = static_cast<unsigned char>(url_str[i]);
            if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.scheme_ += static_cast<char>(std::tolower(c));
        }

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
        auto host_end = std::min({path_start, query_start, fragment_start, url_str.length()});

        std::size_t authority_start = rest_start;

        // Skip userinfo (user:pass@host)
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }

        auto authority = url_str.substr(authority_start, host_end - authority_start);

        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, bracket_end + 1));
            auto after = authority.substr(bracket_end + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return std::unexpected(make_error_code(DownloadErrc::invalid_url));
                }
                url.port_ = std::string(after.substr(1));
            }
        } else {
            auto colon = authority.rfind(':');
            if (colon != std::string_view::npos) {
                url.host_ = std::string(authority.substr(0, colon));
                url.port_ = std::string(authority.substr(colon + 1));
            } else {
                url.host_ = std::string(authority);
            }
        }

        if (!std::all_of(url.port_.begin(), url.port_.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        // Path runs from the first '/' after the authority up to '?' or '#'
        if (path_start < url_str.length() && path_start == host_end) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < url_str.length() && query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        if (fragment_start < url_str.length()) {
            url.fragment_ = std::string(url_str.substr(fragment_start + 1));
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        return url;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_.empty() ? "index.html" : path_;
    }
    auto name = path_.substr(last_slash + 1);
    // For directory URLs (path ends with /), default to index.html
    if (name.empty()) {
        return "index.html";
    }
    return name;
}

std::string Url::extension() const {
    auto last_slash = path_.rfind('/');
    std::string_view name = path_;
    if (last_slash != std::string::npos) {
        name.remove_prefix(last_slash + 1);
    }
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
        return {};
    }

    std::string ext;
    for (char c : name.substr(dot + 1)) {
        ext += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

std::expected<Url, std::error_code> Url::with_origin(std::string_view origin) const noexcept {
    auto parsed = Url::parse(origin);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    try {
        Url result = std::move(*parsed);
        // An origin may carry a path prefix ("https://bucket.example.com/media")
        if (result.path_ == "/") {
            result.path_ = path_;
        } else {
            auto prefix = result.path_;
            if (!prefix.empty() && prefix.back() == '/') {
                prefix.pop_back();
            }
            result.path_ = prefix + path_;
        }
        result.query_ = query_;
        result.fragment_.clear();
        return result;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
}

} // namespace clipfetch::core
