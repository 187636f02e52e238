// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace clipfetch::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    not_found,
    server_error,
    bad_status,
    missing_length,
    empty_body,
    invalid_url,
    invalid_range,
    invalid_state,
    missing_segment,
    retries_exhausted,
    cancelled,
    permission_denied,
    ssl_error,
    dns_error,
    too_many_redirects,
    config_error,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "clipfetch::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::refused:              return "Connection refused";
            case DownloadErrc::not_found:            return "Resource not found (404)";
            case DownloadErrc::server_error:         return "Server error (5xx)";
            case DownloadErrc::bad_status:           return "Unexpected HTTP status";
            case DownloadErrc::missing_length:       return "Missing or invalid Content-Length";
            case DownloadErrc::empty_body:           return "Empty response body";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::invalid_range:        return "Invalid byte range";
            case DownloadErrc::invalid_state:        return "Invalid download state";
            case DownloadErrc::missing_segment:      return "Segment file missing";
            case DownloadErrc::retries_exhausted:    return "Segment retries exhausted";
            case DownloadErrc::cancelled:            return "Download cancelled";
            case DownloadErrc::permission_denied:    return "Permission denied";
            case DownloadErrc::ssl_error:            return "SSL/TLS error";
            case DownloadErrc::dns_error:            return "DNS resolution failed";
            case DownloadErrc::too_many_redirects:   return "Too many redirects";
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

// Map an HTTP status outside the accepted set to an error
[[nodiscard]] inline std::error_code status_error(long http_code) noexcept {
    if (http_code == 404 || http_code == 410) return make_error_code(DownloadErrc::not_found);
    if (http_code == 401 || http_code == 403) return make_error_code(DownloadErrc::permission_denied);
    if (http_code == 416) return make_error_code(DownloadErrc::invalid_range);
    if (http_code >= 500) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::bad_status);
}

} // namespace clipfetch::core

namespace std {

template<>
struct is_error_code_enum<clipfetch::core::DownloadErrc> : true_type {};

} // namespace std
