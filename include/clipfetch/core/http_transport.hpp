// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/core/error.hpp>
#include <clipfetch/core/segment_plan.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace clipfetch::core {

// HTTP response as seen by the engine. Header names are lowercased.
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;
    std::optional<std::uint64_t> content_length;
    std::string content_type;
    std::string body;  // Empty for HEAD

    [[nodiscard]] bool ok_or_partial() const noexcept {
        return status_code == 200 || status_code == 206;
    }
};

// One request, one outcome. Transport failures (DNS, connect, timeout,
// cancellation) are errors; any HTTP status is a response.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url, std::stop_token stop) noexcept = 0;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const std::string& url, const ByteRange& range, std::stop_token stop) noexcept = 0;
};

// Parse a Content-Length style value; nullopt unless the whole string is digits
[[nodiscard]] std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept;

} // namespace clipfetch::core
