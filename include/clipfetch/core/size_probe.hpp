// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/core/http_transport.hpp>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>

namespace clipfetch::core {

struct ProbeResult {
    std::uint64_t size{0};
    std::string content_type;   // empty when the server sent none
};

// Metadata-only request that discovers the byte length of a resource.
// Succeeds on 200/206 with a Content-Length above zero.
class SizeProbe {
public:
    explicit SizeProbe(HttpTransport& transport) noexcept : transport_(transport) {}

    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe(const std::string& url, std::stop_token stop = {}) const noexcept;

private:
    HttpTransport& transport_;
};

} // namespace clipfetch::core
