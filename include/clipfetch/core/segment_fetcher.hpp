// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/core/http_transport.hpp>
#include <clipfetch/core/segment_plan.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <stop_token>
#include <string>

namespace clipfetch::core {

// One ranged GET, one outcome. The body is written to `dest_temp` and
// fsynced; nothing else is touched. Retries are the caller's business.
class SegmentFetcher {
public:
    explicit SegmentFetcher(HttpTransport& transport) noexcept : transport_(transport) {}

    // Returns the number of bytes written
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    fetch(const std::string& url,
          const ByteRange& range,
          const std::filesystem::path& dest_temp,
          std::stop_token stop = {}) const noexcept;

private:
    HttpTransport& transport_;
};

} // namespace clipfetch::core
