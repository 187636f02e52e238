// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/core/http_transport.hpp>
#include <charconv>

namespace clipfetch::core {

std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    if (value.empty()) return std::nullopt;

    std::uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

} // namespace clipfetch::core
