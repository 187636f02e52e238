// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace clipfetch::core {

// Inclusive byte range, as sent in "Range: bytes=first-last"
struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return last - first + 1; }
    [[nodiscard]] std::string header_value() const;  // "first-last"

    bool operator==(const ByteRange&) const = default;
};

// Fixed-size chunking of a resource. Stateless apart from its two inputs.
class SegmentPlan {
public:
    [[nodiscard]] static std::expected<SegmentPlan, std::error_code>
    create(std::uint64_t total_size, std::uint64_t chunk_size) noexcept;

    [[nodiscard]] std::uint64_t total_size() const noexcept { return total_size_; }
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint32_t segment_count() const noexcept { return segment_count_; }

    // Range of segment `index`; index must be below segment_count()
    [[nodiscard]] std::expected<ByteRange, std::error_code> range_for(std::uint32_t index) const noexcept;

    [[nodiscard]] std::vector<ByteRange> ranges() const;

private:
    SegmentPlan(std::uint64_t total_size, std::uint64_t chunk_size, std::uint32_t count) noexcept
        : total_size_(total_size), chunk_size_(chunk_size), segment_count_(count) {}

    std::uint64_t total_size_;
    std::uint64_t chunk_size_;
    std::uint32_t segment_count_;
};

// ceil(total_size / chunk_size); 0 when either input is 0
[[nodiscard]] std::uint64_t segment_count(std::uint64_t total_size, std::uint64_t chunk_size) noexcept;

// [index*chunk, min((index+1)*chunk - 1, total - 1)]
[[nodiscard]] std::expected<ByteRange, std::error_code>
range_for(std::uint64_t index, std::uint64_t total_size, std::uint64_t chunk_size) noexcept;

} // namespace clipfetch::core
