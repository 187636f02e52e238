// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/core/segment_plan.hpp>
#include <algorithm>
#include <limits>

namespace clipfetch::core {

std::string ByteRange::header_value() const {
    return std::to_string(first) + "-" + std::to_string(last);
}

std::uint64_t segment_count(std::uint64_t total_size, std::uint64_t chunk_size) noexcept {
    if (total_size == 0 || chunk_size == 0) return 0;
    return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
}

std::expected<ByteRange, std::error_code>
range_for(std::uint64_t index, std::uint64_t total_size, std::uint64_t chunk_size) noexcept {
    if (total_size == 0 || chunk_size == 0 || index >= segment_count(total_size, chunk_size)) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }

    ByteRange range;
    range.first = index * chunk_size;
    // first < total_size, so first + chunk_size - 1 only overflows for absurd chunk sizes
    std::uint64_t room = std::numeric_limits<std::uint64_t>::max() - range.first;
    std::uint64_t last = chunk_size - 1 > room ? std::numeric_limits<std::uint64_t>::max()
                                               : range.first + chunk_size - 1;
    range.last = std::min(last, total_size - 1);
    return range;
}

//=============================================================================
// SegmentPlan
//=============================================================================

std::expected<SegmentPlan, std::error_code>
SegmentPlan::create(std::uint64_t total_size, std::uint64_t chunk_size) noexcept {
    if (total_size == 0 || chunk_size == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }
    auto count = core::segment_count(total_size, chunk_size);
    // Segment indices are persisted as 32-bit values
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }
    return SegmentPlan(total_size, chunk_size, static_cast<std::uint32_t>(count));
}

std::expected<ByteRange, std::error_code> SegmentPlan::range_for(std::uint32_t index) const noexcept {
    return core::range_for(index, total_size_, chunk_size_);
}

std::vector<ByteRange> SegmentPlan::ranges() const {
    std::vector<ByteRange> result;
    result.reserve(segment_count_);
    for (std::uint32_t i = 0; i < segment_count_; ++i) {
        result.push_back(*range_for(i));
    }
    return result;
}

} // namespace clipfetch::core
