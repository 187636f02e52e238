// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/core/segment_fetcher.hpp>
#include <clipfetch/core/log.hpp>
#include <clipfetch/disk/file_writer.hpp>

namespace clipfetch::core {

std::expected<std::uint64_t, std::error_code>
SegmentFetcher::fetch(const std::string& url,
                      const ByteRange& range,
                      const std::filesystem::path& dest_temp,
                      std::stop_token stop) const noexcept {
    auto response = transport_.get(url, range, stop);
    if (!response) {
        return std::unexpected(response.error());
    }

    if (!response->ok_or_partial()) {
        return std::unexpected(status_error(response->status_code));
    }

    if (response->body.empty()) {
        return std::unexpected(make_error_code(DownloadErrc::empty_body));
    }

    // A server that ignores Range answers 200 with the whole resource
    if (response->body.size() != range.length()) {
        logger()->debug("GET {} bytes={}: got {} bytes, expected {}",
                        url, range.header_value(), response->body.size(), range.length());
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }

    // The result would be discarded anyway
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    if (auto ec = disk::write_file_synced(dest_temp, response->body)) {
        std::error_code ignored;
        std::filesystem::remove(dest_temp, ignored);
        return std::unexpected(ec);
    }

    return static_cast<std::uint64_t>(response->body.size());
}

} // namespace clipfetch::core
