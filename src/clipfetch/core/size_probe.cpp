// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/core/size_probe.hpp>
#include <clipfetch/core/log.hpp>
#include <clipfetch/core/url.hpp>

namespace clipfetch::core {

std::expected<ProbeResult, std::error_code>
SizeProbe::probe(const std::string& url, std::stop_token stop) const noexcept {
    if (!Url::parse(url)) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    auto response = transport_.head(url, std::move(stop));
    if (!response) {
        logger()->debug("Probe of {} failed: {}", url, response.error().message());
        return std::unexpected(response.error());
    }

    if (!response->ok_or_partial()) {
        logger()->debug("Probe of {} returned HTTP {}", url, response->status_code);
        return std::unexpected(status_error(response->status_code));
    }

    if (!response->content_length || *response->content_length == 0) {
        logger()->debug("Probe of {} has no usable Content-Length", url);
        return std::unexpected(make_error_code(DownloadErrc::missing_length));
    }

    try {
        return ProbeResult{*response->content_length, std::move(response->content_type)};
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

} // namespace clipfetch::core
