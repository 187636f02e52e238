// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/core/download_meta.hpp>
#include <clipfetch/core/size_probe.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace clipfetch::core {

// How a start request is served
enum class ResumeRoute : std::uint8_t {
    fresh,          // no usable record: probed and starting from zero
    resume,         // same URL as stored: continue partial data, no probe
    continue_old,   // URL changed but finishing the old target is cheaper
    fallback_old,   // new URL unreachable: continue the old partial data
    switch_new,     // URL changed: discard partial data, restart on the new URL
};

[[nodiscard]] const char* to_string(ResumeRoute route) noexcept;

struct ResumePlan {
    ResumeRoute route{ResumeRoute::fresh};
    std::string url;                        // URL to download from
    std::optional<ProbeResult> probe;       // probe of `url`, when one was made

    [[nodiscard]] bool discards_partial() const noexcept {
        return route == ResumeRoute::fresh || route == ResumeRoute::switch_new;
    }
};

// Finishing the old target wins only when its remaining bytes are strictly
// fewer than the new target's total; ties switch.
[[nodiscard]] constexpr bool prefer_old_target(std::uint64_t old_remaining, std::uint64_t new_total) noexcept {
    return old_remaining < new_total;
}

// Decides which URL a start request downloads from, probing as needed
class UrlReconciler {
public:
    explicit UrlReconciler(const SizeProbe& probe) noexcept : probe_(probe) {}

    [[nodiscard]] std::expected<ResumePlan, std::error_code>
    reconcile(const std::optional<DownloadMetadata>& existing,
              const std::string& new_url,
              std::stop_token stop = {}) const;

private:
    const SizeProbe& probe_;
};

// File suffix for the assembled output: the URL's own extension when it is
// 1-5 alphanumerics, else one mapped from the content type, else `fallback`
[[nodiscard]] std::string resolve_extension(std::string_view url,
                                            std::string_view content_type,
                                            std::string_view fallback);

} // namespace clipfetch::core
