// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/core/url_reconciler.hpp>
#include <clipfetch/core/log.hpp>
#include <clipfetch/core/url.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace clipfetch::core {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 7> CONTENT_TYPE_EXTENSIONS{{
    {"video/mp4", "mp4"},
    {"video/quicktime", "mov"},
    {"video/x-m4v", "m4v"},
    {"video/webm", "webm"},
    {"audio/mpeg", "mp3"},
    {"audio/mp4", "m4a"},
    {"audio/aac", "aac"},
}};

bool is_plausible_extension(std::string_view ext) noexcept {
    return !ext.empty() && ext.size() <= 5 &&
           std::all_of(ext.begin(), ext.end(), [](unsigned char c) { return std::isalnum(c) != 0; });
}

// "Video/MP4; codecs=avc1" -> "video/mp4"
std::string media_type(std::string_view content_type) {
    auto semi = content_type.find(';');
    if (semi != std::string_view::npos) {
        content_type = content_type.substr(0, semi);
    }
    while (!content_type.empty() && content_type.back() == ' ') content_type.remove_suffix(1);
    while (!content_type.empty() && content_type.front() == ' ') content_type.remove_prefix(1);

    std::string result;
    result.reserve(content_type.size());
    for (char c : content_type) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

} // namespace

const char* to_string(ResumeRoute route) noexcept {
    switch (route) {
        case ResumeRoute::fresh:        return "fresh";
        case ResumeRoute::resume:       return "resume";
        case ResumeRoute::continue_old: return "continue-old";
        case ResumeRoute::fallback_old: return "fallback-old";
        case ResumeRoute::switch_new:   return "switch-new";
    }
    return "unknown";
}

std::expected<ResumePlan, std::error_code>
UrlReconciler::reconcile(const std::optional<DownloadMetadata>& existing,
                         const std::string& new_url,
                         std::stop_token stop) const {
    // Nothing to resume
    if (!existing || existing->total_size == 0) {
        auto probed = probe_.probe(new_url, stop);
        if (!probed) {
            return std::unexpected(probed.error());
        }
        return ResumePlan{ResumeRoute::fresh, new_url, std::move(*probed)};
    }

    const auto& old = *existing;
    if (old.origin_url == new_url) {
        return ResumePlan{ResumeRoute::resume, new_url, std::nullopt};
    }

    auto new_probe = probe_.probe(new_url, stop);
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    bool old_url_valid = Url::parse(old.origin_url).has_value();

    if (!new_probe) {
        if (old_url_valid && !old.finished_segments.empty()) {
            logger()->warn("{}: new URL unreachable ({}), continuing {}",
                           old.asset_id, new_probe.error().message(), old.origin_url);
            return ResumePlan{ResumeRoute::fallback_old, old.origin_url, std::nullopt};
        }
        if (!old_url_valid) {
            logger()->error("{}: stored URL {} is unusable and {} is unreachable",
                            old.asset_id, old.origin_url, new_url);
            return std::unexpected(make_error_code(DownloadErrc::invalid_state));
        }
        return std::unexpected(new_probe.error());
    }

    if (!old_url_valid) {
        logger()->info("{}: stored URL unusable, switching to {}", old.asset_id, new_url);
        return ResumePlan{ResumeRoute::switch_new, new_url, std::move(*new_probe)};
    }

    auto old_probe = probe_.probe(old.origin_url, stop);
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    if (!old_probe) {
        logger()->info("{}: old URL unreachable ({}), switching to {}",
                       old.asset_id, old_probe.error().message(), new_url);
        return ResumePlan{ResumeRoute::switch_new, new_url, std::move(*new_probe)};
    }

    if (old_probe->size != old.total_size) {
        logger()->info("{}: old resource changed size ({} -> {}), switching to {}",
                       old.asset_id, old.total_size, old_probe->size, new_url);
        return ResumePlan{ResumeRoute::switch_new, new_url, std::move(*new_probe)};
    }

    auto old_remaining = old.remaining_bytes();
    if (prefer_old_target(old_remaining, new_probe->size)) {
        logger()->info("{}: {} bytes left on old URL < {} on new URL, continuing old",
                       old.asset_id, old_remaining, new_probe->size);
        return ResumePlan{ResumeRoute::continue_old, old.origin_url, std::move(*old_probe)};
    }

    logger()->info("{}: {} bytes left on old URL >= {} on new URL, switching",
                   old.asset_id, old_remaining, new_probe->size);
    return ResumePlan{ResumeRoute::switch_new, new_url, std::move(*new_probe)};
}

std::string resolve_extension(std::string_view url,
                              std::string_view content_type,
                              std::string_view fallback) {
    if (auto parsed = Url::parse(url)) {
        auto ext = parsed->extension();
        if (is_plausible_extension(ext)) {
            return ext;
        }
    }

    auto type = media_type(content_type);
    for (const auto& [mime, ext] : CONTENT_TYPE_EXTENSIONS) {
        if (type == mime) {
            return std::string(ext);
        }
    }

    return std::string(fallback);
}

} // namespace clipfetch::core
