// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/disk/storage_layout.hpp>
#include <clipfetch/core/log.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace fs = std::filesystem;

namespace clipfetch::disk {

namespace {

constexpr std::string_view SEGMENT_SUFFIX = ".seg";
constexpr std::string_view PARTIAL_SUFFIX = ".seg.partial";
constexpr std::string_view METADATA_SUFFIX = ".json";

// "<asset>_part<digits><suffix>" -> digits
std::optional<std::uint32_t> parse_segment_name(std::string_view name,
                                                std::string_view asset_id,
                                                std::string_view suffix) noexcept {
    if (!name.starts_with(asset_id)) return std::nullopt;
    name.remove_prefix(asset_id.size());
    if (!name.starts_with("_part")) return std::nullopt;
    name.remove_prefix(5);
    if (!name.ends_with(suffix)) return std::nullopt;
    name.remove_suffix(suffix.size());

    if (name.empty() || !std::all_of(name.begin(), name.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }

    std::uint32_t index = 0;
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), index);
    if (ec != std::errc{} || ptr != name.data() + name.size()) {
        return std::nullopt;
    }
    return index;
}

std::error_code to_disk_error(const std::error_code& ec, DiskErrc fallback) noexcept {
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return from_errno(ec.value(), fallback);
    }
    return make_error_code(fallback);
}

} // namespace

bool is_valid_asset_id(std::string_view asset_id) noexcept {
    if (asset_id.empty() || asset_id == "." || asset_id == "..") {
        return false;
    }
    return asset_id.find_first_of("/\\") == std::string_view::npos
        && asset_id.find('\0') == std::string_view::npos;
}

//=============================================================================
// StorageLayout
//=============================================================================

StorageLayout::StorageLayout(fs::path root)
    : root_(std::move(root)) {}

fs::path StorageLayout::segment_path(std::string_view asset_id, std::uint32_t index) const {
    return segments_dir() / std::format("{}_part{}{}", asset_id, index, SEGMENT_SUFFIX);
}

fs::path StorageLayout::partial_segment_path(std::string_view asset_id, std::uint32_t index) const {
    return segments_dir() / std::format("{}_part{}{}", asset_id, index, PARTIAL_SUFFIX);
}

fs::path StorageLayout::metadata_path(std::string_view asset_id) const {
    return metadata_dir() / std::format("{}{}", asset_id, METADATA_SUFFIX);
}

fs::path StorageLayout::media_path(std::string_view asset_id, std::string_view extension) const {
    return media_dir() / std::format("{}.{}", asset_id, extension);
}

std::error_code StorageLayout::ensure_directories() const noexcept {
    try {
        for (const auto& dir : {segments_dir(), metadata_dir(), media_dir()}) {
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec) {
                core::logger()->error("Cannot create {}: {}", dir.string(), ec.message());
                return to_disk_error(ec, DiskErrc::invalid_path);
            }
        }
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::invalid_path);
    }
    return {};
}

std::map<std::uint32_t, std::uint64_t> StorageLayout::scan_segments(std::string_view asset_id) const noexcept {
    std::map<std::uint32_t, std::uint64_t> found;
    try {
        std::error_code ec;
        for (fs::directory_iterator it(segments_dir(), ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code size_ec;
            if (!it->is_regular_file(size_ec)) continue;

            auto name = it->path().filename().string();
            auto index = parse_segment_name(name, asset_id, SEGMENT_SUFFIX);
            if (!index) continue;

            auto size = it->file_size(size_ec);
            if (!size_ec) {
                found.emplace(*index, size);
            }
        }
    } catch (const std::exception& e) {
        core::logger()->warn("Segment scan for {} failed: {}", asset_id, e.what());
    }
    return found;
}

std::size_t StorageLayout::remove_partials(std::string_view asset_id) const noexcept {
    std::size_t removed = 0;
    try {
        std::vector<fs::path> victims;
        std::error_code ec;
        for (fs::directory_iterator it(segments_dir(), ec), end; !ec && it != end; it.increment(ec)) {
            if (parse_segment_name(it->path().filename().string(), asset_id, PARTIAL_SUFFIX)) {
                victims.push_back(it->path());
            }
        }
        for (const auto& p : victims) {
            std::error_code rm_ec;
            if (fs::remove(p, rm_ec)) ++removed;
        }
    } catch (const std::exception& e) {
        core::logger()->warn("Partial cleanup for {} failed: {}", asset_id, e.what());
    }
    return removed;
}

std::error_code StorageLayout::remove_segments(std::string_view asset_id) const noexcept {
    try {
        std::vector<fs::path> victims;
        std::error_code ec;
        for (fs::directory_iterator it(segments_dir(), ec), end; !ec && it != end; it.increment(ec)) {
            auto name = it->path().filename().string();
            if (parse_segment_name(name, asset_id, SEGMENT_SUFFIX) ||
                parse_segment_name(name, asset_id, PARTIAL_SUFFIX)) {
                victims.push_back(it->path());
            }
        }
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return to_disk_error(ec, DiskErrc::read_error);
        }

        for (const auto& p : victims) {
            std::error_code rm_ec;
            fs::remove(p, rm_ec);
            if (rm_ec) {
                return to_disk_error(rm_ec, DiskErrc::write_error);
            }
        }
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }
    return {};
}

std::optional<fs::path> StorageLayout::find_media(std::string_view asset_id) const noexcept {
    try {
        std::error_code ec;
        for (fs::directory_iterator it(media_dir(), ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec)) continue;

            auto name = it->path().filename().string();
            std::string_view view = name;
            if (!view.starts_with(asset_id) || view.size() <= asset_id.size() + 1) continue;
            view.remove_prefix(asset_id.size());
            if (view.front() != '.') continue;
            view.remove_prefix(1);
            // "<asset>.<ext>" only; "<asset>.<ext>.part" is an unfinished assembly
            if (view.find('.') != std::string_view::npos) continue;
            return it->path();
        }
    } catch (const std::exception& e) {
        core::logger()->warn("Media lookup for {} failed: {}", asset_id, e.what());
    }
    return std::nullopt;
}

std::error_code StorageLayout::remove_media(std::string_view asset_id) const noexcept {
    while (auto path = find_media(asset_id)) {
        std::error_code ec;
        fs::remove(*path, ec);
        if (ec) {
            return to_disk_error(ec, DiskErrc::write_error);
        }
    }
    return {};
}

std::vector<std::string> StorageLayout::stored_asset_ids() const noexcept {
    std::vector<std::string> ids;
    try {
        std::error_code ec;
        for (fs::directory_iterator it(metadata_dir(), ec), end; !ec && it != end; it.increment(ec)) {
            auto name = it->path().filename().string();
            std::string_view view = name;
            if (!view.ends_with(METADATA_SUFFIX)) continue;
            view.remove_suffix(METADATA_SUFFIX.size());
            if (is_valid_asset_id(view)) {
                ids.emplace_back(view);
            }
        }
        std::sort(ids.begin(), ids.end());
    } catch (const std::exception& e) {
        core::logger()->warn("Metadata listing failed: {}", e.what());
    }
    return ids;
}

std::error_code StorageLayout::wipe() const noexcept {
    try {
        for (const auto& dir : {segments_dir(), metadata_dir(), media_dir()}) {
            std::error_code ec;
            fs::remove_all(dir, ec);
            if (ec) {
                core::logger()->error("Cannot remove {}: {}", dir.string(), ec.message());
                return to_disk_error(ec, DiskErrc::write_error);
            }
        }
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }
    return ensure_directories();
}

} // namespace clipfetch::disk
