// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/disk/error.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace clipfetch::disk {

// Asset ids become file names: non-empty, no path separators, not "." or ".."
[[nodiscard]] bool is_valid_asset_id(std::string_view asset_id) noexcept;

// Where everything lives under the storage root:
//   segments/<asset>_part<i>.seg[.partial]
//   metadata/<asset>.json
//   media/<asset>.<ext>
class StorageLayout {
public:
    explicit StorageLayout(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] std::filesystem::path segments_dir() const { return root_ / "segments"; }
    [[nodiscard]] std::filesystem::path metadata_dir() const { return root_ / "metadata"; }
    [[nodiscard]] std::filesystem::path media_dir() const { return root_ / "media"; }

    [[nodiscard]] std::filesystem::path segment_path(std::string_view asset_id, std::uint32_t index) const;
    [[nodiscard]] std::filesystem::path partial_segment_path(std::string_view asset_id, std::uint32_t index) const;
    [[nodiscard]] std::filesystem::path metadata_path(std::string_view asset_id) const;
    [[nodiscard]] std::filesystem::path media_path(std::string_view asset_id, std::string_view extension) const;

    [[nodiscard]] std::error_code ensure_directories() const noexcept;

    // Finished segment files of an asset and their sizes, keyed by index
    [[nodiscard]] std::map<std::uint32_t, std::uint64_t> scan_segments(std::string_view asset_id) const noexcept;

    // Delete leftover ".partial" fetch files of an asset; returns how many went
    std::size_t remove_partials(std::string_view asset_id) const noexcept;

    // Delete every segment file (finished or partial) of an asset
    [[nodiscard]] std::error_code remove_segments(std::string_view asset_id) const noexcept;

    // Assembled file of an asset, whatever its extension
    [[nodiscard]] std::optional<std::filesystem::path> find_media(std::string_view asset_id) const noexcept;
    [[nodiscard]] std::error_code remove_media(std::string_view asset_id) const noexcept;

    // Asset ids that have a metadata record
    [[nodiscard]] std::vector<std::string> stored_asset_ids() const noexcept;

    // Remove segments, metadata and media directories entirely
    [[nodiscard]] std::error_code wipe() const noexcept;

private:
    std::filesystem::path root_;
};

} // namespace clipfetch::disk
