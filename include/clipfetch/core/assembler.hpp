// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/core/download_meta.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace clipfetch::core {

struct AssembleError {
    std::error_code code;
    std::optional<std::uint32_t> missing_segment;   // set for DownloadErrc::missing_segment

    [[nodiscard]] std::string message() const;
};

// Concatenates finished segments, strictly in index order, into
// media/<asset>.<ext>. On success the segment files and the metadata
// record are deleted.
class Assembler {
public:
    explicit Assembler(MetadataStore& store) noexcept : store_(store) {}

    [[nodiscard]] std::expected<std::filesystem::path, AssembleError>
    assemble(const std::string& asset_id,
             std::uint32_t segment_count,
             const std::string& extension) noexcept;

private:
    MetadataStore& store_;
};

} // namespace clipfetch::core
