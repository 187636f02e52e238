// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/core/assembler.hpp>
#include <clipfetch/core/log.hpp>
#include <clipfetch/disk/file_writer.hpp>
#include <format>

namespace clipfetch::core {

std::string AssembleError::message() const {
    if (missing_segment) {
        return std::format("segment {} missing", *missing_segment);
    }
    return code.message();
}

std::expected<std::filesystem::path, AssembleError>
Assembler::assemble(const std::string& asset_id,
                    std::uint32_t segment_count,
                    const std::string& extension) noexcept {
    const auto& layout = store_.layout();

    try {
        auto final_path = layout.media_path(asset_id, extension);
        auto work_path = final_path;
        work_path += ".part";

        auto abandon = [&](std::error_code ec, std::optional<std::uint32_t> missing = std::nullopt) {
            std::error_code ignored;
            std::filesystem::remove(work_path, ignored);
            return std::unexpected(AssembleError{ec, missing});
        };

        disk::FileWriter out;
        if (auto ec = out.open(work_path, disk::OpenMode::truncate)) {
            return abandon(ec);
        }

        for (std::uint32_t i = 0; i < segment_count; ++i) {
            auto segment = layout.segment_path(asset_id, i);
            std::error_code exists_ec;
            if (!std::filesystem::is_regular_file(segment, exists_ec)) {
                out.close();
                logger()->error("{}: segment {} vanished before assembly", asset_id, i);
                return abandon(make_error_code(DownloadErrc::missing_segment), i);
            }
            if (auto ec = out.append_file(segment)) {
                out.close();
                return abandon(ec);
            }
        }

        if (auto ec = out.sync()) {
            out.close();
            return abandon(ec);
        }
        auto written = out.bytes_written();
        out.close();

        if (auto ec = disk::rename_file(work_path, final_path)) {
            return abandon(ec);
        }

        if (auto ec = layout.remove_segments(asset_id)) {
            logger()->warn("{}: leftover segments after assembly: {}", asset_id, ec.message());
        }
        if (auto ec = store_.remove(asset_id)) {
            logger()->warn("{}: metadata not removed after assembly: {}", asset_id, ec.message());
        }

        logger()->info("{}: assembled {} segment(s), {} bytes -> {}",
                       asset_id, segment_count, written, final_path.string());
        return final_path;
    } catch (const std::exception& e) {
        logger()->error("{}: assembly failed: {}", asset_id, e.what());
        return std::unexpected(AssembleError{make_error_code(disk::DiskErrc::write_error), std::nullopt});
    }
}

} // namespace clipfetch::core
