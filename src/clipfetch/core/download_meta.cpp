// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/core/download_meta.hpp>
#include <clipfetch/core/error.hpp>
#include <clipfetch/core/log.hpp>
#include <clipfetch/core/segment_plan.hpp>
#include <clipfetch/disk/file_writer.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace clipfetch::core {

//=============================================================================
// DownloadMetadata
//=============================================================================

std::uint32_t DownloadMetadata::segment_count() const noexcept {
    return static_cast<std::uint32_t>(core::segment_count(total_size, chunk_size));
}

std::uint64_t DownloadMetadata::remaining_bytes() const noexcept {
    auto plan = SegmentPlan::create(total_size, chunk_size);
    if (!plan) return total_size;

    std::uint64_t done = 0;
    for (auto index : finished_segments) {
        if (auto range = plan->range_for(index)) {
            done += range->length();
        }
    }
    return done >= total_size ? 0 : total_size - done;
}

void to_json(nlohmann::json& j, const DownloadMetadata& meta) {
    j = nlohmann::json{
        {"asset_id", meta.asset_id},
        {"origin_url", meta.origin_url},
        {"total_size", meta.total_size},
        {"chunk_size", meta.chunk_size},
        {"finished_segments", meta.finished_segments},
        {"final_extension", meta.final_extension},
    };
}

void from_json(const nlohmann::json& j, DownloadMetadata& meta) {
    j.at("asset_id").get_to(meta.asset_id);
    j.at("origin_url").get_to(meta.origin_url);
    j.at("total_size").get_to(meta.total_size);
    meta.chunk_size = j.value("chunk_size", std::uint64_t{0});
    meta.finished_segments = j.value("finished_segments", std::set<std::uint32_t>{});
    meta.final_extension = j.value("final_extension", std::string{});
}

//=============================================================================
// MetadataStore
//=============================================================================

MetadataStore::MetadataStore(disk::StorageLayout layout)
    : layout_(std::move(layout)) {}

std::error_code MetadataStore::load_all() noexcept {
    std::map<std::string, DownloadMetadata> loaded;

    for (const auto& id : layout_.stored_asset_ids()) {
        try {
            std::ifstream file(layout_.metadata_path(id), std::ios::binary);
            if (!file) {
                logger()->warn("Cannot open metadata record for {}", id);
                continue;
            }

            auto record = nlohmann::json::parse(file).get<DownloadMetadata>();
            if (record.asset_id != id) {
                logger()->warn("Metadata record {} names asset {}, skipped", id, record.asset_id);
                continue;
            }
            loaded.emplace(id, std::move(record));
        } catch (const nlohmann::json::exception& e) {
            logger()->warn("Malformed metadata record for {}: {}", id, e.what());
        } catch (const std::exception& e) {
            logger()->warn("Cannot read metadata record for {}: {}", id, e.what());
        }
    }

    std::lock_guard lock(mutex_);
    records_ = std::move(loaded);
    logger()->debug("Loaded {} metadata record(s)", records_.size());
    return {};
}

std::optional<DownloadMetadata> MetadataStore::load(const std::string& asset_id) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(asset_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::error_code MetadataStore::persist(const DownloadMetadata& meta) const noexcept {
    try {
        nlohmann::json j = meta;
        return disk::write_file_atomic(layout_.metadata_path(meta.asset_id), j.dump(2));
    } catch (const std::exception& e) {
        logger()->error("Cannot serialize metadata for {}: {}", meta.asset_id, e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::error_code MetadataStore::save(const DownloadMetadata& meta) noexcept {
    if (!disk::is_valid_asset_id(meta.asset_id)) {
        return make_error_code(DownloadErrc::invalid_state);
    }

    std::lock_guard lock(mutex_);
    if (auto ec = persist(meta)) {
        logger()->error("Saving metadata for {} failed: {}", meta.asset_id, ec.message());
        return ec;
    }
    try {
        records_.insert_or_assign(meta.asset_id, meta);
    } catch (const std::bad_alloc&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
    return {};
}

std::error_code MetadataStore::remove(const std::string& asset_id) noexcept {
    if (!disk::is_valid_asset_id(asset_id)) {
        return make_error_code(DownloadErrc::invalid_state);
    }

    std::lock_guard lock(mutex_);
    records_.erase(asset_id);

    std::error_code ec;
    std::filesystem::remove(layout_.metadata_path(asset_id), ec);
    if (ec) {
        logger()->error("Removing metadata for {} failed: {}", asset_id, ec.message());
        return disk::from_errno(ec.value(), disk::DiskErrc::write_error);
    }
    return {};
}

std::error_code MetadataStore::mark_finished(const std::string& asset_id, std::uint32_t index) noexcept {
    std::lock_guard lock(mutex_);
    auto it = records_.find(asset_id);
    if (it == records_.end()) {
        return make_error_code(DownloadErrc::invalid_state);
    }

    if (index >= it->second.segment_count()) {
        return make_error_code(DownloadErrc::invalid_range);
    }

    try {
        auto updated = it->second;
        if (!updated.finished_segments.insert(index).second) {
            return {};  // Already recorded
        }
        if (auto ec = persist(updated)) {
            return ec;
        }
        it->second = std::move(updated);
    } catch (const std::bad_alloc&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
    return {};
}

std::expected<DownloadMetadata, std::error_code>
MetadataStore::reconcile_with_disk(const std::string& asset_id,
                                   const std::set<std::uint32_t>& on_disk) noexcept {
    std::lock_guard lock(mutex_);
    auto it = records_.find(asset_id);
    if (it == records_.end()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_state));
    }

    try {
        auto updated = it->second;
        auto count = updated.segment_count();

        updated.finished_segments.clear();
        for (auto index : on_disk) {
            if (index < count) {
                updated.finished_segments.insert(index);
            }
        }

        if (updated.finished_segments != it->second.finished_segments) {
            logger()->info("Reconciled {}: {} segment(s) recorded, {} on disk",
                           asset_id, it->second.finished_segments.size(),
                           updated.finished_segments.size());
            if (auto ec = persist(updated)) {
                return std::unexpected(ec);
            }
            it->second = updated;
        }
        return updated;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(disk::DiskErrc::write_error));
    }
}

std::expected<DownloadMetadata, std::error_code>
MetadataStore::reconcile_with_disk(const std::string& asset_id) noexcept {
    auto record = load(asset_id);
    if (!record) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_state));
    }

    if (auto n = layout_.remove_partials(asset_id); n > 0) {
        logger()->debug("Removed {} partial segment file(s) of {}", n, asset_id);
    }

    std::set<std::uint32_t> present;
    auto plan = SegmentPlan::create(record->total_size, record->chunk_size);

    for (const auto& [index, size] : layout_.scan_segments(asset_id)) {
        std::optional<ByteRange> range;
        if (plan) {
            if (auto r = plan->range_for(index)) range = *r;
        }

        if (!range || range->length() != size) {
            // Truncated, oversized or from a different plan
            std::error_code ec;
            std::filesystem::remove(layout_.segment_path(asset_id, index), ec);
            if (ec) {
                logger()->warn("Cannot discard segment {} of {}: {}", index, asset_id, ec.message());
            } else {
                logger()->warn("Discarded segment {} of {} ({} bytes on disk)", index, asset_id, size);
            }
            continue;
        }
        present.insert(index);
    }

    return reconcile_with_disk(asset_id, present);
}

std::vector<DownloadMetadata> MetadataStore::all() const {
    std::lock_guard lock(mutex_);
    std::vector<DownloadMetadata> result;
    result.reserve(records_.size());
    for (const auto& [id, meta] : records_) {
        result.push_back(meta);
    }
    return result;
}

std::error_code MetadataStore::clear() noexcept {
    std::lock_guard lock(mutex_);
    std::error_code result;
    for (const auto& [id, meta] : records_) {
        std::error_code ec;
        std::filesystem::remove(layout_.metadata_path(id), ec);
        if (ec && !result) {
            result = disk::from_errno(ec.value(), disk::DiskErrc::write_error);
        }
    }
    records_.clear();
    return result;
}

} // namespace clipfetch::core
