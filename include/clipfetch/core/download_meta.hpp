// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/disk/storage_layout.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace clipfetch::core {

// Durable record of one asset download
struct DownloadMetadata {
    std::string asset_id;
    std::string origin_url;
    std::uint64_t total_size{0};        // 0 = not probed yet
    std::uint64_t chunk_size{0};        // chunk size the segments were cut with
    std::set<std::uint32_t> finished_segments;
    std::string final_extension;

    [[nodiscard]] std::uint32_t segment_count() const noexcept;

    // Bytes of the segments not yet finished
    [[nodiscard]] std::uint64_t remaining_bytes() const noexcept;

    bool operator==(const DownloadMetadata&) const = default;
};

void to_json(nlohmann::json& j, const DownloadMetadata& meta);
void from_json(const nlohmann::json& j, DownloadMetadata& meta);

// Single writer of durable per-asset state. Keeps an in-memory copy of every
// record; every mutation is written to disk before it returns. Thread-safe.
class MetadataStore {
public:
    explicit MetadataStore(disk::StorageLayout layout);

    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    // Read every record under metadata/ into memory; unreadable records are skipped
    [[nodiscard]] std::error_code load_all() noexcept;

    [[nodiscard]] std::optional<DownloadMetadata> load(const std::string& asset_id) const;

    // Full upsert, durable before returning
    [[nodiscard]] std::error_code save(const DownloadMetadata& meta) noexcept;

    [[nodiscard]] std::error_code remove(const std::string& asset_id) noexcept;

    // Record one more finished segment
    [[nodiscard]] std::error_code mark_finished(const std::string& asset_id, std::uint32_t index) noexcept;

    // Replace the finished set with the segments present on disk (disk wins)
    [[nodiscard]] std::expected<DownloadMetadata, std::error_code>
    reconcile_with_disk(const std::string& asset_id,
                        const std::set<std::uint32_t>& on_disk) noexcept;

    // Scan the segment directory, discard partial and wrongly sized files,
    // then reconcile with what is left
    [[nodiscard]] std::expected<DownloadMetadata, std::error_code>
    reconcile_with_disk(const std::string& asset_id) noexcept;

    [[nodiscard]] std::vector<DownloadMetadata> all() const;

    // Forget every record (memory and disk)
    [[nodiscard]] std::error_code clear() noexcept;

    [[nodiscard]] const disk::StorageLayout& layout() const noexcept { return layout_; }

private:
    [[nodiscard]] std::error_code persist(const DownloadMetadata& meta) const noexcept;

    disk::StorageLayout layout_;
    mutable std::mutex mutex_;
    std::map<std::string, DownloadMetadata> records_;
};

} // namespace clipfetch::core
