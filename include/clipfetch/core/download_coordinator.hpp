// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/core/assembler.hpp>
#include <clipfetch/core/config.hpp>
#include <clipfetch/core/download_meta.hpp>
#include <clipfetch/core/download_scheduler.hpp>
#include <clipfetch/core/http_transport.hpp>
#include <clipfetch/core/size_probe.hpp>
#include <clipfetch/core/url_reconciler.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace clipfetch::core {

// Per-asset lifecycle
enum class AssetState : std::uint8_t {
    idle,        // Nothing stored, nothing running
    probing,     // Discovering size / reconciling URLs
    planning,    // Writing metadata, reconciling with disk
    active,      // Segments downloading
    paused,      // Cancelled; partial data kept for resume
    assembling,  // Concatenating segments
    completed,   // Final file in place
    failed       // Terminal for this run; partial data kept
};

[[nodiscard]] const char* to_string(AssetState state) noexcept;

// Receives every asset event. Calls arrive on engine threads; on_progress calls
// for one asset are serialized and their fraction never decreases.
class DownloadObserver {
public:
    virtual ~DownloadObserver() = default;

    virtual void on_progress(const std::string& asset_id,
                             std::uint64_t received_bytes,
                             std::uint64_t total_bytes,
                             double fraction) = 0;
    virtual void on_complete(const std::string& asset_id, const std::filesystem::path& file) = 0;
    virtual void on_fail(const std::string& asset_id, std::error_code error, const std::string& detail) = 0;
};

// Platform hook that keeps the host process alive while anything downloads.
// Called under the coordinator lock; must not call back into the coordinator.
class BackgroundWork {
public:
    virtual ~BackgroundWork() = default;
    virtual void begin_background_work() {}
    virtual void end_background_work() {}
};

// Public face of the engine: start/resume/cancel/remove per asset id
class DownloadCoordinator {
public:
    // Creates the storage directories, loads every stored record and
    // reconciles each against the segment files on disk
    [[nodiscard]] static std::expected<std::unique_ptr<DownloadCoordinator>, std::error_code>
    create(EngineConfig config,
           HttpTransport& transport,
           DownloadObserver& observer,
           BackgroundWork* background = nullptr) noexcept;

    // Stops every asset and joins its threads; partial data stays on disk
    ~DownloadCoordinator();

    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;

    // Start or resume `asset_id` from `url`. Replaces any work already running
    // for the asset. Failures after this returns arrive through on_fail.
    [[nodiscard]] std::error_code start_download(const std::string& asset_id, const std::string& url) noexcept;
    [[nodiscard]] std::error_code resume_download(const std::string& asset_id, const std::string& url) noexcept {
        return start_download(asset_id, url);
    }

    // Stop requests and probe; segment files and metadata are kept
    void cancel_download(const std::string& asset_id) noexcept;

    // Cancel, then delete segments, final file and metadata
    [[nodiscard]] std::error_code remove_download_completely(const std::string& asset_id) noexcept;

    // Remove completely every asset that is currently active
    void clear_all_active_downloads() noexcept;

    // Cancel everything and delete everything under the storage root
    [[nodiscard]] std::error_code wipe_all_downloads() noexcept;

    // Probing, planning, downloading or assembling
    [[nodiscard]] bool is_active(const std::string& asset_id) const noexcept;
    [[nodiscard]] bool has_partial_data(const std::string& asset_id) const noexcept;
    [[nodiscard]] bool local_file_exists(const std::string& asset_id) const noexcept;
    [[nodiscard]] std::optional<std::filesystem::path> local_file_path(const std::string& asset_id) const noexcept;
    [[nodiscard]] AssetState state(const std::string& asset_id) const noexcept;
    [[nodiscard]] std::optional<DownloadMetadata> metadata(const std::string& asset_id) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    DownloadCoordinator(EngineConfig config,
                        HttpTransport& transport,
                        DownloadObserver& observer,
                        BackgroundWork* background);

    struct Entry {
        std::uint64_t generation{0};
        AssetState state{AssetState::idle};
        std::jthread job;                                 // probe and planning
        std::unique_ptr<DownloadScheduler> scheduler;
        bool counted{false};                              // holds background work
    };

    // Serializes on_progress for one asset and remembers its last fraction
    struct ProgressChannel {
        std::recursive_mutex mutex;
        double last_fraction{0.0};
        std::uint64_t last_received{0};
    };

    // Job thread body: reconcile URLs, write metadata, launch the scheduler
    void prepare(std::string asset_id, std::string url, std::uint64_t generation, std::stop_token stop) noexcept;

    void handle_progress(const std::string& asset_id, std::uint64_t generation,
                         std::uint64_t completed, std::uint64_t total) noexcept;
    void handle_finished(const std::string& asset_id, std::uint64_t generation,
                         std::uint32_t segment_count, const std::string& extension) noexcept;
    void handle_failure(const std::string& asset_id, std::uint64_t generation,
                        std::error_code ec, std::string detail) noexcept;

    // All below require mutex_ held
    [[nodiscard]] bool is_current(const std::string& asset_id, std::uint64_t generation) const noexcept;
    void retire(Entry& entry) noexcept;
    void activate(Entry& entry) noexcept;
    void deactivate(Entry& entry) noexcept;
    std::shared_ptr<ProgressChannel> channel(const std::string& asset_id);

    // Join retired threads that do not belong to the calling thread
    void reap() noexcept;

    void reset_progress(const std::string& asset_id) noexcept;

    EngineConfig config_;
    HttpTransport& transport_;
    DownloadObserver& observer_;
    BackgroundWork* background_;

    MetadataStore store_;
    SizeProbe probe_;
    UrlReconciler reconciler_;
    Assembler assembler_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, std::shared_ptr<ProgressChannel>> channels_;
    std::vector<std::jthread> retired_jobs_;
    std::vector<std::unique_ptr<DownloadScheduler>> retired_schedulers_;
    std::uint64_t next_generation_{1};
    std::size_t active_count_{0};
};

} // namespace clipfetch::core
