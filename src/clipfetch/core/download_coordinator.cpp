// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/core/download_coordinator.hpp>
#include <clipfetch/core/log.hpp>
#include <algorithm>
#include <format>
#include <iterator>

namespace clipfetch::core {

const char* to_string(AssetState state) noexcept {
    switch (state) {
        case AssetState::idle:       return "idle";
        case AssetState::probing:    return "probing";
        case AssetState::planning:   return "planning";
        case AssetState::active:     return "active";
        case AssetState::paused:     return "paused";
        case AssetState::assembling: return "assembling";
        case AssetState::completed:  return "completed";
        case AssetState::failed:     return "failed";
    }
    return "unknown";
}

namespace {

bool is_running(AssetState state) noexcept {
    return state == AssetState::probing || state == AssetState::planning ||
           state == AssetState::active || state == AssetState::assembling;
}

} // namespace

//=============================================================================
// Construction
//=============================================================================

DownloadCoordinator::DownloadCoordinator(EngineConfig config,
                                         HttpTransport& transport,
                                         DownloadObserver& observer,
                                         BackgroundWork* background)
    : config_(std::move(config))
    , transport_(transport)
    , observer_(observer)
    , background_(background)
    , store_(disk::StorageLayout(config_.storage_root))
    , probe_(transport_)
    , reconciler_(probe_)
    , assembler_(store_) {}

std::expected<std::unique_ptr<DownloadCoordinator>, std::error_code>
DownloadCoordinator::create(EngineConfig config,
                            HttpTransport& transport,
                            DownloadObserver& observer,
                            BackgroundWork* background) noexcept {
    if (auto ec = config.validate()) {
        return std::unexpected(ec);
    }

    try {
        std::unique_ptr<DownloadCoordinator> coordinator(
            new DownloadCoordinator(std::move(config), transport, observer, background));

        if (auto ec = coordinator->store_.layout().ensure_directories()) {
            return std::unexpected(ec);
        }
        if (auto ec = coordinator->store_.load_all()) {
            return std::unexpected(ec);
        }

        // Disk is the truth for which segments exist
        for (const auto& meta : coordinator->store_.all()) {
            auto reconciled = coordinator->store_.reconcile_with_disk(meta.asset_id);
            if (!reconciled) {
                logger()->warn("{}: startup reconciliation failed: {}",
                               meta.asset_id, reconciled.error().message());
            }
        }

        logger()->debug("Storage root {}", coordinator->config_.storage_root.string());
        return coordinator;
    } catch (const std::exception& e) {
        logger()->error("Cannot create download coordinator: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_state));
    }
}

DownloadCoordinator::~DownloadCoordinator() {
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, entry] : entries_) {
            entry.generation = next_generation_++;
            retire(entry);
            deactivate(entry);
        }
    }
    reap();
}

//=============================================================================
// Public operations
//=============================================================================

std::error_code DownloadCoordinator::start_download(const std::string& asset_id, const std::string& url) noexcept {
    if (!disk::is_valid_asset_id(asset_id)) {
        logger()->error("Rejected asset id '{}'", asset_id);
        return make_error_code(DownloadErrc::invalid_state);
    }

    std::error_code result;
    {
        std::lock_guard lock(mutex_);
        try {
            auto& entry = entries_[asset_id];
            retire(entry);
            entry.generation = next_generation_++;
            entry.state = AssetState::probing;
            activate(entry);

            auto generation = entry.generation;
            entry.job = std::jthread([this, asset_id, url, generation](std::stop_token stop) {
                prepare(asset_id, url, generation, stop);
            });
            logger()->info("{}: starting from {}", asset_id, url);
        } catch (const std::exception& e) {
            logger()->error("{}: cannot start: {}", asset_id, e.what());
            if (auto it = entries_.find(asset_id); it != entries_.end()) {
                it->second.state = AssetState::failed;
                deactivate(it->second);
            }
            result = std::make_error_code(std::errc::resource_unavailable_try_again);
        }
    }

    reap();
    return result;
}

void DownloadCoordinator::cancel_download(const std::string& asset_id) noexcept {
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(asset_id);
        if (it == entries_.end() || !is_running(it->second.state)) {
            return;
        }

        auto& entry = it->second;
        // Assembly is short and not interruptible; let it finish
        if (entry.state == AssetState::assembling) {
            logger()->debug("{}: cancel ignored while assembling", asset_id);
            return;
        }

        entry.generation = next_generation_++;
        retire(entry);
        deactivate(entry);
        entry.state = store_.load(asset_id) ? AssetState::paused : AssetState::idle;
    }

    reap();
    logger()->info("{}: paused", asset_id);
}

std::error_code DownloadCoordinator::remove_download_completely(const std::string& asset_id) noexcept {
    if (!disk::is_valid_asset_id(asset_id)) {
        return make_error_code(DownloadErrc::invalid_state);
    }

    {
        std::lock_guard lock(mutex_);
        if (auto it = entries_.find(asset_id); it != entries_.end()) {
            it->second.generation = next_generation_++;
            retire(it->second);
            deactivate(it->second);
            entries_.erase(it);
        }
    }

    // Waits for in-flight fetches and any running assembly
    reap();
    reset_progress(asset_id);

    const auto& layout = store_.layout();
    std::error_code result = layout.remove_segments(asset_id);
    if (auto ec = layout.remove_media(asset_id); ec && !result) {
        result = ec;
    }
    if (auto ec = store_.remove(asset_id); ec && !result) {
        result = ec;
    }

    if (result) {
        logger()->error("{}: removal incomplete: {}", asset_id, result.message());
    } else {
        logger()->info("{}: removed", asset_id);
    }
    return result;
}

void DownloadCoordinator::clear_all_active_downloads() noexcept {
    std::vector<std::string> active;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            if (is_running(entry.state)) {
                active.push_back(id);
            }
        }
    }

    for (const auto& id : active) {
        if (auto ec = remove_download_completely(id)) {
            logger()->warn("{}: {}", id, ec.message());
        }
    }
}

std::error_code DownloadCoordinator::wipe_all_downloads() noexcept {
    std::vector<std::shared_ptr<ProgressChannel>> channels;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, entry] : entries_) {
            entry.generation = next_generation_++;
            retire(entry);
            deactivate(entry);
        }
        entries_.clear();
        for (const auto& [id, ch] : channels_) {
            channels.push_back(ch);
        }
    }

    reap();

    for (const auto& ch : channels) {
        std::lock_guard p(ch->mutex);
        ch->last_fraction = 0.0;
        ch->last_received = 0;
    }

    std::error_code result = store_.clear();
    if (auto ec = store_.layout().wipe(); ec && !result) {
        result = ec;
    }

    if (result) {
        logger()->error("Wipe incomplete: {}", result.message());
    } else {
        logger()->info("Wiped {}", store_.layout().root().string());
    }
    return result;
}

bool DownloadCoordinator::is_active(const std::string& asset_id) const noexcept {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(asset_id);
    return it != entries_.end() && is_running(it->second.state);
}

bool DownloadCoordinator::has_partial_data(const std::string& asset_id) const noexcept {
    try {
        auto meta = store_.load(asset_id);
        if (!meta || meta->total_size == 0) {
            return false;
        }
        return !meta->finished_segments.empty() || !store_.layout().scan_segments(asset_id).empty();
    } catch (const std::exception&) {
        return false;
    }
}

bool DownloadCoordinator::local_file_exists(const std::string& asset_id) const noexcept {
    return local_file_path(asset_id).has_value();
}

std::optional<std::filesystem::path> DownloadCoordinator::local_file_path(const std::string& asset_id) const noexcept {
    if (!disk::is_valid_asset_id(asset_id)) {
        return std::nullopt;
    }
    return store_.layout().find_media(asset_id);
}

AssetState DownloadCoordinator::state(const std::string& asset_id) const noexcept {
    {
        std::lock_guard lock(mutex_);
        if (auto it = entries_.find(asset_id); it != entries_.end()) {
            return it->second.state;
        }
    }

    try {
        if (store_.load(asset_id)) {
            return AssetState::paused;
        }
    } catch (const std::exception&) {
        return AssetState::idle;
    }
    return local_file_exists(asset_id) ? AssetState::completed : AssetState::idle;
}

std::optional<DownloadMetadata> DownloadCoordinator::metadata(const std::string& asset_id) const {
    return store_.load(asset_id);
}

//=============================================================================
// Job thread
//=============================================================================

void DownloadCoordinator::prepare(std::string asset_id, std::string url,
                                  std::uint64_t generation, std::stop_token stop) noexcept {
    try {
        auto existing = store_.load(asset_id);
        auto plan = reconciler_.reconcile(existing, url, stop);
        if (stop.stop_requested()) {
            return;
        }
        if (!plan) {
            handle_failure(asset_id, generation, plan.error(), std::format("cannot download {}", url));
            return;
        }

        {
            std::lock_guard lock(mutex_);
            if (!is_current(asset_id, generation)) return;
            entries_[asset_id].state = AssetState::planning;
        }

        logger()->info("{}: {} via {}", asset_id, to_string(plan->route), plan->url);

        DownloadMetadata meta;
        if (plan->discards_partial()) {
            if (auto ec = store_.layout().remove_segments(asset_id)) {
                handle_failure(asset_id, generation, ec, "cannot discard old segments");
                return;
            }

            meta.asset_id = asset_id;
            meta.origin_url = plan->url;
            meta.total_size = plan->probe->size;
            meta.chunk_size = config_.chunk_size;
            meta.final_extension = resolve_extension(plan->url, plan->probe->content_type,
                                                     config_.default_extension);
            if (auto ec = store_.save(meta)) {
                handle_failure(asset_id, generation, ec, "cannot write metadata");
                return;
            }
            reset_progress(asset_id);
        } else {
            auto reconciled = store_.reconcile_with_disk(asset_id);
            if (!reconciled) {
                handle_failure(asset_id, generation, reconciled.error(), "cannot reconcile partial data");
                return;
            }
            meta = std::move(*reconciled);

            bool dirty = false;
            if (meta.chunk_size == 0) {
                meta.chunk_size = config_.chunk_size;
                dirty = true;
            }
            if (meta.final_extension.empty()) {
                auto content_type = plan->probe ? plan->probe->content_type : std::string{};
                meta.final_extension = resolve_extension(meta.origin_url, content_type,
                                                         config_.default_extension);
                dirty = true;
            }
            if (dirty) {
                if (auto ec = store_.save(meta)) {
                    handle_failure(asset_id, generation, ec, "cannot write metadata");
                    return;
                }
            }
        }

        auto segment_plan = SegmentPlan::create(meta.total_size, meta.chunk_size);
        if (!segment_plan) {
            handle_failure(asset_id, generation, make_error_code(DownloadErrc::invalid_state),
                           std::format("unusable record: {} bytes in chunks of {}",
                                       meta.total_size, meta.chunk_size));
            return;
        }

        auto segment_count = segment_plan->segment_count();
        SchedulerCallbacks callbacks;
        callbacks.on_progress = [this, asset_id, generation](std::uint64_t completed, std::uint64_t total) {
            handle_progress(asset_id, generation, completed, total);
        };
        callbacks.on_finished = [this, asset_id, generation, segment_count, ext = meta.final_extension] {
            handle_finished(asset_id, generation, segment_count, ext);
        };
        callbacks.on_failed = [this, asset_id, generation](std::error_code ec, std::string detail) {
            handle_failure(asset_id, generation, ec, std::move(detail));
        };

        auto scheduler = std::make_unique<DownloadScheduler>(
            transport_, store_, config_,
            SchedulerJob{asset_id, meta.origin_url, *segment_plan, meta.finished_segments},
            std::move(callbacks));

        std::uint64_t completed = 0;
        {
            std::lock_guard lock(mutex_);
            if (!is_current(asset_id, generation) || stop.stop_requested()) return;

            auto& entry = entries_[asset_id];
            entry.state = AssetState::active;
            entry.scheduler = std::move(scheduler);
            entry.scheduler->start();
            completed = entry.scheduler->completed_bytes();
        }

        logger()->info("{}: {} segment(s), {} of {} bytes already on disk",
                       asset_id, segment_count, completed, meta.total_size);
        handle_progress(asset_id, generation, completed, meta.total_size);
    } catch (const std::exception& e) {
        handle_failure(asset_id, generation, make_error_code(DownloadErrc::invalid_state), e.what());
    }
}

//=============================================================================
// Scheduler events
//=============================================================================

void DownloadCoordinator::handle_progress(const std::string& asset_id, std::uint64_t generation,
                                          std::uint64_t completed, std::uint64_t total) noexcept {
    try {
        std::shared_ptr<ProgressChannel> ch;
        {
            std::lock_guard lock(mutex_);
            if (!is_current(asset_id, generation) || entries_[asset_id].state != AssetState::active) return;
            ch = channel(asset_id);
        }

        std::lock_guard p(ch->mutex);
        {
            // Re-check: the asset may have been cancelled while we waited
            std::lock_guard lock(mutex_);
            if (!is_current(asset_id, generation) || entries_[asset_id].state != AssetState::active) return;
        }

        double fraction = total > 0 ? static_cast<double>(completed) / static_cast<double>(total) : 0.0;
        fraction = std::clamp(fraction, ch->last_fraction, 1.0);
        ch->last_fraction = fraction;
        ch->last_received = std::max(ch->last_received, completed);

        observer_.on_progress(asset_id, ch->last_received, total, fraction);
    } catch (const std::exception& e) {
        logger()->error("{}: progress dispatch failed: {}", asset_id, e.what());
    }
}

void DownloadCoordinator::handle_finished(const std::string& asset_id, std::uint64_t generation,
                                          std::uint32_t segment_count, const std::string& extension) noexcept {
    try {
        {
            std::lock_guard lock(mutex_);
            if (!is_current(asset_id, generation)) return;
            entries_[asset_id].state = AssetState::assembling;
        }

        auto assembled = assembler_.assemble(asset_id, segment_count, extension);
        if (!assembled) {
            handle_failure(asset_id, generation, assembled.error().code, assembled.error().message());
            return;
        }

        std::shared_ptr<ProgressChannel> ch;
        {
            std::lock_guard lock(mutex_);
            if (!is_current(asset_id, generation)) return;
            ch = channel(asset_id);
        }

        {
            std::lock_guard p(ch->mutex);
            std::uint64_t total = 0;
            {
                std::lock_guard lock(mutex_);
                if (!is_current(asset_id, generation)) return;
                auto& entry = entries_[asset_id];
                entry.state = AssetState::completed;
                if (entry.scheduler) {
                    total = entry.scheduler->total_bytes();
                }
                retire(entry);
                deactivate(entry);
            }

            observer_.on_progress(asset_id, total, total, 1.0);
            ch->last_fraction = 0.0;
            ch->last_received = 0;
        }

        observer_.on_complete(asset_id, *assembled);
    } catch (const std::exception& e) {
        handle_failure(asset_id, generation, make_error_code(DownloadErrc::invalid_state), e.what());
    }
}

void DownloadCoordinator::handle_failure(const std::string& asset_id, std::uint64_t generation,
                                         std::error_code ec, std::string detail) noexcept {
    {
        std::lock_guard lock(mutex_);
        if (!is_current(asset_id, generation)) return;

        auto& entry = entries_[asset_id];
        if (entry.state == AssetState::failed) return;
        entry.state = AssetState::failed;
        retire(entry);
        deactivate(entry);
    }

    reset_progress(asset_id);
    logger()->error("{}: failed: {} ({})", asset_id, ec.message(), detail);

    try {
        observer_.on_fail(asset_id, ec, detail);
    } catch (const std::exception& e) {
        logger()->error("{}: failure dispatch failed: {}", asset_id, e.what());
    }
}

//=============================================================================
// Registry helpers
//=============================================================================

bool DownloadCoordinator::is_current(const std::string& asset_id, std::uint64_t generation) const noexcept {
    auto it = entries_.find(asset_id);
    return it != entries_.end() && it->second.generation == generation;
}

void DownloadCoordinator::retire(Entry& entry) noexcept {
    if (entry.job.joinable()) {
        entry.job.request_stop();
        retired_jobs_.push_back(std::move(entry.job));
    }
    if (entry.scheduler) {
        entry.scheduler->cancel();
        retired_schedulers_.push_back(std::move(entry.scheduler));
    }
}

void DownloadCoordinator::activate(Entry& entry) noexcept {
    if (entry.counted) return;
    entry.counted = true;
    if (active_count_++ == 0 && background_) {
        background_->begin_background_work();
    }
}

void DownloadCoordinator::deactivate(Entry& entry) noexcept {
    if (!entry.counted) return;
    entry.counted = false;
    if (--active_count_ == 0 && background_) {
        background_->end_background_work();
    }
}

std::shared_ptr<DownloadCoordinator::ProgressChannel> DownloadCoordinator::channel(const std::string& asset_id) {
    auto& ch = channels_[asset_id];
    if (!ch) {
        ch = std::make_shared<ProgressChannel>();
    }
    return ch;
}

void DownloadCoordinator::reap() noexcept {
    std::vector<std::jthread> jobs;
    std::vector<std::unique_ptr<DownloadScheduler>> schedulers;
    {
        std::lock_guard lock(mutex_);
        auto self = std::this_thread::get_id();

        auto job_split = std::stable_partition(retired_jobs_.begin(), retired_jobs_.end(),
                                               [self](const std::jthread& t) { return t.get_id() == self; });
        std::move(job_split, retired_jobs_.end(), std::back_inserter(jobs));
        retired_jobs_.erase(job_split, retired_jobs_.end());

        auto sched_split = std::stable_partition(retired_schedulers_.begin(), retired_schedulers_.end(),
                                                 [](const auto& s) { return s->runs_on_current_thread(); });
        std::move(sched_split, retired_schedulers_.end(), std::back_inserter(schedulers));
        retired_schedulers_.erase(sched_split, retired_schedulers_.end());
    }

    // Joined outside the lock: lanes may be waiting for it
    for (auto& s : schedulers) {
        s->join();
    }
    for (auto& t : jobs) {
        t.join();
    }
}

void DownloadCoordinator::reset_progress(const std::string& asset_id) noexcept {
    try {
        std::shared_ptr<ProgressChannel> ch;
        {
            std::lock_guard lock(mutex_);
            ch = channel(asset_id);
        }
        std::lock_guard p(ch->mutex);
        ch->last_fraction = 0.0;
        ch->last_received = 0;
    } catch (const std::exception& e) {
        logger()->warn("{}: cannot reset progress: {}", asset_id, e.what());
    }
}

} // namespace clipfetch::core
