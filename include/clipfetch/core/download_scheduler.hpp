// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/core/config.hpp>
#include <clipfetch/core/download_meta.hpp>
#include <clipfetch/core/http_transport.hpp>
#include <clipfetch/core/segment_fetcher.hpp>
#include <clipfetch/core/segment_plan.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace clipfetch::core {

// What one scheduler run downloads
struct SchedulerJob {
    std::string asset_id;
    std::string url;                          // asset URL as stored in metadata
    SegmentPlan plan;
    std::set<std::uint32_t> finished;         // already on disk
};

// Invoked from worker lanes, never while the scheduler lock is held
struct SchedulerCallbacks {
    std::function<void(std::uint64_t completed_bytes, std::uint64_t total_bytes)> on_progress;
    std::function<void()> on_finished;        // every segment is on disk
    std::function<void(std::error_code, std::string detail)> on_failed;
};

// In-memory state of one active asset. Ephemeral; rebuilt from metadata on resume.
struct SegmentContext {
    std::deque<std::uint32_t> pending;
    std::set<std::uint32_t> in_flight;
    std::map<std::uint32_t, std::uint32_t> retry_count;
    std::uint64_t completed_bytes{0};

    using Clock = std::chrono::steady_clock;
    std::vector<std::pair<Clock::time_point, std::uint32_t>> delayed;   // retries waiting out their delay
};

// Bounded-concurrency segment pool for one asset. Runs max_concurrent_segments
// worker lanes; each lane takes the next pending index as soon as its previous
// fetch resolves. A failed segment goes back to the front of the queue after
// retry_delay; one failure too many fails the asset and stops every lane.
class DownloadScheduler {
public:
    DownloadScheduler(HttpTransport& transport,
                      MetadataStore& store,
                      const EngineConfig& config,
                      SchedulerJob job,
                      SchedulerCallbacks callbacks);

    // Requests stop and joins the lanes; must not run on a lane
    ~DownloadScheduler();

    DownloadScheduler(const DownloadScheduler&) = delete;
    DownloadScheduler& operator=(const DownloadScheduler&) = delete;

    // Launch the worker lanes
    void start();

    // Ask every lane to stop; in-flight requests observe it and return early.
    // On return no further segment of this job is committed to disk or metadata.
    void cancel() noexcept;

    // Wait for every lane to exit
    void join() noexcept;

    // True when called from one of this scheduler's lanes
    [[nodiscard]] bool runs_on_current_thread() const noexcept;

    // Origin the segment is requested from: even indices origin A, odd origin B
    [[nodiscard]] const std::string& url_for(std::uint32_t index) const noexcept;

    [[nodiscard]] std::uint64_t completed_bytes() const noexcept;
    [[nodiscard]] std::uint64_t total_bytes() const noexcept { return job_.plan.total_size(); }
    [[nodiscard]] const std::string& asset_id() const noexcept { return job_.asset_id; }

private:
    void lane(std::stop_token stop) noexcept;

    // Wait for a runnable index; nullopt once the lane should exit.
    // Sets `report_finished` for the one lane that observes the last segment done.
    [[nodiscard]] std::optional<std::uint32_t> next_index(std::stop_token stop, bool& report_finished);

    // Move retries whose delay has elapsed to the front of the queue
    void promote_due_retries(SegmentContext::Clock::time_point now);

    [[nodiscard]] bool all_done() const noexcept {
        return context_.pending.empty() && context_.in_flight.empty() && context_.delayed.empty();
    }

    // Move the fetched temp file into its slot and record it in metadata.
    // Fails with cancelled once stop is requested.
    [[nodiscard]] std::error_code commit_segment(std::uint32_t index, const std::stop_token& stop);
    void on_segment_done(std::uint32_t index, std::uint64_t bytes);
    void on_segment_failed(std::uint32_t index, std::error_code ec);
    void fail(std::error_code ec, std::string detail);

    MetadataStore& store_;
    SegmentFetcher fetcher_;
    SchedulerJob job_;
    SchedulerCallbacks callbacks_;

    std::uint32_t max_concurrent_;
    std::uint32_t max_retries_;
    std::chrono::milliseconds retry_delay_;
    std::string url_even_;
    std::string url_odd_;

    mutable std::mutex mutex_;
    std::mutex commit_mutex_;                 // serializes commits against cancel()
    std::condition_variable_any cv_;
    SegmentContext context_;
    bool finished_{false};                    // completion or failure already reported
    std::stop_source stop_source_;
    std::vector<std::jthread> lanes_;
    std::vector<std::thread::id> lane_ids_;
};

} // namespace clipfetch::core
