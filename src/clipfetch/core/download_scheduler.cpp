// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/core/download_scheduler.hpp>
#include <clipfetch/core/log.hpp>
#include <clipfetch/core/url.hpp>
#include <clipfetch/disk/file_writer.hpp>
#include <algorithm>
#include <format>

namespace clipfetch::core {

//=============================================================================
// DownloadScheduler
//=============================================================================

DownloadScheduler::DownloadScheduler(HttpTransport& transport,
                                     MetadataStore& store,
                                     const EngineConfig& config,
                                     SchedulerJob job,
                                     SchedulerCallbacks callbacks)
    : store_(store)
    , fetcher_(transport)
    , job_(std::move(job))
    , callbacks_(std::move(callbacks))
    , max_concurrent_(std::max<std::uint32_t>(1, config.max_concurrent_segments))
    , max_retries_(config.max_retries_per_segment)
    , retry_delay_(config.retry_delay)
    , url_even_(job_.url)
    , url_odd_(job_.url) {
    if (!config.alternates_origins()) {
        return;
    }

    auto parsed = Url::parse(job_.url);
    if (!parsed) {
        logger()->warn("{}: cannot parse {}, origin alternation disabled", job_.asset_id, job_.url);
        return;
    }

    auto even = parsed->with_origin(config.origin_a);
    auto odd = parsed->with_origin(config.origin_b);
    if (even && odd) {
        url_even_ = even->full();
        url_odd_ = odd->full();
    } else {
        logger()->warn("{}: invalid origin pair, origin alternation disabled", job_.asset_id);
    }
}

DownloadScheduler::~DownloadScheduler() {
    cancel();
    join();
}

void DownloadScheduler::start() {
    std::lock_guard lock(mutex_);

    for (std::uint32_t i = 0; i < job_.plan.segment_count(); ++i) {
        if (job_.finished.contains(i)) {
            if (auto range = job_.plan.range_for(i)) {
                context_.completed_bytes += range->length();
            }
        } else {
            context_.pending.push_back(i);
        }
    }

    auto lane_count = std::clamp<std::size_t>(context_.pending.size(), 1, max_concurrent_);

    logger()->debug("{}: {} of {} segment(s) pending, {} lane(s)",
                    job_.asset_id, context_.pending.size(), job_.plan.segment_count(), lane_count);

    auto token = stop_source_.get_token();
    for (std::size_t i = 0; i < lane_count; ++i) {
        lanes_.emplace_back([this, token] { lane(token); });
        lane_ids_.push_back(lanes_.back().get_id());
    }
}

void DownloadScheduler::cancel() noexcept {
    stop_source_.request_stop();
    {
        // Wait out a commit already past its stop check; later ones see the stop
        std::lock_guard lock(commit_mutex_);
    }
    cv_.notify_all();
}

void DownloadScheduler::join() noexcept {
    std::vector<std::jthread> lanes;
    {
        std::lock_guard lock(mutex_);
        lanes.swap(lanes_);
    }

    for (auto& t : lanes) {
        if (!t.joinable()) continue;
        if (t.get_id() == std::this_thread::get_id()) {
            t.detach();
        } else {
            t.join();
        }
    }
}

bool DownloadScheduler::runs_on_current_thread() const noexcept {
    std::lock_guard lock(mutex_);
    return std::find(lane_ids_.begin(), lane_ids_.end(), std::this_thread::get_id()) != lane_ids_.end();
}

const std::string& DownloadScheduler::url_for(std::uint32_t index) const noexcept {
    return (index % 2 == 0) ? url_even_ : url_odd_;
}

std::uint64_t DownloadScheduler::completed_bytes() const noexcept {
    std::lock_guard lock(mutex_);
    return context_.completed_bytes;
}

//=============================================================================
// Worker lanes
//=============================================================================

void DownloadScheduler::lane(std::stop_token stop) noexcept {
    try {
        bool report_finished = false;
        while (auto index = next_index(stop, report_finished)) {
            auto temp = store_.layout().partial_segment_path(job_.asset_id, *index);
            auto range = job_.plan.range_for(*index);

            std::expected<std::uint64_t, std::error_code> result;
            if (range) {
                result = fetcher_.fetch(url_for(*index), *range, temp, stop);
            } else {
                result = std::unexpected(range.error());
            }

            std::error_code ec = result ? commit_segment(*index, stop) : result.error();

            if (stop.stop_requested()) {
                // Torn down while in flight: the result is not applied
                std::error_code ignored;
                std::filesystem::remove(temp, ignored);
                std::lock_guard lock(mutex_);
                context_.in_flight.erase(*index);
                return;
            }

            if (ec) {
                on_segment_failed(*index, ec);
            } else {
                on_segment_done(*index, *result);
            }
        }

        if (report_finished && callbacks_.on_finished) {
            callbacks_.on_finished();
        }
    } catch (const std::exception& e) {
        logger()->error("{}: worker lane failed: {}", job_.asset_id, e.what());
        fail(make_error_code(DownloadErrc::network_error), e.what());
    }
}

std::optional<std::uint32_t> DownloadScheduler::next_index(std::stop_token stop, bool& report_finished) {
    std::unique_lock lock(mutex_);

    auto runnable = [this] {
        return finished_ || !context_.pending.empty() || !context_.delayed.empty() || all_done();
    };
    auto ready = [this] {
        return finished_ || !context_.pending.empty() || all_done();
    };

    for (;;) {
        if (stop.stop_requested() || finished_) {
            return std::nullopt;
        }

        promote_due_retries(SegmentContext::Clock::now());

        if (!context_.pending.empty()) {
            auto index = context_.pending.front();
            context_.pending.pop_front();
            context_.in_flight.insert(index);
            return index;
        }

        if (all_done()) {
            finished_ = true;
            report_finished = true;
            cv_.notify_all();
            return std::nullopt;
        }

        if (!context_.delayed.empty()) {
            auto earliest = std::min_element(context_.delayed.begin(), context_.delayed.end())->first;
            cv_.wait_until(lock, stop, earliest, ready);
        } else {
            // Other lanes still have fetches in flight
            cv_.wait(lock, stop, runnable);
        }
    }
}

void DownloadScheduler::promote_due_retries(SegmentContext::Clock::time_point now) {
    auto& delayed = context_.delayed;
    auto due_end = std::partition(delayed.begin(), delayed.end(),
                                  [now](const auto& entry) { return entry.first <= now; });
    if (due_end == delayed.begin()) {
        return;
    }

    std::sort(delayed.begin(), due_end);
    // Earliest-due retry ends up at the very front
    for (auto it = std::make_reverse_iterator(due_end); it != delayed.rend(); ++it) {
        context_.pending.push_front(it->second);
    }
    delayed.erase(delayed.begin(), due_end);
}

std::error_code DownloadScheduler::commit_segment(std::uint32_t index, const std::stop_token& stop) {
    const auto& layout = store_.layout();
    auto temp = layout.partial_segment_path(job_.asset_id, index);

    std::lock_guard lock(commit_mutex_);
    if (stop.stop_requested()) {
        return make_error_code(DownloadErrc::cancelled);
    }

    if (auto ec = disk::rename_file(temp, layout.segment_path(job_.asset_id, index))) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return ec;
    }
    return store_.mark_finished(job_.asset_id, index);
}

void DownloadScheduler::on_segment_done(std::uint32_t index, std::uint64_t bytes) {
    std::uint64_t completed = 0;
    {
        std::lock_guard lock(mutex_);
        context_.in_flight.erase(index);
        context_.retry_count.erase(index);
        context_.completed_bytes += bytes;
        completed = context_.completed_bytes;
        cv_.notify_all();
    }

    logger()->trace("{}: segment {} done ({} bytes)", job_.asset_id, index, bytes);
    if (callbacks_.on_progress) {
        callbacks_.on_progress(completed, job_.plan.total_size());
    }
}

void DownloadScheduler::on_segment_failed(std::uint32_t index, std::error_code ec) {
    std::string detail;
    {
        std::lock_guard lock(mutex_);
        context_.in_flight.erase(index);
        if (finished_) {
            return;
        }

        auto attempts = ++context_.retry_count[index];
        if (attempts <= max_retries_) {
            logger()->warn("{}: segment {} failed ({}), retry {}/{} in {}ms",
                           job_.asset_id, index, ec.message(), attempts, max_retries_,
                           retry_delay_.count());
            context_.delayed.emplace_back(SegmentContext::Clock::now() + retry_delay_, index);
            cv_.notify_all();
            return;
        }

        detail = std::format("segment {}: {}", index, ec.message());
    }

    fail(make_error_code(DownloadErrc::retries_exhausted), std::move(detail));
}

void DownloadScheduler::fail(std::error_code ec, std::string detail) {
    {
        std::lock_guard lock(mutex_);
        if (finished_) {
            return;
        }
        finished_ = true;
    }

    // Siblings still in flight observe the stop and discard their results
    stop_source_.request_stop();
    cv_.notify_all();

    logger()->error("{}: {} ({})", job_.asset_id, ec.message(), detail);
    if (callbacks_.on_failed) {
        callbacks_.on_failed(ec, std::move(detail));
    }
}

} // namespace clipfetch::core
