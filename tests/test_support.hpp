// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/core/download_coordinator.hpp>
#include <clipfetch/core/http_transport.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace clipfetch::test {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// Unique scratch directory, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("clipfetch-test-" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
};

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline void write_file(const fs::path& path, std::string_view data) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

// Deterministic pseudo-random payload
inline std::string make_payload(std::size_t size, unsigned seed = 7) {
    std::mt19937 rng(seed);
    std::string data(size, '\0');
    for (auto& c : data) {
        c = static_cast<char>(rng() & 0xff);
    }
    return data;
}

// In-memory HTTP server. Thread-safe.
class FakeTransport final : public core::HttpTransport {
public:
    struct Resource {
        std::string body;
        std::string content_type{"video/mp4"};
        std::int32_t head_status{200};
        std::int32_t get_status{206};
        std::optional<std::uint64_t> declared_length;   // overrides body.size() on HEAD
        bool omit_length{false};
        bool ignore_range{false};                       // answer GET with the whole body
    };

    Resource& serve(const std::string& url, std::string body, std::string content_type = "video/mp4") {
        std::lock_guard lock(mutex_);
        auto& r = resources_[url];
        r.body = std::move(body);
        r.content_type = std::move(content_type);
        unreachable_.erase(url);
        return r;
    }

    // Requests to `url` fail at the transport level
    void make_unreachable(const std::string& url) {
        std::lock_guard lock(mutex_);
        unreachable_.insert(url);
    }

    // The next `count` GETs of the range starting at `first` fail with `ec`
    void fail_range(std::uint64_t first, int count,
                    std::error_code ec = core::make_error_code(core::DownloadErrc::timeout)) {
        std::lock_guard lock(mutex_);
        failures_[first] = {count, ec};
    }

    void set_latency(std::chrono::milliseconds latency) {
        std::lock_guard lock(mutex_);
        latency_ = latency;
    }

    // Extra latency for the range starting at `first`
    void set_range_latency(std::uint64_t first, std::chrono::milliseconds latency) {
        std::lock_guard lock(mutex_);
        range_latency_[first] = latency;
    }

    [[nodiscard]] int peak_in_flight() const noexcept { return peak_.load(); }
    [[nodiscard]] int head_count() const noexcept { return heads_.load(); }
    [[nodiscard]] int get_count() const noexcept { return gets_.load(); }

    [[nodiscard]] std::vector<std::pair<std::string, core::ByteRange>> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    [[nodiscard]] int attempts_for(std::uint64_t first) const {
        std::lock_guard lock(mutex_);
        int n = 0;
        for (const auto& [url, range] : requests_) {
            if (range.first == first) ++n;
        }
        return n;
    }

    std::expected<core::HttpResponse, std::error_code>
    head(const std::string& url, std::stop_token stop) noexcept override {
        ++heads_;
        std::lock_guard lock(mutex_);
        if (stop.stop_requested()) {
            return std::unexpected(core::make_error_code(core::DownloadErrc::cancelled));
        }
        if (unreachable_.contains(url)) {
            return std::unexpected(core::make_error_code(core::DownloadErrc::refused));
        }

        core::HttpResponse response;
        auto it = resources_.find(url);
        if (it == resources_.end()) {
            response.status_code = 404;
            return response;
        }

        const auto& r = it->second;
        response.status_code = r.head_status;
        response.content_type = r.content_type;
        if (!r.omit_length) {
            response.content_length = r.declared_length.value_or(r.body.size());
        }
        return response;
    }

    std::expected<core::HttpResponse, std::error_code>
    get(const std::string& url, const core::ByteRange& range, std::stop_token stop) noexcept override {
        ++gets_;
        int now = ++in_flight_;
        int peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {}

        auto result = serve_get(url, range, stop);
        --in_flight_;
        return result;
    }

private:
    std::expected<core::HttpResponse, std::error_code>
    serve_get(const std::string& url, const core::ByteRange& range, std::stop_token stop) {
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard lock(mutex_);
            requests_.emplace_back(url, range);
            delay = latency_;
            if (auto it = range_latency_.find(range.first); it != range_latency_.end()) {
                delay += it->second;
            }
        }

        if (delay.count() > 0) {
            std::mutex m;
            std::condition_variable_any cv;
            std::unique_lock lock(m);
            cv.wait_for(lock, stop, delay, [] { return false; });
        }
        if (stop.stop_requested()) {
            return std::unexpected(core::make_error_code(core::DownloadErrc::cancelled));
        }

        std::lock_guard lock(mutex_);
        if (unreachable_.contains(url)) {
            return std::unexpected(core::make_error_code(core::DownloadErrc::refused));
        }

        if (auto it = failures_.find(range.first); it != failures_.end() && it->second.first != 0) {
            if (it->second.first > 0) --it->second.first;
            return std::unexpected(it->second.second);
        }

        core::HttpResponse response;
        auto it = resources_.find(url);
        if (it == resources_.end()) {
            response.status_code = 404;
            return response;
        }

        const auto& r = it->second;
        response.status_code = r.get_status;
        response.content_type = r.content_type;
        if (r.ignore_range) {
            response.body = r.body;
        } else if (range.first < r.body.size()) {
            auto last = std::min<std::uint64_t>(range.last, r.body.size() - 1);
            response.body = r.body.substr(range.first, last - range.first + 1);
        }
        response.content_length = response.body.size();
        return response;
    }

    mutable std::mutex mutex_;
    std::map<std::string, Resource> resources_;
    std::set<std::string> unreachable_;
    std::map<std::uint64_t, std::pair<int, std::error_code>> failures_;   // count < 0: forever
    std::map<std::uint64_t, std::chrono::milliseconds> range_latency_;
    std::chrono::milliseconds latency_{0};
    std::vector<std::pair<std::string, core::ByteRange>> requests_;

    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_{0};
    std::atomic<int> heads_{0};
    std::atomic<int> gets_{0};
};

// Records every observer event for assertions on the test thread
class RecordingObserver final : public core::DownloadObserver {
public:
    struct Progress {
        std::string asset_id;
        std::uint64_t received;
        std::uint64_t total;
        double fraction;
    };

    void on_progress(const std::string& asset_id, std::uint64_t received,
                     std::uint64_t total, double fraction) override {
        std::lock_guard lock(mutex_);
        progress_.push_back({asset_id, received, total, fraction});
        cv_.notify_all();
    }

    void on_complete(const std::string& asset_id, const std::filesystem::path& file) override {
        std::lock_guard lock(mutex_);
        completed_[asset_id] = file;
        cv_.notify_all();
    }

    void on_fail(const std::string& asset_id, std::error_code error, const std::string& detail) override {
        std::lock_guard lock(mutex_);
        failed_[asset_id] = {error, detail};
        cv_.notify_all();
    }

    // Completed or failed within `timeout`
    bool wait_done(const std::string& asset_id, std::chrono::milliseconds timeout = 10s) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            return completed_.contains(asset_id) || failed_.contains(asset_id);
        });
    }

    // Some progress event for the asset reached `fraction`
    bool wait_fraction(const std::string& asset_id, double fraction, std::chrono::milliseconds timeout = 10s) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            for (const auto& p : progress_) {
                if (p.asset_id == asset_id && p.fraction >= fraction) return true;
            }
            return false;
        });
    }

    [[nodiscard]] std::vector<Progress> progress(const std::string& asset_id) const {
        std::lock_guard lock(mutex_);
        std::vector<Progress> result;
        for (const auto& p : progress_) {
            if (p.asset_id == asset_id) result.push_back(p);
        }
        return result;
    }

    [[nodiscard]] std::optional<std::filesystem::path> completed(const std::string& asset_id) const {
        std::lock_guard lock(mutex_);
        auto it = completed_.find(asset_id);
        if (it == completed_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] std::optional<std::pair<std::error_code, std::string>> failed(const std::string& asset_id) const {
        std::lock_guard lock(mutex_);
        auto it = failed_.find(asset_id);
        if (it == failed_.end()) return std::nullopt;
        return it->second;
    }

    void reset() {
        std::lock_guard lock(mutex_);
        progress_.clear();
        completed_.clear();
        failed_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Progress> progress_;
    std::map<std::string, std::filesystem::path> completed_;
    std::map<std::string, std::pair<std::error_code, std::string>> failed_;
};

class CountingBackgroundWork final : public core::BackgroundWork {
public:
    void begin_background_work() override { ++begins; }
    void end_background_work() override { ++ends; }

    std::atomic<int> begins{0};
    std::atomic<int> ends{0};
};

// Small chunks, fast retries, storage under `root`
inline core::EngineConfig test_config(const fs::path& root, std::uint64_t chunk_size = 4) {
    core::EngineConfig config;
    config.storage_root = root;
    config.chunk_size = chunk_size;
    config.retry_delay = 10ms;
    return config;
}

// Poll `pred` until it holds or `timeout` expires
inline bool eventually(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 10s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace clipfetch::test
