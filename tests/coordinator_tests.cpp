// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <clipfetch/core/download_coordinator.hpp>
#include "test_support.hpp"

using namespace clipfetch::core;
using namespace clipfetch::test;
using clipfetch::disk::StorageLayout;

namespace {

constexpr const char* CLIP = "https://cdn.example.com/v/clip.mp4";

struct Engine {
    TempDir dir;
    FakeTransport transport;
    RecordingObserver observer;
    CountingBackgroundWork background;
    std::unique_ptr<DownloadCoordinator> coordinator;

    explicit Engine(std::uint64_t chunk_size = 4, std::function<void(EngineConfig&)> tweak = {}) {
        auto config = test_config(dir.path(), chunk_size);
        if (tweak) tweak(config);
        auto created = DownloadCoordinator::create(config, transport, observer, &background);
        REQUIRE(created.has_value());
        coordinator = std::move(*created);
    }

    [[nodiscard]] StorageLayout layout() const { return StorageLayout(dir.path()); }
};

bool fractions_non_decreasing(const std::vector<RecordingObserver::Progress>& events) {
    for (std::size_t i = 1; i < events.size(); ++i) {
        if (events[i].fraction < events[i - 1].fraction) return false;
        if (events[i].received < events[i - 1].received) return false;
    }
    return true;
}

} // namespace

TEST_CASE("Ten byte asset downloads in three segments", "[coordinator]") {
    Engine e;
    e.transport.serve(CLIP, "0123456789");

    REQUIRE_FALSE(e.coordinator->start_download("clip", CLIP));
    REQUIRE(e.observer.wait_done("clip"));

    auto file = e.observer.completed("clip");
    REQUIRE(file.has_value());
    CHECK(file->filename().string() == "clip.mp4");
    CHECK(read_file(*file) == "0123456789");

    CHECK(e.coordinator->state("clip") == AssetState::completed);
    CHECK_FALSE(e.coordinator->is_active("clip"));
    CHECK(e.coordinator->local_file_exists("clip"));
    CHECK(e.coordinator->local_file_path("clip").value_or("").string() == file->string());
    CHECK_FALSE(e.coordinator->has_partial_data("clip"));
    CHECK_FALSE(e.coordinator->metadata("clip").has_value());
    CHECK(e.layout().scan_segments("clip").empty());

    CHECK(e.transport.head_count() == 1);
    CHECK(e.transport.get_count() == 3);

    auto progress = e.observer.progress("clip");
    REQUIRE_FALSE(progress.empty());
    CHECK(fractions_non_decreasing(progress));
    CHECK(progress.back().fraction == 1.0);
    CHECK(progress.back().received == 10);
    CHECK(progress.back().total == 10);

    CHECK(e.background.begins == 1);
    CHECK(e.background.ends == 1);
}

TEST_CASE("Cancel keeps partial data and resume finishes it", "[coordinator]") {
    Engine e(4, [](EngineConfig& c) { c.max_concurrent_segments = 2; });
    auto payload = make_payload(4 * 40);
    e.transport.serve(CLIP, payload);
    e.transport.set_latency(20ms);

    REQUIRE_FALSE(e.coordinator->start_download("clip", CLIP));
    REQUIRE(e.observer.wait_fraction("clip", 0.2));
    e.coordinator->cancel_download("clip");

    CHECK(e.coordinator->state("clip") == AssetState::paused);
    CHECK_FALSE(e.coordinator->is_active("clip"));
    CHECK(e.coordinator->has_partial_data("clip"));
    CHECK_FALSE(e.coordinator->local_file_exists("clip"));
    CHECK(e.background.begins == 1);
    CHECK(e.background.ends == 1);

    // Nothing arrives after cancel returns
    auto events_at_cancel = e.observer.progress("clip").size();
    std::this_thread::sleep_for(100ms);
    CHECK(e.observer.progress("clip").size() == events_at_cancel);
    CHECK_FALSE(e.observer.completed("clip").has_value());
    CHECK_FALSE(e.observer.failed("clip").has_value());

    auto paused = e.coordinator->metadata("clip");
    REQUIRE(paused.has_value());
    auto done_before = paused->finished_segments;
    REQUIRE_FALSE(done_before.empty());
    CHECK(done_before.size() < 40);
    CHECK(fs::is_empty(e.layout().media_dir()));

    REQUIRE_FALSE(e.coordinator->resume_download("clip", CLIP));
    REQUIRE(e.observer.wait_done("clip"));

    auto file = e.observer.completed("clip");
    REQUIRE(file.has_value());
    CHECK(read_file(*file) == payload);

    // Finished segments were not fetched again, and the URL was not re-probed
    for (auto index : done_before) {
        CAPTURE(index);
        CHECK(e.transport.attempts_for(std::uint64_t{index} * 4) == 1);
    }
    CHECK(e.transport.head_count() == 1);
    CHECK(fractions_non_decreasing(e.observer.progress("clip")));
    CHECK(e.background.begins == 2);
    CHECK(e.background.ends == 2);

    SECTION("Same bytes as an uninterrupted download") {
        Engine straight;
        straight.transport.serve(CLIP, payload);
        REQUIRE_FALSE(straight.coordinator->start_download("clip", CLIP));
        REQUIRE(straight.observer.wait_done("clip"));
        auto other = straight.observer.completed("clip");
        REQUIRE(other.has_value());
        CHECK(read_file(*other) == read_file(*file));
    }
}

TEST_CASE("Segment that keeps failing fails the asset", "[coordinator]") {
    Engine e(4, [](EngineConfig& c) { c.max_retries_per_segment = 2; });
    e.transport.serve(CLIP, "0123456789");
    e.transport.fail_range(4, -1);

    REQUIRE_FALSE(e.coordinator->start_download("clip", CLIP));
    REQUIRE(e.observer.wait_done("clip"));

    auto failure = e.observer.failed("clip");
    REQUIRE(failure.has_value());
    CHECK(failure->first == DownloadErrc::retries_exhausted);
    CHECK_FALSE(e.observer.completed("clip").has_value());
    CHECK(e.transport.attempts_for(4) == 3);

    CHECK(e.coordinator->state("clip") == AssetState::failed);
    CHECK_FALSE(e.coordinator->is_active("clip"));
    CHECK_FALSE(e.coordinator->local_file_exists("clip"));
    CHECK(e.background.begins == e.background.ends);

    // Partial data survives for a later retry
    auto meta = e.coordinator->metadata("clip");
    REQUIRE(meta.has_value());
    CHECK_FALSE(meta->finished_segments.contains(1));

    SECTION("A later start recovers") {
        e.transport.fail_range(4, 0);
        e.observer.reset();
        REQUIRE_FALSE(e.coordinator->start_download("clip", CLIP));
        REQUIRE(e.observer.wait_done("clip"));
        REQUIRE(e.observer.completed("clip").has_value());
        CHECK(read_file(*e.observer.completed("clip")) == "0123456789");
    }
}

TEST_CASE("Probe failure is reported and leaves nothing behind", "[coordinator]") {
    Engine e;

    REQUIRE_FALSE(e.coordinator->start_download("clip", CLIP));
    REQUIRE(e.observer.wait_done("clip"));

    auto failure = e.observer.failed("clip");
    REQUIRE(failure.has_value());
    CHECK(failure->first == DownloadErrc::not_found);
    CHECK(e.coordinator->state("clip") == AssetState::failed);
    CHECK_FALSE(e.coordinator->metadata("clip").has_value());
    CHECK(e.transport.get_count() == 0);
    CHECK(e.background.ends == 1);
}

TEST_CASE("Invalid asset ids are rejected", "[coordinator]") {
    Engine e;
    CHECK(e.coordinator->start_download("", CLIP) == DownloadErrc::invalid_state);
    CHECK(e.coordinator->start_download("../clip", CLIP) == DownloadErrc::invalid_state);
    CHECK(e.coordinator->remove_download_completely("a/b") == DownloadErrc::invalid_state);
    CHECK(e.background.begins == 0);
}

TEST_CASE("Remove deletes everything for the asset", "[coordinator]") {
    Engine e;
    e.transport.serve(CLIP, make_payload(4 * 30));

    SECTION("After completion") {
        REQUIRE_FALSE(e.coordinator->start_download("clip", CLIP));
        REQUIRE(e.observer.wait_done("clip"));
        REQUIRE(e.coordinator->local_file_exists("clip"));

        REQUIRE_FALSE(e.coordinator->remove_download_completely("clip"));
        CHECK_FALSE(e.coordinator->local_file_exists("clip"));
        CHECK(e.coordinator->state("clip") == AssetState::idle);
    }

    SECTION("While downloading") {
        e.transport.set_latency(20ms);
        REQUIRE_FALSE(e.coordinator->start_download("clip", CLIP));
        REQUIRE(e.observer.wait_fraction("clip", 0.1));

        REQUIRE_FALSE(e.coordinator->remove_download_completely("clip"));
        CHECK_FALSE(e.coordinator->is_active("clip"));
        CHECK(e.coordinator->state("clip") == AssetState::idle);
        CHECK_FALSE(e.coordinator->metadata("clip").has_value());
        CHECK(e.layout().scan_segments("clip").empty());
        CHECK(fs::is_empty(e.layout().segments_dir()));
        CHECK(e.background.begins == e.background.ends);

        std::this_thread::sleep_for(100ms);
        CHECK_FALSE(e.observer.completed("clip").has_value());
        CHECK_FALSE(e.layout().find_media("clip").has_value());
    }

    SECTION("Unknown asset is a no-op") {
        CHECK_FALSE(e.coordinator->remove_download_completely("never-seen"));
    }
}

TEST_CASE("Stored records are reconciled on startup", "[coordinator]") {
    TempDir dir;
    StorageLayout layout(dir.path());
    {
        REQUIRE_FALSE(layout.ensure_directories());
        MetadataStore store(layout);
        DownloadMetadata meta;
        meta.asset_id = "clip";
        meta.origin_url = CLIP;
        meta.total_size = 10;
        meta.chunk_size = 4;
        meta.finished_segments = {0, 1, 2};
        meta.final_extension = "mp4";
        REQUIRE_FALSE(store.save(meta));
    }
    write_file(layout.segment_path("clip", 0), "0123");
    write_file(layout.segment_path("clip", 1), "45");           // torn write
    write_file(layout.partial_segment_path("clip", 2), "8");

    FakeTransport transport;
    transport.serve(CLIP, "0123456789");
    RecordingObserver observer;
    auto created = DownloadCoordinator::create(test_config(dir.path()), transport, observer);
    REQUIRE(created.has_value());
    auto& coordinator = **created;

    auto meta = coordinator.metadata("clip");
    REQUIRE(meta.has_value());
    CHECK(meta->finished_segments == std::set<std::uint32_t>{0});
    CHECK(coordinator.state("clip") == AssetState::paused);
    CHECK(coordinator.has_partial_data("clip"));
    CHECK_FALSE(coordinator.is_active("clip"));

    REQUIRE_FALSE(coordinator.start_download("clip", CLIP));
    REQUIRE(observer.wait_done("clip"));
    REQUIRE(observer.completed("clip").has_value());
    CHECK(read_file(*observer.completed("clip")) == "0123456789");
    CHECK(transport.get_count() == 2);
    CHECK(transport.attempts_for(0) == 0);

    // The first event already accounts for the segment on disk
    auto progress = observer.progress("clip");
    REQUIRE_FALSE(progress.empty());
    CHECK(progress.front().received >= 4);
}

TEST_CASE("Changed URL follows the size heuristic", "[coordinator]") {
    constexpr const char* NEW_CLIP = "https://cdn.example.com/v/clip.mp4?token=fresh";
    Engine e(4, [](EngineConfig& c) { c.max_concurrent_segments = 1; });
    auto old_payload = make_payload(4 * 10, 1);
    e.transport.serve(CLIP, old_payload);
    e.transport.set_range_latency(16, 5s);   // Stall at segment 4

    REQUIRE_FALSE(e.coordinator->start_download("clip", CLIP));
    REQUIRE(e.observer.wait_fraction("clip", 0.4));
    e.coordinator->cancel_download("clip");
    REQUIRE(e.coordinator->metadata("clip")->finished_segments == std::set<std::uint32_t>{0, 1, 2, 3});
    e.transport.set_range_latency(16, 0ms);

    SECTION("Small replacement switches") {
        auto new_payload = make_payload(12, 2);
        e.transport.serve(NEW_CLIP, new_payload);
        e.observer.reset();

        REQUIRE_FALSE(e.coordinator->start_download("clip", NEW_CLIP));
        REQUIRE(e.observer.wait_done("clip"));
        REQUIRE(e.observer.completed("clip").has_value());
        CHECK(read_file(*e.observer.completed("clip")) == new_payload);
    }

    SECTION("Large replacement continues the old target") {
        e.transport.serve(NEW_CLIP, make_payload(4 * 100, 2));
        e.observer.reset();

        REQUIRE_FALSE(e.coordinator->start_download("clip", NEW_CLIP));
        REQUIRE(e.observer.wait_done("clip"));
        REQUIRE(e.observer.completed("clip").has_value());
        CHECK(read_file(*e.observer.completed("clip")) == old_payload);
    }

    SECTION("Unreachable replacement falls back to the old URL") {
        e.transport.make_unreachable(NEW_CLIP);
        e.observer.reset();

        REQUIRE_FALSE(e.coordinator->start_download("clip", NEW_CLIP));
        REQUIRE(e.observer.wait_done("clip"));
        REQUIRE(e.observer.completed("clip").has_value());
        CHECK(read_file(*e.observer.completed("clip")) == old_payload);
    }
}

TEST_CASE("Independent assets download concurrently", "[coordinator]") {
    Engine e;
    auto a = make_payload(4 * 12, 3);
    auto b = make_payload(4 * 9 + 1, 4);
    e.transport.serve("https://cdn.example.com/a.mp4", a);
    e.transport.serve("https://cdn.example.com/b.webm", b, "video/webm");
    e.transport.set_latency(5ms);

    REQUIRE_FALSE(e.coordinator->start_download("a", "https://cdn.example.com/a.mp4"));
    REQUIRE_FALSE(e.coordinator->start_download("b", "https://cdn.example.com/b.webm"));
    REQUIRE(e.observer.wait_done("a"));
    REQUIRE(e.observer.wait_done("b"));

    CHECK(read_file(*e.observer.completed("a")) == a);
    CHECK(read_file(*e.observer.completed("b")) == b);
    CHECK(e.observer.completed("b")->filename().string() == "b.webm");
    CHECK(fractions_non_decreasing(e.observer.progress("a")));
    CHECK(fractions_non_decreasing(e.observer.progress("b")));
    CHECK(e.background.begins == e.background.ends);
}

TEST_CASE("Clear and wipe", "[coordinator]") {
    Engine e;
    e.transport.serve("https://cdn.example.com/done.mp4", "0123456789");
    e.transport.serve("https://cdn.example.com/slow.mp4", make_payload(4 * 50));
    e.transport.set_range_latency(20, 5s);

    REQUIRE_FALSE(e.coordinator->start_download("done", "https://cdn.example.com/done.mp4"));
    REQUIRE(e.observer.wait_done("done"));
    REQUIRE_FALSE(e.coordinator->start_download("slow", "https://cdn.example.com/slow.mp4"));
    REQUIRE(e.observer.wait_fraction("slow", 0.05));

    SECTION("Clear removes only what is running") {
        e.coordinator->clear_all_active_downloads();
        CHECK_FALSE(e.coordinator->is_active("slow"));
        CHECK_FALSE(e.coordinator->metadata("slow").has_value());
        CHECK(e.coordinator->local_file_exists("done"));
    }

    SECTION("Wipe removes everything") {
        REQUIRE_FALSE(e.coordinator->wipe_all_downloads());
        CHECK_FALSE(e.coordinator->is_active("slow"));
        CHECK(e.coordinator->state("slow") == AssetState::idle);
        CHECK(e.coordinator->state("done") == AssetState::idle);
        CHECK_FALSE(e.coordinator->local_file_exists("done"));
        CHECK(fs::is_empty(e.layout().segments_dir()));
        CHECK(fs::is_empty(e.layout().metadata_dir()));
        CHECK(fs::is_empty(e.layout().media_dir()));
    }

    CHECK(e.background.begins == e.background.ends);
}

TEST_CASE("Cancel of an idle asset does nothing", "[coordinator]") {
    Engine e;
    e.coordinator->cancel_download("clip");
    CHECK(e.coordinator->state("clip") == AssetState::idle);
    CHECK(e.background.begins == 0);
}
