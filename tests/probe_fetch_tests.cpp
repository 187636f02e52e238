// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <clipfetch/core/segment_fetcher.hpp>
#include <clipfetch/core/size_probe.hpp>
#include "test_support.hpp"

using namespace clipfetch::core;
using namespace clipfetch::test;

namespace {
constexpr const char* CLIP = "https://cdn.example.com/clip.mp4";
}

TEST_CASE("SizeProbe reads Content-Length", "[probe]") {
    FakeTransport transport;
    SizeProbe probe(transport);

    SECTION("200 with length") {
        transport.serve(CLIP, "0123456789");
        auto result = probe.probe(CLIP);
        REQUIRE(result.has_value());
        CHECK(result->size == 10);
        CHECK(result->content_type == "video/mp4");
    }

    SECTION("206 is accepted too") {
        transport.serve(CLIP, "0123456789").head_status = 206;
        auto result = probe.probe(CLIP);
        REQUIRE(result.has_value());
        CHECK(result->size == 10);
    }

    SECTION("Declared length is taken at face value") {
        transport.serve(CLIP, "").declared_length = 5'000'000;
        auto result = probe.probe(CLIP);
        REQUIRE(result.has_value());
        CHECK(result->size == 5'000'000);
    }
}

TEST_CASE("SizeProbe failures", "[probe]") {
    FakeTransport transport;
    SizeProbe probe(transport);

    SECTION("Unknown resource is 404") {
        auto result = probe.probe(CLIP);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == DownloadErrc::not_found);
    }

    SECTION("5xx") {
        transport.serve(CLIP, "0123456789").head_status = 503;
        auto result = probe.probe(CLIP);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == DownloadErrc::server_error);
    }

    SECTION("Other statuses") {
        transport.serve(CLIP, "0123456789").head_status = 302;
        CHECK(probe.probe(CLIP).error() == DownloadErrc::bad_status);
    }

    SECTION("No Content-Length") {
        transport.serve(CLIP, "0123456789").omit_length = true;
        auto result = probe.probe(CLIP);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == DownloadErrc::missing_length);
    }

    SECTION("Zero Content-Length") {
        transport.serve(CLIP, "");
        CHECK(probe.probe(CLIP).error() == DownloadErrc::missing_length);
    }

    SECTION("Transport error passes through") {
        transport.make_unreachable(CLIP);
        CHECK(probe.probe(CLIP).error() == DownloadErrc::refused);
    }

    SECTION("Malformed URL never reaches the transport") {
        CHECK(probe.probe("cdn.example.com/clip.mp4").error() == DownloadErrc::invalid_url);
        CHECK(transport.head_count() == 0);
    }
}

TEST_CASE("SegmentFetcher writes exactly one range", "[fetch]") {
    TempDir dir;
    FakeTransport transport;
    SegmentFetcher fetcher(transport);
    auto dest = dir.path() / "clip_part1.seg.partial";

    SECTION("206 with the requested bytes") {
        transport.serve(CLIP, "0123456789");
        auto result = fetcher.fetch(CLIP, ByteRange{4, 7}, dest);
        REQUIRE(result.has_value());
        CHECK(*result == 4);
        CHECK(read_file(dest) == "4567");
    }

    SECTION("200 is fine when the body matches the range") {
        transport.serve(CLIP, "0123456789").get_status = 200;
        auto result = fetcher.fetch(CLIP, ByteRange{8, 9}, dest);
        REQUIRE(result.has_value());
        CHECK(read_file(dest) == "89");
    }

    SECTION("Whole resource instead of the range") {
        auto& r = transport.serve(CLIP, "0123456789");
        r.get_status = 200;
        r.ignore_range = true;
        auto result = fetcher.fetch(CLIP, ByteRange{4, 7}, dest);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == DownloadErrc::invalid_range);
        CHECK_FALSE(fs::exists(dest));
    }

    SECTION("Range not satisfiable") {
        transport.serve(CLIP, "0123456789").get_status = 416;
        CHECK(fetcher.fetch(CLIP, ByteRange{0, 3}, dest).error() == DownloadErrc::invalid_range);
    }

    SECTION("Empty body") {
        transport.serve(CLIP, "0123456789");
        auto result = fetcher.fetch(CLIP, ByteRange{20, 23}, dest);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == DownloadErrc::empty_body);
        CHECK_FALSE(fs::exists(dest));
    }

    SECTION("Transport failure") {
        transport.serve(CLIP, "0123456789");
        transport.fail_range(0, 1);
        CHECK(fetcher.fetch(CLIP, ByteRange{0, 3}, dest).error() == DownloadErrc::timeout);
        // Only the next attempt was rigged to fail
        CHECK(fetcher.fetch(CLIP, ByteRange{0, 3}, dest).has_value());
    }

    SECTION("Stop requested before the request") {
        transport.serve(CLIP, "0123456789");
        transport.set_latency(std::chrono::milliseconds{50});
        std::stop_source source;
        source.request_stop();
        auto result = fetcher.fetch(CLIP, ByteRange{0, 3}, dest, source.get_token());
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == DownloadErrc::cancelled);
        CHECK_FALSE(fs::exists(dest));
    }
}
