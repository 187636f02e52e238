// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace clipfetch::core {

constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 500'000;                // 500 KB
constexpr std::uint32_t MAX_CONCURRENT_SEGMENTS = 5;
constexpr std::uint32_t MAX_RETRIES_PER_SEGMENT = 5;
constexpr std::chrono::milliseconds RETRY_DELAY{2000};

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t REQUEST_TIMEOUT_SEC = 180;

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::string_view DEFAULT_EXTENSION = "mp4";

// Tunables for one engine instance. Defaults mirror the constants above.
struct EngineConfig {
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t max_concurrent_segments{MAX_CONCURRENT_SEGMENTS};
    std::uint32_t max_retries_per_segment{MAX_RETRIES_PER_SEGMENT};
    std::chrono::milliseconds retry_delay{RETRY_DELAY};
    std::chrono::seconds request_timeout{REQUEST_TIMEOUT_SEC};
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};

    // Two mirrors of the same content, e.g. "https://cdn.example.com".
    // Even segments go to origin_a, odd segments to origin_b. Both empty
    // means every segment is requested from the asset URL itself.
    std::string origin_a;
    std::string origin_b;

    std::filesystem::path storage_root{"clipfetch-data"};
    std::string default_extension{DEFAULT_EXTENSION};

    [[nodiscard]] bool alternates_origins() const noexcept {
        return !origin_a.empty() && !origin_b.empty();
    }

    [[nodiscard]] std::error_code validate() const noexcept;
};

// Read an EngineConfig from a JSON file. Keys that are absent keep defaults.
[[nodiscard]] std::expected<EngineConfig, std::error_code>
load_engine_config(const std::filesystem::path& path) noexcept;

// Same as load_engine_config but from an in-memory JSON document
[[nodiscard]] std::expected<EngineConfig, std::error_code>
parse_engine_config(std::string_view json_text) noexcept;

} // namespace clipfetch::core
