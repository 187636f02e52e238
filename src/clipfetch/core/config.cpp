// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/core/config.hpp>
#include <clipfetch/core/error.hpp>
#include <clipfetch/core/log.hpp>
#include <clipfetch/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace clipfetch::core {

using json = nlohmann::json;

namespace {

// False when an unsigned field holds a negative, fractional or oversized number
template<typename T>
[[nodiscard]] bool read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return true;
    }
    if constexpr (std::is_unsigned_v<T>) {
        if (!it->is_number_unsigned() ||
            it->get<std::uint64_t>() > std::numeric_limits<T>::max()) {
            logger()->error("config: {} must be an integer in [0, {}]", key, std::numeric_limits<T>::max());
            return false;
        }
    }
    out = it->get<T>();
    return true;
}

std::expected<EngineConfig, std::error_code> from_json_document(const json& j) {
    if (!j.is_object()) {
        return std::unexpected(make_error_code(DownloadErrc::config_error));
    }

    EngineConfig cfg;
    try {
        std::int64_t retry_delay_ms = cfg.retry_delay.count();
        std::int64_t request_timeout_sec = cfg.request_timeout.count();
        std::int64_t connect_timeout_sec = cfg.connect_timeout.count();
        std::string root = cfg.storage_root.string();

        bool ok = read_key(j, "chunk_size", cfg.chunk_size) &&
                  read_key(j, "max_concurrent_segments", cfg.max_concurrent_segments) &&
                  read_key(j, "max_retries_per_segment", cfg.max_retries_per_segment) &&
                  read_key(j, "origin_a", cfg.origin_a) &&
                  read_key(j, "origin_b", cfg.origin_b) &&
                  read_key(j, "default_extension", cfg.default_extension) &&
                  read_key(j, "retry_delay_ms", retry_delay_ms) &&
                  read_key(j, "request_timeout_sec", request_timeout_sec) &&
                  read_key(j, "connect_timeout_sec", connect_timeout_sec) &&
                  read_key(j, "storage_root", root);
        if (!ok) {
            return std::unexpected(make_error_code(DownloadErrc::config_error));
        }

        cfg.retry_delay = std::chrono::milliseconds{retry_delay_ms};
        cfg.request_timeout = std::chrono::seconds{request_timeout_sec};
        cfg.connect_timeout = std::chrono::seconds{connect_timeout_sec};
        cfg.storage_root = root;
    } catch (const json::exception& e) {
        logger()->error("config: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::config_error));
    }

    if (auto ec = cfg.validate()) {
        return std::unexpected(ec);
    }
    return cfg;
}

} // namespace

std::error_code EngineConfig::validate() const noexcept {
    if (chunk_size == 0 || max_concurrent_segments == 0) {
        return make_error_code(DownloadErrc::config_error);
    }
    if (retry_delay.count() < 0 || request_timeout.count() <= 0 || connect_timeout.count() <= 0) {
        return make_error_code(DownloadErrc::config_error);
    }
    // Alternation needs both mirrors
    if (origin_a.empty() != origin_b.empty()) {
        return make_error_code(DownloadErrc::config_error);
    }
    if (storage_root.empty()) {
        return make_error_code(DownloadErrc::config_error);
    }
    // Media files are named "<asset>.<ext>"; the lookup needs a dot-free, non-empty suffix
    if (default_extension.empty() ||
        !std::all_of(default_extension.begin(), default_extension.end(),
                     [](unsigned char c) { return std::isalnum(c) != 0; })) {
        return make_error_code(DownloadErrc::config_error);
    }
    return {};
}

std::expected<EngineConfig, std::error_code>
parse_engine_config(std::string_view json_text) noexcept {
    try {
        return from_json_document(json::parse(json_text));
    } catch (const json::exception& e) {
        logger()->error("config: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::config_error));
    }
}

std::expected<EngineConfig, std::error_code>
load_engine_config(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        return parse_engine_config(buffer.str());
    } catch (const std::exception& e) {
        logger()->error("config {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace clipfetch::core
