// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>

namespace clipfetch::core {

struct LogConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    bool console{true};
    std::filesystem::path file;                     // empty = no file sink
    std::size_t max_file_size{10 * 1024 * 1024};    // 10 MB
    std::size_t max_files{3};
};

// Install the "clipfetch" logger. Safe to call more than once; the last call wins.
void init_logging(const LogConfig& config) noexcept;

// Engine logger. Falls back to a console logger at info level until init_logging runs.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger() noexcept;

} // namespace clipfetch::core
