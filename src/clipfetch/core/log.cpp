// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/core/log.hpp>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <vector>

namespace clipfetch::core {

namespace {

constexpr const char* LOGGER_NAME = "clipfetch";
constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] [%t] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> current_logger;

std::shared_ptr<spdlog::logger> make_default_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern(CONSOLE_PATTERN);
    auto lg = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
    lg->set_level(spdlog::level::info);
    return lg;
}

} // namespace

void init_logging(const LogConfig& config) noexcept {
    std::vector<spdlog::sink_ptr> sinks;

    try {
        if (config.console) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_pattern(CONSOLE_PATTERN);
            sinks.push_back(std::move(console));
        }

        if (!config.file.empty()) {
            if (config.file.has_parent_path()) {
                std::filesystem::create_directories(config.file.parent_path());
            }
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file.string(), config.max_file_size, config.max_files);
            file->set_pattern(FILE_PATTERN);
            sinks.push_back(std::move(file));
        }

        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }

        auto lg = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        lg->set_level(config.level);
        lg->flush_on(spdlog::level::warn);

        std::lock_guard<std::mutex> lock(logger_mutex);
        current_logger = std::move(lg);
    } catch (const std::exception& e) {
        // Keep whatever logger was installed before
        logger()->error("logging setup failed: {}", e.what());
    }
}

std::shared_ptr<spdlog::logger> logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!current_logger) {
        try {
            current_logger = make_default_logger();
        } catch (const std::exception&) {
            current_logger = std::make_shared<spdlog::logger>(
                LOGGER_NAME, std::make_shared<spdlog::sinks::null_sink_mt>());
        }
    }
    return current_logger;
}

} // namespace clipfetch::core
