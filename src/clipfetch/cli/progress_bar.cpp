// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace clipfetch::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current) noexcept {
    if (total_ == 0 || finished_) return;

    if (!started_) {
        // Bytes already on disk from an earlier run don't count towards speed
        started_ = true;
        first_value_ = current;
        start_time_ = Clock::now();
    }

    double percent = static_cast<double>(current) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    // Only redraw on whole-percent steps
    auto whole = static_cast<int>(percent);
    if (whole <= last_percent_) return;
    last_percent_ = whole;

    try {
        draw(current, percent);
    } catch (const std::exception&) {
        // Formatting failure only loses one frame
        last_percent_ = whole - 1;
    }
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    try {
        if (total_ > 0) {
            draw(total_, 100.0);
        }
        std::cout << std::endl;
    } catch (const std::exception&) {
        std::cout << std::endl;
    }
    finished_ = true;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

void ProgressBar::draw(std::uint64_t current, double percent) {
    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);
    line += std::format(" {:3d}% ({}/{})", static_cast<int>(percent),
                        format_bytes(current), format_bytes(total_));

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time_).count();
    if (elapsed > 0 && current > first_value_) {
        auto speed = (current - first_value_) * 1000 / static_cast<std::uint64_t>(elapsed);
        line += " @ ";
        line += format_speed(speed);

        if (speed > 0 && current < total_) {
            line += " ETA: ";
            line += format_time((total_ - current) / speed);
        }
    }

    // Clear rest of line
    line += std::string(10, ' ');
    std::cout << line << std::flush;
}

std::string ProgressBar::render_bar(double percent) const {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        bar += '>';
        bar.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    return format_bytes(bps) + "/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    auto value = static_cast<double>(bytes);
    if (bytes >= GB) return std::format("{:.2f} GB", value / GB);
    if (bytes >= MB) return std::format("{:.1f} MB", value / MB);
    if (bytes >= KB) return std::format("{:.0f} KB", value / KB);
    return std::format("{} B", bytes);
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) return std::format("{}h {:02}m {}s", hours, minutes, secs);
    if (minutes > 0) return std::format("{}m {}s", minutes, secs);
    return std::format("{}s", secs);
}

} // namespace clipfetch::cli
