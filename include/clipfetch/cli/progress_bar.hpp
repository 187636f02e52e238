// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace clipfetch::cli {

// Minimal progress bar for CLI
class ProgressBar {
public:
    ProgressBar(std::uint64_t total, std::string_view label = {});

    // Redraw for `current` of total bytes; speed is measured from the first update
    void update(std::uint64_t current) noexcept;

    // Draw 100% and end the line
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] std::string render_bar(double percent) const;
    void draw(std::uint64_t current, double percent);

    using Clock = std::chrono::steady_clock;

    std::uint64_t total_{0};
    std::uint64_t first_value_{0};
    int last_percent_{-1};
    bool started_{false};
    bool finished_{false};
    Clock::time_point start_time_;
    std::string label_;
};

} // namespace clipfetch::cli
