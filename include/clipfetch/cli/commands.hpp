// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/core/config.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace clipfetch::cli {

// CLI result: process exit code, or the error that stopped the command
using CliResult = std::expected<int, std::error_code>;

// Exit code after Ctrl-C paused a download
constexpr int EXIT_PAUSED = 130;

enum class Command {
    download,   // <asset-id> <url>
    info,       // --info <url>
    remove,     // --remove <asset-id>
    status,     // --status <asset-id>
    wipe,       // --wipe
};

// Command line arguments
struct CliArgs {
    Command command{Command::download};
    std::string asset_id;
    std::string url;

    std::string storage_dir;
    std::string config_file;
    std::optional<std::uint64_t> chunk_size;
    std::optional<std::uint32_t> concurrency;
    std::optional<std::uint32_t> retries;
    std::optional<std::string> origin_a;
    std::optional<std::string> origin_b;

    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};

    std::string error;   // set when the command line is unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Config file (if any), then command line overrides, then validation
[[nodiscard]] std::expected<core::EngineConfig, std::error_code> build_config(const CliArgs& args) noexcept;

// Download or resume one asset with a progress bar; Ctrl-C pauses
[[nodiscard]] CliResult download(const CliArgs& args) noexcept;

// Probe a URL without downloading
[[nodiscard]] CliResult info(const CliArgs& args) noexcept;

// Delete everything stored for one asset
[[nodiscard]] CliResult remove(const CliArgs& args) noexcept;

// Print what is stored for one asset
[[nodiscard]] CliResult status(const CliArgs& args) noexcept;

// Delete everything under the storage root
[[nodiscard]] CliResult wipe(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace clipfetch::cli
