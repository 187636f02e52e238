// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/cli/commands.hpp>
#include <clipfetch/cli/progress_bar.hpp>
#include <clipfetch/core/curl_transport.hpp>
#include <clipfetch/core/download_coordinator.hpp>
#include <clipfetch/core/log.hpp>
#include <clipfetch/core/size_probe.hpp>
#include <clipfetch/core/url_reconciler.hpp>
#include <clipfetch/version.hpp>
#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <vector>

using namespace clipfetch::core;

namespace chrono = std::chrono;

namespace clipfetch::cli {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) {
    g_interrupted = 1;
}

template<typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Waits for one asset to finish, drawing progress as it goes
class CliObserver final : public DownloadObserver {
public:
    explicit CliObserver(bool quiet) : quiet_(quiet), bar_(0, "Downloading") {}

    void on_progress(const std::string&, std::uint64_t received,
                     std::uint64_t total, double) override {
        std::lock_guard lock(mutex_);
        if (quiet_) return;
        bar_.total(total);
        bar_.update(received);
    }

    void on_complete(const std::string&, const std::filesystem::path& file) override {
        std::lock_guard lock(mutex_);
        if (!quiet_) bar_.finish();
        file_ = file;
        done_ = true;
        cv_.notify_all();
    }

    void on_fail(const std::string&, std::error_code error, const std::string& detail) override {
        std::lock_guard lock(mutex_);
        if (!quiet_) bar_.clear();
        error_ = error;
        detail_ = detail;
        done_ = true;
        cv_.notify_all();
    }

    // True once the asset completed or failed
    bool wait_for(chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return done_; });
    }

    void clear_line() {
        std::lock_guard lock(mutex_);
        if (!quiet_) bar_.clear();
    }

    [[nodiscard]] std::error_code error() const { std::lock_guard lock(mutex_); return error_; }
    [[nodiscard]] std::string detail() const { std::lock_guard lock(mutex_); return detail_; }
    [[nodiscard]] std::filesystem::path file() const { std::lock_guard lock(mutex_); return file_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool quiet_;
    ProgressBar bar_;
    bool done_{false};
    std::error_code error_;
    std::string detail_;
    std::filesystem::path file_;
};

TransportOptions transport_options(const EngineConfig& config) noexcept {
    TransportOptions options;
    options.connect_timeout = config.connect_timeout;
    options.request_timeout = config.request_timeout;
    return options;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;
    std::vector<std::string> positional;

    auto take_value = [&](int& i, std::string_view flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            args.error = std::format("{} needs a value", flag);
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-d" || arg == "--dir") {
            if (auto v = take_value(i, arg)) args.storage_dir = *v;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = take_value(i, arg)) args.config_file = *v;
        } else if (arg == "--chunk-size") {
            if (auto v = take_value(i, arg)) {
                args.chunk_size = parse_number<std::uint64_t>(*v);
                if (!args.chunk_size) args.error = std::format("invalid chunk size '{}'", *v);
            }
        } else if (arg == "--concurrency") {
            if (auto v = take_value(i, arg)) {
                args.concurrency = parse_number<std::uint32_t>(*v);
                if (!args.concurrency) args.error = std::format("invalid concurrency '{}'", *v);
            }
        } else if (arg == "--retries") {
            if (auto v = take_value(i, arg)) {
                args.retries = parse_number<std::uint32_t>(*v);
                if (!args.retries) args.error = std::format("invalid retry count '{}'", *v);
            }
        } else if (arg == "--origin-a") {
            if (auto v = take_value(i, arg)) args.origin_a = *v;
        } else if (arg == "--origin-b") {
            if (auto v = take_value(i, arg)) args.origin_b = *v;
        } else if (arg == "--info") {
            args.command = Command::info;
            if (auto v = take_value(i, arg)) args.url = *v;
        } else if (arg == "--remove") {
            args.command = Command::remove;
            if (auto v = take_value(i, arg)) args.asset_id = *v;
        } else if (arg == "--status") {
            args.command = Command::status;
            if (auto v = take_value(i, arg)) args.asset_id = *v;
        } else if (arg == "--wipe") {
            args.command = Command::wipe;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            args.error = std::format("unknown option '{}'", arg);
        } else {
            positional.push_back(std::move(arg));
        }
    }

    if (!args.error.empty()) {
        return args;
    }

    if (args.command == Command::download) {
        if (positional.size() != 2) {
            args.error = "expected <asset-id> <url>";
        } else {
            args.asset_id = positional[0];
            args.url = positional[1];
        }
    } else if (!positional.empty()) {
        args.error = std::format("unexpected argument '{}'", positional.front());
    }

    return args;
}

std::expected<EngineConfig, std::error_code> build_config(const CliArgs& args) noexcept {
    try {
        EngineConfig config;
        if (!args.config_file.empty()) {
            auto loaded = load_engine_config(args.config_file);
            if (!loaded) {
                return std::unexpected(loaded.error());
            }
            config = std::move(*loaded);
        }

        if (!args.storage_dir.empty()) config.storage_root = args.storage_dir;
        if (args.chunk_size) config.chunk_size = *args.chunk_size;
        if (args.concurrency) config.max_concurrent_segments = *args.concurrency;
        if (args.retries) config.max_retries_per_segment = *args.retries;
        if (args.origin_a) config.origin_a = *args.origin_a;
        if (args.origin_b) config.origin_b = *args.origin_b;

        if (auto ec = config.validate()) {
            return std::unexpected(ec);
        }
        return config;
    } catch (const std::exception& e) {
        logger()->error("config: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::config_error));
    }
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) noexcept {
    try {
        auto config = build_config(args);
        if (!config) {
            std::cerr << "Error: " << config.error().message() << std::endl;
            return std::unexpected(config.error());
        }

        CurlTransport transport(transport_options(*config));
        CliObserver observer(args.quiet);

        auto coordinator = DownloadCoordinator::create(*config, transport, observer);
        if (!coordinator) {
            std::cerr << "Error: " << coordinator.error().message() << std::endl;
            return std::unexpected(coordinator.error());
        }
        auto& engine = **coordinator;

        if (engine.local_file_exists(args.asset_id) && !engine.has_partial_data(args.asset_id)) {
            if (!args.quiet) {
                std::cout << "Already downloaded: " << engine.local_file_path(args.asset_id)->string() << std::endl;
            }
            return 0;
        }

        if (args.verbose && engine.has_partial_data(args.asset_id)) {
            std::cout << "Resuming " << args.asset_id << std::endl;
        }

        if (auto ec = engine.start_download(args.asset_id, args.url)) {
            std::cerr << "Error: " << ec.message() << std::endl;
            return std::unexpected(ec);
        }

        g_interrupted = 0;
        auto previous = std::signal(SIGINT, on_interrupt);

        bool done = false;
        while (!done && !g_interrupted) {
            done = observer.wait_for(chrono::milliseconds(100));
        }
        std::signal(SIGINT, previous == SIG_ERR ? SIG_DFL : previous);

        if (!done) {
            engine.cancel_download(args.asset_id);
            observer.clear_line();
            std::cout << "Paused " << args.asset_id << "; run the same command again to resume" << std::endl;
            return EXIT_PAUSED;
        }

        if (auto ec = observer.error()) {
            std::cerr << "Error: " << ec.message() << " (" << observer.detail() << ")" << std::endl;
            return std::unexpected(ec);
        }

        if (!args.quiet) {
            std::cout << "Saved to " << observer.file().string() << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::invalid_state));
    }
}

CliResult info(const CliArgs& args) noexcept {
    try {
        auto config = build_config(args);
        if (!config) {
            std::cerr << "Error: " << config.error().message() << std::endl;
            return std::unexpected(config.error());
        }

        CurlTransport transport(transport_options(*config));
        SizeProbe probe(transport);

        auto result = probe.probe(args.url);
        if (!result) {
            std::cerr << "Error: " << result.error().message() << std::endl;
            return std::unexpected(result.error());
        }

        auto plan = SegmentPlan::create(result->size, config->chunk_size);

        std::cout << "URL: " << args.url << "\n";
        std::cout << "Content-Length: " << result->size << " ("
                  << ProgressBar::format_bytes(result->size) << ")\n";
        std::cout << "Content-Type: " << (result->content_type.empty() ? "-" : result->content_type) << "\n";
        std::cout << "Extension: "
                  << resolve_extension(args.url, result->content_type, config->default_extension) << "\n";
        if (plan) {
            std::cout << "Segments: " << plan->segment_count() << " x "
                      << ProgressBar::format_bytes(config->chunk_size) << "\n";
        }
        std::cout << std::flush;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::invalid_state));
    }
}

namespace {

// Engine for commands that only touch local storage
class SilentObserver final : public DownloadObserver {
public:
    void on_progress(const std::string&, std::uint64_t, std::uint64_t, double) override {}
    void on_complete(const std::string&, const std::filesystem::path&) override {}
    void on_fail(const std::string&, std::error_code, const std::string&) override {}
};

template<typename Fn>
CliResult with_local_engine(const CliArgs& args, Fn&& fn) noexcept {
    try {
        auto config = build_config(args);
        if (!config) {
            std::cerr << "Error: " << config.error().message() << std::endl;
            return std::unexpected(config.error());
        }

        CurlTransport transport(transport_options(*config));
        SilentObserver observer;
        auto coordinator = DownloadCoordinator::create(*config, transport, observer);
        if (!coordinator) {
            std::cerr << "Error: " << coordinator.error().message() << std::endl;
            return std::unexpected(coordinator.error());
        }
        return fn(**coordinator);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::invalid_state));
    }
}

} // namespace

CliResult remove(const CliArgs& args) noexcept {
    return with_local_engine(args, [&](DownloadCoordinator& engine) -> CliResult {
        if (auto ec = engine.remove_download_completely(args.asset_id)) {
            std::cerr << "Error: " << ec.message() << std::endl;
            return std::unexpected(ec);
        }
        if (!args.quiet) std::cout << "Removed " << args.asset_id << std::endl;
        return 0;
    });
}

CliResult status(const CliArgs& args) noexcept {
    return with_local_engine(args, [&](DownloadCoordinator& engine) -> CliResult {
        std::cout << "Asset: " << args.asset_id << "\n";
        std::cout << "State: " << to_string(engine.state(args.asset_id)) << "\n";

        if (auto meta = engine.metadata(args.asset_id)) {
            auto count = meta->segment_count();
            auto done = meta->total_size - meta->remaining_bytes();
            std::cout << "URL: " << meta->origin_url << "\n";
            std::cout << "Segments: " << meta->finished_segments.size() << "/" << count << "\n";
            std::cout << "Received: " << ProgressBar::format_bytes(done) << " of "
                      << ProgressBar::format_bytes(meta->total_size) << "\n";
            std::cout << "Extension: " << meta->final_extension << "\n";
        }
        if (auto path = engine.local_file_path(args.asset_id)) {
            std::cout << "File: " << path->string() << "\n";
        }
        std::cout << std::flush;
        return 0;
    });
}

CliResult wipe(const CliArgs& args) noexcept {
    return with_local_engine(args, [&](DownloadCoordinator& engine) -> CliResult {
        if (auto ec = engine.wipe_all_downloads()) {
            std::cerr << "Error: " << ec.message() << std::endl;
            return std::unexpected(ec);
        }
        if (!args.quiet) {
            std::cout << "Wiped " << engine.config().storage_root.string() << std::endl;
        }
        return 0;
    });
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "clipfetch " << version.to_string() << " - resumable segmented media downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <ASSET-ID> <URL>\n";
    std::cout << "  " << program_name << " [OPTIONS] --info <URL>\n";
    std::cout << "  " << program_name << " [OPTIONS] --status <ASSET-ID>\n";
    std::cout << "  " << program_name << " [OPTIONS] --remove <ASSET-ID>\n";
    std::cout << "  " << program_name << " [OPTIONS] --wipe\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -d, --dir <DIR>         Storage root (default: clipfetch-data)\n";
    std::cout << "  -c, --config <FILE>     JSON configuration file\n";
    std::cout << "      --chunk-size <N>    Segment size in bytes (default: 500000)\n";
    std::cout << "      --concurrency <N>   Parallel segment requests (default: 5)\n";
    std::cout << "      --retries <N>       Retries per segment (default: 5)\n";
    std::cout << "      --origin-a <URL>    Origin for even segments\n";
    std::cout << "      --origin-b <URL>    Origin for odd segments\n";
    std::cout << "\n";
    std::cout << "Ctrl-C pauses a download; running the same command again resumes it.\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " lesson-12 https://cdn.example.com/v/lesson-12.mp4\n";
    std::cout << "  " << program_name << " --origin-a https://cdn-a.example.com \\\n";
    std::cout << "      --origin-b https://cdn-b.example.com lesson-12 https://cdn.example.com/v/lesson-12.mp4\n";
}

void print_version() noexcept {
    std::cout << "clipfetch " << version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, nlohmann/json, spdlog\n";
}

} // namespace clipfetch::cli
