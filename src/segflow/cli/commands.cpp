// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/cli/commands.hpp>
#include <segflow/cli/progress_bar.hpp>
#include <segflow/core/download_task.hpp>
#include <segflow/core/error.hpp>
#include <segflow/core/http_session.hpp>
#include <segflow/core/live_probe.hpp>
#include <segflow/core/url.hpp>
#include <segflow/version.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <charconv>
#include <iostream>
#include <memory>
#include <optional>

using namespace segflow::core;

namespace segflow::cli {

namespace {

std::optional<std::uint32_t> parse_count(std::string_view text) noexcept {
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

spdlog::level::level_enum to_spdlog_level(EventLevel level) noexcept {
    switch (level) {
        case EventLevel::debug: return spdlog::level::debug;
        case EventLevel::info:  return spdlog::level::info;
        case EventLevel::warn:  return spdlog::level::warn;
        case EventLevel::error: return spdlog::level::err;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_logger(EventLevel level) {
    auto logger = spdlog::get("segflow");
    if (!logger) {
        logger = spdlog::stderr_color_mt("segflow");
    }
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    logger->set_level(to_spdlog_level(level));
    return logger;
}

// Owns the session, task and probe so they are gone before curl cleanup
CliResult run(const DownloadConfig& config,
              StreamInfo stream,
              const CliArgs& args,
              EventSink& events,
              ProgressBar* bar) {
    HttpSession session(config.user_agent);
    DownloadTask task(config, stream, events, &session);

    if (auto ec = task.start()) {
        if (bar) bar->clear();
        std::cerr << "Error: Failed to start download: " << ec.message() << std::endl;
        return std::unexpected(ec);
    }

    std::optional<LiveProbe> probe;
    if (stream.live) {
        probe.emplace(session, task, events, config.url,
                      args.probe_interval.value_or(LIVE_PROBE_INTERVAL));
        probe->start();
    }

    DownloadResult result = task.wait();
    if (probe) {
        probe->stop();
    }
    if (bar) bar->finish();

    if (!result.ok()) {
        std::cerr << "Error: Download failed: " << result.error.message() << std::endl;
        return std::unexpected(result.error);
    }

    if (!result.lost_segments.empty()) {
        std::cout << "Lost segments (" << result.lost_segments.size() << "):";
        for (auto index : result.lost_segments) {
            std::cout << ' ' << index;
        }
        std::cout << std::endl;
    }

    if (!args.quiet) {
        std::cout << "Saved " << result.total_segments - result.lost_segments.size()
                  << '/' << result.total_segments << " segments to " << config.output_path << std::endl;
    }
    return 0;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto fail = [&args](std::string message) {
        if (args.error.empty()) {
            args.error = std::move(message);
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        // Option value, or nullptr when the option is the last argument
        auto value = [&]() -> const char* {
            if (i + 1 < argc) {
                return argv[++i];
            }
            fail("Missing value for " + std::string(arg));
            return nullptr;
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-l" || arg == "--live") {
            args.live = true;
        } else if (arg == "-k" || arg == "--keep-scratch") {
            args.keep_scratch = true;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value()) args.output_file = v;
        } else if (arg == "-s" || arg == "--scratch-dir") {
            if (auto v = value()) args.scratch_dir = v;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value()) args.config_path = v;
        } else if (arg == "-t" || arg == "--threads") {
            if (auto v = value()) {
                args.threads = parse_count(v);
                if (!args.threads) fail("Invalid thread count: " + std::string(v));
            }
        } else if (arg == "-n" || arg == "--segments") {
            if (auto v = value()) {
                args.segments = parse_count(v);
                if (!args.segments) fail("Invalid segment count: " + std::string(v));
            }
        } else if (arg == "-m" || arg == "--queue-mode") {
            if (auto v = value()) {
                args.queue_mode = parse_queue_mode(v);
                if (!args.queue_mode) fail("Invalid queue mode: " + std::string(v));
            }
        } else if (arg == "--log-level") {
            if (auto v = value()) {
                auto level = parse_level(v);
                if (level) {
                    args.log_level = *level;
                } else {
                    fail("Invalid log level: " + std::string(v));
                }
            }
        } else if (arg == "--probe-interval") {
            if (auto v = value()) {
                auto seconds = parse_count(v);
                if (seconds && *seconds > 0) {
                    args.probe_interval = std::chrono::seconds(*seconds);
                } else {
                    fail("Invalid probe interval: " + std::string(v));
                }
            }
        } else if (arg.starts_with("-") && arg.size() > 1) {
            fail("Unknown option: " + std::string(arg));
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            fail("Unexpected argument: " + std::string(arg));
        }
    }

    return args;
}

//=============================================================================
// Configuration
//=============================================================================

DownloadConfig build_config(const CliArgs& args, const FileConfig& file) {
    DownloadConfig config;
    file.apply(config);

    config.url = args.url;
    if (args.threads) config.threads = *args.threads;
    if (args.queue_mode) config.queue_mode = *args.queue_mode;
    if (args.keep_scratch) config.keep_scratch = true;
    if (!args.scratch_dir.empty()) config.scratch_dir = args.scratch_dir;

    config.output_path = args.output_file;
    if (config.output_path.empty()) {
        auto parsed = Url::parse(args.url);
        if (parsed) {
            config.output_path = parsed->filename();
        }
    }
    return config;
}

EventLevel effective_level(const CliArgs& args, const FileConfig& file) noexcept {
    if (args.log_level) return *args.log_level;
    if (file.log_level) return *file.log_level;
    return args.quiet ? EventLevel::warn : EventLevel::info;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) noexcept {
    try {
        FileConfig file;
        if (!args.config_path.empty()) {
            auto loaded = load_config_file(args.config_path);
            if (!loaded) {
                std::cerr << "Error: Cannot load config " << args.config_path << ": "
                          << loaded.error().message() << std::endl;
                return std::unexpected(loaded.error());
            }
            file = std::move(*loaded);
        }

        if (!args.live && !args.segments) {
            std::cerr << "Error: Segment count (-n) is required unless --live is given" << std::endl;
            return std::unexpected(make_error_code(DownloadErrc::config_error));
        }

        DownloadConfig config = build_config(args, file);
        StreamInfo stream{args.segments.value_or(0), args.live};

        auto logger = make_logger(effective_level(args, file));
        LogEventSink log(logger);

        std::unique_ptr<ProgressBar> bar;
        if (!args.quiet) {
            bar = std::make_unique<ProgressBar>(std::cout);
        }
        ProgressSink sink(log, bar.get());

        HttpSession::global_init();
        auto result = run(config, stream, args, sink, bar.get());
        HttpSession::global_cleanup();
        return result;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::config_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "segflow " << segflow::version.to_string() << " - Segmented stream downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>\n";
    std::cout << "\n";
    std::cout << "  URL is the stream base URL. \"{index}\" in it is replaced by the\n";
    std::cout << "  segment number, otherwise \"sq=<number>\" is added to the query.\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << "  -v, --version             Show version information\n";
    std::cout << "  -o, --output <FILE>       Save to specified file\n";
    std::cout << "  -n, --segments <N>        Number of segments (required unless --live)\n";
    std::cout << "  -l, --live                Stream is live, total grows while downloading\n";
    std::cout << "  -t, --threads <N>         Parallel fetchers (default: 1)\n";
    std::cout << "  -m, --queue-mode <MODE>   auto, sequential or out_of_order (default: auto)\n";
    std::cout << "  -s, --scratch-dir <DIR>   Segment scratch directory (default: <FILE>.parts)\n";
    std::cout << "  -k, --keep-scratch        Keep segment files after merging\n";
    std::cout << "  -c, --config <FILE>       Read settings from a JSON file\n";
    std::cout << "      --log-level <LEVEL>   debug, info, warn or error\n";
    std::cout << "      --probe-interval <S>  Seconds between live stream polls (default: 5)\n";
    std::cout << "  -q, --quiet               Quiet mode (no progress bar)\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " -n 120 -t 4 https://cdn.example.com/video/seg{index}.ts\n";
    std::cout << "  " << program_name << " --live -o show.ts https://example.com/videoplayback?id=42\n";
}

void print_version() noexcept {
    std::cout << "segflow " << segflow::version.to_string()
              << " (built " << segflow::BUILD_DATE << " " << segflow::BUILD_TIME << ")" << std::endl;
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann-json\n";
}

} // namespace segflow::cli
