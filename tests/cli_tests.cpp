// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <segflow/cli/commands.hpp>
#include <segflow/cli/config_file.hpp>
#include <segflow/cli/progress_bar.hpp>
#include <segflow/version.hpp>
#include "support/fakes.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

using namespace segflow::cli;
using namespace segflow::core;
using segflow::test::TempDir;

namespace {

CliArgs parse(std::vector<std::string> words) {
    words.insert(words.begin(), "segflow");
    std::vector<char*> argv;
    for (auto& w : words) {
        argv.push_back(w.data());
    }
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args", "[cli]") {
    SECTION("Full set of options") {
        auto args = parse({"-o", "show.ts", "-t", "4", "-n", "120", "-m", "sequential",
                           "-s", "/tmp/parts", "-k", "-c", "cfg.json", "--log-level", "debug",
                           "-q", "https://example.com/vp?id=1"});
        CHECK(args.error.empty());
        CHECK(args.url == "https://example.com/vp?id=1");
        CHECK(args.output_file == "show.ts");
        CHECK(args.threads == 4u);
        CHECK(args.segments == 120u);
        CHECK(args.queue_mode == QueueMode::sequential);
        CHECK(args.scratch_dir == "/tmp/parts");
        CHECK(args.keep_scratch);
        CHECK(args.config_path == "cfg.json");
        CHECK(args.log_level == EventLevel::debug);
        CHECK(args.quiet);
        CHECK(!args.live);
    }

    SECTION("Live with probe interval") {
        auto args = parse({"--live", "--probe-interval", "3", "http://example.com/live"});
        CHECK(args.error.empty());
        CHECK(args.live);
        CHECK(args.probe_interval == std::chrono::milliseconds(3000));
        CHECK(!args.segments.has_value());
    }

    SECTION("Help and version stop parsing") {
        CHECK(parse({"-h", "--bogus"}).help);
        CHECK(parse({"--version"}).version);
    }

    SECTION("Malformed values") {
        CHECK(parse({"-t", "four", "http://e.com/s"}).error == "Invalid thread count: four");
        CHECK(!parse({"-n", "-5", "http://e.com/s"}).error.empty());
        CHECK(!parse({"-m", "random", "http://e.com/s"}).error.empty());
        CHECK(!parse({"--log-level", "loud", "http://e.com/s"}).error.empty());
        CHECK(!parse({"--probe-interval", "0", "http://e.com/s"}).error.empty());
    }

    SECTION("Missing value") {
        auto args = parse({"http://e.com/s", "-o"});
        CHECK(args.error == "Missing value for -o");
    }

    SECTION("Unknown option and extra argument") {
        CHECK(parse({"--fast", "http://e.com/s"}).error == "Unknown option: --fast");
        CHECK(parse({"http://e.com/a", "http://e.com/b"}).error == "Unexpected argument: http://e.com/b");
    }

    SECTION("Zero threads parses and is rejected later") {
        auto args = parse({"-t", "0", "http://e.com/s"});
        CHECK(args.error.empty());
        CHECK(args.threads == 0u);
        CHECK(build_config(args, {}).validate() == DownloadErrc::invalid_thread_count);
    }
}

TEST_CASE("parse_config", "[cli][config]") {
    SECTION("All keys") {
        auto config = parse_config(R"({
            "threads": 6,
            "queue_mode": "out_of_order",
            "fail_threshold": 5,
            "retry_delay_ms": 250,
            "request_retries": 2,
            "keep_scratch": true,
            "scratch_dir": "/var/tmp/parts",
            "user_agent": "segflow-test",
            "log_level": "warn",
            "comment": "ignored"
        })");
        REQUIRE(config.has_value());
        CHECK(config->threads == 6u);
        CHECK(config->queue_mode == QueueMode::out_of_order);
        CHECK(config->fail_threshold == 5u);
        CHECK(config->retry_delay == std::chrono::milliseconds(250));
        CHECK(config->request_retries == 2u);
        CHECK(config->keep_scratch == true);
        CHECK(config->scratch_dir == "/var/tmp/parts");
        CHECK(config->user_agent == "segflow-test");
        CHECK(config->log_level == EventLevel::warn);
    }

    SECTION("Empty object") {
        auto config = parse_config("{}");
        REQUIRE(config.has_value());
        CHECK(!config->threads.has_value());
        CHECK(!config->log_level.has_value());
    }

    SECTION("Errors") {
        CHECK(parse_config("not json").error() == DownloadErrc::config_error);
        CHECK(parse_config("[1, 2]").error() == DownloadErrc::config_error);
        CHECK(parse_config(R"({"threads": "four"})").error() == DownloadErrc::config_error);
        CHECK(parse_config(R"({"threads": -1})").error() == DownloadErrc::config_error);
        CHECK(parse_config(R"({"keep_scratch": "yes"})").error() == DownloadErrc::config_error);
        CHECK(parse_config(R"({"queue_mode": "random"})").error() == DownloadErrc::config_error);
        CHECK(parse_config(R"({"log_level": "loud"})").error() == DownloadErrc::config_error);
    }
}

TEST_CASE("load_config_file", "[cli][config]") {
    TempDir dir;

    SECTION("Reads a file") {
        {
            std::ofstream out(dir.file("segflow.json"));
            out << R"({"threads": 3, "fail_threshold": 7})";
        }
        auto config = load_config_file(dir.file("segflow.json"));
        REQUIRE(config.has_value());
        CHECK(config->threads == 3u);
        CHECK(config->fail_threshold == 7u);
    }

    SECTION("Missing file") {
        auto config = load_config_file(dir.file("absent.json"));
        REQUIRE(!config.has_value());
        CHECK(config.error() == segflow::disk::DiskErrc::file_not_found);
    }
}

TEST_CASE("build_config", "[cli][config]") {
    FileConfig file;
    file.threads = 6;
    file.fail_threshold = 9;
    file.keep_scratch = true;
    file.scratch_dir = "/from/file";
    file.user_agent = "file-agent";

    SECTION("File values over defaults") {
        auto args = parse({"https://example.com/path/show.ts"});
        auto config = build_config(args, file);
        CHECK(config.url == "https://example.com/path/show.ts");
        CHECK(config.output_path == "show.ts");
        CHECK(config.threads == 6);
        CHECK(config.retry.fail_threshold == 9);
        CHECK(config.retry.request_retries == REQUEST_RETRY_COUNT);
        CHECK(config.keep_scratch);
        CHECK(config.scratch_dir == "/from/file");
        CHECK(config.user_agent == "file-agent");
    }

    SECTION("Flags over file values") {
        auto args = parse({"-t", "2", "-s", "/from/flag", "-o", "x.ts", "-m", "sequential",
                           "https://example.com/show.ts"});
        auto config = build_config(args, file);
        CHECK(config.threads == 2);
        CHECK(config.scratch_dir == "/from/flag");
        CHECK(config.output_path == "x.ts");
        CHECK(config.queue_mode == QueueMode::sequential);
    }

    SECTION("Defaults without file") {
        auto config = build_config(parse({"https://example.com/"}), {});
        CHECK(config.threads == DEFAULT_THREADS);
        CHECK(config.queue_mode == QueueMode::automatic);
        CHECK(config.output_path == "stream");
        CHECK(config.user_agent == DEFAULT_USER_AGENT);
        CHECK(!config.keep_scratch);
        CHECK(!config.validate());
    }

    SECTION("Log level precedence") {
        FileConfig with_level;
        with_level.log_level = EventLevel::error;
        CHECK(effective_level(parse({"--log-level", "debug", "http://e.com/s"}), with_level) == EventLevel::debug);
        CHECK(effective_level(parse({"http://e.com/s"}), with_level) == EventLevel::error);
        CHECK(effective_level(parse({"http://e.com/s"}), {}) == EventLevel::info);
        CHECK(effective_level(parse({"-q", "http://e.com/s"}), {}) == EventLevel::warn);
    }
}

TEST_CASE("download rejects a fixed stream without a segment count", "[cli]") {
    auto result = download(parse({"-q", "https://example.com/vp"}));
    REQUIRE(!result.has_value());
    CHECK(result.error() == DownloadErrc::config_error);
}

TEST_CASE("ProgressBar rendering", "[cli][progress]") {
    SECTION("Line format") {
        CHECK(ProgressBar::render("segments", 0, 4) ==
              "|segments| [>                             ]   0.00% (0/4)");
        CHECK(ProgressBar::render("segments", 4, 4) ==
              "|segments| [==============================] 100.00% (4/4)");
        CHECK(ProgressBar::render("s", 1, 3).ends_with(" 33.33% (1/3)"));
    }

    SECTION("Unknown total renders zero percent") {
        CHECK(ProgressBar::render("segments", 0, 0).ends_with("  0.00% (0/0)"));
    }

    SECTION("Never draws backwards") {
        std::ostringstream out;
        ProgressBar bar(out, "seg");
        bar.update(2, 10);
        bar.update(1, 10);
        bar.update(3, 10);
        bar.finish();
        bar.update(9, 10);

        const std::string text = out.str();
        CHECK(text.find("(1/10)") == std::string::npos);
        CHECK(text.find("(3/10)") != std::string::npos);
        CHECK(text.find("(9/10)") == std::string::npos);
        CHECK(text.back() == '\n');
    }

    SECTION("ProgressSink forwards counts to the bar and text to the log") {
        std::ostringstream out;
        ProgressBar bar(out, "seg");
        segflow::test::RecordingSink log;
        ProgressSink sink(log, &bar);

        sink.on_progress(1, 2);
        sink.on_event(EventLevel::info, "hello");
        sink.on_segment_abandoned(0, 7);

        CHECK(out.str().find("(1/2)") != std::string::npos);
        CHECK(log.contains("hello"));
        CHECK(log.contains("Giving up segment 7"));
        CHECK(log.progress().empty());
    }
}

TEST_CASE("print_version shows the build stamp", "[cli]") {
    std::ostringstream out;
    auto* previous = std::cout.rdbuf(out.rdbuf());
    print_version();
    std::cout.rdbuf(previous);

    const std::string text = out.str();
    CHECK(text.starts_with("segflow " + segflow::version.to_string()));
    CHECK(text.find(std::string(segflow::BUILD_DATE)) != std::string::npos);
    CHECK(text.find(std::string(segflow::BUILD_TIME)) != std::string::npos);
}
