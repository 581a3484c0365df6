// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/cli/config_file.hpp>
#include <segflow/core/error.hpp>
#include <segflow/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace segflow::cli {

using core::DownloadErrc;

namespace {

std::uint32_t get_count(const nlohmann::json& value) {
    if (!value.is_number_unsigned()) {
        throw std::invalid_argument("expected a non-negative integer");
    }
    return value.get<std::uint32_t>();
}

} // namespace

void FileConfig::apply(core::DownloadConfig& config) const {
    if (threads) config.threads = *threads;
    if (queue_mode) config.queue_mode = *queue_mode;
    if (fail_threshold) config.retry.fail_threshold = *fail_threshold;
    if (retry_delay) config.retry.retry_delay = *retry_delay;
    if (request_retries) config.retry.request_retries = *request_retries;
    if (keep_scratch) config.keep_scratch = *keep_scratch;
    if (scratch_dir) config.scratch_dir = *scratch_dir;
    if (user_agent) config.user_agent = *user_agent;
}

std::expected<FileConfig, std::error_code> parse_config(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::config_error));
        }

        FileConfig config;

        if (j.contains("threads")) {
            config.threads = get_count(j["threads"]);
        }

        if (j.contains("queue_mode")) {
            auto mode = core::parse_queue_mode(j["queue_mode"].get<std::string>());
            if (!mode) {
                return std::unexpected(make_error_code(DownloadErrc::config_error));
            }
            config.queue_mode = *mode;
        }

        if (j.contains("fail_threshold")) {
            config.fail_threshold = get_count(j["fail_threshold"]);
        }

        if (j.contains("retry_delay_ms")) {
            config.retry_delay = std::chrono::milliseconds(get_count(j["retry_delay_ms"]));
        }

        if (j.contains("request_retries")) {
            config.request_retries = get_count(j["request_retries"]);
        }

        if (j.contains("keep_scratch")) {
            config.keep_scratch = j["keep_scratch"].get<bool>();
        }

        if (j.contains("scratch_dir")) {
            config.scratch_dir = j["scratch_dir"].get<std::string>();
        }

        if (j.contains("user_agent")) {
            config.user_agent = j["user_agent"].get<std::string>();
        }

        if (j.contains("log_level")) {
            auto level = core::parse_level(j["log_level"].get<std::string>());
            if (!level) {
                return std::unexpected(level.error());
            }
            config.log_level = *level;
        }

        return config;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DownloadErrc::config_error));
    }
}

std::expected<FileConfig, std::error_code> load_config_file(const std::string& path) noexcept {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    std::string text;
    try {
        std::ostringstream ss;
        ss << file.rdbuf();
        text = ss.str();
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }

    return parse_config(text);
}

} // namespace segflow::cli
