// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/config.hpp>
#include <ranger/core/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace ranger::core {

namespace {

template<typename T>
void read_key(const nlohmann::json& j, const char* name, T& out) {
    if (j.contains(name)) {
        out = j[name].get<T>();
    }
}

} // namespace

std::expected<FileConfig, std::error_code> parse_config(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(std::make_error_code(std::errc::invalid_argument));
        }

        FileConfig cfg;

        read_key(j, "endpoint", cfg.client.endpoint);
        read_key(j, "path_style", cfg.client.path_style);
        read_key(j, "max_retries", cfg.client.max_retries);
        read_key(j, "connect_timeout_sec", cfg.client.connect_timeout_sec);
        read_key(j, "low_speed_time_sec", cfg.client.low_speed_time_sec);
        read_key(j, "verify_tls", cfg.client.verify_tls);

        if (j.contains("retry_backoff_ms")) {
            cfg.client.retry_backoff = std::chrono::milliseconds(j["retry_backoff_ms"].get<std::uint32_t>());
        }

        if (j.contains("headers")) {
            const auto& headers = j["headers"];
            if (!headers.is_object()) {
                return std::unexpected(std::make_error_code(std::errc::invalid_argument));
            }
            for (auto& [name, value] : headers.items()) {
                cfg.client.headers[name] = value.get<std::string>();
            }
        }

        read_key(j, "part_size", cfg.downloader.target_part_size);
        read_key(j, "concurrency", cfg.downloader.concurrency);
        read_key(j, "checksum_validation", cfg.downloader.checksum_validation_enabled);
        cfg.client.checksum_mode = cfg.downloader.checksum_validation_enabled;

        read_key(j, "log_level", cfg.log_level);

        return cfg;
    } catch (const std::exception& e) {
        logger()->debug("config parse error: {}", e.what());
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
}

std::expected<FileConfig, std::error_code> load_config(std::string_view path) noexcept {
    std::ifstream file{std::string(path)};
    if (!file) {
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }

    auto cfg = parse_config(content.str());
    if (!cfg) {
        logger()->error("invalid config file {}", path);
    }
    return cfg;
}

} // namespace ranger::core
