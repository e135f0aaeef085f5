// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <system_error>

namespace ranger::core {

constexpr std::uint64_t MEBIBYTE = 1024 * 1024;

constexpr std::uint64_t MIN_PART_SIZE = 5 * MEBIBYTE;       // multipart-compatible floor
constexpr std::uint64_t DEFAULT_PART_SIZE = 8 * MEBIBYTE;
constexpr std::uint32_t DEFAULT_CONCURRENCY = 8;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;
constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::chrono::milliseconds RETRY_BACKOFF{200};

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;        // 256 KB
constexpr std::uint32_t MAX_REDIRECTS = 10;

enum class ChecksumPolicy : std::uint8_t {
    validate_full_object, // check the whole body against the stored object checksum
    disabled
};

// Pipeline settings shared by every task of a transfer
struct DownloaderConfig {
    std::uint64_t target_part_size{DEFAULT_PART_SIZE};
    std::uint32_t concurrency{DEFAULT_CONCURRENCY};
    bool checksum_validation_enabled{true};
};

// Settings for the libcurl object client
struct ClientConfig {
    std::string endpoint{"http://127.0.0.1:9000"};
    bool path_style{true};                // http://host/bucket/key vs http://bucket.host/key
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t low_speed_time_sec{STALL_TIMEOUT_SEC};
    std::uint32_t max_retries{RETRY_COUNT};
    std::chrono::milliseconds retry_backoff{RETRY_BACKOFF};
    bool verify_tls{true};
    bool checksum_mode{true};             // ask the store to return x-amz-checksum-* headers
    std::map<std::string, std::string> headers;
};

// Everything a config file can set
struct FileConfig {
    DownloaderConfig downloader;
    ClientConfig client;
    std::string log_level{"warn"};
};

// Load a JSON config file. Missing keys keep their defaults.
[[nodiscard]] std::expected<FileConfig, std::error_code> load_config(std::string_view path) noexcept;

// Parse JSON config text
[[nodiscard]] std::expected<FileConfig, std::error_code> parse_config(std::string_view json) noexcept;

} // namespace ranger::core
