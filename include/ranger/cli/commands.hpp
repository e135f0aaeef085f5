// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/config.hpp>
#include <ranger/core/downloader.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace ranger::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string object_uri;                    // s3://bucket/key
    std::string output_file;                   // "-" for stdout
    std::string endpoint;
    std::string config_path;
    std::optional<std::uint64_t> part_size;
    std::optional<std::uint32_t> concurrency;
    std::optional<std::string> range;
    std::optional<std::uint32_t> part_number;
    bool no_checksum{false};
    bool info{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                         // set when parsing failed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Config file (if any) overlaid with command line options
[[nodiscard]] std::expected<core::FileConfig, std::error_code> resolve_config(const CliArgs& args) noexcept;

// Set the log level, reporting an unknown name on stderr. The current level
// is kept in that case.
bool apply_log_level(std::string_view level) noexcept;

// Downloader over a curl client built from the config
[[nodiscard]] std::expected<core::Downloader, std::error_code>
make_downloader(const core::FileConfig& config) noexcept;

// Download the object to a file or stdout
[[nodiscard]] CliResult download(const CliArgs& args) noexcept;

// Print object metadata without downloading the body
[[nodiscard]] CliResult info(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace ranger::cli
