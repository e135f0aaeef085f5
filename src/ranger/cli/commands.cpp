// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/cli/commands.hpp>
#include <ranger/cli/progress_bar.hpp>
#include <ranger/core/curl_client.hpp>
#include <ranger/core/log.hpp>
#include <ranger/core/url.hpp>
#include <ranger/disk/file_writer.hpp>
#include <ranger/version.hpp>
#include <charconv>
#include <iostream>

using namespace ranger::core;

namespace ranger::cli {

namespace {

template<typename T>
bool parse_number(std::string_view text, T& out) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

// libcurl global state for the duration of a command
struct CurlGlobal {
    CurlGlobal() noexcept { CurlObjectClient::global_init(); }
    ~CurlGlobal() { CurlObjectClient::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

void print_error(std::string_view what, const std::string& detail) {
    std::cerr << "Error: " << what << ": " << detail << std::endl;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view option) -> const char* {
        if (i + 1 >= argc) {
            args.error = "missing value for " + std::string(option);
            return nullptr;
        }
        return argv[++i];
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
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "--no-checksum") {
            args.no_checksum = true;
        } else if (arg == "-o" || arg == "--output") {
            if (const char* v = value_of(i, arg)) args.output_file = v;
        } else if (arg == "-e" || arg == "--endpoint") {
            if (const char* v = value_of(i, arg)) args.endpoint = v;
        } else if (arg == "-c" || arg == "--config") {
            if (const char* v = value_of(i, arg)) args.config_path = v;
        } else if (arg == "-r" || arg == "--range") {
            if (const char* v = value_of(i, arg)) args.range = v;
        } else if (arg == "-p" || arg == "--part-size") {
            if (const char* v = value_of(i, arg)) {
                std::uint64_t n = 0;
                if (parse_number(v, n)) args.part_size = n;
                else args.error = "invalid part size '" + std::string(v) + "'";
            }
        } else if (arg == "-n" || arg == "--concurrency") {
            if (const char* v = value_of(i, arg)) {
                std::uint32_t n = 0;
                if (parse_number(v, n)) args.concurrency = n;
                else args.error = "invalid concurrency '" + std::string(v) + "'";
            }
        } else if (arg == "--part-number") {
            if (const char* v = value_of(i, arg)) {
                std::uint32_t n = 0;
                if (parse_number(v, n)) args.part_number = n;
                else args.error = "invalid part number '" + std::string(v) + "'";
            }
        } else if (arg.starts_with("s3://")) {
            if (!args.object_uri.empty()) {
                args.error = "only one object can be downloaded at a time";
            }
            args.object_uri = arg;
        } else {
            args.error = "unknown argument '" + arg + "'";
        }
    }

    return args;
}

//=============================================================================
// Setup
//=============================================================================

std::expected<FileConfig, std::error_code> resolve_config(const CliArgs& args) noexcept {
    FileConfig cfg;

    if (!args.config_path.empty()) {
        auto loaded = load_config(args.config_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        cfg = std::move(*loaded);
    }

    if (!args.endpoint.empty()) {
        cfg.client.endpoint = args.endpoint;
    }
    if (args.part_size) {
        cfg.downloader.target_part_size = *args.part_size;
    }
    if (args.concurrency) {
        cfg.downloader.concurrency = *args.concurrency;
    }
    if (args.no_checksum) {
        cfg.downloader.checksum_validation_enabled = false;
        cfg.client.checksum_mode = false;
    }
    if (args.verbose) {
        cfg.log_level = "debug";
    }

    return cfg;
}

bool apply_log_level(std::string_view level) noexcept {
    if (!set_log_level(level)) {
        print_error("unknown log level", std::string(level));
        return false;
    }
    return true;
}

std::expected<Downloader, std::error_code> make_downloader(const FileConfig& config) noexcept {
    auto client = CurlObjectClient::create(config.client);
    if (!client) {
        return std::unexpected(client.error());
    }

    return Downloader::builder()
        .executor(std::move(*client))
        .config(config.downloader)
        .build();
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) noexcept {
    auto uri = ObjectUri::parse(args.object_uri);
    if (!uri) {
        print_error("invalid object URI", args.object_uri);
        return std::unexpected(uri.error());
    }

    auto cfg = resolve_config(args);
    if (!cfg) {
        print_error("cannot load config", cfg.error().message());
        return std::unexpected(cfg.error());
    }
    apply_log_level(cfg->log_level);

    CurlGlobal curl;

    auto downloader = make_downloader(*cfg);
    if (!downloader) {
        print_error("cannot create client", downloader.error().message());
        return std::unexpected(downloader.error());
    }

    auto handle = downloader->start(DownloadRequest{uri->bucket, uri->key, args.range, args.part_number});
    if (!handle) {
        print_error("download failed", handle.error().message());
        return std::unexpected(handle.error().code);
    }

    const auto& meta = handle->object_metadata();
    bool whole_object = !args.range && !args.part_number;

    std::string output = args.output_file.empty() ? uri->filename() : args.output_file;
    disk::FileWriter writer;
    auto ec = (output == "-")
        ? writer.open_stdout()
        : writer.open(output, whole_object ? meta.total_size() : 0);
    if (ec) {
        print_error("cannot open " + output, ec.message());
        return std::unexpected(ec);
    }

    logger()->info("s3://{}/{} -> {} ({} bytes)", uri->bucket, uri->key, output, meta.total_size());

    bool show_progress = !args.quiet && !writer.is_stream() && whole_object;
    ProgressBar bar(meta.total_size(), uri->filename());

    auto body = handle->body();
    if (!body) {
        print_error("download failed", body.error().message());
        return std::unexpected(body.error());
    }

    std::uint64_t offset = 0;
    while (auto item = (*body)->next()) {
        if (!*item) {
            if (show_progress) bar.clear();
            print_error("download failed", item->error().message());
            return std::unexpected(item->error().code);
        }

        ec = writer.write(offset, (*item)->span());
        if (ec) {
            if (show_progress) bar.clear();
            print_error("write to " + output + " failed", ec.message());
            return std::unexpected(ec);
        }
        offset += (*item)->size();

        if (show_progress) bar.update(offset);
    }

    ec = writer.flush();
    if (ec) {
        print_error("flush of " + output + " failed", ec.message());
        return std::unexpected(ec);
    }
    writer.close();

    if (show_progress) bar.finish();
    logger()->info("wrote {} bytes in {} chunks", handle->bytes_delivered(), handle->chunks_delivered());

    return 0;
}

CliResult info(const CliArgs& args) noexcept {
    auto uri = ObjectUri::parse(args.object_uri);
    if (!uri) {
        print_error("invalid object URI", args.object_uri);
        return std::unexpected(uri.error());
    }

    auto cfg = resolve_config(args);
    if (!cfg) {
        print_error("cannot load config", cfg.error().message());
        return std::unexpected(cfg.error());
    }
    apply_log_level(cfg->log_level);

    CurlGlobal curl;

    auto downloader = make_downloader(*cfg);
    if (!downloader) {
        print_error("cannot create client", downloader.error().message());
        return std::unexpected(downloader.error());
    }

    auto discovery = downloader->discover(DownloadRequest{uri->bucket, uri->key, args.range, args.part_number});
    if (!discovery) {
        print_error("discovery failed", discovery.error().message());
        return std::unexpected(discovery.error().code);
    }

    const auto& meta = discovery->meta;
    std::cout << "Object: s3://" << uri->bucket << "/" << uri->key << std::endl;
    std::cout << "Size: " << discovery->total_size << " ("
              << ProgressBar::format_bytes(discovery->total_size) << ")" << std::endl;
    std::cout << "ETag: " << meta.etag << std::endl;
    std::cout << "Content-Type: " << meta.content_type << std::endl;
    if (!meta.content_encoding.empty()) std::cout << "Content-Encoding: " << meta.content_encoding << std::endl;
    if (!meta.last_modified.empty()) std::cout << "Last-Modified: " << meta.last_modified << std::endl;
    if (!meta.version_id.empty()) std::cout << "Version: " << meta.version_id << std::endl;
    if (meta.parts_count) std::cout << "Parts: " << *meta.parts_count << std::endl;
    if (!meta.checksum_crc32.empty()) std::cout << "CRC32: " << meta.checksum_crc32 << std::endl;
    if (!meta.checksum_crc32c.empty()) std::cout << "CRC32C: " << meta.checksum_crc32c << std::endl;
    if (!meta.checksum_sha1.empty()) std::cout << "SHA1: " << meta.checksum_sha1 << std::endl;
    if (!meta.checksum_sha256.empty()) std::cout << "SHA256: " << meta.checksum_sha256 << std::endl;
    if (discovery->remaining) {
        std::cout << "Remaining: " << discovery->remaining->to_header() << std::endl;
    }
    std::cout << "Discovery: " << to_string(discovery->strategy) << std::endl;

    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "ranger - parallel ranged downloads from S3-compatible stores\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] s3://<bucket>/<key>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -o, --output <FILE>     Save to FILE, '-' for stdout (default: key basename)\n";
    std::cout << "  -e, --endpoint <URL>    Store endpoint (default: http://127.0.0.1:9000)\n";
    std::cout << "  -c, --config <FILE>     JSON config file\n";
    std::cout << "  -p, --part-size <BYTES> Part size (minimum 5 MiB, default 8 MiB)\n";
    std::cout << "  -n, --concurrency <N>   Parallel requests (default: 8)\n";
    std::cout << "  -r, --range <RANGE>     Download a byte range, e.g. bytes=0-1048575\n";
    std::cout << "      --part-number <N>   Download one stored part\n";
    std::cout << "      --no-checksum       Skip whole-object checksum validation\n";
    std::cout << "  -i, --info              Show object metadata without downloading\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " s3://bucket/data.bin\n";
    std::cout << "  " << program_name << " -n 16 -p 16777216 -o big.iso s3://bucket/images/big.iso\n";
    std::cout << "  " << program_name << " -r bytes=0-99 -o - s3://bucket/log.txt\n";
}

void print_version() noexcept {
    std::cout << "ranger " << ranger::version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " " << BUILD_TIME << " with C++23, libcurl, spdlog\n";
}

} // namespace ranger::cli
