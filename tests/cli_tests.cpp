// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ranger/cli/commands.hpp>
#include <ranger/cli/progress_bar.hpp>
#include <ranger/core/log.hpp>
#include <ranger/version.hpp>
#include <string>
#include <vector>

using namespace ranger::cli;

namespace {

CliArgs parse(std::vector<std::string> words) {
    words.insert(words.begin(), "ranger");
    std::vector<char*> argv;
    for (auto& w : words) {
        argv.push_back(w.data());
    }
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args", "[cli]") {
    SECTION("Full download command") {
        auto args = parse({"s3://bucket/dir/file.bin", "-o", "out.bin", "-e", "http://localhost:9000",
                           "-p", "16777216", "-n", "12", "-r", "bytes=0-99", "--no-checksum", "-q"});
        CHECK(args.error.empty());
        CHECK(args.object_uri == "s3://bucket/dir/file.bin");
        CHECK(args.output_file == "out.bin");
        CHECK(args.endpoint == "http://localhost:9000");
        CHECK(args.part_size == 16777216u);
        CHECK(args.concurrency == 12u);
        CHECK(args.range == std::string("bytes=0-99"));
        CHECK(args.no_checksum);
        CHECK(args.quiet);
        CHECK(!args.info);
    }

    SECTION("Info and part number") {
        auto args = parse({"--info", "--part-number", "3", "s3://b/k"});
        CHECK(args.error.empty());
        CHECK(args.info);
        CHECK(args.part_number == 3u);
    }

    SECTION("Help wins") {
        CHECK(parse({"--help", "--bogus"}).help);
        CHECK(parse({"-v"}).version);
    }

    SECTION("Errors") {
        CHECK(!parse({"--bogus"}).error.empty());
        CHECK(!parse({"-n", "many"}).error.empty());
        CHECK(!parse({"-p", "-5"}).error.empty());
        CHECK(!parse({"s3://b/k", "-o"}).error.empty());
        CHECK(!parse({"s3://b/k1", "s3://b/k2"}).error.empty());
    }
}

TEST_CASE("resolve_config overlays flags", "[cli]") {
    auto args = parse({"s3://b/k", "-e", "http://minio:9000", "-n", "3", "--no-checksum", "-V"});
    REQUIRE(args.error.empty());

    auto cfg = resolve_config(args);
    REQUIRE(cfg.has_value());
    CHECK(cfg->client.endpoint == "http://minio:9000");
    CHECK(cfg->downloader.concurrency == 3);
    CHECK(!cfg->downloader.checksum_validation_enabled);
    CHECK(cfg->log_level == "debug");
}

TEST_CASE("ProgressBar formatting", "[cli]") {
    CHECK(ProgressBar::format_bytes(512) == "512 B");
    CHECK(ProgressBar::format_bytes(2048) == "2 KB");
    CHECK(ProgressBar::format_bytes(8 * 1024 * 1024) == "8.0 MB");
    CHECK(ProgressBar::format_speed(100) == "100 B/s");
    CHECK(ProgressBar::format_speed(3 * 1024 * 1024) == "3.0 MB/s");
    CHECK(ProgressBar::format_time(42) == "42s");
    CHECK(ProgressBar::format_time(125) == "2m 5s");
    CHECK(ProgressBar::format_time(3723) == "1h 02m 03s");
}

TEST_CASE("apply_log_level", "[cli]") {
    using ranger::core::logger;

    CHECK(apply_log_level("debug"));
    CHECK(logger()->level() == spdlog::level::debug);

    // Unknown names leave the level unchanged
    CHECK(!apply_log_level("chatty"));
    CHECK(logger()->level() == spdlog::level::debug);

    CHECK(apply_log_level("warn"));
    CHECK(logger()->level() == spdlog::level::warn);
}

TEST_CASE("Version string", "[cli]") {
    CHECK(ranger::version.to_string() == "0.1.0");
    CHECK(ranger::Version{1, 2, 3}.to_string() == "1.2.3");
}
