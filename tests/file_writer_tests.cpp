// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ranger/disk/file_writer.hpp>
#include "fake_object_client.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace ranger::disk;
using ranger::testing::to_bytes;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

} // namespace

TEST_CASE("FileWriter positional writes", "[disk]") {
    auto path = std::filesystem::temp_directory_path() / "ranger_file_writer_test.bin";

    {
        FileWriter writer;
        REQUIRE(!writer.open(path.string(), 9));
        CHECK(writer.is_open());
        CHECK(!writer.is_stream());
        CHECK(std::filesystem::file_size(path) == 9);

        // Out of order, as parts may complete
        auto tail = to_bytes("ghi");
        auto head = to_bytes("abc");
        auto middle = to_bytes("def");
        CHECK(!writer.write(6, tail));
        CHECK(!writer.write(0, head));
        CHECK(!writer.write(3, middle));
        CHECK(writer.bytes_written() == 9);
        CHECK(!writer.flush());

        CHECK(writer.open(path.string(), 0) == DiskErrc::already_open);
    }

    CHECK(read_file(path) == "abcdefghi");
    std::filesystem::remove(path);
}

TEST_CASE("FileWriter errors", "[disk]") {
    FileWriter writer;

    SECTION("Empty path") {
        CHECK(writer.open("", 0) == DiskErrc::invalid_path);
    }

    SECTION("Missing directory") {
        auto path = std::filesystem::temp_directory_path() / "ranger_no_such_dir" / "out.bin";
        CHECK(writer.open(path.string(), 0) == DiskErrc::file_not_found);
        CHECK(!writer.is_open());
    }

    SECTION("Write before open") {
        auto data = to_bytes("x");
        CHECK(writer.write(0, data) == DiskErrc::handle_invalid);
        CHECK(writer.flush() == DiskErrc::handle_invalid);
    }
}

TEST_CASE("from_errno", "[disk]") {
    CHECK(from_errno(ENOENT) == DiskErrc::file_not_found);
    CHECK(from_errno(ENOSPC) == DiskErrc::disk_full);
    CHECK(from_errno(EACCES) == DiskErrc::access_denied);
    CHECK(from_errno(EIO) == DiskErrc::write_error);
}
