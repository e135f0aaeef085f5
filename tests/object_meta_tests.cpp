// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ranger/core/object_meta.hpp>

using namespace ranger::core;

TEST_CASE("ObjectMetadata::from_headers", "[meta]") {
    SECTION("Full response") {
        Headers headers{
            {"content-length", "700"},
            {"etag", "\"abc123\""},
            {"content-type", "application/octet-stream"},
            {"content-encoding", "gzip"},
            {"last-modified", "Mon, 19 Oct 2026 10:00:00 GMT"},
            {"x-amz-version-id", "v1"},
            {"x-amz-mp-parts-count", "3"},
            {"x-amz-checksum-crc32", "y/Q5Jg=="},
            {"x-amz-checksum-type", "FULL_OBJECT"},
        };

        auto meta = ObjectMetadata::from_headers(headers);
        CHECK(meta.content_length == 700u);
        CHECK(meta.total_size() == 700);
        CHECK(meta.etag == "\"abc123\"");
        CHECK(meta.content_type == "application/octet-stream");
        CHECK(meta.content_encoding == "gzip");
        CHECK(meta.last_modified == "Mon, 19 Oct 2026 10:00:00 GMT");
        CHECK(meta.version_id == "v1");
        CHECK(meta.parts_count == 3u);
        CHECK(meta.checksum_crc32 == "y/Q5Jg==");
        CHECK(meta.checksum_type == "FULL_OBJECT");
        CHECK(meta.has_checksum());
        CHECK(!meta.content_range.has_value());
    }

    SECTION("Partial response is normalized to the whole object") {
        Headers headers{
            {"content-length", "500"},
            {"content-range", "bytes 0-499/700"},
        };

        auto meta = ObjectMetadata::from_headers(headers);
        CHECK(meta.content_length == 700u);
        CHECK(meta.total_size() == 700);
        REQUIRE(meta.content_range.has_value());
        CHECK(meta.content_range->range == RangeSpec{0, 499});
    }

    SECTION("Unknown total keeps Content-Length") {
        Headers headers{
            {"content-length", "100"},
            {"content-range", "bytes 0-99/*"},
        };
        CHECK(ObjectMetadata::from_headers(headers).total_size() == 100);
    }

    SECTION("Missing or malformed numbers") {
        Headers headers{
            {"content-length", "lots"},
            {"x-amz-mp-parts-count", ""},
        };
        auto meta = ObjectMetadata::from_headers(headers);
        CHECK(!meta.content_length.has_value());
        CHECK(!meta.parts_count.has_value());
        CHECK(meta.total_size() == 0);
        CHECK(!meta.has_checksum());
    }
}
