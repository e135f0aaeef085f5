// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/byte_range.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace ranger::core {

// Response headers, names lowercased
using Headers = std::map<std::string, std::string>;

// Object-level metadata captured during discovery.
//
// When discovery used a ranged GET the headers belong to a partial response.
// content_length is normalized to the whole object from Content-Range; the
// other fields (etag, content-type, content-encoding, checksums) are taken
// verbatim since S3-compatible stores report them per object, not per range.
struct ObjectMetadata {
    std::optional<std::uint64_t> content_length;
    std::optional<ContentRange> content_range; // as received, not normalized
    std::string etag;
    std::string content_type;
    std::string content_encoding;
    std::string content_disposition;
    std::string cache_control;
    std::string last_modified;
    std::string version_id;
    std::optional<std::uint32_t> parts_count;

    std::string checksum_crc32;
    std::string checksum_crc32c;
    std::string checksum_sha1;
    std::string checksum_sha256;
    std::string checksum_type;            // FULL_OBJECT or COMPOSITE

    [[nodiscard]] static ObjectMetadata from_headers(const Headers& headers);

    // Size of the whole object: Content-Range total if known, else Content-Length
    [[nodiscard]] std::uint64_t total_size() const noexcept;

    [[nodiscard]] bool has_checksum() const noexcept {
        return !checksum_crc32.empty() || !checksum_crc32c.empty()
            || !checksum_sha1.empty() || !checksum_sha256.empty();
    }
};

} // namespace ranger::core
