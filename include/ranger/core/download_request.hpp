// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/byte_range.hpp>
#include <ranger/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace ranger::core {

// One logical "get object" request, consumed once by Downloader::start
struct DownloadRequest {
    std::string bucket;
    std::string key;
    std::optional<std::string> range;          // HTTP Range value, e.g. "bytes=0-99"
    std::optional<std::uint32_t> part_number;  // single-subrequest path

    // Check preconditions and parse the range.
    // InvalidRequest for an empty bucket/key, a malformed range, part number 0,
    // or a part number combined with a range.
    [[nodiscard]] std::expected<std::optional<ByteRange>, TransferError> validate() const;

    // True when the transfer reproduces the whole stored object
    [[nodiscard]] bool covers_whole_object() const noexcept {
        return !range && !part_number;
    }
};

} // namespace ranger::core
