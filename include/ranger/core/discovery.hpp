// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/byte_range.hpp>
#include <ranger/core/bytes.hpp>
#include <ranger/core/context.hpp>
#include <ranger/core/download_request.hpp>
#include <ranger/core/error.hpp>
#include <ranger/core/object_meta.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string_view>

namespace ranger::core {

enum class DiscoveryStrategy : std::uint8_t {
    ranged_get,  // first part doubles as the size probe
    head_object, // open-ended caller range, resolved against the size
    part_number  // one GET for a stored part, no splitting
};

[[nodiscard]] std::string_view to_string(DiscoveryStrategy strategy) noexcept;

// Which probe a request needs
[[nodiscard]] DiscoveryStrategy choose_strategy(const DownloadRequest& request,
                                                const std::optional<ByteRange>& range) noexcept;

// Outcome of probing the object
struct ObjectDiscovery {
    DiscoveryStrategy strategy{DiscoveryStrategy::ranged_get};
    std::uint64_t total_size{0};                // whole object
    ObjectMetadata meta;
    std::optional<Bytes> initial_chunk;         // never empty when set
    std::optional<RangeSpec> remaining;         // bytes still to fetch
    bool covers_whole_object{false};            // bytes 0..total_size-1 will be delivered

    // Sequence number of the first planned work item
    [[nodiscard]] std::uint64_t start_sequence() const noexcept { return initial_chunk ? 1 : 0; }
};

// Learn the object size and metadata, capturing the first part when the probe
// is a GET. range is the result of request.validate().
[[nodiscard]] std::expected<ObjectDiscovery, TransferError>
discover_object(const TransferContext& ctx,
                const DownloadRequest& request,
                const std::optional<ByteRange>& range,
                std::stop_token stoken);

} // namespace ranger::core
