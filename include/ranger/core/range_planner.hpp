// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/byte_range.hpp>
#include <cstdint>
#include <optional>

namespace ranger::core {

// One ranged subrequest to execute
struct WorkItem {
    std::uint64_t sequence_number{0};
    RangeSpec range;

    bool operator==(const WorkItem&) const = default;
};

// Splits the remaining part of an object into part-sized work items.
// Lazy and single-pass; the output depends only on the constructor inputs.
class RangePlanner {
public:
    // remaining is clipped to [0, total_size); nullopt or an empty object
    // yields no items. A part_size of 0 is treated as 1.
    RangePlanner(std::uint64_t total_size,
                 std::uint64_t part_size,
                 std::uint64_t start_seq,
                 std::optional<RangeSpec> remaining) noexcept;

    // Next item in plan order, nullopt when exhausted
    [[nodiscard]] std::optional<WorkItem> next() noexcept;

    // Items not yet returned by next()
    [[nodiscard]] std::uint64_t remaining_items() const noexcept;

    [[nodiscard]] bool exhausted() const noexcept { return !has_more_; }
    [[nodiscard]] std::uint64_t part_size() const noexcept { return part_size_; }
    [[nodiscard]] std::uint64_t start_sequence() const noexcept { return start_seq_; }

private:
    std::uint64_t part_size_;
    std::uint64_t start_seq_;
    std::uint64_t next_seq_;
    std::uint64_t cursor_{0};  // next byte offset to plan
    std::uint64_t end_{0};     // inclusive last byte
    bool has_more_{false};
};

} // namespace ranger::core
