// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/range_planner.hpp>
#include <algorithm>

namespace ranger::core {

RangePlanner::RangePlanner(std::uint64_t total_size,
                           std::uint64_t part_size,
                           std::uint64_t start_seq,
                           std::optional<RangeSpec> remaining) noexcept
    : part_size_(part_size == 0 ? 1 : part_size)
    , start_seq_(start_seq)
    , next_seq_(start_seq) {
    if (!remaining || total_size == 0 || remaining->start > remaining->end
        || remaining->start >= total_size) {
        return;
    }

    cursor_ = remaining->start;
    end_ = std::min(remaining->end, total_size - 1);
    has_more_ = true;
}

std::optional<WorkItem> RangePlanner::next() noexcept {
    if (!has_more_) return std::nullopt;

    // Last item may be shorter than part_size
    std::uint64_t left = end_ - cursor_;  // bytes after cursor_
    std::uint64_t last = (left < part_size_) ? end_ : cursor_ + part_size_ - 1;

    WorkItem item{next_seq_++, RangeSpec{cursor_, last}};

    if (last == end_) {
        has_more_ = false;
    } else {
        cursor_ = last + 1;
    }
    return item;
}

std::uint64_t RangePlanner::remaining_items() const noexcept {
    if (!has_more_) return 0;
    std::uint64_t bytes = end_ - cursor_ + 1;
    return (bytes + part_size_ - 1) / part_size_;
}

} // namespace ranger::core
