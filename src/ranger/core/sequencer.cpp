// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/sequencer.hpp>
#include <ranger/core/log.hpp>
#include <algorithm>

namespace ranger::core {

namespace {

// std heap algorithms build a max-heap; invert for smallest sequence on top
struct Later {
    bool operator()(const ChunkResponse& a, const ChunkResponse& b) const noexcept {
        return a.sequence_number > b.sequence_number;
    }
};

} // namespace

bool Sequencer::push(ChunkResponse chunk) {
    auto seq = chunk.sequence_number;
    if (seq < next_expected_) {
        logger()->warn("dropping chunk {}: already delivered (next expected {})", seq, next_expected_);
        return false;
    }

    bool duplicate = std::any_of(heap_.begin(), heap_.end(), [seq](const ChunkResponse& c) {
        return c.sequence_number == seq;
    });
    if (duplicate) {
        logger()->warn("dropping duplicate chunk {}", seq);
        return false;
    }

    heap_.push_back(std::move(chunk));
    std::push_heap(heap_.begin(), heap_.end(), Later{});
    high_water_ = std::max(high_water_, heap_.size());
    return true;
}

bool Sequencer::ready() const noexcept {
    return !heap_.empty() && heap_.front().sequence_number == next_expected_;
}

std::optional<ChunkResponse> Sequencer::pop_ready() {
    if (!ready()) return std::nullopt;

    std::pop_heap(heap_.begin(), heap_.end(), Later{});
    ChunkResponse chunk = std::move(heap_.back());
    heap_.pop_back();
    ++next_expected_;
    return chunk;
}

} // namespace ranger::core
