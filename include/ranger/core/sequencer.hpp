// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/bytes.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace ranger::core {

// Completion of one subrequest. data is always set for real chunks.
struct ChunkResponse {
    std::uint64_t sequence_number{0};
    std::optional<Bytes> data;
};

// Reorder buffer: a min-heap of chunks keyed by sequence number.
// pop_ready() only releases the chunk whose number is next_expected().
class Sequencer {
public:
    explicit Sequencer(std::uint64_t first_expected = 0) noexcept
        : next_expected_(first_expected) {}

    // False (chunk dropped) for a duplicate or an already delivered number
    bool push(ChunkResponse chunk);

    [[nodiscard]] std::optional<ChunkResponse> pop_ready();

    [[nodiscard]] bool ready() const noexcept;
    [[nodiscard]] std::uint64_t next_expected() const noexcept { return next_expected_; }
    [[nodiscard]] std::size_t buffered() const noexcept { return heap_.size(); }
    [[nodiscard]] bool empty() const noexcept { return heap_.empty(); }

    // Largest buffered() seen so far
    [[nodiscard]] std::size_t high_water_mark() const noexcept { return high_water_; }

private:
    std::vector<ChunkResponse> heap_;
    std::uint64_t next_expected_;
    std::size_t high_water_{0};
};

} // namespace ranger::core
