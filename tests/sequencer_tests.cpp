// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ranger/core/sequencer.hpp>
#include <algorithm>
#include <numeric>
#include <random>
#include <string>
#include <vector>

using namespace ranger::core;

namespace {

ChunkResponse chunk(std::uint64_t seq) {
    return ChunkResponse{seq, Bytes::copy_from(std::to_string(seq))};
}

} // namespace

TEST_CASE("Sequencer releases chunks in order", "[sequencer]") {
    Sequencer seq;

    CHECK(seq.push(chunk(2)));
    CHECK(seq.push(chunk(1)));
    CHECK(!seq.ready());
    CHECK(!seq.pop_ready().has_value());

    CHECK(seq.push(chunk(0)));
    CHECK(seq.ready());

    for (std::uint64_t expected = 0; expected < 3; ++expected) {
        auto c = seq.pop_ready();
        REQUIRE(c.has_value());
        CHECK(c->sequence_number == expected);
        CHECK(c->data->to_string() == std::to_string(expected));
    }
    CHECK(seq.empty());
    CHECK(seq.next_expected() == 3);
    CHECK(seq.high_water_mark() == 3);
}

TEST_CASE("Sequencer rejects duplicates and stale chunks", "[sequencer]") {
    Sequencer seq;
    CHECK(seq.push(chunk(1)));
    CHECK(!seq.push(chunk(1)));
    CHECK(seq.buffered() == 1);

    CHECK(seq.push(chunk(0)));
    CHECK(seq.pop_ready()->sequence_number == 0);
    CHECK(!seq.push(chunk(0)));
    CHECK(seq.pop_ready()->sequence_number == 1);
    CHECK(seq.empty());
}

TEST_CASE("Sequencer output is ordered for any arrival order", "[sequencer]") {
    constexpr std::uint64_t count = 64;
    std::vector<std::uint64_t> order(count);
    std::iota(order.begin(), order.end(), 0);

    std::mt19937 rng(1234);
    for (int round = 0; round < 20; ++round) {
        std::shuffle(order.begin(), order.end(), rng);

        Sequencer seq;
        std::vector<std::uint64_t> delivered;
        for (auto n : order) {
            CHECK(seq.push(chunk(n)));
            while (auto c = seq.pop_ready()) {
                delivered.push_back(c->sequence_number);
            }
        }

        REQUIRE(delivered.size() == count);
        for (std::uint64_t i = 0; i < count; ++i) {
            CHECK(delivered[i] == i);
        }
    }
}

TEST_CASE("Sequencer with a later first chunk", "[sequencer]") {
    Sequencer seq(5);
    CHECK(!seq.push(chunk(4)));
    CHECK(seq.push(chunk(5)));
    CHECK(seq.pop_ready()->sequence_number == 5);
    CHECK(seq.next_expected() == 6);
}
