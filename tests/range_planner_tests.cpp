// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ranger/core/config.hpp>
#include <ranger/core/range_planner.hpp>
#include <vector>

using namespace ranger::core;

namespace {

std::vector<WorkItem> drain(RangePlanner planner) {
    std::vector<WorkItem> items;
    while (auto item = planner.next()) {
        items.push_back(*item);
    }
    return items;
}

} // namespace

TEST_CASE("RangePlanner splits the remaining range", "[planner]") {
    SECTION("20 MiB object after an 8 MiB first part") {
        constexpr std::uint64_t total = 20 * MEBIBYTE;
        constexpr std::uint64_t part = 8 * MEBIBYTE;

        RangePlanner planner(total, part, 1, RangeSpec{part, total - 1});
        CHECK(planner.remaining_items() == 2);

        auto items = drain(planner);
        REQUIRE(items.size() == 2);
        CHECK(items[0] == WorkItem{1, RangeSpec{8 * MEBIBYTE, 16 * MEBIBYTE - 1}});
        CHECK(items[1] == WorkItem{2, RangeSpec{16 * MEBIBYTE, 20 * MEBIBYTE - 1}});
        CHECK(items[1].range.length() == 4 * MEBIBYTE);
    }

    SECTION("Exact multiple of the part size") {
        auto items = drain(RangePlanner(300, 100, 0, RangeSpec{0, 299}));
        REQUIRE(items.size() == 3);
        for (const auto& item : items) {
            CHECK(item.range.length() == 100);
        }
    }

    SECTION("Part larger than the remaining range gives one item") {
        auto items = drain(RangePlanner(1000, 5000, 1, RangeSpec{10, 999}));
        REQUIRE(items.size() == 1);
        CHECK(items[0] == WorkItem{1, RangeSpec{10, 999}});
    }

    SECTION("Items are contiguous and numbered in order") {
        auto items = drain(RangePlanner(1001, 64, 3, RangeSpec{0, 1000}));
        REQUIRE(!items.empty());

        std::uint64_t expected_start = 0;
        std::uint64_t expected_seq = 3;
        for (const auto& item : items) {
            CHECK(item.sequence_number == expected_seq++);
            CHECK(item.range.start == expected_start);
            CHECK(item.range.length() <= 64);
            expected_start = item.range.end + 1;
        }
        CHECK(expected_start == 1001);
        CHECK(items.back().range.length() == 1001 % 64);
    }
}

TEST_CASE("RangePlanner edge cases", "[planner]") {
    SECTION("No remaining range") {
        RangePlanner planner(100, 10, 1, std::nullopt);
        CHECK(planner.exhausted());
        CHECK(planner.remaining_items() == 0);
        CHECK(!planner.next().has_value());
    }

    SECTION("Empty object plans nothing") {
        RangePlanner planner(0, 10, 0, RangeSpec{0, 0});
        CHECK(planner.exhausted());
        CHECK(!planner.next().has_value());
    }

    SECTION("Remaining range clipped to the object") {
        auto items = drain(RangePlanner(50, 100, 0, RangeSpec{20, 500}));
        REQUIRE(items.size() == 1);
        CHECK(items[0].range == RangeSpec{20, 49});
    }

    SECTION("Remaining range past the end") {
        CHECK(drain(RangePlanner(50, 10, 0, RangeSpec{50, 60})).empty());
    }

    SECTION("Zero part size is treated as one byte") {
        RangePlanner planner(3, 0, 0, RangeSpec{0, 2});
        CHECK(planner.part_size() == 1);
        CHECK(drain(planner).size() == 3);
    }

    SECTION("Exhausted after the last item") {
        RangePlanner planner(10, 5, 0, RangeSpec{0, 9});
        CHECK(planner.next().has_value());
        CHECK(!planner.exhausted());
        CHECK(planner.next().has_value());
        CHECK(planner.exhausted());
        CHECK(!planner.next().has_value());
        CHECK(!planner.next().has_value());
    }
}

TEST_CASE("RangePlanner output depends only on its inputs", "[planner]") {
    auto a = drain(RangePlanner(12345, 1000, 1, RangeSpec{1000, 12344}));
    auto b = drain(RangePlanner(12345, 1000, 1, RangeSpec{1000, 12344}));
    CHECK(a == b);
    CHECK(a.size() == 12);
}
