// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace ranger::core {

// Inclusive byte interval [start, end], as in an HTTP Range header
struct RangeSpec {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }

    // "bytes=start-end"
    [[nodiscard]] std::string to_header() const;

    bool operator==(const RangeSpec&) const = default;
};

// A caller-supplied Range header value
struct ByteRange {
    enum class Kind : std::uint8_t {
        inclusive, // bytes=a-b
        all_from,  // bytes=a-
        last       // bytes=-n
    };

    Kind kind{Kind::inclusive};
    std::uint64_t first{0}; // a, or n for Kind::last
    std::uint64_t last{0};  // b, only for Kind::inclusive

    [[nodiscard]] static std::expected<ByteRange, std::error_code> parse(std::string_view header) noexcept;

    // Concrete interval within an object of total_size bytes; nullopt when nothing overlaps
    [[nodiscard]] std::optional<RangeSpec> resolve(std::uint64_t total_size) const noexcept;

    bool operator==(const ByteRange&) const = default;
};

// A Content-Range response header: "bytes 0-99/700", "bytes */700", "bytes 0-99/*"
struct ContentRange {
    std::optional<RangeSpec> range;
    std::optional<std::uint64_t> total;

    [[nodiscard]] static std::expected<ContentRange, std::error_code> parse(std::string_view header) noexcept;

    bool operator==(const ContentRange&) const = default;
};

} // namespace ranger::core
