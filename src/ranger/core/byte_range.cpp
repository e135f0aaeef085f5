// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/byte_range.hpp>
#include <ranger/core/error.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace ranger::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

// Case-insensitive prefix match
bool consume_prefix(std::string_view& s, std::string_view prefix) noexcept {
    if (s.size() < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
    }
    s.remove_prefix(prefix.size());
    return true;
}

std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
    s = trim(s);
    if (s.empty()) return std::nullopt;

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

} // namespace

std::string RangeSpec::to_header() const {
    return "bytes=" + std::to_string(start) + "-" + std::to_string(end);
}

//=============================================================================
// ByteRange
//=============================================================================

std::expected<ByteRange, std::error_code> ByteRange::parse(std::string_view header) noexcept {
    const auto invalid = std::unexpected(make_error_code(TransferErrc::invalid_request));

    auto value = trim(header);
    if (!consume_prefix(value, "bytes=")) return invalid;

    // Multiple ranges are not supported
    if (value.find(',') != std::string_view::npos) return invalid;

    auto dash = value.find('-');
    if (dash == std::string_view::npos) return invalid;

    auto first_str = trim(value.substr(0, dash));
    auto last_str = trim(value.substr(dash + 1));

    ByteRange range;
    if (first_str.empty()) {
        auto n = parse_u64(last_str);
        if (!n) return invalid;
        range.kind = Kind::last;
        range.first = *n;
        return range;
    }

    auto first = parse_u64(first_str);
    if (!first) return invalid;

    if (last_str.empty()) {
        range.kind = Kind::all_from;
        range.first = *first;
        return range;
    }

    auto last = parse_u64(last_str);
    if (!last || *last < *first) return invalid;

    range.kind = Kind::inclusive;
    range.first = *first;
    range.last = *last;
    return range;
}

std::optional<RangeSpec> ByteRange::resolve(std::uint64_t total_size) const noexcept {
    if (total_size == 0) return std::nullopt;

    switch (kind) {
        case Kind::inclusive:
            if (first >= total_size) return std::nullopt;
            return RangeSpec{first, std::min(last, total_size - 1)};
        case Kind::all_from:
            if (first >= total_size) return std::nullopt;
            return RangeSpec{first, total_size - 1};
        case Kind::last:
            if (first == 0) return std::nullopt;
            return RangeSpec{total_size - std::min(first, total_size), total_size - 1};
    }
    return std::nullopt;
}

//=============================================================================
// ContentRange
//=============================================================================

std::expected<ContentRange, std::error_code> ContentRange::parse(std::string_view header) noexcept {
    const auto invalid = std::unexpected(make_error_code(ClientErrc::invalid_response));

    auto value = trim(header);
    // Unit is optional; some stores omit it
    if (consume_prefix(value, "bytes")) {
        value = trim(value);
    }

    auto slash = value.find('/');
    if (slash == std::string_view::npos) return invalid;

    auto range_str = trim(value.substr(0, slash));
    auto total_str = trim(value.substr(slash + 1));

    ContentRange result;

    if (total_str != "*") {
        auto total = parse_u64(total_str);
        if (!total) return invalid;
        result.total = *total;
    }

    if (range_str != "*") {
        auto dash = range_str.find('-');
        if (dash == std::string_view::npos) return invalid;

        auto start = parse_u64(range_str.substr(0, dash));
        auto end = parse_u64(range_str.substr(dash + 1));
        if (!start || !end || *end < *start) return invalid;
        if (result.total && *end >= *result.total) return invalid;

        result.range = RangeSpec{*start, *end};
    }

    if (!result.range && !result.total) return invalid;
    return result;
}

} // namespace ranger::core
