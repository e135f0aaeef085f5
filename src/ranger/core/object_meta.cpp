// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/object_meta.hpp>
#include <charconv>

namespace ranger::core {

namespace {

std::string header_or_empty(const Headers& headers, const std::string& name) {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : std::string{};
}

template<typename T>
std::optional<T> header_number(const Headers& headers, const std::string& name) noexcept {
    auto it = headers.find(name);
    if (it == headers.end() || it->second.empty()) return std::nullopt;

    const auto& str = it->second;
    T value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size()) return std::nullopt;
    return value;
}

} // namespace

ObjectMetadata ObjectMetadata::from_headers(const Headers& headers) {
    ObjectMetadata meta;

    auto cr_it = headers.find("content-range");
    if (cr_it != headers.end()) {
        auto parsed = ContentRange::parse(cr_it->second);
        if (parsed) {
            meta.content_range = *parsed;
        }
    }

    // Normalize to the whole object when this was a partial response
    if (meta.content_range && meta.content_range->total) {
        meta.content_length = *meta.content_range->total;
    } else {
        meta.content_length = header_number<std::uint64_t>(headers, "content-length");
    }

    meta.etag = header_or_empty(headers, "etag");
    meta.content_type = header_or_empty(headers, "content-type");
    meta.content_encoding = header_or_empty(headers, "content-encoding");
    meta.content_disposition = header_or_empty(headers, "content-disposition");
    meta.cache_control = header_or_empty(headers, "cache-control");
    meta.last_modified = header_or_empty(headers, "last-modified");
    meta.version_id = header_or_empty(headers, "x-amz-version-id");
    meta.parts_count = header_number<std::uint32_t>(headers, "x-amz-mp-parts-count");

    meta.checksum_crc32 = header_or_empty(headers, "x-amz-checksum-crc32");
    meta.checksum_crc32c = header_or_empty(headers, "x-amz-checksum-crc32c");
    meta.checksum_sha1 = header_or_empty(headers, "x-amz-checksum-sha1");
    meta.checksum_sha256 = header_or_empty(headers, "x-amz-checksum-sha256");
    meta.checksum_type = header_or_empty(headers, "x-amz-checksum-type");

    return meta;
}

std::uint64_t ObjectMetadata::total_size() const noexcept {
    if (content_range && content_range->total) {
        return *content_range->total;
    }
    return content_length.value_or(0);
}

} // namespace ranger::core
