// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/byte_range.hpp>
#include <ranger/core/bytes.hpp>
#include <ranger/core/object_meta.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>

namespace ranger::core {

struct GetObjectRequest {
    std::string bucket;
    std::string key;
    std::optional<RangeSpec> range;
    std::optional<std::uint32_t> part_number;
};

struct HeadObjectRequest {
    std::string bucket;
    std::string key;
};

// A fully buffered response
struct ObjectResponse {
    std::int32_t status_code{0};
    Bytes body;
    std::optional<ContentRange> content_range;
    Headers headers;
};

// Subrequest executor. Implementations retry internally; a returned error is
// final. Calls must return promptly with ClientErrc::cancelled once stop is
// requested on the token, and must be safe to call from many threads at once.
class ObjectClient {
public:
    virtual ~ObjectClient() = default;

    [[nodiscard]] virtual std::expected<ObjectResponse, std::error_code>
    get_object(const GetObjectRequest& request, std::stop_token stoken) = 0;

    [[nodiscard]] virtual std::expected<ObjectResponse, std::error_code>
    head_object(const HeadObjectRequest& request, std::stop_token stoken) = 0;
};

} // namespace ranger::core
