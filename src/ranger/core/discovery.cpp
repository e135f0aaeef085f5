// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/discovery.hpp>
#include <ranger/core/log.hpp>
#include <algorithm>
#include <limits>

namespace ranger::core {

namespace {

std::string describe(const DownloadRequest& request) {
    return request.bucket + "/" + request.key;
}

// Ranged GET of the first part, either of the object or of the caller's
// bytes=a-b range
std::expected<ObjectDiscovery, TransferError>
discover_with_ranged_get(const TransferContext& ctx,
                         const DownloadRequest& request,
                         const std::optional<ByteRange>& range,
                         std::stop_token stoken) {
    std::uint64_t part_size = std::max<std::uint64_t>(ctx.target_part_size, 1);
    std::uint64_t first = range ? range->first : 0;
    std::uint64_t last = (part_size - 1 > std::numeric_limits<std::uint64_t>::max() - first)
        ? std::numeric_limits<std::uint64_t>::max()
        : first + part_size - 1;
    if (range) {
        last = std::min(last, range->last);
    }

    RangeSpec probe{first, last};
    logger()->debug("discovering {} with GET {}", describe(request), probe.to_header());

    ObjectDiscovery discovery;
    discovery.strategy = DiscoveryStrategy::ranged_get;
    discovery.covers_whole_object = !range;

    auto response = ctx.client->get_object(
        GetObjectRequest{request.bucket, request.key, probe, std::nullopt}, stoken);

    if (!response) {
        if (response.error() == ClientErrc::range_not_satisfiable) {
            // Empty object, or a range starting past its end
            logger()->debug("{}: range not satisfiable, treating as empty", describe(request));
            discovery.meta.content_length = 0;
            return discovery;
        }
        return std::unexpected(TransferError::discovery(response.error(), "GET " + probe.to_header()));
    }

    discovery.meta = ObjectMetadata::from_headers(response->headers);
    Bytes body = std::move(response->body);

    if (response->status_code == 206) {
        auto content_range = response->content_range ? response->content_range
                                                     : discovery.meta.content_range;
        if (!content_range || !content_range->range || !content_range->total) {
            return std::unexpected(TransferError::discovery(
                make_error_code(ClientErrc::invalid_response),
                "partial response without a usable Content-Range"));
        }

        const RangeSpec& received = *content_range->range;
        if (received.start != first || body.size() != received.length()) {
            return std::unexpected(TransferError::discovery(
                make_error_code(ClientErrc::invalid_response),
                "partial response does not match " + probe.to_header()));
        }

        discovery.total_size = *content_range->total;
        std::uint64_t wanted_end = discovery.total_size - 1;
        if (range) {
            wanted_end = std::min(range->last, wanted_end);
        }
        if (received.end < wanted_end) {
            discovery.remaining = RangeSpec{received.end + 1, wanted_end};
        }
    } else {
        // Range ignored: the body is the whole object
        discovery.total_size = body.size();
        if (range) {
            auto wanted = range->resolve(discovery.total_size);
            body = wanted ? body.slice(wanted->start, wanted->length()) : Bytes{};
        }
    }

    discovery.meta.content_length = discovery.total_size;
    if (!body.empty()) {
        discovery.initial_chunk = std::move(body);
    }
    return discovery;
}

// HEAD, then resolve an open-ended range (bytes=a- or bytes=-n) against the size
std::expected<ObjectDiscovery, TransferError>
discover_with_head(const TransferContext& ctx,
                   const DownloadRequest& request,
                   const ByteRange& range,
                   std::stop_token stoken) {
    logger()->debug("discovering {} with HEAD", describe(request));

    auto response = ctx.client->head_object(HeadObjectRequest{request.bucket, request.key}, stoken);
    if (!response) {
        return std::unexpected(TransferError::discovery(response.error(), "HEAD"));
    }

    ObjectDiscovery discovery;
    discovery.strategy = DiscoveryStrategy::head_object;
    discovery.meta = ObjectMetadata::from_headers(response->headers);
    bool sized = discovery.meta.content_length
        || (discovery.meta.content_range && discovery.meta.content_range->total);
    if (!sized) {
        return std::unexpected(TransferError::discovery(
            make_error_code(ClientErrc::invalid_response), "HEAD response without an object size"));
    }
    discovery.total_size = discovery.meta.total_size();
    discovery.meta.content_length = discovery.total_size;
    discovery.remaining = range.resolve(discovery.total_size);

    if (!discovery.remaining) {
        logger()->debug("{}: range selects no bytes of a {} byte object",
                        describe(request), discovery.total_size);
    }
    return discovery;
}

std::expected<ObjectDiscovery, TransferError>
discover_part(const TransferContext& ctx, const DownloadRequest& request, std::stop_token stoken) {
    logger()->debug("fetching {} part {}", describe(request), *request.part_number);

    auto response = ctx.client->get_object(
        GetObjectRequest{request.bucket, request.key, std::nullopt, request.part_number}, stoken);
    if (!response) {
        return std::unexpected(TransferError::discovery(
            response.error(), "GET partNumber=" + std::to_string(*request.part_number)));
    }

    ObjectDiscovery discovery;
    discovery.strategy = DiscoveryStrategy::part_number;
    discovery.meta = ObjectMetadata::from_headers(response->headers);

    auto content_range = response->content_range ? response->content_range
                                                 : discovery.meta.content_range;
    if (content_range && content_range->total) {
        discovery.total_size = *content_range->total;
    } else {
        discovery.total_size = response->body.size();
    }
    discovery.meta.content_length = discovery.total_size;

    if (!response->body.empty()) {
        discovery.initial_chunk = std::move(response->body);
    }
    return discovery;
}

} // namespace

std::string_view to_string(DiscoveryStrategy strategy) noexcept {
    switch (strategy) {
        case DiscoveryStrategy::ranged_get:  return "ranged-get";
        case DiscoveryStrategy::head_object: return "head-object";
        case DiscoveryStrategy::part_number: return "part-number";
    }
    return "unknown";
}

DiscoveryStrategy choose_strategy(const DownloadRequest& request,
                                  const std::optional<ByteRange>& range) noexcept {
    if (request.part_number) {
        return DiscoveryStrategy::part_number;
    }
    if (range && range->kind != ByteRange::Kind::inclusive) {
        return DiscoveryStrategy::head_object;
    }
    return DiscoveryStrategy::ranged_get;
}

std::expected<ObjectDiscovery, TransferError>
discover_object(const TransferContext& ctx,
                const DownloadRequest& request,
                const std::optional<ByteRange>& range,
                std::stop_token stoken) {
    if (!ctx.client) {
        return std::unexpected(TransferError::invalid_request("no object client configured"));
    }

    std::expected<ObjectDiscovery, TransferError> result;
    switch (choose_strategy(request, range)) {
        case DiscoveryStrategy::part_number:
            result = discover_part(ctx, request, stoken);
            break;
        case DiscoveryStrategy::head_object:
            result = discover_with_head(ctx, request, *range, stoken);
            break;
        case DiscoveryStrategy::ranged_get:
            result = discover_with_ranged_get(ctx, request, range, stoken);
            break;
    }

    if (result) {
        logger()->debug("{}: {} bytes via {}, initial chunk {} bytes, remaining {}",
                        describe(request), result->total_size, to_string(result->strategy),
                        result->initial_chunk ? result->initial_chunk->size() : 0,
                        result->remaining ? result->remaining->to_header() : std::string("none"));
    } else {
        logger()->warn("{}: {}", describe(request), result.error().message());
    }
    return result;
}

} // namespace ranger::core
