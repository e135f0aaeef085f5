// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/downloader.hpp>
#include <ranger/core/channel.hpp>
#include <ranger/core/log.hpp>
#include <ranger/core/range_planner.hpp>
#include <algorithm>
#include <exception>
#include <string>

namespace ranger::core {

namespace {

// One ranged GET for a work item. Exceptions become ChunkFailed.
ChunkResult fetch_chunk(ObjectClient& client,
                        const std::string& bucket,
                        const std::string& key,
                        const WorkItem& item,
                        std::stop_token stoken) {
    try {
        auto response = client.get_object(
            GetObjectRequest{bucket, key, item.range, std::nullopt}, std::move(stoken));
        if (!response) {
            return std::unexpected(TransferError::chunk_failed(
                item.sequence_number, response.error(), "GET " + item.range.to_header()));
        }

        if (response->body.size() != item.range.length()) {
            return std::unexpected(TransferError::chunk_failed(
                item.sequence_number, make_error_code(ClientErrc::invalid_response),
                "GET " + item.range.to_header() + " returned " + std::to_string(response->body.size())
                + " bytes"));
        }

        return ChunkResponse{item.sequence_number, std::move(response->body)};
    } catch (const std::exception& e) {
        return std::unexpected(TransferError::chunk_failed(
            item.sequence_number, {}, std::string("worker exception: ") + e.what()));
    } catch (...) {
        return std::unexpected(TransferError::chunk_failed(
            item.sequence_number, {}, "worker exception of unknown type"));
    }
}

// Pops work items until the work channel closes or a subrequest fails
void run_worker(std::size_t id,
                std::shared_ptr<ObjectClient> client,
                std::string bucket,
                std::string key,
                Receiver<WorkItem> work,
                Sender<ChunkResult> results,
                std::stop_token stoken) {
    std::uint64_t completed = 0;

    while (auto item = work.recv(stoken)) {
        auto chunk = fetch_chunk(*client, bucket, key, *item, stoken);

        if (!chunk) {
            if (stoken.stop_requested()) {
                break;  // cancelled, not a failure
            }
            logger()->warn("worker {}: {}", id, chunk.error().message());
            // Exit either way; a failed send means the consumer is gone
            (void)results.send(std::move(chunk), stoken);
            return;
        }

        if (!results.send(std::move(chunk), stoken)) {
            break;
        }
        ++completed;
    }

    logger()->debug("worker {} exiting after {} chunks", id, completed);
}

// Feeds the plan into the work channel, one delivery credit per item
void run_distributor(RangePlanner planner,
                     Sender<WorkItem> work,
                     std::shared_ptr<DeliveryCredits> credits,
                     std::stop_token stoken) {
    std::uint64_t sent = 0;

    while (auto item = planner.next()) {
        if (!credits->acquire(stoken)) {
            logger()->debug("distributor cancelled after {} items", sent);
            return;
        }
        if (!work.send(*item, stoken)) {
            logger()->debug("distributor stopped after {} items: no workers left", sent);
            return;
        }
        ++sent;
    }

    logger()->debug("distributor finished, {} items sent", sent);
}

} // namespace

//=============================================================================
// Downloader
//=============================================================================

Downloader::Downloader(TransferContext ctx) noexcept
    : ctx_(std::move(ctx)) {
    ctx_.concurrency = std::max<std::uint32_t>(ctx_.concurrency, 1);
    ctx_.target_part_size = std::max<std::uint64_t>(ctx_.target_part_size, 1);
}

DownloaderBuilder Downloader::builder() {
    return DownloaderBuilder{};
}

std::expected<ObjectDiscovery, TransferError> Downloader::discover(const DownloadRequest& request) const {
    auto range = request.validate();
    if (!range) {
        return std::unexpected(std::move(range.error()));
    }
    return discover_object(ctx_, request, *range, {});
}

std::expected<DownloadHandle, TransferError> Downloader::start(DownloadRequest request) const {
    auto range = request.validate();
    if (!range) {
        logger()->debug("rejecting request: {}", range.error().message());
        return std::unexpected(std::move(range.error()));
    }

    auto discovery = discover_object(ctx_, request, *range, {});
    if (!discovery) {
        return std::unexpected(std::move(discovery.error()));
    }

    std::unique_ptr<ChecksumValidator> validator;
    if (ctx_.checksum_policy == ChecksumPolicy::validate_full_object && discovery->covers_whole_object) {
        validator = make_validator(discovery->meta);
        if (validator) {
            logger()->debug("validating body against {} checksum", to_string(validator->algorithm()));
        }
    }

    std::uint64_t first_planned = discovery->start_sequence();
    RangePlanner planner(discovery->total_size, ctx_.target_part_size, first_planned, discovery->remaining);
    std::uint64_t expected_chunks = first_planned + planner.remaining_items();

    auto tasks = std::make_unique<TaskSet>();
    std::unique_ptr<OrderedBody> body;

    if (planner.exhausted()) {
        // Everything came back with discovery
        body = std::make_unique<OrderedBody>(Receiver<ChunkResult>{}, expected_chunks, first_planned,
                                             nullptr, std::move(validator));
    } else {
        std::uint32_t concurrency = ctx_.concurrency;
        auto credits = std::make_shared<DeliveryCredits>(concurrency);
        auto work_channel = make_channel<WorkItem>(concurrency);
        auto result_channel = make_channel<ChunkResult>(concurrency);

        logger()->debug("{}/{}: {} parts of up to {} bytes from seq {}, {} workers",
                        request.bucket, request.key, planner.remaining_items(),
                        planner.part_size(), first_planned, concurrency);

        body = std::make_unique<OrderedBody>(std::move(result_channel.second), expected_chunks,
                                             first_planned, credits, std::move(validator));

        tasks->spawn([planner, work = std::move(work_channel.first), credits](std::stop_token stoken) mutable {
            run_distributor(planner, std::move(work), std::move(credits), stoken);
        });

        for (std::uint32_t i = 0; i < concurrency; ++i) {
            tasks->spawn([id = static_cast<std::size_t>(i), client = ctx_.client,
                          bucket = request.bucket, key = request.key,
                          work = work_channel.second, results = result_channel.first](std::stop_token stoken) mutable {
                run_worker(id, std::move(client), std::move(bucket), std::move(key),
                           std::move(work), std::move(results), stoken);
            });
        }

        // Only the tasks hold endpoints from here on
        work_channel.second.close();
        result_channel.first.close();
    }

    if (discovery->initial_chunk) {
        body->inject(ChunkResponse{0, std::move(*discovery->initial_chunk)});
    }

    return DownloadHandle(std::move(discovery->meta), std::move(body), std::move(tasks));
}

//=============================================================================
// DownloaderBuilder
//=============================================================================

std::expected<Downloader, std::error_code> DownloaderBuilder::build() const {
    if (!client_) {
        return std::unexpected(make_error_code(TransferErrc::invalid_request));
    }

    TransferContext ctx;
    ctx.client = client_;
    ctx.target_part_size = std::max(config_.target_part_size, MIN_PART_SIZE);
    ctx.concurrency = std::max<std::uint32_t>(config_.concurrency, 1);
    ctx.checksum_policy = config_.checksum_validation_enabled ? ChecksumPolicy::validate_full_object
                                                              : ChecksumPolicy::disabled;
    return Downloader(std::move(ctx));
}

} // namespace ranger::core
