// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/bytes.hpp>
#include <ranger/core/channel.hpp>
#include <ranger/core/checksum.hpp>
#include <ranger/core/error.hpp>
#include <ranger/core/object_meta.hpp>
#include <ranger/core/sequencer.hpp>
#include <ranger/core/task_set.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <system_error>

namespace ranger::core {

// What a worker reports for one work item
using ChunkResult = std::expected<ChunkResponse, TransferError>;

// Ordered byte stream over unordered worker completions.
//
// next() yields chunks in object order, then nullopt. The first error ends
// the stream: it is returned once and every later call returns nullopt.
// Not thread-safe; one consumer pulls at a time.
class OrderedBody {
public:
    // expected_chunks: total number of chunks the transfer delivers.
    // Every chunk numbered >= first_planned_seq holds one delivery credit,
    // returned to credits when the chunk is handed to the consumer.
    OrderedBody(Receiver<ChunkResult> results,
                std::uint64_t expected_chunks,
                std::uint64_t first_planned_seq,
                std::shared_ptr<DeliveryCredits> credits,
                std::unique_ptr<ChecksumValidator> validator);

    OrderedBody(const OrderedBody&) = delete;
    OrderedBody& operator=(const OrderedBody&) = delete;

    // Queue a chunk that did not come through a worker (the discovery part)
    void inject(ChunkResponse chunk);

    // Next chunk in order, an error, or nullopt at end of stream
    [[nodiscard]] std::optional<std::expected<Bytes, TransferError>> next();

    // Drain the rest of the stream into one buffer
    [[nodiscard]] std::expected<Bytes, TransferError> collect();

    // End the stream without delivering anything further
    void close() noexcept;

    [[nodiscard]] bool finished() const noexcept { return done_; }
    [[nodiscard]] std::uint64_t expected_chunks() const noexcept { return expected_chunks_; }
    [[nodiscard]] std::size_t buffered() const noexcept { return sequencer_.buffered(); }
    [[nodiscard]] std::size_t max_buffered() const noexcept { return sequencer_.high_water_mark(); }

    [[nodiscard]] std::uint64_t bytes_delivered() const noexcept {
        return bytes_delivered_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] std::uint64_t chunks_delivered() const noexcept {
        return chunks_delivered_.load(std::memory_order_relaxed);
    }

private:
    // End of stream: run the checksum check, stop receiving
    [[nodiscard]] std::optional<std::expected<Bytes, TransferError>> finish();
    [[nodiscard]] std::optional<std::expected<Bytes, TransferError>> fail(TransferError error);

    Receiver<ChunkResult> results_;
    Sequencer sequencer_;
    std::uint64_t expected_chunks_;
    std::uint64_t first_planned_seq_;
    std::shared_ptr<DeliveryCredits> credits_;
    std::unique_ptr<ChecksumValidator> validator_;
    bool done_{false};

    std::atomic<std::uint64_t> bytes_delivered_{0};
    std::atomic<std::uint64_t> chunks_delivered_{0};
};

// Owner of a running transfer. Destroying it cancels and joins every task.
class DownloadHandle {
public:
    DownloadHandle(ObjectMetadata meta,
                   std::unique_ptr<OrderedBody> body,
                   std::unique_ptr<TaskSet> tasks) noexcept;
    ~DownloadHandle();

    DownloadHandle(const DownloadHandle&) = delete;
    DownloadHandle& operator=(const DownloadHandle&) = delete;
    DownloadHandle(DownloadHandle&&) noexcept = default;
    DownloadHandle& operator=(DownloadHandle&& other) noexcept;

    // Available before any chunk is pulled
    [[nodiscard]] const ObjectMetadata& object_metadata() const noexcept { return meta_; }

    // The ordered body, owned by this handle. A second call fails with
    // TransferErrc::invalid_request.
    [[nodiscard]] std::expected<OrderedBody*, std::error_code> body() noexcept;

    // Cancel and join all tasks now. Buffered chunks are discarded.
    void abort() noexcept;

    [[nodiscard]] std::size_t task_count() const noexcept { return tasks_ ? tasks_->size() : 0; }
    [[nodiscard]] std::uint64_t bytes_delivered() const noexcept {
        return body_ ? body_->bytes_delivered() : 0;
    }
    [[nodiscard]] std::uint64_t chunks_delivered() const noexcept {
        return body_ ? body_->chunks_delivered() : 0;
    }

private:
    ObjectMetadata meta_;
    std::unique_ptr<OrderedBody> body_;
    std::unique_ptr<TaskSet> tasks_;   // declared last, destroyed first
    bool body_taken_{false};
};

} // namespace ranger::core
