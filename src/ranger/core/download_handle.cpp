// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/download_handle.hpp>
#include <ranger/core/log.hpp>
#include <vector>

namespace ranger::core {

//=============================================================================
// OrderedBody
//=============================================================================

OrderedBody::OrderedBody(Receiver<ChunkResult> results,
                         std::uint64_t expected_chunks,
                         std::uint64_t first_planned_seq,
                         std::shared_ptr<DeliveryCredits> credits,
                         std::unique_ptr<ChecksumValidator> validator)
    : results_(std::move(results))
    , expected_chunks_(expected_chunks)
    , first_planned_seq_(first_planned_seq)
    , credits_(std::move(credits))
    , validator_(std::move(validator)) {}

void OrderedBody::inject(ChunkResponse chunk) {
    (void)sequencer_.push(std::move(chunk));
}

std::optional<std::expected<Bytes, TransferError>> OrderedBody::next() {
    if (done_) return std::nullopt;

    while (true) {
        if (auto chunk = sequencer_.pop_ready()) {
            if (credits_ && chunk->sequence_number >= first_planned_seq_) {
                credits_->release();
            }
            if (!chunk->data) {
                continue;  // sentinel, carries no bytes
            }

            Bytes data = std::move(*chunk->data);
            if (validator_) {
                validator_->update(data);
            }
            bytes_delivered_.fetch_add(data.size(), std::memory_order_relaxed);
            chunks_delivered_.fetch_add(1, std::memory_order_relaxed);
            return std::expected<Bytes, TransferError>(std::move(data));
        }

        if (sequencer_.next_expected() >= expected_chunks_) {
            return finish();
        }

        auto item = results_.recv();
        if (!item) {
            // Every worker is gone but a chunk is still missing
            return fail(TransferError::chunk_failed(
                sequencer_.next_expected(), make_error_code(ClientErrc::invalid_response),
                "stream ended before all parts were received"));
        }
        if (!*item) {
            return fail(std::move(item->error()));
        }

        auto& chunk = **item;
        if (chunk.sequence_number >= expected_chunks_) {
            logger()->warn("dropping chunk {}: beyond the {} planned chunks",
                           chunk.sequence_number, expected_chunks_);
            continue;
        }
        (void)sequencer_.push(std::move(chunk));
    }
}

std::expected<Bytes, TransferError> OrderedBody::collect() {
    std::vector<std::byte> buffer;
    while (auto item = next()) {
        if (!*item) {
            return std::unexpected(std::move(item->error()));
        }
        auto span = (*item)->span();
        buffer.insert(buffer.end(), span.begin(), span.end());
    }
    return Bytes(std::move(buffer));
}

void OrderedBody::close() noexcept {
    done_ = true;
    results_.close();
}

std::optional<std::expected<Bytes, TransferError>> OrderedBody::finish() {
    close();

    if (validator_) {
        auto verified = validator_->finish();
        validator_.reset();
        if (!verified) {
            return std::unexpected(std::move(verified.error()));
        }
    }
    return std::nullopt;
}

std::optional<std::expected<Bytes, TransferError>> OrderedBody::fail(TransferError error) {
    logger()->debug("body terminated: {}", error.message());
    close();
    validator_.reset();
    return std::unexpected(std::move(error));
}

//=============================================================================
// DownloadHandle
//=============================================================================

DownloadHandle::DownloadHandle(ObjectMetadata meta,
                               std::unique_ptr<OrderedBody> body,
                               std::unique_ptr<TaskSet> tasks) noexcept
    : meta_(std::move(meta))
    , body_(std::move(body))
    , tasks_(std::move(tasks)) {}

DownloadHandle::~DownloadHandle() {
    // Tasks first: they hold the other ends of the body's channel
    abort();
}

DownloadHandle& DownloadHandle::operator=(DownloadHandle&& other) noexcept {
    if (this != &other) {
        abort();
        meta_ = std::move(other.meta_);
        body_ = std::move(other.body_);
        tasks_ = std::move(other.tasks_);
        body_taken_ = other.body_taken_;
    }
    return *this;
}

std::expected<OrderedBody*, std::error_code> DownloadHandle::body() noexcept {
    if (body_taken_ || !body_) {
        return std::unexpected(make_error_code(TransferErrc::invalid_request));
    }
    body_taken_ = true;
    return body_.get();
}

void DownloadHandle::abort() noexcept {
    if (tasks_) {
        if (tasks_->size() > 0 && body_ && !body_->finished()) {
            logger()->debug("cancelling {} running tasks", tasks_->size());
        }
        tasks_->abort_all();
    }
    if (body_) {
        body_->close();
    }
}

} // namespace ranger::core
