// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/error.hpp>
#include <ranger/core/object_client.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ranger::testing {

// Deterministic object contents: byte i is (i * 31 + 7) mod 251
inline std::vector<std::byte> make_object(std::size_t size) {
    std::vector<std::byte> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::byte>((i * 31 + 7) % 251);
    }
    return data;
}

inline std::vector<std::byte> to_bytes(std::string_view text) {
    auto span = std::as_bytes(std::span(text.data(), text.size()));
    return {span.begin(), span.end()};
}

// In-memory S3 stand-in with the status semantics of a real store:
// 206 + Content-Range for satisfiable ranges, 416 past the end, 200 without
// a range. Records what it was asked for and how many calls overlapped.
class FakeObjectClient final : public core::ObjectClient {
public:
    explicit FakeObjectClient(std::vector<std::byte> object)
        : object_(core::Bytes(std::move(object))) {}

    // Extra response headers (etag, checksums, ...)
    core::Headers headers;

    // Answer ranged GETs with 200 and the whole object
    bool ignore_range{false};

    // Part size used to answer partNumber requests
    std::uint64_t stored_part_size{5 * 1024 * 1024};

    // Ranged GETs starting at any of these offsets fail permanently
    std::set<std::uint64_t> fail_at_offsets;
    core::ClientErrc failure{core::ClientErrc::server_error};

    // HEAD answers without Content-Length
    bool head_without_length{false};

    // Delay before answering a range, e.g. to shuffle completion order
    std::function<std::chrono::milliseconds(const core::RangeSpec&)> delay;

    // Hold requests until release(); the first `pass` requests go through
    void hold(std::uint32_t pass = 0) {
        std::lock_guard lock(mutex_);
        holding_ = true;
        pass_ = pass;
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            holding_ = false;
        }
        cv_.notify_all();
    }

    std::expected<core::ObjectResponse, std::error_code>
    get_object(const core::GetObjectRequest& request, std::stop_token stoken) override {
        InFlight guard(*this);

        {
            std::lock_guard lock(mutex_);
            get_requests_.push_back(request);
        }

        if (!wait_turn(stoken)) {
            cancelled_.fetch_add(1);
            return std::unexpected(make_error_code(core::ClientErrc::cancelled));
        }

        if (request.range && delay) {
            if (!sleep_for(delay(*request.range), stoken)) {
                cancelled_.fetch_add(1);
                return std::unexpected(make_error_code(core::ClientErrc::cancelled));
            }
        }

        const auto total = static_cast<std::uint64_t>(object_.size());

        if (request.part_number) {
            std::uint64_t start = (*request.part_number - 1) * stored_part_size;
            if (start >= total) {
                return std::unexpected(make_error_code(core::ClientErrc::range_not_satisfiable));
            }
            std::uint64_t end = std::min(start + stored_part_size, total) - 1;
            return partial(core::RangeSpec{start, end}, total);
        }

        if (!request.range || ignore_range) {
            return whole();
        }

        if (fail_at_offsets.contains(request.range->start)) {
            return std::unexpected(make_error_code(failure));
        }

        if (request.range->start >= total) {
            return std::unexpected(make_error_code(core::ClientErrc::range_not_satisfiable));
        }

        core::RangeSpec served{request.range->start, std::min(request.range->end, total - 1)};
        return partial(served, total);
    }

    std::expected<core::ObjectResponse, std::error_code>
    head_object(const core::HeadObjectRequest&, std::stop_token) override {
        head_requests_.fetch_add(1);

        core::ObjectResponse response;
        response.status_code = 200;
        response.headers = headers;
        if (!head_without_length) {
            response.headers["content-length"] = std::to_string(object_.size());
        }
        return response;
    }

    [[nodiscard]] std::size_t get_count() const {
        std::lock_guard lock(mutex_);
        return get_requests_.size();
    }

    [[nodiscard]] std::vector<core::GetObjectRequest> get_requests() const {
        std::lock_guard lock(mutex_);
        return get_requests_;
    }

    [[nodiscard]] std::uint32_t head_count() const noexcept { return head_requests_.load(); }
    [[nodiscard]] std::uint32_t in_flight() const noexcept { return in_flight_.load(); }
    [[nodiscard]] std::uint32_t max_in_flight() const noexcept { return max_in_flight_.load(); }
    [[nodiscard]] std::uint32_t cancelled_count() const noexcept { return cancelled_.load(); }

    [[nodiscard]] const core::Bytes& object() const noexcept { return object_; }

private:
    struct InFlight {
        explicit InFlight(FakeObjectClient& c) : client(c) {
            auto now = client.in_flight_.fetch_add(1) + 1;
            auto seen = client.max_in_flight_.load();
            while (now > seen && !client.max_in_flight_.compare_exchange_weak(seen, now)) {}
        }
        ~InFlight() { client.in_flight_.fetch_sub(1); }
        FakeObjectClient& client;
    };

    bool wait_turn(std::stop_token stoken) {
        std::unique_lock lock(mutex_);
        if (pass_ > 0) {
            --pass_;
            return !stoken.stop_requested();
        }
        return cv_.wait(lock, stoken, [this] { return !holding_; });
    }

    bool sleep_for(std::chrono::milliseconds duration, std::stop_token stoken) {
        std::unique_lock lock(mutex_);
        (void)sleep_cv_.wait_for(lock, stoken, duration, [] { return false; });
        return !stoken.stop_requested();
    }

    core::ObjectResponse whole() const {
        core::ObjectResponse response;
        response.status_code = 200;
        response.body = object_;
        response.headers = headers;
        response.headers["content-length"] = std::to_string(object_.size());
        return response;
    }

    core::ObjectResponse partial(core::RangeSpec served, std::uint64_t total) const {
        core::ObjectResponse response;
        response.status_code = 206;
        response.body = object_.slice(served.start, served.length());
        response.content_range = core::ContentRange{served, total};
        response.headers = headers;
        response.headers["content-length"] = std::to_string(served.length());
        response.headers["content-range"] = "bytes " + std::to_string(served.start) + "-"
            + std::to_string(served.end) + "/" + std::to_string(total);
        return response;
    }

    core::Bytes object_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any sleep_cv_;
    bool holding_{false};
    std::uint32_t pass_{0};
    std::vector<core::GetObjectRequest> get_requests_;

    std::atomic<std::uint32_t> head_requests_{0};
    std::atomic<std::uint32_t> in_flight_{0};
    std::atomic<std::uint32_t> max_in_flight_{0};
    std::atomic<std::uint32_t> cancelled_{0};
};

} // namespace ranger::testing
