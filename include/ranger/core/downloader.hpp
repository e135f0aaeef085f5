// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/config.hpp>
#include <ranger/core/context.hpp>
#include <ranger/core/discovery.hpp>
#include <ranger/core/download_handle.hpp>
#include <ranger/core/download_request.hpp>
#include <ranger/core/error.hpp>
#include <ranger/core/object_client.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <system_error>

namespace ranger::testing {
struct DownloaderAccess;
} // namespace ranger::testing

namespace ranger::core {

class DownloaderBuilder;

// Concurrent ranged download of one object into an ordered byte stream.
//
// start() probes the object, then splits what is left into part-sized
// ranged GETs run by `concurrency` worker threads. The returned handle owns
// those threads and the ordered body. Instances come from builder().
class Downloader {
public:
    [[nodiscard]] static DownloaderBuilder builder();

    [[nodiscard]] std::expected<DownloadHandle, TransferError> start(DownloadRequest request) const;

    // Discovery only, no workers
    [[nodiscard]] std::expected<ObjectDiscovery, TransferError> discover(const DownloadRequest& request) const;

    [[nodiscard]] const TransferContext& context() const noexcept { return ctx_; }

private:
    friend class DownloaderBuilder;
    friend struct testing::DownloaderAccess;

    // Context is used as given; the builder applies the part size floor
    explicit Downloader(TransferContext ctx) noexcept;

    TransferContext ctx_;
};

class DownloaderBuilder {
public:
    DownloaderBuilder() = default;

    // Mandatory
    DownloaderBuilder& executor(std::shared_ptr<ObjectClient> client) noexcept {
        client_ = std::move(client);
        return *this;
    }

    // Raised to MIN_PART_SIZE
    DownloaderBuilder& target_part_size_bytes(std::uint64_t bytes) noexcept {
        config_.target_part_size = bytes;
        return *this;
    }

    // 0 is raised to 1
    DownloaderBuilder& concurrency(std::uint32_t n) noexcept {
        config_.concurrency = n;
        return *this;
    }

    DownloaderBuilder& checksum_validation_enabled(bool enabled) noexcept {
        config_.checksum_validation_enabled = enabled;
        return *this;
    }

    DownloaderBuilder& config(const DownloaderConfig& cfg) noexcept {
        config_ = cfg;
        return *this;
    }

    // TransferErrc::invalid_request when no executor was set
    [[nodiscard]] std::expected<Downloader, std::error_code> build() const;

private:
    std::shared_ptr<ObjectClient> client_;
    DownloaderConfig config_;
};

} // namespace ranger::core
