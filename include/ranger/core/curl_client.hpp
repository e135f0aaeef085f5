// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/config.hpp>
#include <ranger/core/object_client.hpp>
#include <ranger/core/url.hpp>
#include <expected>
#include <memory>
#include <string>

namespace ranger::core {

// ObjectClient over libcurl. Requests are unsigned; use static headers or a
// pre-authorised endpoint for access control. Thread-safe: each call uses its
// own easy handle.
class CurlObjectClient final : public ObjectClient {
public:
    [[nodiscard]] static std::expected<std::shared_ptr<CurlObjectClient>, std::error_code>
    create(ClientConfig config) noexcept;

    ~CurlObjectClient() override;

    CurlObjectClient(const CurlObjectClient&) = delete;
    CurlObjectClient& operator=(const CurlObjectClient&) = delete;

    [[nodiscard]] std::expected<ObjectResponse, std::error_code>
    get_object(const GetObjectRequest& request, std::stop_token stoken) override;

    [[nodiscard]] std::expected<ObjectResponse, std::error_code>
    head_object(const HeadObjectRequest& request, std::stop_token stoken) override;

    // URL for an object under the configured addressing style
    [[nodiscard]] std::string object_url(const std::string& bucket, const std::string& key) const;

    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    CurlObjectClient(ClientConfig config, Url endpoint) noexcept;

    // One request, no retries
    [[nodiscard]] std::expected<ObjectResponse, std::error_code>
    perform(const std::string& url, const std::string& range, bool head,
            std::stop_token stoken) const noexcept;

    // perform() with retries of transient failures
    [[nodiscard]] std::expected<ObjectResponse, std::error_code>
    perform_with_retry(const std::string& url, const std::string& range, bool head,
                       std::stop_token stoken) const noexcept;

    ClientConfig config_;
    Url endpoint_;
};

} // namespace ranger::core
