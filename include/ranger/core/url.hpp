// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace ranger::core {

// Endpoint URL, e.g. https://s3.example.com:9000/prefix
class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }

    [[nodiscard]] std::string base() const;  // scheme://host[:port]

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
};

// Object address, s3://bucket/key
struct ObjectUri {
    std::string bucket;
    std::string key;

    static std::expected<ObjectUri, std::error_code> parse(std::string_view uri) noexcept;

    // Last path component of the key
    [[nodiscard]] std::string filename() const;
};

// Percent-encode a key for use in a URL path; '/' is kept
[[nodiscard]] std::string encode_key(std::string_view key);

} // namespace ranger::core
