// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/url.hpp>
#include <ranger/core/error.hpp>
#include <algorithm>
#include <cctype>

namespace ranger::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    const auto invalid = std::unexpected(make_error_code(ClientErrc::invalid_endpoint));
    Url url;

    // Parse scheme
    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return invalid;
    }

    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }
    if (url.scheme_ != "http" && url.scheme_ != "https") {
        return invalid;
    }

    auto rest_start = scheme_end + 3; // Skip "://"

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) {
        path_start = url_str.length();
    }

    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }

    // host_end is at the first of: /, ?, or end
    auto host_end = std::min({path_start, query_start, url_str.length()});
    if (path_start > query_start) {
        path_start = url_str.length();
    }

    // Skip userinfo portion (user:pass@host)
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);

    // IPv6 address in brackets [::1]:port
    if (!authority.empty() && authority.front() == '[') {
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return invalid;
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        auto after = authority.substr(bracket_end + 1);
        if (!after.empty() && after.front() == ':') {
            url.port_ = std::string(after.substr(1));
        }
    } else {
        auto colon = authority.find(':');
        if (colon != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon));
            url.port_ = std::string(authority.substr(colon + 1));
        } else {
            url.host_ = std::string(authority);
        }
    }

    if (!std::all_of(url.port_.begin(), url.port_.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return invalid;
    }

    // Path without trailing slash so keys can be appended
    if (path_start < url_str.length()) {
        url.path_ = std::string(url_str.substr(path_start, query_start - path_start));
        while (!url.path_.empty() && url.path_.back() == '/') {
            url.path_.pop_back();
        }
    }

    if (url.host_.empty()) {
        return invalid;
    }

    return url;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

//=============================================================================
// ObjectUri
//=============================================================================

std::expected<ObjectUri, std::error_code> ObjectUri::parse(std::string_view uri) noexcept {
    const auto invalid = std::unexpected(make_error_code(TransferErrc::invalid_request));

    constexpr std::string_view prefix = "s3://";
    if (uri.substr(0, prefix.size()) != prefix) {
        return invalid;
    }
    uri.remove_prefix(prefix.size());

    auto slash = uri.find('/');
    if (slash == std::string_view::npos || slash == 0 || slash + 1 == uri.size()) {
        return invalid;
    }

    ObjectUri result;
    result.bucket = std::string(uri.substr(0, slash));
    result.key = std::string(uri.substr(slash + 1));
    return result;
}

std::string ObjectUri::filename() const {
    auto last_slash = key.rfind('/');
    if (last_slash == std::string::npos) {
        return key;
    }
    auto name = key.substr(last_slash + 1);
    return name.empty() ? std::string("object.bin") : name;
}

std::string encode_key(std::string_view key) {
    constexpr char hex[] = "0123456789ABCDEF";

    std::string result;
    result.reserve(key.size());
    for (char c : key) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            result += c;
        } else {
            result += '%';
            result += hex[uc >> 4];
            result += hex[uc & 0x0F];
        }
    }
    return result;
}

} // namespace ranger::core
