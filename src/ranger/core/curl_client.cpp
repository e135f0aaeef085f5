// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/curl_client.hpp>
#include <ranger/core/error.hpp>
#include <ranger/core/log.hpp>
#include <curl/curl.h>
#include <cctype>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <vector>

namespace ranger::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

// Header callback; restarts on each status line so redirects don't leak headers
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<Headers*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    // Trim whitespace and \r\n
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* buffer = static_cast<std::vector<std::byte>*>(userdata);
    if (!buffer) return 0;

    std::size_t total = size * nitems;
    const std::size_t offset = buffer->size();
    buffer->resize(offset + total);
    std::memcpy(buffer->data() + offset, ptr, total);
    return total;
}

// Aborts the transfer once stop is requested
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* stoken = static_cast<std::stop_token*>(userdata);
    return (stoken && stoken->stop_requested()) ? 1 : 0;
}

std::error_code map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(ClientErrc::cancelled);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(ClientErrc::timeout);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(ClientErrc::invalid_endpoint);
        default:
            return make_error_code(ClientErrc::network_error);
    }
}

std::error_code map_status(long http_code) noexcept {
    if (http_code == 200 || http_code == 206) return {};
    if (http_code == 416) return make_error_code(ClientErrc::range_not_satisfiable);
    if (http_code == 404) return make_error_code(ClientErrc::not_found);
    if (http_code == 401 || http_code == 403) return make_error_code(ClientErrc::permission_denied);
    if (http_code >= 500) return make_error_code(ClientErrc::server_error);
    return make_error_code(ClientErrc::invalid_response);
}

bool is_transient(const std::error_code& ec) noexcept {
    return ec == ClientErrc::network_error
        || ec == ClientErrc::timeout
        || ec == ClientErrc::server_error;
}

} // namespace

//=============================================================================
// CurlObjectClient
//=============================================================================

std::expected<std::shared_ptr<CurlObjectClient>, std::error_code>
CurlObjectClient::create(ClientConfig config) noexcept {
    auto endpoint = Url::parse(config.endpoint);
    if (!endpoint) {
        return std::unexpected(endpoint.error());
    }
    try {
        return std::shared_ptr<CurlObjectClient>(
            new CurlObjectClient(std::move(config), std::move(*endpoint)));
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

CurlObjectClient::CurlObjectClient(ClientConfig config, Url endpoint) noexcept
    : config_(std::move(config))
    , endpoint_(std::move(endpoint)) {}

CurlObjectClient::~CurlObjectClient() = default;

std::string CurlObjectClient::object_url(const std::string& bucket, const std::string& key) const {
    std::string url;
    if (config_.path_style) {
        url = endpoint_.base();
        url += endpoint_.path();
        url += "/";
        url += bucket;
    } else {
        url = std::string(endpoint_.scheme());
        url += "://";
        url += bucket;
        url += ".";
        url += endpoint_.host();
        if (!endpoint_.port().empty()) {
            url += ":";
            url += endpoint_.port();
        }
        url += endpoint_.path();
    }
    url += "/";
    url += encode_key(key);
    return url;
}

std::expected<ObjectResponse, std::error_code>
CurlObjectClient::get_object(const GetObjectRequest& request, std::stop_token stoken) {
    std::string url = object_url(request.bucket, request.key);
    if (request.part_number) {
        url += "?partNumber=" + std::to_string(*request.part_number);
    }

    std::string range;
    if (request.range) {
        range = request.range->to_header();
    }
    return perform_with_retry(url, range, false, std::move(stoken));
}

std::expected<ObjectResponse, std::error_code>
CurlObjectClient::head_object(const HeadObjectRequest& request, std::stop_token stoken) {
    return perform_with_retry(object_url(request.bucket, request.key), {}, true, std::move(stoken));
}

std::expected<ObjectResponse, std::error_code>
CurlObjectClient::perform_with_retry(const std::string& url, const std::string& range, bool head,
                                     std::stop_token stoken) const noexcept {
    auto result = perform(url, range, head, stoken);

    std::uint32_t retries = 0;
    while (!result && is_transient(result.error()) && retries < config_.max_retries) {
        ++retries;
        logger()->warn("{} {}{}: retry {}/{} after error: {}",
                       head ? "HEAD" : "GET", url, range.empty() ? "" : " " + range,
                       retries, config_.max_retries, result.error().message());

        // Backoff, cut short by cancellation
        std::mutex mutex;
        std::condition_variable_any cv;
        std::unique_lock lock(mutex);
        cv.wait_for(lock, stoken, config_.retry_backoff, [] { return false; });
        if (stoken.stop_requested()) {
            return std::unexpected(make_error_code(ClientErrc::cancelled));
        }

        result = perform(url, range, head, stoken);
    }
    return result;
}

std::expected<ObjectResponse, std::error_code>
CurlObjectClient::perform(const std::string& url, const std::string& range, bool head,
                          std::stop_token stoken) const noexcept {
    if (stoken.stop_requested()) {
        return std::unexpected(make_error_code(ClientErrc::cancelled));
    }

    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(ClientErrc::network_error));
        }

        ObjectResponse response{};
        std::vector<std::byte> body;

        curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
        if (head) {
            curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        }

        // Request headers
        SlistPtr header_list;
        auto append_header = [&](const std::string& line) {
            curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
            if (appended) {
                (void)header_list.release();
                header_list.reset(appended);
            }
        };
        if (!range.empty()) {
            append_header("Range: " + range);
        }
        if (config_.checksum_mode) {
            append_header("x-amz-checksum-mode: ENABLED");
        }
        for (const auto& [name, value] : config_.headers) {
            append_header(name + ": " + value);
        }
        if (header_list) {
            curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, header_list.get());
        }

        curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
        curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout_sec));
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.low_speed_time_sec));
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, config_.verify_tls ? 1L : 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, config_.verify_tls ? 2L : 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));
        curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);

        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &body);

        // Progress callback lets cancellation abort the transfer
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &stoken);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result != CURLE_OK) {
            logger()->debug("{}: curl error {}: {}", url, static_cast<int>(result), curl_easy_strerror(result));
            return std::unexpected(map_curl_error(result));
        }

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<std::int32_t>(http_code);

        if (auto ec = map_status(http_code)) {
            logger()->debug("{}: HTTP {}", url, http_code);
            return std::unexpected(ec);
        }

        auto cr_it = response.headers.find("content-range");
        if (cr_it != response.headers.end()) {
            auto parsed = ContentRange::parse(cr_it->second);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            response.content_range = *parsed;
        }

        response.body = Bytes(std::move(body));
        return response;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void CurlObjectClient::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlObjectClient::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace ranger::core
