// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/core/curl_transport.hpp>
#include <clipfetch/core/log.hpp>
#include <curl/curl.h>
#include <cctype>
#include <string_view>

namespace clipfetch::core {

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

struct RequestState {
    HttpResponse* response{nullptr};
    std::stop_token stop;
};

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* state = static_cast<RequestState*>(userdata);
    if (!state || !state->response) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new response (redirect hop); forget earlier headers
    if (header.starts_with("HTTP/")) {
        state->response->headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

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

    state->response->headers[lower_name] = std::string(value);
    return total;
}

// Write callback for GET requests (body kept in memory, one chunk at a time)
std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* state = static_cast<RequestState*>(userdata);
    if (!state || !state->response) return 0;

    std::size_t total = size * nitems;
    try {
        state->response->body.append(ptr, total);
    } catch (const std::bad_alloc&) {
        return 0;  // Aborts the transfer with CURLE_WRITE_ERROR
    }
    return total;
}

// Transfer-info callback: a non-zero return aborts the transfer
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* state = static_cast<RequestState*>(userdata);
    return state && state->stop.stop_requested() ? 1 : 0;
}

std::error_code map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_ABORTED_BY_CALLBACK:    return make_error_code(DownloadErrc::cancelled);
        case CURLE_OPERATION_TIMEDOUT:     return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:  return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:        return make_error_code(DownloadErrc::refused);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION: return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:     return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:   return make_error_code(DownloadErrc::invalid_url);
        case CURLE_RANGE_ERROR:            return make_error_code(DownloadErrc::invalid_range);
        default:                           return make_error_code(DownloadErrc::network_error);
    }
}

} // namespace

//=============================================================================
// CurlTransport
//=============================================================================

CurlTransport::CurlTransport(TransportOptions options) noexcept
    : options_(options) {}

std::expected<HttpResponse, std::error_code>
CurlTransport::head(const std::string& url, std::stop_token stop) noexcept {
    return perform(url, nullptr, std::move(stop));
}

std::expected<HttpResponse, std::error_code>
CurlTransport::get(const std::string& url, const ByteRange& range, std::stop_token stop) noexcept {
    return perform(url, &range, std::move(stop));
}

std::expected<HttpResponse, std::error_code>
CurlTransport::perform(const std::string& url, const ByteRange* range, std::stop_token stop) noexcept {
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};
    RequestState state{&response, stop};
    std::string range_value;

    try {
        curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());

        if (range) {
            range_value = range->header_value();
            curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range_value.c_str());
            curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
            curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &state);
            response.body.reserve(static_cast<std::size_t>(range->length()));
        } else {
            curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        }

        if constexpr (FOLLOW_REDIRECTS) {
            curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
        }

        // Timeouts
        curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(options_.request_timeout.count()));
        curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);

        // SSL options
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, options_.verify_peer ? 1L : 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, options_.verify_peer ? 2L : 0L);

        // Reuse pooled connections across requests
        curl_easy_setopt(curl.ptr, CURLOPT_FRESH_CONNECT, 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);

        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &state);

        // Cooperative cancellation
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &state);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        if (result != CURLE_ABORTED_BY_CALLBACK) {
            logger()->debug("{} {}: {}", range ? "GET" : "HEAD", url, curl_easy_strerror(result));
        }
        return std::unexpected(map_curl_error(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T doesn't work for HEAD, read the header
    if (auto it = response.headers.find("content-length"); it != response.headers.end()) {
        response.content_length = parse_content_length(it->second);
    }

    if (auto it = response.headers.find("content-type"); it != response.headers.end()) {
        response.content_type = it->second;
    }

    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void CurlTransport::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlTransport::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace clipfetch::core
