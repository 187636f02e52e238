// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/core/config.hpp>
#include <clipfetch/core/http_transport.hpp>
#include <chrono>

namespace clipfetch::core {

struct TransportOptions {
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds request_timeout{REQUEST_TIMEOUT_SEC};
    bool verify_peer{true};
};

// libcurl easy-handle transport. Thread-safe: every request owns its handle.
class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(TransportOptions options = {}) noexcept;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url, std::stop_token stop) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url, const ByteRange& range, std::stop_token stop) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    perform(const std::string& url, const ByteRange* range, std::stop_token stop) noexcept;

    TransportOptions options_;
};

// RAII wrapper around global_init/global_cleanup for main()
class CurlGlobal {
public:
    CurlGlobal() noexcept { CurlTransport::global_init(); }
    ~CurlGlobal() { CurlTransport::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace clipfetch::core
