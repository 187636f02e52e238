// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <clipfetch/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace clipfetch::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]

    [[nodiscard]] std::string filename() const;

    // Lowercased suffix of the last path component without the dot, or empty
    [[nodiscard]] std::string extension() const;

    // Same path and query served from another origin ("https://mirror.example.com")
    [[nodiscard]] std::expected<Url, std::error_code> with_origin(std::string_view origin) const noexcept;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

} // namespace clipfetch::core
