// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/core/config.hpp>
#include <edgehls/core/error.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <expected>

namespace edgehls::core {

// Complete HTTP response: status, lowercased headers and body
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;
    std::string content_type;
    std::string body;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;

    // max-age from Cache-Control, if present and numeric
    [[nodiscard]] std::optional<std::uint32_t> max_age() const;
};

struct HttpOptions {
    std::uint32_t connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::uint32_t timeout{FETCH_TIMEOUT_SEC};
};

// Blocking libcurl client. Transport failures are errors; any HTTP status,
// including 4xx and 5xx, is a response.
class HttpSession {
public:
    explicit HttpSession(HttpOptions options = {});

    // Perform GET request
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url) const noexcept;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpOptions options_;
};

// Parse the max-age directive of a Cache-Control value
[[nodiscard]] std::optional<std::uint32_t> parse_max_age(std::string_view cache_control) noexcept;

} // namespace edgehls::core
