// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/core/config.hpp>
#include <edgehls/core/error.hpp>
#include <edgehls/core/url.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <expected>

namespace edgehls::core {

// Requests under prefix go to backend, e.g. "/alt/x.m3u8" -> video_backend_alt "/x.m3u8"
struct Route {
    std::string prefix;
    std::string backend;
    bool strip_prefix{true};
};

struct CacheSettings {
    std::uint32_t default_max_age{DEFAULT_MAX_AGE_SEC};  // When origin sends no max-age
    std::uint32_t stale_while_revalidate{0};             // 0 = not advertised
    std::uint32_t stale_if_error{DEFAULT_STALE_IF_ERROR_SEC};
    std::size_t max_entries{4096};
};

struct FetchSettings {
    std::uint32_t connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::uint32_t timeout{FETCH_TIMEOUT_SEC};
};

// Environment lookup, injectable for tests
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

[[nodiscard]] std::optional<std::string> process_env(const std::string& name);

// Edge service configuration: backends, routes, cache and fetch settings
struct EdgeConfig {
    std::uint16_t listen_port{DEFAULT_LISTEN_PORT};
    std::string default_backend;
    std::map<std::string, Url> backends;
    std::vector<Route> routes;
    CacheSettings cache;
    FetchSettings fetch;

    // Parse a JSON document
    [[nodiscard]] static std::expected<EdgeConfig, std::error_code>
    parse(std::string_view json) noexcept;

    // Load a JSON file
    [[nodiscard]] static std::expected<EdgeConfig, std::error_code>
    load(std::string_view path) noexcept;

    // EDGEHLS_BACKEND_<NAME> and EDGEHLS_LISTEN_PORT overrides
    [[nodiscard]] std::error_code apply_env(const EnvLookup& lookup = process_env);

    // Default and route backends must exist
    [[nodiscard]] std::error_code validate() const noexcept;

    // "video_backend_alt" -> "EDGEHLS_BACKEND_VIDEO_BACKEND_ALT"
    [[nodiscard]] static std::string backend_env_name(std::string_view backend);
};

} // namespace edgehls::core
