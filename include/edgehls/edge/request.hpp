// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/core/url.hpp>
#include <edgehls/delta/policy.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace edgehls::edge {

// Incoming request as seen by the edge
struct EdgeRequest {
    std::string method{"GET"};
    std::string path;
    core::QueryParams query;

    // Build from a request-line target such as "/live/a.m3u8?_HLS_skip=YES"
    [[nodiscard]] static EdgeRequest from_target(std::string method, std::string_view target);
};

// Response handed back to the front end. Header names keep their case;
// lookups are case-insensitive.
struct EdgeResponse {
    int status{200};
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
    void set_header(std::string name, std::string value);
};

enum class RequestClass : std::uint8_t {
    forward,  // Blocking reload or non-playlist path: pass through untouched
    full,     // Playlist without a delta flag
    delta     // Playlist with _HLS_skip=YES|v2
};

[[nodiscard]] std::string_view to_string(RequestClass cls) noexcept;

// Classified request
struct DeltaRequest {
    RequestClass kind{RequestClass::forward};
    delta::SkipMode mode{delta::SkipMode::none};
    bool blocking_reload{false};
    core::QueryParams origin_query;  // Query forwarded to origin, minus _HLS_skip
};

// Blocking-reload parameters first, then the delta flag
[[nodiscard]] DeltaRequest classify(std::string_view path, const core::QueryParams& query);

} // namespace edgehls::edge
