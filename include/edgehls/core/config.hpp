// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string_view>

namespace edgehls::core {

// CAN-SKIP-UNTIL must be at least this many target durations
constexpr std::uint32_t SKIP_BOUNDARY_MIN_TARGET_DURATIONS = 6;

// EXT-X-VERSION needed for EXT-X-SKIP, and for skipping date ranges
constexpr int SKIP_MIN_VERSION = 9;
constexpr int SKIP_DATERANGES_MIN_VERSION = 10;

// Tolerance for comparing summed decimal durations
constexpr double DURATION_EPSILON = 1e-6;

constexpr std::string_view PLAYLIST_CONTENT_TYPE = "application/vnd.apple.mpegurl";
constexpr std::string_view PLAYLIST_EXTENSION = ".m3u8";

constexpr std::string_view QUERY_SKIP = "_HLS_skip";
constexpr std::string_view QUERY_MSN = "_HLS_msn";
constexpr std::string_view QUERY_PART = "_HLS_part";

constexpr std::uint16_t DEFAULT_LISTEN_PORT = 8080;
constexpr std::uint32_t DEFAULT_MAX_AGE_SEC = 1;
constexpr std::uint32_t DEFAULT_STALE_IF_ERROR_SEC = 6;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 5;
constexpr std::uint32_t FETCH_TIMEOUT_SEC = 10;
constexpr std::uint32_t MAX_REDIRECTS = 5;

// Status returned when the origin produced no usable answer
constexpr int BAD_GATEWAY = 502;

} // namespace edgehls::core
