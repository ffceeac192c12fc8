// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/delta/error.hpp>
#include <edgehls/playlist/playlist.hpp>
#include <cstdint>
#include <string_view>
#include <expected>

namespace edgehls::delta {

// Value of the _HLS_skip query parameter
enum class SkipMode : std::uint8_t {
    none,  // Absent or unrecognized
    yes,   // _HLS_skip=YES: skip segments
    v2     // _HLS_skip=v2: skip segments and, if allowed, date ranges
};

[[nodiscard]] SkipMode parse_skip_mode(std::string_view value) noexcept;
[[nodiscard]] std::string_view to_string(SkipMode mode) noexcept;

// How much of a playlist snapshot a delta update may elide
struct SkipBoundary {
    std::size_t segments{0};      // Leading complete segments to skip
    bool omit_dateranges{false};  // Drop skipped EXT-X-DATERANGE tags instead of hoisting
};

// Decides whether a delta update is legal for a playlist, and where the
// skip boundary lies. Pure: same playlist and mode, same result.
class DeltaPolicy {
public:
    [[nodiscard]] static std::expected<SkipBoundary, std::error_code>
    compute(const playlist::Playlist& playlist, SkipMode mode) noexcept;
};

} // namespace edgehls::delta
