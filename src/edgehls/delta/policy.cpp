// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/delta/policy.hpp>
#include <edgehls/core/config.hpp>
#include <edgehls/core/log.hpp>

namespace edgehls::delta {

SkipMode parse_skip_mode(std::string_view value) noexcept {
    if (value == "YES") return SkipMode::yes;
    if (value == "v2") return SkipMode::v2;
    return SkipMode::none;
}

std::string_view to_string(SkipMode mode) noexcept {
    switch (mode) {
        case SkipMode::yes: return "YES";
        case SkipMode::v2:  return "v2";
        default:            return "";
    }
}

std::expected<SkipBoundary, std::error_code>
DeltaPolicy::compute(const playlist::Playlist& playlist, SkipMode mode) noexcept {
    if (mode == SkipMode::none) {
        return std::unexpected(make_error_code(DeltaErrc::skip_not_requested));
    }

    if (!playlist.server_control || !playlist.server_control->can_skip_until) {
        return std::unexpected(make_error_code(DeltaErrc::no_skip_boundary_advertised));
    }

    // Without EXT-X-TARGETDURATION there is no floor to hold the window to
    if (playlist.target_duration <= 0.0) {
        return std::unexpected(make_error_code(DeltaErrc::boundary_too_small));
    }

    // Both operands are parsed values, so the floor is compared exactly
    const double can_skip_until = *playlist.server_control->can_skip_until;
    const double floor = core::SKIP_BOUNDARY_MIN_TARGET_DURATIONS * playlist.target_duration;
    if (can_skip_until < floor) {
        return std::unexpected(make_error_code(DeltaErrc::boundary_too_small));
    }

    const double total = playlist.total_duration();
    const std::size_t count = playlist.segment_count();
    if (count < 2 || total + core::DURATION_EPSILON < can_skip_until) {
        return std::unexpected(make_error_code(DeltaErrc::playlist_too_short));
    }

    // Largest N with cumulative duration <= total - CAN-SKIP-UNTIL,
    // never reaching the most recent segment
    const double cutoff = total - can_skip_until;
    double cumulative = 0.0;
    std::size_t skipped = 0;
    while (skipped + 1 < count) {
        cumulative += playlist.segment(skipped).duration;
        if (cumulative > cutoff + core::DURATION_EPSILON) {
            break;
        }
        ++skipped;
    }

    SkipBoundary boundary;
    boundary.segments = skipped;
    boundary.omit_dateranges = (mode == SkipMode::v2) && playlist.server_control->can_skip_dateranges;

    EDGEHLS_LOG_TRACE << "skip boundary: " << skipped << " of " << count << " segments, total "
                      << total << "s, CAN-SKIP-UNTIL " << can_skip_until << "s";

    return boundary;
}

} // namespace edgehls::delta
