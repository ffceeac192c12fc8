// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace edgehls::delta {

// Reasons a delta playlist is not produced
enum class DeltaErrc {
    success = 0,
    skip_not_requested,
    no_skip_boundary_advertised,
    boundary_too_small,
    playlist_too_short,
    boundary_out_of_range,  // Renderer asked to skip more than exists
};

namespace detail {

struct DeltaErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "edgehls::delta";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DeltaErrc>(ev)) {
            case DeltaErrc::success:                      return "Success";
            case DeltaErrc::skip_not_requested:           return "Delta update not requested";
            case DeltaErrc::no_skip_boundary_advertised:  return "Playlist advertises no CAN-SKIP-UNTIL";
            case DeltaErrc::boundary_too_small:           return "CAN-SKIP-UNTIL below six target durations";
            case DeltaErrc::playlist_too_short:           return "Playlist too short to skip";
            case DeltaErrc::boundary_out_of_range:        return "Skip boundary exceeds skippable segments";
            default:                                      return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DeltaErrcCategory& delta_errc_category() noexcept {
    static detail::DeltaErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DeltaErrc e) noexcept {
    return {static_cast<int>(e), delta_errc_category()};
}

} // namespace edgehls::delta

namespace std {

template<>
struct is_error_code_enum<edgehls::delta::DeltaErrc> : true_type {};

} // namespace std
