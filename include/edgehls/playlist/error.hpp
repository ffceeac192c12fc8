// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace edgehls::playlist {

enum class PlaylistErrc {
    success = 0,
    not_m3u8,          // Missing #EXTM3U header
    malformed_tag,     // Known tag with an unusable value
    unexpected_eof,    // Input ended inside a segment
    attribute_syntax,  // Broken KEY=VALUE list
};

namespace detail {

struct PlaylistErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "edgehls::playlist";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<PlaylistErrc>(ev)) {
            case PlaylistErrc::success:           return "Success";
            case PlaylistErrc::not_m3u8:          return "Not an M3U8 playlist";
            case PlaylistErrc::malformed_tag:     return "Malformed tag";
            case PlaylistErrc::unexpected_eof:    return "Unexpected end of playlist";
            case PlaylistErrc::attribute_syntax:  return "Attribute list syntax error";
            default:                              return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::PlaylistErrcCategory& playlist_errc_category() noexcept {
    static detail::PlaylistErrcCategory category;
    return category;
}

inline std::error_code make_error_code(PlaylistErrc e) noexcept {
    return {static_cast<int>(e), playlist_errc_category()};
}

} // namespace edgehls::playlist

namespace std {

template<>
struct is_error_code_enum<edgehls::playlist::PlaylistErrc> : true_type {};

} // namespace std
