// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/playlist/error.hpp>
#include <edgehls/playlist/playlist.hpp>
#include <string_view>
#include <expected>

namespace edgehls::playlist {

// LL-HLS media playlist parser.
//
// Single pass over the input. Interprets only what delta computation needs
// (playlist attributes, #EXTINF segments, #EXT-X-PART parts); every other
// line is kept as a RawLine. Each Line keeps its exact source bytes, so
// Playlist::to_string() returns the input unchanged.
class PlaylistParser {
public:
    [[nodiscard]] static std::expected<Playlist, std::error_code>
    parse(std::string_view content) noexcept;

    // Check if a request path names a playlist
    [[nodiscard]] static bool is_playlist_path(std::string_view path) noexcept;

    // "#EXT-X-KEY:METHOD=NONE" -> "EXT-X-KEY"; empty for non-tag lines
    [[nodiscard]] static std::string_view tag_name(std::string_view line) noexcept;

    [[nodiscard]] static LineKind classify_tag(std::string_view tag) noexcept;
};

} // namespace edgehls::playlist
