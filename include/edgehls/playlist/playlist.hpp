// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/playlist/attribute_list.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace edgehls::playlist {

// How a verbatim line relates to the playlist
enum class LineKind : std::uint8_t {
    header,        // #EXTM3U
    playlist_tag,  // Applies to the whole playlist (EXT-X-VERSION, EXT-X-ENDLIST, ...)
    segment_tag,   // Applies to the following media segment (EXT-X-DATERANGE, EXT-X-KEY, ...)
    other          // Comments, blank lines, unrecognized tags
};

// A line passed through without interpretation
struct RawLine {
    std::string text;   // Source bytes including the line terminator
    std::string tag;    // "EXT-X-DATERANGE"; empty for comments and blank lines
    LineKind kind{LineKind::other};
};

// One LL-HLS partial segment (#EXT-X-PART)
struct PartLine {
    std::string text;
    double duration{0.0};
    std::string uri;
    bool independent{false};
    bool gap{false};
    // Line index of the parent SegmentLine; empty for parts of the
    // segment still being produced
    std::optional<std::size_t> segment;
};

// One complete media segment: #EXTINF through its URI line
struct SegmentLine {
    std::string text;
    double duration{0.0};
    std::string title;
    std::string uri;
    std::vector<std::size_t> parts;  // Line indices of its PartLines
    bool is_last{false};
};

using Line = std::variant<RawLine, PartLine, SegmentLine>;

[[nodiscard]] std::string_view line_text(const Line& line) noexcept;

// Parsed #EXT-X-SERVER-CONTROL
struct ServerControl {
    std::optional<double> can_skip_until;
    bool can_skip_dateranges{false};
    bool can_block_reload{false};
    std::optional<double> hold_back;
    std::optional<double> part_hold_back;
    AttributeList attributes;
};

// Parsed media playlist. Lines keep source order and source bytes.
struct Playlist {
    int version{1};
    double target_duration{0.0};
    std::uint64_t media_sequence{0};
    std::uint64_t discontinuity_sequence{0};
    std::optional<double> part_target;          // Present => LL-HLS
    std::optional<ServerControl> server_control;
    bool ended{false};                           // EXT-X-ENDLIST seen
    std::string line_terminator{"\n"};

    std::vector<Line> lines;
    std::vector<std::size_t> segments;           // Line indices of SegmentLines, oldest first

    [[nodiscard]] const SegmentLine& segment(std::size_t n) const {
        return std::get<SegmentLine>(lines[segments[n]]);
    }

    [[nodiscard]] std::size_t segment_count() const noexcept { return segments.size(); }

    // Duration of complete segments only
    [[nodiscard]] double segments_duration() const noexcept;

    // Duration of parts after the last complete segment
    [[nodiscard]] double trailing_parts_duration() const noexcept;

    // Complete segments plus trailing parts
    [[nodiscard]] double total_duration() const noexcept {
        return segments_duration() + trailing_parts_duration();
    }

    // Index of the first line carrying media segment content, lines.size() if none
    [[nodiscard]] std::size_t first_media_line() const noexcept;

    // Concatenation of all line texts; equals the parsed input
    [[nodiscard]] std::string to_string() const;
};

} // namespace edgehls::playlist
