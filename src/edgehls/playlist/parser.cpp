// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/playlist/parser.hpp>
#include <edgehls/core/config.hpp>
#include <edgehls/core/log.hpp>
#include <algorithm>
#include <array>
#include <cctype>

namespace edgehls::playlist {

namespace {

constexpr std::string_view TAG_HEADER = "#EXTM3U";
constexpr std::string_view TAG_EXTINF = "EXTINF";
constexpr std::string_view TAG_PART = "EXT-X-PART";
constexpr std::string_view TAG_PART_INF = "EXT-X-PART-INF";
constexpr std::string_view TAG_VERSION = "EXT-X-VERSION";
constexpr std::string_view TAG_TARGET_DURATION = "EXT-X-TARGETDURATION";
constexpr std::string_view TAG_MEDIA_SEQUENCE = "EXT-X-MEDIA-SEQUENCE";
constexpr std::string_view TAG_DISCONTINUITY_SEQUENCE = "EXT-X-DISCONTINUITY-SEQUENCE";
constexpr std::string_view TAG_SERVER_CONTROL = "EXT-X-SERVER-CONTROL";
constexpr std::string_view TAG_ENDLIST = "EXT-X-ENDLIST";

constexpr std::array<std::string_view, 17> PLAYLIST_TAGS = {
    "EXT-X-VERSION",
    "EXT-X-TARGETDURATION",
    "EXT-X-MEDIA-SEQUENCE",
    "EXT-X-DISCONTINUITY-SEQUENCE",
    "EXT-X-ENDLIST",
    "EXT-X-PLAYLIST-TYPE",
    "EXT-X-I-FRAMES-ONLY",
    "EXT-X-PART-INF",
    "EXT-X-SERVER-CONTROL",
    "EXT-X-INDEPENDENT-SEGMENTS",
    "EXT-X-START",
    "EXT-X-DEFINE",
    "EXT-X-PRELOAD-HINT",
    "EXT-X-RENDITION-REPORT",
    "EXT-X-SKIP",
    "EXT-X-ALLOW-CACHE",
    "EXT-X-CONTENT-STEERING",
};

constexpr std::array<std::string_view, 12> SEGMENT_TAGS = {
    "EXTINF",
    "EXT-X-PART",
    "EXT-X-DISCONTINUITY",
    "EXT-X-PROGRAM-DATE-TIME",
    "EXT-X-KEY",
    "EXT-X-MAP",
    "EXT-X-BYTERANGE",
    "EXT-X-GAP",
    "EXT-X-BITRATE",
    "EXT-X-DATERANGE",
    "EXT-X-TILES",
    "EXT-OATCLS-SCTE35",
};

// Next line starting at pos, including its terminator
std::string_view next_line(std::string_view content, std::size_t& pos) noexcept {
    auto nl = content.find('\n', pos);
    auto end = (nl == std::string_view::npos) ? content.size() : nl + 1;
    auto line = content.substr(pos, end - pos);
    pos = end;
    return line;
}

// Line without terminator or trailing blanks
std::string_view line_body(std::string_view text) noexcept {
    while (!text.empty() &&
           (text.back() == '\n' || text.back() == '\r' || text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

std::string_view tag_value(std::string_view body) noexcept {
    auto colon = body.find(':');
    return colon == std::string_view::npos ? std::string_view{} : body.substr(colon + 1);
}

std::unexpected<std::error_code> fail(PlaylistErrc e, std::size_t line_no) {
    EDGEHLS_LOG_DEBUG << "playlist parse failed at line " << line_no << ": "
                      << make_error_code(e).message();
    return std::unexpected(make_error_code(e));
}

// Optional numeric attribute: absent is fine, present-but-unparsable is not
bool read_optional_double(const AttributeList& attrs, std::string_view name,
                          std::optional<double>& out) noexcept {
    if (!attrs.contains(name)) {
        return true;
    }
    out = attrs.get_double(name);
    return out.has_value() && *out >= 0.0;
}

} // namespace

bool PlaylistParser::is_playlist_path(std::string_view path) noexcept {
    if (path.size() < core::PLAYLIST_EXTENSION.size()) {
        return false;
    }
    auto ext = path.substr(path.size() - core::PLAYLIST_EXTENSION.size());
    return std::equal(ext.begin(), ext.end(), core::PLAYLIST_EXTENSION.begin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) == b;
                      });
}

std::string_view PlaylistParser::tag_name(std::string_view line) noexcept {
    if (!line.starts_with("#EXT")) {
        return {};
    }
    auto name = line.substr(1);
    auto colon = name.find(':');
    if (colon != std::string_view::npos) {
        name = name.substr(0, colon);
    }
    return line_body(name);
}

LineKind PlaylistParser::classify_tag(std::string_view tag) noexcept {
    if (tag == TAG_HEADER.substr(1)) {
        return LineKind::header;
    }
    if (std::find(PLAYLIST_TAGS.begin(), PLAYLIST_TAGS.end(), tag) != PLAYLIST_TAGS.end()) {
        return LineKind::playlist_tag;
    }
    if (std::find(SEGMENT_TAGS.begin(), SEGMENT_TAGS.end(), tag) != SEGMENT_TAGS.end() ||
        tag.starts_with("EXT-X-CUE")) {
        return LineKind::segment_tag;
    }
    return LineKind::other;
}

std::expected<Playlist, std::error_code>
PlaylistParser::parse(std::string_view content) noexcept {
    Playlist playlist;

    std::size_t pos = 0;
    std::size_t line_no = 0;

    // Header
    {
        auto text = next_line(content, pos);
        ++line_no;
        if (!text.starts_with(TAG_HEADER)) {
            return fail(PlaylistErrc::not_m3u8, line_no);
        }
        if (text.ends_with("\r\n")) {
            playlist.line_terminator = "\r\n";
        }
        playlist.lines.emplace_back(RawLine{std::string(text), std::string(TAG_HEADER.substr(1)),
                                            LineKind::header});
    }

    std::optional<SegmentLine> open_segment;
    std::vector<std::size_t> pending_parts;

    while (pos < content.size()) {
        auto text = next_line(content, pos);
        auto body = line_body(text);
        ++line_no;

        if (open_segment) {
            if (!body.empty() && body.front() != '#') {
                // URI line closes the segment
                open_segment->text += text;
                open_segment->uri = std::string(body);
                open_segment->parts = std::move(pending_parts);
                pending_parts.clear();

                const auto idx = playlist.lines.size();
                for (auto part_idx : open_segment->parts) {
                    std::get<PartLine>(playlist.lines[part_idx]).segment = idx;
                }
                playlist.lines.emplace_back(std::move(*open_segment));
                playlist.segments.push_back(idx);
                open_segment.reset();
                continue;
            }

            auto tag = tag_name(body);
            if (tag == TAG_EXTINF || tag == TAG_PART) {
                return fail(PlaylistErrc::malformed_tag, line_no);
            }
            // Tags between #EXTINF and the URI (EXT-X-BYTERANGE, ...) stay in the block
            open_segment->text += text;
            continue;
        }

        if (body.empty()) {
            playlist.lines.emplace_back(RawLine{std::string(text), {}, LineKind::other});
            continue;
        }

        if (body.front() != '#') {
            // URI without #EXTINF: not a media playlist we can model
            return fail(PlaylistErrc::malformed_tag, line_no);
        }

        auto tag = tag_name(body);
        if (tag.empty()) {
            // Comment
            playlist.lines.emplace_back(RawLine{std::string(text), {}, LineKind::other});
            continue;
        }

        auto value = tag_value(body);

        if (tag == TAG_EXTINF) {
            auto comma = value.find(',');
            auto duration = parse_decimal(value.substr(0, comma));
            if (!duration || *duration < 0.0) {
                return fail(PlaylistErrc::malformed_tag, line_no);
            }
            SegmentLine segment;
            segment.text = std::string(text);
            segment.duration = *duration;
            if (comma != std::string_view::npos) {
                segment.title = std::string(value.substr(comma + 1));
            }
            open_segment = std::move(segment);
            continue;
        }

        if (tag == TAG_PART) {
            auto attrs = AttributeList::parse(value);
            if (!attrs) {
                return fail(PlaylistErrc::attribute_syntax, line_no);
            }
            auto duration = attrs->get_double("DURATION");
            auto uri = attrs->get("URI");
            if (!duration || *duration < 0.0 || !uri) {
                return fail(PlaylistErrc::malformed_tag, line_no);
            }
            PartLine part;
            part.text = std::string(text);
            part.duration = *duration;
            part.uri = std::string(*uri);
            part.independent = attrs->get_yes("INDEPENDENT");
            part.gap = attrs->get_yes("GAP");
            pending_parts.push_back(playlist.lines.size());
            playlist.lines.emplace_back(std::move(part));
            continue;
        }

        if (tag == TAG_VERSION) {
            auto v = parse_integer(value);
            if (!v || *v > 1000) {
                return fail(PlaylistErrc::malformed_tag, line_no);
            }
            playlist.version = static_cast<int>(*v);
        } else if (tag == TAG_TARGET_DURATION) {
            auto v = parse_decimal(value);
            if (!v || *v < 0.0) {
                return fail(PlaylistErrc::malformed_tag, line_no);
            }
            playlist.target_duration = *v;
        } else if (tag == TAG_MEDIA_SEQUENCE) {
            auto v = parse_integer(value);
            if (!v) {
                return fail(PlaylistErrc::malformed_tag, line_no);
            }
            playlist.media_sequence = *v;
        } else if (tag == TAG_DISCONTINUITY_SEQUENCE) {
            auto v = parse_integer(value);
            if (!v) {
                return fail(PlaylistErrc::malformed_tag, line_no);
            }
            playlist.discontinuity_sequence = *v;
        } else if (tag == TAG_PART_INF) {
            auto attrs = AttributeList::parse(value);
            if (!attrs) {
                return fail(PlaylistErrc::attribute_syntax, line_no);
            }
            auto part_target = attrs->get_double("PART-TARGET");
            if (!part_target || *part_target < 0.0) {
                return fail(PlaylistErrc::malformed_tag, line_no);
            }
            playlist.part_target = part_target;
        } else if (tag == TAG_SERVER_CONTROL) {
            auto attrs = AttributeList::parse(value);
            if (!attrs) {
                return fail(PlaylistErrc::attribute_syntax, line_no);
            }
            ServerControl control;
            if (!read_optional_double(*attrs, "CAN-SKIP-UNTIL", control.can_skip_until) ||
                !read_optional_double(*attrs, "HOLD-BACK", control.hold_back) ||
                !read_optional_double(*attrs, "PART-HOLD-BACK", control.part_hold_back)) {
                return fail(PlaylistErrc::malformed_tag, line_no);
            }
            control.can_skip_dateranges = attrs->get_yes("CAN-SKIP-DATERANGES");
            control.can_block_reload = attrs->get_yes("CAN-BLOCK-RELOAD");
            control.attributes = std::move(*attrs);
            playlist.server_control = std::move(control);
        } else if (tag == TAG_ENDLIST) {
            playlist.ended = true;
        }

        playlist.lines.emplace_back(RawLine{std::string(text), std::string(tag), classify_tag(tag)});
    }

    if (open_segment) {
        return fail(PlaylistErrc::unexpected_eof, line_no);
    }

    if (!playlist.segments.empty()) {
        std::get<SegmentLine>(playlist.lines[playlist.segments.back()]).is_last = true;
    }

    EDGEHLS_LOG_TRACE << "parsed playlist: " << playlist.segments.size() << " segments, "
                      << playlist.lines.size() << " lines, media sequence "
                      << playlist.media_sequence;

    return playlist;
}

} // namespace edgehls::playlist
