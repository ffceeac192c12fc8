// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/delta/renderer.hpp>
#include <edgehls/core/config.hpp>
#include <edgehls/core/log.hpp>
#include <edgehls/playlist/parser.hpp>
#include <algorithm>
#include <map>
#include <optional>
#include <vector>

namespace edgehls::delta {

using playlist::LineKind;
using playlist::Playlist;
using playlist::RawLine;
using playlist::SegmentLine;

namespace {

constexpr std::string_view TAG_VERSION = "EXT-X-VERSION";
constexpr std::string_view TAG_DATERANGE = "EXT-X-DATERANGE";
constexpr std::string_view TAG_MAP = "EXT-X-MAP";
constexpr std::string_view TAG_KEY = "EXT-X-KEY";
constexpr std::string_view DEFAULT_KEYFORMAT = "identity";

std::string_view terminator_of(std::string_view text) noexcept {
    if (text.ends_with("\r\n")) return "\r\n";
    if (text.ends_with("\n")) return "\n";
    return {};
}

std::string keyformat_of(std::string_view text) {
    auto body = text.substr(0, text.size() - terminator_of(text).size());
    auto colon = body.find(':');
    if (colon == std::string_view::npos) {
        return std::string(DEFAULT_KEYFORMAT);
    }
    auto attrs = playlist::AttributeList::parse(body.substr(colon + 1));
    if (!attrs) {
        return std::string(DEFAULT_KEYFORMAT);
    }
    return std::string(attrs->get("KEYFORMAT").value_or(DEFAULT_KEYFORMAT));
}

// A line to re-emit after the skip tag: a whole playlist line, or a tag
// carried between #EXTINF and the URI of a skipped segment block
struct Hoisted {
    std::optional<std::size_t> line;
    std::string_view text;
};

// Lines inside the skip region that must survive the skip, in source order
std::vector<Hoisted> hoisted_lines(const Playlist& pl, std::size_t begin, std::size_t end,
                                   bool omit_dateranges) {
    std::vector<Hoisted> candidates;
    std::vector<std::size_t> keep;
    std::optional<std::size_t> last_map;
    std::map<std::string, std::size_t> last_key;

    auto consider = [&](std::string_view tag, std::string_view text, Hoisted hoisted) {
        const auto n = candidates.size();
        if (tag == TAG_DATERANGE) {
            // Omitted ranges are not listed in RECENTLY-REMOVED-DATERANGES:
            // a single snapshot cannot tell removed ranges from skipped ones
            if (omit_dateranges) {
                return;
            }
            keep.push_back(n);
        } else if (tag == TAG_MAP) {
            last_map = n;
        } else if (tag == TAG_KEY) {
            last_key[keyformat_of(text)] = n;
        } else {
            return;
        }
        candidates.push_back(hoisted);
    };

    for (std::size_t i = begin; i < end; ++i) {
        if (const auto* raw = std::get_if<RawLine>(&pl.lines[i])) {
            if (raw->kind == LineKind::playlist_tag) {
                keep.push_back(candidates.size());
                candidates.push_back(Hoisted{i, raw->text});
            } else {
                consider(raw->tag, raw->text, Hoisted{i, raw->text});
            }
        } else if (const auto* segment = std::get_if<SegmentLine>(&pl.lines[i])) {
            std::string_view block = segment->text;
            std::size_t pos = 0;
            while (pos < block.size()) {
                auto nl = block.find('\n', pos);
                auto next = nl == std::string_view::npos ? block.size() : nl + 1;
                auto text = block.substr(pos, next - pos);
                pos = next;
                consider(playlist::PlaylistParser::tag_name(text), text, Hoisted{std::nullopt, text});
            }
        }
    }

    if (last_map) {
        keep.push_back(*last_map);
    }
    for (const auto& [format, n] : last_key) {
        keep.push_back(n);
    }
    std::sort(keep.begin(), keep.end());

    std::vector<Hoisted> out;
    out.reserve(keep.size());
    for (auto n : keep) {
        out.push_back(candidates[n]);
    }
    return out;
}

} // namespace

std::size_t DeltaRenderer::skip_region_end(const Playlist& pl, std::size_t segments) noexcept {
    if (segments == 0 || segments > pl.segment_count()) {
        return pl.first_media_line();
    }
    return pl.segments[segments - 1] + 1;
}

std::string DeltaRenderer::render_full(const Playlist& pl) {
    return pl.to_string();
}

std::expected<std::string, std::error_code>
DeltaRenderer::render(const Playlist& pl, const SkipBoundary& boundary) {
    if (boundary.segments > 0 && boundary.segments >= pl.segment_count()) {
        return std::unexpected(make_error_code(DeltaErrc::boundary_out_of_range));
    }

    const std::size_t begin = pl.first_media_line();
    const std::size_t end = skip_region_end(pl, boundary.segments);

    const int required_version = boundary.omit_dateranges
        ? core::SKIP_DATERANGES_MIN_VERSION
        : core::SKIP_MIN_VERSION;
    const bool bump_version = pl.version < required_version;
    const bool has_version_line = std::any_of(pl.lines.begin(), pl.lines.end(), [](const auto& line) {
        const auto* raw = std::get_if<RawLine>(&line);
        return raw && raw->tag == TAG_VERSION;
    });

    std::string out;
    out.reserve(pl.lines.size() * 64);

    auto emit = [&](std::size_t i) {
        const auto* raw = std::get_if<RawLine>(&pl.lines[i]);
        if (raw && raw->tag == TAG_VERSION && bump_version) {
            out += "#EXT-X-VERSION:";
            out += std::to_string(required_version);
            out += terminator_of(raw->text);
            return;
        }
        out += playlist::line_text(pl.lines[i]);
        if (raw && raw->kind == LineKind::header && !has_version_line) {
            out += "#EXT-X-VERSION:";
            out += std::to_string(required_version);
            out += pl.line_terminator;
        }
    };

    for (std::size_t i = 0; i < begin; ++i) {
        emit(i);
    }

    if (!out.empty() && out.back() != '\n') {
        out += pl.line_terminator;
    }
    out += "#EXT-X-SKIP:SKIPPED-SEGMENTS=";
    out += std::to_string(boundary.segments);
    out += pl.line_terminator;

    for (const auto& hoisted : hoisted_lines(pl, begin, end, boundary.omit_dateranges)) {
        if (hoisted.line) {
            emit(*hoisted.line);
        } else {
            out += hoisted.text;
        }
    }

    for (std::size_t i = end; i < pl.lines.size(); ++i) {
        emit(i);
    }

    return out;
}

DeltaOutcome transform(std::string_view bytes, SkipMode mode) {
    DeltaOutcome outcome;

    auto fallback = [&](std::error_code reason) {
        outcome.kind = DeltaOutcome::Kind::fallback;
        outcome.body = std::string(bytes);
        outcome.reason = reason;
        return outcome;
    };

    auto parsed = playlist::PlaylistParser::parse(bytes);
    if (!parsed) {
        return fallback(parsed.error());
    }

    auto boundary = DeltaPolicy::compute(*parsed, mode);
    if (!boundary) {
        return fallback(boundary.error());
    }

    auto rendered = DeltaRenderer::render(*parsed, *boundary);
    if (!rendered) {
        // Policy and renderer disagree: never serve a possibly corrupt playlist
        EDGEHLS_LOG_ERROR << "delta render rejected boundary of " << boundary->segments
                          << " segments (" << parsed->segment_count() << " present): "
                          << rendered.error().message();
        return fallback(rendered.error());
    }

    outcome.kind = DeltaOutcome::Kind::delta;
    outcome.body = std::move(*rendered);
    outcome.skipped_segments = boundary->segments;
    return outcome;
}

} // namespace edgehls::delta
