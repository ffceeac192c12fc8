// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/playlist/playlist.hpp>

namespace edgehls::playlist {

std::string_view line_text(const Line& line) noexcept {
    return std::visit([](const auto& l) { return std::string_view(l.text); }, line);
}

double Playlist::segments_duration() const noexcept {
    double total = 0.0;
    for (auto idx : segments) {
        total += std::get<SegmentLine>(lines[idx]).duration;
    }
    return total;
}

double Playlist::trailing_parts_duration() const noexcept {
    std::size_t start = segments.empty() ? 0 : segments.back() + 1;
    double total = 0.0;
    for (std::size_t i = start; i < lines.size(); ++i) {
        if (const auto* part = std::get_if<PartLine>(&lines[i])) {
            total += part->duration;
        }
    }
    return total;
}

std::size_t Playlist::first_media_line() const noexcept {
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (const auto* raw = std::get_if<RawLine>(&lines[i])) {
            if (raw->kind == LineKind::segment_tag) {
                return i;
            }
            continue;
        }
        return i;
    }
    return lines.size();
}

std::string Playlist::to_string() const {
    std::string out;
    for (const auto& line : lines) {
        out += line_text(line);
    }
    return out;
}

} // namespace edgehls::playlist
