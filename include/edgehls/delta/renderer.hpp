// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/delta/policy.hpp>
#include <edgehls/playlist/playlist.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <expected>

namespace edgehls::delta {

// Rebuilds playlist bytes. Lines outside the skip region are copied from
// their source bytes, never re-serialized.
class DeltaRenderer {
public:
    // Delta update: leading segments replaced by #EXT-X-SKIP, with the
    // date ranges, EXT-X-MAP and EXT-X-KEY state of the skipped part hoisted
    // right after it
    [[nodiscard]] static std::expected<std::string, std::error_code>
    render(const playlist::Playlist& playlist, const SkipBoundary& boundary);

    // No-op render, byte-identical to the parsed input
    [[nodiscard]] static std::string render_full(const playlist::Playlist& playlist);

    // Line index one past the last skipped line
    [[nodiscard]] static std::size_t skip_region_end(const playlist::Playlist& playlist,
                                                     std::size_t segments) noexcept;
};

// Result of running parser, policy and renderer over one snapshot
struct DeltaOutcome {
    enum class Kind : std::uint8_t {
        delta,     // body is a delta update
        fallback   // body is the unmodified input, reason says why
    };

    Kind kind{Kind::fallback};
    std::string body;
    std::error_code reason;
    std::size_t skipped_segments{0};

    [[nodiscard]] bool is_delta() const noexcept { return kind == Kind::delta; }
};

// Parser -> Policy -> Renderer. Never fails: every error becomes a fallback
// carrying the original bytes.
[[nodiscard]] DeltaOutcome transform(std::string_view bytes, SkipMode mode);

} // namespace edgehls::delta
