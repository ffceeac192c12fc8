// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <edgehls/delta/error.hpp>
#include <edgehls/delta/policy.hpp>
#include <edgehls/delta/renderer.hpp>
#include <edgehls/playlist/parser.hpp>
#include <limits>
#include <string>

using namespace edgehls::delta;
using edgehls::playlist::Playlist;
using edgehls::playlist::PlaylistParser;

namespace {

// count segments of seg_duration seconds, optional trailing parts
std::string make_playlist(int count, double seg_duration, int target, std::string server_control,
                          int trailing_parts = 0) {
    std::string text = "#EXTM3U\n#EXT-X-VERSION:6\n";
    text += "#EXT-X-TARGETDURATION:" + std::to_string(target) + "\n";
    if (!server_control.empty()) {
        text += "#EXT-X-SERVER-CONTROL:" + server_control + "\n";
    }
    text += "#EXT-X-MEDIA-SEQUENCE:0\n";
    for (int i = 0; i < count; ++i) {
        text += "#EXTINF:" + std::to_string(seg_duration) + ",\n";
        text += "seg" + std::to_string(i) + ".ts\n";
    }
    for (int i = 0; i < trailing_parts; ++i) {
        text += "#EXT-X-PART:DURATION=1.0,URI=\"part" + std::to_string(i) + ".mp4\"\n";
    }
    return text;
}

Playlist parse(const std::string& text) {
    auto pl = PlaylistParser::parse(text);
    REQUIRE(pl.has_value());
    return std::move(*pl);
}

} // namespace

TEST_CASE("DeltaPolicy - skip boundary", "[policy]") {
    SECTION("8 x 2s with CAN-SKIP-UNTIL=12 skips 2 segments") {
        auto pl = parse(make_playlist(8, 2.0, 2, "CAN-SKIP-UNTIL=12.0"));
        auto boundary = DeltaPolicy::compute(pl, SkipMode::yes);
        REQUIRE(boundary.has_value());
        CHECK(boundary->segments == 2);
        CHECK(!boundary->omit_dateranges);
    }

    SECTION("Window equal to the total duration skips nothing") {
        auto pl = parse(make_playlist(6, 2.0, 2, "CAN-SKIP-UNTIL=12.0"));
        auto boundary = DeltaPolicy::compute(pl, SkipMode::yes);
        REQUIRE(boundary.has_value());
        CHECK(boundary->segments == 0);
    }

    SECTION("Uneven durations round down to a whole segment") {
        // Total 15s, cutoff 3s: first segment (2.5s) fits, second would reach 5s
        std::string text =
            "#EXTM3U\n#EXT-X-TARGETDURATION:2\n#EXT-X-SERVER-CONTROL:CAN-SKIP-UNTIL=12.0\n"
            "#EXTINF:2.5,\na.ts\n#EXTINF:2.5,\nb.ts\n#EXTINF:2.5,\nc.ts\n"
            "#EXTINF:2.5,\nd.ts\n#EXTINF:2.5,\ne.ts\n#EXTINF:2.5,\nf.ts\n";
        auto boundary = DeltaPolicy::compute(parse(text), SkipMode::yes);
        REQUIRE(boundary.has_value());
        CHECK(boundary->segments == 1);
    }

    SECTION("Decimal sums within tolerance count as equal") {
        // 0.1 * 3 is not exactly 0.3 in binary
        std::string text = "#EXTM3U\n#EXT-X-TARGETDURATION:1\n#EXT-X-SERVER-CONTROL:CAN-SKIP-UNTIL=6.0\n";
        for (int i = 0; i < 3; ++i) {
            text += "#EXTINF:0.1,\ns" + std::to_string(i) + ".ts\n";
        }
        text += "#EXTINF:6.0,\nlast.ts\n";
        auto boundary = DeltaPolicy::compute(parse(text), SkipMode::yes);
        REQUIRE(boundary.has_value());
        CHECK(boundary->segments == 3);
    }

    SECTION("Trailing parts extend the total duration") {
        // 8 x 2s + 2 x 1s parts = 18s, cutoff 6s
        auto pl = parse(make_playlist(8, 2.0, 2, "CAN-SKIP-UNTIL=12.0", 2));
        auto boundary = DeltaPolicy::compute(pl, SkipMode::yes);
        REQUIRE(boundary.has_value());
        CHECK(boundary->segments == 3);
    }

    SECTION("Most recent segment is never skipped") {
        std::string text =
            "#EXTM3U\n#EXT-X-TARGETDURATION:2\n#EXT-X-SERVER-CONTROL:CAN-SKIP-UNTIL=12.0\n"
            "#EXTINF:2.0,\na.ts\n#EXTINF:2.0,\nb.ts\n"
            "#EXT-X-PART:DURATION=12.0,URI=\"p.mp4\"\n";
        auto pl = parse(text);
        auto boundary = DeltaPolicy::compute(pl, SkipMode::yes);
        REQUIRE(boundary.has_value());
        CHECK(boundary->segments == 1);
        CHECK(boundary->segments < pl.segment_count());
    }

    SECTION("Ended playlists stay eligible") {
        auto text = make_playlist(8, 2.0, 2, "CAN-SKIP-UNTIL=12.0") + "#EXT-X-ENDLIST\n";
        auto boundary = DeltaPolicy::compute(parse(text), SkipMode::yes);
        REQUIRE(boundary.has_value());
        CHECK(boundary->segments == 2);
    }
}

TEST_CASE("DeltaPolicy - not eligible", "[policy]") {
    auto reason = [](const std::string& text, SkipMode mode = SkipMode::yes) {
        auto pl = PlaylistParser::parse(text);
        REQUIRE(pl.has_value());
        auto boundary = DeltaPolicy::compute(*pl, mode);
        REQUIRE(!boundary.has_value());
        return boundary.error();
    };

    CHECK(reason(make_playlist(8, 2.0, 2, "CAN-SKIP-UNTIL=12.0"), SkipMode::none)
          == DeltaErrc::skip_not_requested);
    CHECK(reason(make_playlist(8, 2.0, 2, "")) == DeltaErrc::no_skip_boundary_advertised);
    CHECK(reason(make_playlist(8, 2.0, 2, "CAN-BLOCK-RELOAD=YES"))
          == DeltaErrc::no_skip_boundary_advertised);
    CHECK(reason(make_playlist(8, 2.0, 2, "CAN-SKIP-UNTIL=10.0")) == DeltaErrc::boundary_too_small);
    CHECK(reason(make_playlist(8, 2.0, 2, "CAN-SKIP-UNTIL=11.9999995")) == DeltaErrc::boundary_too_small);
    CHECK(reason(make_playlist(8, 2.0, 0, "CAN-SKIP-UNTIL=1.0")) == DeltaErrc::boundary_too_small);
    CHECK(reason(make_playlist(1, 20.0, 2, "CAN-SKIP-UNTIL=12.0")) == DeltaErrc::playlist_too_short);
    CHECK(reason(make_playlist(5, 2.0, 2, "CAN-SKIP-UNTIL=12.0")) == DeltaErrc::playlist_too_short);
    CHECK(reason(make_playlist(0, 2.0, 2, "CAN-SKIP-UNTIL=12.0")) == DeltaErrc::playlist_too_short);
}

TEST_CASE("DeltaPolicy - missing target duration", "[policy]") {
    std::string text = "#EXTM3U\n#EXT-X-VERSION:9\n#EXT-X-SERVER-CONTROL:CAN-SKIP-UNTIL=1.0\n";
    for (int i = 0; i < 8; ++i) {
        text += "#EXTINF:2.0,\nseg" + std::to_string(i) + ".ts\n";
    }

    auto boundary = DeltaPolicy::compute(parse(text), SkipMode::yes);
    REQUIRE(!boundary.has_value());
    CHECK(boundary.error() == DeltaErrc::boundary_too_small);

    auto outcome = transform(text, SkipMode::yes);
    CHECK(!outcome.is_delta());
    CHECK(outcome.body == text);
}

TEST_CASE("DeltaPolicy - minimum window holds regardless of length", "[policy]") {
    auto count = GENERATE(2, 8, 50, 500);
    auto pl = parse(make_playlist(count, 4.0, 4, "CAN-SKIP-UNTIL=23.9"));
    auto boundary = DeltaPolicy::compute(pl, SkipMode::yes);
    REQUIRE(!boundary.has_value());
    CHECK(boundary.error() == DeltaErrc::boundary_too_small);
}

TEST_CASE("DeltaPolicy - boundary is non-increasing in the window", "[policy]") {
    std::size_t previous = std::numeric_limits<std::size_t>::max();
    for (double window = 12.0; window <= 60.0; window += 0.5) {
        auto text = make_playlist(30, 2.0, 2, "CAN-SKIP-UNTIL=" + std::to_string(window));
        auto boundary = DeltaPolicy::compute(parse(text), SkipMode::yes);
        REQUIRE(boundary.has_value());
        CHECK(boundary->segments <= previous);
        previous = boundary->segments;
    }
    CHECK(previous == 0);
}

TEST_CASE("DeltaPolicy - date range skipping", "[policy]") {
    const auto allowed = make_playlist(8, 2.0, 2, "CAN-SKIP-UNTIL=12.0,CAN-SKIP-DATERANGES=YES");
    const auto denied = make_playlist(8, 2.0, 2, "CAN-SKIP-UNTIL=12.0");

    CHECK(DeltaPolicy::compute(parse(allowed), SkipMode::v2)->omit_dateranges);
    CHECK(!DeltaPolicy::compute(parse(allowed), SkipMode::yes)->omit_dateranges);
    CHECK(!DeltaPolicy::compute(parse(denied), SkipMode::v2)->omit_dateranges);
}

TEST_CASE("SkipMode parsing", "[policy]") {
    CHECK(parse_skip_mode("YES") == SkipMode::yes);
    CHECK(parse_skip_mode("v2") == SkipMode::v2);
    CHECK(parse_skip_mode("yes") == SkipMode::none);
    CHECK(parse_skip_mode("NO") == SkipMode::none);
    CHECK(parse_skip_mode("") == SkipMode::none);
    CHECK(to_string(SkipMode::v2) == "v2");
}
