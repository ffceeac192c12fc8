// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <edgehls/playlist/error.hpp>
#include <edgehls/playlist/parser.hpp>
#include <string>

using namespace edgehls::playlist;

namespace {

const std::string LL_PLAYLIST =
    "#EXTM3U\n"
    "#EXT-X-VERSION:9\n"
    "#EXT-X-TARGETDURATION:4\n"
    "#EXT-X-PART-INF:PART-TARGET=1.0\n"
    "#EXT-X-SERVER-CONTROL:CAN-BLOCK-RELOAD=YES,CAN-SKIP-UNTIL=24.0,PART-HOLD-BACK=3.0,X-VENDOR=\"a,b\"\n"
    "#EXT-X-MEDIA-SEQUENCE:100\n"
    "#EXT-X-DISCONTINUITY-SEQUENCE:3\n"
    "#EXT-X-MAP:URI=\"init.mp4\"\n"
    "#EXT-X-PROGRAM-DATE-TIME:2026-01-01T00:00:00.000Z\n"
    "#EXTINF:4.0,first\n"
    "seg100.mp4\n"
    "#EXT-X-PART:DURATION=1.0,URI=\"seg101.0.mp4\",INDEPENDENT=YES\n"
    "#EXT-X-PART:DURATION=1.0,URI=\"seg101.1.mp4\"\n"
    "#EXT-X-PART:DURATION=1.0,URI=\"seg101.2.mp4\"\n"
    "#EXT-X-PART:DURATION=1.0,URI=\"seg101.3.mp4\"\n"
    "#EXTINF:4.0,\n"
    "seg101.mp4\n"
    "#EXT-X-PART:DURATION=1.0,URI=\"seg102.0.mp4\",INDEPENDENT=YES\n"
    "#EXT-X-PRELOAD-HINT:TYPE=PART,URI=\"seg102.1.mp4\"\n"
    "#EXT-X-RENDITION-REPORT:URI=\"../alt/index.m3u8\",LAST-MSN=101\n";

} // namespace

TEST_CASE("PlaylistParser - LL-HLS media playlist", "[parser]") {
    auto result = PlaylistParser::parse(LL_PLAYLIST);
    REQUIRE(result.has_value());
    const auto& pl = *result;

    SECTION("Playlist attributes") {
        CHECK(pl.version == 9);
        CHECK(pl.target_duration == Catch::Approx(4.0));
        CHECK(pl.media_sequence == 100);
        CHECK(pl.discontinuity_sequence == 3);
        REQUIRE(pl.part_target.has_value());
        CHECK(*pl.part_target == Catch::Approx(1.0));
        CHECK(!pl.ended);
        CHECK(pl.line_terminator == "\n");
    }

    SECTION("Server control") {
        REQUIRE(pl.server_control.has_value());
        const auto& sc = *pl.server_control;
        REQUIRE(sc.can_skip_until.has_value());
        CHECK(*sc.can_skip_until == Catch::Approx(24.0));
        CHECK(sc.can_block_reload);
        CHECK(!sc.can_skip_dateranges);
        CHECK(sc.part_hold_back == Catch::Approx(3.0));
        CHECK(!sc.hold_back.has_value());
        CHECK(sc.attributes.get("X-VENDOR") == "a,b");
    }

    SECTION("Segments and parts") {
        REQUIRE(pl.segment_count() == 2);
        CHECK(pl.segment(0).uri == "seg100.mp4");
        CHECK(pl.segment(0).title == "first");
        CHECK(pl.segment(0).parts.empty());
        CHECK(!pl.segment(0).is_last);

        const auto& second = pl.segment(1);
        CHECK(second.uri == "seg101.mp4");
        CHECK(second.is_last);
        REQUIRE(second.parts.size() == 4);
        const auto& part = std::get<PartLine>(pl.lines[second.parts[0]]);
        CHECK(part.uri == "seg101.0.mp4");
        CHECK(part.independent);
        CHECK(part.segment == pl.segments[1]);

        CHECK(pl.segments_duration() == Catch::Approx(8.0));
        CHECK(pl.trailing_parts_duration() == Catch::Approx(1.0));
        CHECK(pl.total_duration() == Catch::Approx(9.0));
    }

    SECTION("Trailing part has no parent yet") {
        const PartLine* trailing = nullptr;
        for (std::size_t i = pl.segments.back() + 1; i < pl.lines.size(); ++i) {
            if (auto* part = std::get_if<PartLine>(&pl.lines[i])) {
                trailing = part;
            }
        }
        REQUIRE(trailing != nullptr);
        CHECK(trailing->uri == "seg102.0.mp4");
        CHECK(!trailing->segment.has_value());
    }

    SECTION("Line classification") {
        const auto& header = std::get<RawLine>(pl.lines[0]);
        CHECK(header.kind == LineKind::header);

        const auto& map = std::get<RawLine>(pl.lines[7]);
        CHECK(map.tag == "EXT-X-MAP");
        CHECK(map.kind == LineKind::segment_tag);

        const auto& report = std::get<RawLine>(pl.lines.back());
        CHECK(report.tag == "EXT-X-RENDITION-REPORT");
        CHECK(report.kind == LineKind::playlist_tag);

        CHECK(pl.first_media_line() == 7);
    }

    SECTION("Byte-exact round trip") {
        CHECK(pl.to_string() == LL_PLAYLIST);
    }
}

TEST_CASE("PlaylistParser - round trip preserves formatting", "[parser]") {
    SECTION("CRLF terminators") {
        const std::string text =
            "#EXTM3U\r\n"
            "#EXT-X-TARGETDURATION:2\r\n"
            "#EXTINF:2.000,\r\n"
            "a.ts\r\n"
            "#EXT-X-ENDLIST\r\n";
        auto pl = PlaylistParser::parse(text);
        REQUIRE(pl.has_value());
        CHECK(pl->line_terminator == "\r\n");
        CHECK(pl->segment(0).uri == "a.ts");
        CHECK(pl->ended);
        CHECK(pl->to_string() == text);
    }

    SECTION("Missing final newline, comments, blank lines and unknown tags") {
        const std::string text =
            "#EXTM3U\n"
            "# generated by packager\n"
            "\n"
            "#EXT-X-TARGETDURATION:2\n"
            "#EXT-X-VENDOR-THING:foo=bar\n"
            "#EXTINF:2.0,\n"
            "#EXT-X-BYTERANGE:1000@0\n"
            "a.ts\n"
            "#EXTINF:2.0,\n"
            "b.ts";
        auto pl = PlaylistParser::parse(text);
        REQUIRE(pl.has_value());
        REQUIRE(pl->segment_count() == 2);
        CHECK(pl->segment(0).text == "#EXTINF:2.0,\n#EXT-X-BYTERANGE:1000@0\na.ts\n");
        CHECK(pl->segment(1).uri == "b.ts");
        CHECK(pl->to_string() == text);
    }

    SECTION("Defaults when tags are absent") {
        auto pl = PlaylistParser::parse("#EXTM3U\n#EXTINF:1.5,\na.ts\n");
        REQUIRE(pl.has_value());
        CHECK(pl->version == 1);
        CHECK(pl->media_sequence == 0);
        CHECK(!pl->server_control.has_value());
        CHECK(!pl->part_target.has_value());
    }
}

TEST_CASE("PlaylistParser - errors", "[parser]") {
    auto error_of = [](std::string_view text) {
        auto pl = PlaylistParser::parse(text);
        REQUIRE(!pl.has_value());
        return pl.error();
    };

    CHECK(error_of("") == PlaylistErrc::not_m3u8);
    CHECK(error_of("<html></html>\n") == PlaylistErrc::not_m3u8);
    CHECK(error_of("#EXTM3U\n#EXT-X-TARGETDURATION:abc\n") == PlaylistErrc::malformed_tag);
    CHECK(error_of("#EXTM3U\n#EXT-X-MEDIA-SEQUENCE:-4\n") == PlaylistErrc::malformed_tag);
    CHECK(error_of("#EXTM3U\n#EXTINF:x,\na.ts\n") == PlaylistErrc::malformed_tag);
    CHECK(error_of("#EXTM3U\n#EXT-X-PART:URI=\"a.mp4\"\n") == PlaylistErrc::malformed_tag);
    CHECK(error_of("#EXTM3U\n#EXT-X-PART:DURATION=1.0\n") == PlaylistErrc::malformed_tag);
    CHECK(error_of("#EXTM3U\n#EXTINF:2.0,\n#EXTINF:2.0,\na.ts\n") == PlaylistErrc::malformed_tag);
    CHECK(error_of("#EXTM3U\n#EXTINF:2.0,\n") == PlaylistErrc::unexpected_eof);
    CHECK(error_of("#EXTM3U\n#EXT-X-SERVER-CONTROL:CAN-SKIP-UNTIL=\"12.0\n")
          == PlaylistErrc::attribute_syntax);
    CHECK(error_of("#EXTM3U\n#EXT-X-SERVER-CONTROL:CAN-SKIP-UNTIL=soon\n")
          == PlaylistErrc::malformed_tag);

    SECTION("Multivariant playlists are not media playlists") {
        CHECK(error_of("#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=800000\nlow/index.m3u8\n")
              == PlaylistErrc::malformed_tag);
    }
}

TEST_CASE("PlaylistParser helpers", "[parser]") {
    CHECK(PlaylistParser::is_playlist_path("/live/index.m3u8"));
    CHECK(PlaylistParser::is_playlist_path("/live/INDEX.M3U8"));
    CHECK(!PlaylistParser::is_playlist_path("/live/seg1.mp4"));
    CHECK(!PlaylistParser::is_playlist_path("/m3u8"));

    CHECK(PlaylistParser::tag_name("#EXT-X-KEY:METHOD=NONE") == "EXT-X-KEY");
    CHECK(PlaylistParser::tag_name("#EXT-X-ENDLIST\r\n") == "EXT-X-ENDLIST");
    CHECK(PlaylistParser::tag_name("# comment").empty());
    CHECK(PlaylistParser::tag_name("seg.ts").empty());

    CHECK(PlaylistParser::classify_tag("EXT-X-DATERANGE") == LineKind::segment_tag);
    CHECK(PlaylistParser::classify_tag("EXT-X-CUE-OUT") == LineKind::segment_tag);
    CHECK(PlaylistParser::classify_tag("EXT-X-PRELOAD-HINT") == LineKind::playlist_tag);
    CHECK(PlaylistParser::classify_tag("EXT-X-VENDOR-THING") == LineKind::other);
}
