// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <edgehls/edge/request.hpp>
#include <edgehls/edge/router.hpp>

using namespace edgehls::edge;
using edgehls::core::QueryParams;
using edgehls::core::Route;
using edgehls::delta::SkipMode;

TEST_CASE("classify - request branches", "[request]") {
    SECTION("Blocking reload parameters force forwarding") {
        auto r = classify("/live/index.m3u8", QueryParams::parse("_HLS_skip=YES&_HLS_msn=42"));
        CHECK(r.kind == RequestClass::forward);
        CHECK(r.blocking_reload);
        CHECK(r.origin_query.to_string() == "_HLS_skip=YES&_HLS_msn=42");

        CHECK(classify("/live/index.m3u8", QueryParams::parse("_HLS_part=1")).kind
              == RequestClass::forward);
    }

    SECTION("No delta flag serves the full playlist") {
        auto r = classify("/live/index.m3u8", QueryParams::parse("token=abc"));
        CHECK(r.kind == RequestClass::full);
        CHECK(r.mode == SkipMode::none);
        CHECK(r.origin_query.to_string() == "token=abc");
    }

    SECTION("Delta flag") {
        auto yes = classify("/live/index.m3u8", QueryParams::parse("_HLS_skip=YES&token=abc"));
        CHECK(yes.kind == RequestClass::delta);
        CHECK(yes.mode == SkipMode::yes);
        CHECK(yes.origin_query.to_string() == "token=abc");

        auto v2 = classify("/live/index.m3u8", QueryParams::parse("_HLS_skip=v2"));
        CHECK(v2.kind == RequestClass::delta);
        CHECK(v2.mode == SkipMode::v2);
        CHECK(v2.origin_query.empty());
    }

    SECTION("Unknown skip values count as no delta flag") {
        auto r = classify("/live/index.m3u8", QueryParams::parse("_HLS_skip=NO"));
        CHECK(r.kind == RequestClass::full);
        CHECK(!r.origin_query.contains("_HLS_skip"));
    }

    SECTION("Non-playlist paths are forwarded") {
        auto r = classify("/live/seg100.mp4", QueryParams::parse("_HLS_skip=YES"));
        CHECK(r.kind == RequestClass::forward);
        CHECK(!r.blocking_reload);
    }
}

TEST_CASE("EdgeRequest and EdgeResponse", "[request]") {
    auto request = EdgeRequest::from_target("HEAD", "/a/b.m3u8?x=1&_HLS_skip=v2");
    CHECK(request.method == "HEAD");
    CHECK(request.path == "/a/b.m3u8");
    CHECK(request.query.get("_HLS_skip") == "v2");

    EdgeResponse response;
    response.set_header("Content-Type", "text/plain");
    response.set_header("content-type", "application/vnd.apple.mpegurl");
    CHECK(response.headers.size() == 1);
    CHECK(response.header("CONTENT-TYPE") == "application/vnd.apple.mpegurl");
    CHECK(!response.header("Cache-Control").has_value());
}

TEST_CASE("Router - backend selection", "[router]") {
    Router router({
        Route{"/alt", "video_backend_alt", true},
        Route{"/alt/keep", "video_backend_keep", false},
        Route{"/eu/", "video_backend_eu", true},
    }, "video_backend");

    SECTION("Default backend") {
        auto t = router.resolve("/live/index.m3u8");
        CHECK(t.backend == "video_backend");
        CHECK(t.path == "/live/index.m3u8");
    }

    SECTION("Prefix stripped") {
        auto t = router.resolve("/alt/index.m3u8");
        CHECK(t.backend == "video_backend_alt");
        CHECK(t.path == "/index.m3u8");
    }

    SECTION("Trailing slash in prefix") {
        auto t = router.resolve("/eu/live/index.m3u8");
        CHECK(t.backend == "video_backend_eu");
        CHECK(t.path == "/live/index.m3u8");
    }

    SECTION("Longest prefix wins, prefix kept") {
        auto t = router.resolve("/alt/keep/index.m3u8");
        CHECK(t.backend == "video_backend_keep");
        CHECK(t.path == "/alt/keep/index.m3u8");
    }

    SECTION("Prefix matches whole segments only") {
        auto t = router.resolve("/alternate.m3u8");
        CHECK(t.backend == "video_backend");
        CHECK(t.path == "/alternate.m3u8");
    }

    SECTION("Exact prefix") {
        auto t = router.resolve("/alt");
        CHECK(t.backend == "video_backend_alt");
        CHECK(t.path == "/");
    }
}
