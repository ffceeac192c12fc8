// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <edgehls/core/http_session.hpp>

using namespace edgehls::core;

TEST_CASE("parse_max_age", "[http]") {
    CHECK(parse_max_age("max-age=2") == 2u);
    CHECK(parse_max_age("public, max-age=30") == 30u);
    CHECK(parse_max_age("no-cache,  Max-Age=5 , must-revalidate") == 5u);
    CHECK(parse_max_age("s-maxage=10, max-age=1") == 1u);

    CHECK(!parse_max_age("").has_value());
    CHECK(!parse_max_age("no-store").has_value());
    CHECK(!parse_max_age("max-age=").has_value());
    CHECK(!parse_max_age("max-age=abc").has_value());
    CHECK(!parse_max_age("max-age=-1").has_value());
}

TEST_CASE("HttpResponse - header lookup", "[http]") {
    HttpResponse response;
    response.headers["cache-control"] = "public, max-age=4";
    response.headers["etag"] = "\"abc\"";

    CHECK(response.header("ETag") == "\"abc\"");
    CHECK(response.header("CACHE-CONTROL") == "public, max-age=4");
    CHECK(!response.header("x-missing").has_value());
    CHECK(response.max_age() == 4u);

    response.headers.erase("cache-control");
    CHECK(!response.max_age().has_value());
}
