// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <edgehls/playlist/attribute_list.hpp>
#include <edgehls/playlist/error.hpp>

using namespace edgehls::playlist;

TEST_CASE("AttributeList::parse - valid lists", "[attributes]") {
    SECTION("Quoted value with embedded commas") {
        auto attrs = AttributeList::parse(
            R"(ID="ad-1",CLASS="com.example,ads",START-DATE="2026-01-01T00:00:00Z",DURATION=30.0)");
        REQUIRE(attrs.has_value());
        REQUIRE(attrs->size() == 4);
        CHECK(attrs->get("ID") == "ad-1");
        CHECK(attrs->get("CLASS") == "com.example,ads");
        CHECK(attrs->find("CLASS")->quoted);
        CHECK(!attrs->find("DURATION")->quoted);
        CHECK(attrs->get_double("DURATION") == Catch::Approx(30.0));
    }

    SECTION("Source order preserved") {
        auto attrs = AttributeList::parse("B=1,A=2,C=3");
        REQUIRE(attrs.has_value());
        const auto& list = attrs->attributes();
        CHECK(list[0].name == "B");
        CHECK(list[1].name == "A");
        CHECK(list[2].name == "C");
    }

    SECTION("Enumerated YES values") {
        auto attrs = AttributeList::parse("CAN-SKIP-UNTIL=12.0,CAN-BLOCK-RELOAD=YES,CAN-SKIP-DATERANGES=NO");
        REQUIRE(attrs.has_value());
        CHECK(attrs->get_yes("CAN-BLOCK-RELOAD"));
        CHECK(!attrs->get_yes("CAN-SKIP-DATERANGES"));
        CHECK(!attrs->get_yes("MISSING"));
    }

    SECTION("Empty list") {
        auto attrs = AttributeList::parse("");
        REQUIRE(attrs.has_value());
        CHECK(attrs->size() == 0);
    }

    SECTION("Empty quoted value") {
        auto attrs = AttributeList::parse(R"(KEYFORMAT="",METHOD=NONE)");
        REQUIRE(attrs.has_value());
        CHECK(attrs->get("KEYFORMAT") == "");
        CHECK(attrs->get("METHOD") == "NONE");
    }
}

TEST_CASE("AttributeList::parse - syntax errors", "[attributes]") {
    auto fails = [](std::string_view text) {
        auto attrs = AttributeList::parse(text);
        return !attrs.has_value() && attrs.error() == PlaylistErrc::attribute_syntax;
    };

    CHECK(fails(R"(URI="part.mp4,DURATION=1.0)"));  // Unterminated quote
    CHECK(fails("DURATION"));                       // Missing '='
    CHECK(fails("=1.0"));                           // Empty name
    CHECK(fails(R"(URI="a.mp4"x,DURATION=1)"));     // Garbage after quoted value
    CHECK(fails(R"(URI=a"b.mp4)"));                 // Quote inside unquoted value
}

TEST_CASE("parse_decimal and parse_integer", "[attributes]") {
    CHECK(parse_decimal("4.00008") == Catch::Approx(4.00008));
    CHECK(parse_decimal("12") == Catch::Approx(12.0));
    CHECK(!parse_decimal("4s").has_value());
    CHECK(!parse_decimal("").has_value());
    CHECK(!parse_decimal("abc").has_value());

    CHECK(parse_integer("42") == 42u);
    CHECK(!parse_integer("-1").has_value());
    CHECK(!parse_integer("4.0").has_value());
}
