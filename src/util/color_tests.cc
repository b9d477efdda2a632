#include "util/color.hpp"

#include <doctest.h>

using namespace patchy;

TEST_CASE("color") {
    SUBCASE("from_name") {
        REQUIRE(TermColor::from_name("green"));
        CHECK(*TermColor::from_name("green") == TermColor::kGreen);
        CHECK(*TermColor::from_name("light_red") == TermColor::kLightRed);
        CHECK_FALSE(TermColor::from_name("chartreuse"));
    }

    SUBCASE("to_ansi") {
        CHECK(TermStyle{TermColor::kRed, TermColor::kNone}.to_ansi() == "\033[31m");
        CHECK(TermStyle{TermColor::kGreen, TermColor::kBlack, TermStyle::Attribute::Bold}.to_ansi() ==
              "\033[1;32;40m");
        CHECK(TermStyle{}.to_ansi() == "");
    }

    SUBCASE("parse_string") {
        auto style = TermStyle::parse_string("bold light_red on_black");
        REQUIRE(style);
        CHECK(style->fg == TermColor::kLightRed);
        CHECK(style->bg == TermColor::kBlack);
        CHECK(style->attr == TermStyle::Attribute::Bold);
        CHECK(style->to_string() == "bold light_red on_black");

        auto empty = TermStyle::parse_string("");
        REQUIRE(empty);
        CHECK(empty->to_ansi() == "");

        CHECK_FALSE(TermStyle::parse_string("sparkly green"));
        CHECK_FALSE(TermStyle::parse_string("on_nothing"));
    }
}
