#include "doctest/doctest.h"

#include <nlohmann/json.hpp>

#include "utils/color.hpp"

namespace color = captionist::utils::color;

TEST_CASE("hex colours parse in short and long forms") {
    auto white = color::parse("#FFF");
    REQUIRE(white.has_value());
    CHECK(white->r == 255);
    CHECK(white->g == 255);
    CHECK(white->b == 255);
    CHECK(white->a == 255);

    auto orange = color::parse("#FF8800");
    REQUIRE(orange.has_value());
    CHECK(orange->g == 0x88);

    auto translucent = color::parse("#FF880080");
    REQUIRE(translucent.has_value());
    CHECK(translucent->a == 0x80);

    auto short_alpha = color::parse("#0008");
    REQUIRE(short_alpha.has_value());
    CHECK(short_alpha->a == 0x88);
}

TEST_CASE("named colours are case-insensitive") {
    auto red = color::parse("Red");
    REQUIRE(red.has_value());
    CHECK(red->r == 255);
    CHECK(red->g == 0);
    CHECK(color::is_valid(" grey "));
}

TEST_CASE("invalid colour strings are rejected") {
    CHECK_FALSE(color::is_valid(""));
    CHECK_FALSE(color::is_valid("#12"));
    CHECK_FALSE(color::is_valid("#12345"));
    CHECK_FALSE(color::is_valid("#GGGGGG"));
    CHECK_FALSE(color::is_valid("chartreuse-ish"));
}

TEST_CASE("colours format back to hex") {
    CHECK(color::to_hex(SDL_Color{255, 136, 0, 255}) == "#FF8800");
    CHECK(color::to_hex(SDL_Color{0, 0, 0, 128}) == "#00000080");
}

TEST_CASE("colours read from JSON strings or channel arrays") {
    CHECK(color::from_json(nlohmann::json("#abc")) == std::string("#abc"));
    CHECK(color::from_json(nlohmann::json::array({255, 0, 0})) == std::string("#FF0000"));
    CHECK(color::from_json(nlohmann::json::array({0, 0, 0, 128})) == std::string("#00000080"));
    CHECK_FALSE(color::from_json(nlohmann::json("nope")).has_value());
    CHECK_FALSE(color::from_json(nlohmann::json(5)).has_value());
}
