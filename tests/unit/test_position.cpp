/**
 * @file test_position.cpp
 * @brief Позиции: середина, границы неопределённости, координаты
 */

#include <doctest/doctest.h>
#include "model/position.hpp"

using namespace striplog::model;

TEST_CASE("Position from a single value") {
    Position p(120.5);
    REQUIRE(p.middle().has_value());
    CHECK(p.z() == doctest::Approx(120.5));
    CHECK(p.upper() == doctest::Approx(120.5));
    CHECK(p.lower() == doctest::Approx(120.5));
    CHECK(p.uncertainty() == doctest::Approx(0.0));
    CHECK(p.units() == "m");
    CHECK_FALSE(p.hasCoordinates());
}

TEST_CASE("Position from uncertainty bounds") {
    Position p = Position::fromBounds(99.0, 101.0);
    CHECK_FALSE(p.middle().has_value());
    CHECK(p.z() == doctest::Approx(100.0));
    CHECK(p.uncertainty() == doctest::Approx(2.0));

    auto [lower, upper] = p.span();
    CHECK(lower == doctest::Approx(101.0));
    CHECK(upper == doctest::Approx(99.0));

    SUBCASE("invert swaps the bounds") {
        p.invert();
        CHECK(p.upper() == doctest::Approx(101.0));
        CHECK(p.lower() == doctest::Approx(99.0));
        CHECK(p.z() == doctest::Approx(100.0));
    }
}

TEST_CASE("Position construction errors") {
    CHECK_THROWS_AS(Position(std::nullopt, 5.0, std::nullopt), PositionError);
    CHECK_THROWS_AS(Position(std::nullopt, std::nullopt, std::nullopt), PositionError);
    CHECK_THROWS_AS(Position(10.0, std::nullopt, std::nullopt, 1.0, std::nullopt), PositionError);
    CHECK_NOTHROW(Position(10.0, std::nullopt, std::nullopt, 1.0, 2.0));
}

TEST_CASE("Position keeps only non-empty metadata") {
    DataMap meta{{"note", ""}, {"source", "core"}, {"flag", false}};
    Position p(10.0, std::nullopt, std::nullopt, std::nullopt, std::nullopt, "ft", meta);
    CHECK(p.units() == "ft");
    CHECK(p.meta().size() == 1);
    CHECK(p.meta().count("source") == 1);
}

TEST_CASE("Position compares by working value and shifts with its bounds") {
    CHECK(Position(1.0) < Position(2.0));
    CHECK(Position(2.0) == Position::fromBounds(1.0, 3.0));

    Position p = Position::fromBounds(10.0, 12.0).shifted(5.0);
    CHECK(p.upper() == doctest::Approx(15.0));
    CHECK(p.lower() == doctest::Approx(17.0));
    CHECK(p.z() == doctest::Approx(16.0));
}
