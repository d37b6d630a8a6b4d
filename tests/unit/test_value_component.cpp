/**
 * @file test_value_component.cpp
 * @brief Значения свойств и компоненты
 */

#include <doctest/doctest.h>
#include "model/component.hpp"
#include <stdexcept>

using namespace striplog::model;

TEST_CASE("parseScalar turns numeric text into numbers") {
    CHECK(parseScalar("2.5").isNumber());
    CHECK(parseScalar("2.5").asNumber() == doctest::Approx(2.5));
    CHECK(parseScalar(" 10 ").asNumber() == doctest::Approx(10.0));
    CHECK(parseScalar("VF-F").isString());
    CHECK(parseScalar("").isString());
}

TEST_CASE("compareValues orders numbers and strings, rejects mixed types") {
    CHECK(compareValues(Value{1.0}, Value{2.0}) < 0);
    CHECK(compareValues(Value{3}, Value{3.0}) == 0);
    CHECK(compareValues(Value{true}, Value{0.5}) > 0);
    CHECK(compareValues(Value{"b"}, Value{"a"}) > 0);
    CHECK_THROWS_AS((void)compareValues(Value{"a"}, Value{1.0}), std::invalid_argument);
    CHECK_THROWS_AS((void)compareValues(Value{ValueList{}}, Value{ValueList{}}), std::invalid_argument);
}

TEST_CASE("listAndAdd flattens into a single list") {
    Value combined = listAndAdd(Value{1.0}, Value{2.0});
    REQUIRE(combined.isList());
    CHECK(combined.asList().size() == 2);

    Value longer = listAndAdd(combined, Value{"x"});
    REQUIRE(longer.isList());
    CHECK(longer.asList().size() == 3);
    CHECK(longer.toString() == "[1, 2, x]");
}

TEST_CASE("Value truthiness") {
    CHECK_FALSE(Value{}.truthy());
    CHECK_FALSE(Value{0.0}.truthy());
    CHECK_FALSE(Value{""}.truthy());
    CHECK_FALSE(Value{false}.truthy());
    CHECK(Value{"a"}.truthy());
    CHECK(Value{ValueList{Value{1.0}}}.truthy());
}

TEST_CASE("Component stores properties in insertion order") {
    Component c{{"colour", "Red"}, {"grainsize", "VF-F"}, {"lithology", "Sandstone"}};
    REQUIRE(c.size() == 3);
    CHECK(c.properties().front().first == "colour");
    CHECK(c.has("lithology"));
    CHECK_FALSE(c.has("porosity"));

    SUBCASE("numeric strings become numbers") {
        c.set("porosity", "0.25");
        REQUIRE(c.get("porosity") != nullptr);
        CHECK(c.get("porosity")->isNumber());
    }

    SUBCASE("set replaces in place and erase removes") {
        c.set("colour", "grey");
        CHECK(c.properties().front().second.asString() == "grey");
        c.erase("colour");
        CHECK(c.size() == 2);
        CHECK_FALSE(c.has("colour"));
    }

    SUBCASE("null values are skipped at construction") {
        Component sparse{{"lithology", "shale"}, {"colour", Value{}}};
        CHECK(sparse.size() == 1);
    }
}

TEST_CASE("Component summary") {
    Component c{{"colour", "Red"}, {"grainsize", "VF-F"}, {"lithology", "Sandstone"}};

    CHECK(c.summary() == "Red, VF-F, Sandstone");
    CHECK(c.summary("{lithology!u} {colour!l}") == "SANDSTONE red");
    CHECK(c.summary("{lithology!l} of {colour!c}") == "sandstone of Red");
    CHECK(c.summary("{lithology} {missing}") == "Sandstone _");
    CHECK(c.summary("{{literal}}") == "{literal}");

    Component lower{{"lithology", "sandstone"}};
    CHECK(lower.summary() == "Sandstone");
    CHECK(lower.summary(std::nullopt, false) == "sandstone");

    Component titled{{"name", "upper chalk group"}};
    CHECK(titled.summary("{name!t}") == "Upper Chalk Group");

    CHECK(Component{}.summary(std::nullopt, true, "none") == "none");
    CHECK_THROWS_AS((void)c.summary("{lithology"), ComponentError);
}

TEST_CASE("Component equality ignores case, numbers and empty entries") {
    Component a{{"lithology", "Sandstone"}, {"porosity", 0.2}};
    Component b{{"LITHOLOGY", "sandstone"}, {"porosity", 0.3}, {"colour", ""}};
    Component c{{"lithology", "shale"}};
    Component d{{"lithology", "sandstone"}, {"porous", true}};

    CHECK(a == b);
    CHECK_FALSE(a == c);
    CHECK_FALSE(a == d);
    CHECK(Component{} == Component{{"thickness", 3.0}});
}

TEST_CASE("restrictedTo keeps only the requested keys") {
    Component c{{"colour", "grey"}, {"lithology", "sandstone"}, {"porous", true}};
    Component r = c.restrictedTo({"porous"});
    CHECK(r.size() == 1);
    CHECK(r.has("porous"));
    CHECK(r == Component{{"porous", true}});
}
