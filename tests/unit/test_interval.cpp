/**
 * @file test_interval.cpp
 * @brief Интервалы: взаимное расположение и попарная алгебра
 */

#include <doctest/doctest.h>
#include "model/interval.hpp"

using namespace striplog::model;

namespace {

Component lith(const char* name) {
    return Component{{"lithology", name}};
}

Interval bed(double top, double base, const char* name, std::string description = {}) {
    return Interval(top, base, std::move(description), {lith(name)});
}

double totalThickness(const std::vector<Interval>& pieces) {
    double total = 0.0;
    for (const auto& iv : pieces) {
        total += iv.thickness();
    }
    return total;
}

} // namespace

TEST_CASE("Interval derived quantities") {
    Interval iv(Position::fromBounds(9.0, 11.0), Position::fromBounds(19.0, 21.0));
    CHECK(iv.thickness() == doctest::Approx(10.0));
    CHECK(iv.middle() == doctest::Approx(15.0));
    CHECK(iv.minThickness() == doctest::Approx(8.0));
    CHECK(iv.maxThickness() == doctest::Approx(12.0));
    CHECK(iv.kind() == IntervalKind::Interval);
    CHECK(iv.order() == Order::Depth);
    CHECK(iv.empty());

    Interval p = Interval::point(Position(42.0), "marker");
    CHECK(p.kind() == IntervalKind::Point);
    CHECK(p.thickness() == doctest::Approx(0.0));

    Interval up(20.0, 10.0);
    CHECK(up.order() == Order::Elevation);
}

TEST_CASE("Interval summary uses components before description") {
    Interval iv(10.0, 30.0, "fallback text",
                {Component{{"colour", "grey"}, {"lithology", "sandstone"}}});
    CHECK(iv.summary() == "20.00 m of grey, sandstone");
    CHECK(iv.summary(std::string("{lithology}")) == "20.00 m of sandstone");

    Interval plain(10.0, 30.0, "fallback text");
    CHECK(plain.summary() == "fallback text");
    CHECK(Interval(1.0, 2.0).summary().empty());
}

TEST_CASE("Relationship between depth intervals") {
    Interval a(10.0, 20.0);

    CHECK(a.relationship(Interval(12.0, 15.0)) == Relationship::Contains);
    CHECK(Interval(12.0, 15.0).relationship(a) == Relationship::ContainedBy);
    CHECK(a.relationship(Interval(15.0, 25.0)) == Relationship::Partially);
    CHECK(a.relationship(Interval(5.0, 15.0)) == Relationship::Partially);
    CHECK(a.relationship(Interval(20.0, 30.0)) == Relationship::Touches);
    CHECK(a.relationship(Interval(0.0, 10.0)) == Relationship::Touches);
    CHECK(a.relationship(Interval(30.0, 40.0)) == Relationship::None);

    SUBCASE("shared boundary with overlap counts as containment") {
        CHECK(a.relationship(Interval(10.0, 15.0)) == Relationship::Contains);
        CHECK(a.relationship(Interval(10.0, 20.0)) == Relationship::Contains);
        CHECK(Interval(15.0, 20.0).relationship(a) == Relationship::ContainedBy);
    }

    SUBCASE("predicates follow the relationship") {
        Interval b(15.0, 25.0);
        CHECK(a.anyOverlaps(b));
        CHECK(a.partiallyOverlaps(b));
        CHECK_FALSE(a.completelyContains(b));
        CHECK(a.completelyContains(Interval(12.0, 15.0)));
        CHECK(Interval(12.0, 15.0).isContainedBy(a));
        CHECK(a.touches(Interval(20.0, 30.0)));
        CHECK_FALSE(a.anyOverlaps(Interval(20.0, 30.0)));
    }
}

TEST_CASE("Relationship between elevation intervals") {
    Interval a(20.0, 10.0);
    CHECK(a.relationship(Interval(15.0, 12.0)) == Relationship::Contains);
    CHECK(a.relationship(Interval(15.0, 5.0)) == Relationship::Partially);
    CHECK(a.relationship(Interval(10.0, 0.0)) == Relationship::Touches);
    CHECK(a.relationship(Interval(40.0, 30.0)) == Relationship::None);
    CHECK(a.isAbove(Interval(15.0, 5.0)));
}

TEST_CASE("Relationship of intervals with different orders is an error") {
    CHECK_THROWS_AS((void)Interval(10.0, 20.0).relationship(Interval(20.0, 10.0)), IntervalError);

    // Точка принимает порядок второго интервала
    CHECK(Interval::point(Position(15.0)).relationship(Interval(20.0, 10.0)) == Relationship::ContainedBy);
}

TEST_CASE("spans is inclusive at both ends") {
    Interval iv(10.0, 20.0);
    CHECK(iv.spans(10.0));
    CHECK(iv.spans(20.0));
    CHECK(iv.spans(15.0));
    CHECK_FALSE(iv.spans(20.5));
    CHECK(Interval(20.0, 10.0).spans(12.0));
}

TEST_CASE("splitAt") {
    Interval iv = bed(10.0, 30.0, "sandstone", "grey sandstone");

    auto [upper, lower] = iv.splitAt(17.0);
    CHECK(upper.top().z() == doctest::Approx(10.0));
    CHECK(upper.base().z() == doctest::Approx(17.0));
    CHECK(lower.top().z() == doctest::Approx(17.0));
    CHECK(lower.base().z() == doctest::Approx(30.0));
    CHECK(upper.description() == "grey sandstone");
    CHECK(lower.components() == iv.components());

    CHECK_THROWS_AS((void)iv.splitAt(31.0), IntervalError);

    SUBCASE("split pieces rejoin into the original thickness") {
        for (double d : {10.0, 12.5, 17.0, 29.0, 30.0}) {
            auto [a, b] = iv.splitAt(d);
            CHECK(a.unionWith(b, false).thickness() == doctest::Approx(iv.thickness()));
        }
    }
}

TEST_CASE("intersect") {
    Interval a = bed(10.0, 20.0, "sandstone");
    Interval b = bed(15.0, 25.0, "shale");

    Interval x = a.intersect(b);
    CHECK(x.top().z() == doctest::Approx(15.0));
    CHECK(x.base().z() == doctest::Approx(20.0));
    REQUIRE(x.components().size() == 2);
    CHECK(x.components()[0] == lith("sandstone"));
    CHECK(x.components()[1] == lith("shale"));

    SUBCASE("without blending the other interval replaces the content") {
        Interval y = a.intersect(b, false);
        REQUIRE(y.components().size() == 1);
        CHECK(y.components()[0] == lith("shale"));
    }

    SUBCASE("non-overlapping intervals cannot intersect") {
        CHECK_THROWS_AS((void)a.intersect(Interval(20.0, 30.0)), IntervalError);
        CHECK_THROWS_AS((void)a.intersect(Interval(40.0, 50.0)), IntervalError);
    }
}

TEST_CASE("blended descriptions weigh by thickness") {
    Interval thick = bed(0.0, 30.0, "sandstone", "sandstone.");
    Interval thin = bed(20.0, 30.0, "shale", "shale");

    Interval x = thick.intersect(thin);
    CHECK(x.description() == "75.0% sandstone with 25.0% shale");

    SUBCASE("identical components keep the description") {
        Interval same = bed(20.0, 30.0, "sandstone", "other text");
        CHECK(thick.intersect(same).description() == "sandstone");
    }
}

TEST_CASE("data maps are merged with list accumulation") {
    Interval a(10.0, 20.0, "", {}, DataMap{{"gr", 40.0}, {"well", "A-1"}});
    Interval b(15.0, 25.0, "", {}, DataMap{{"gr", 60.0}, {"phi", 0.2}});

    Interval x = a.intersect(b);
    REQUIRE(x.data().count("gr") == 1);
    REQUIRE(x.data().at("gr").isList());
    CHECK(x.data().at("gr").asList().size() == 2);
    CHECK(x.data().at("well").asString() == "A-1");
    CHECK(x.data().at("phi").asNumber() == doctest::Approx(0.2));
}

TEST_CASE("merge of partially overlapping depth intervals") {
    Interval a = bed(10.0, 20.0, "sandstone");
    Interval b = bed(15.0, 25.0, "shale");

    auto pieces = a.merge(b);
    REQUIRE(pieces.size() == 3);
    CHECK(pieces[0].top().z() == doctest::Approx(10.0));
    CHECK(pieces[0].base().z() == doctest::Approx(15.0));
    CHECK(pieces[0].components().size() == 1);
    CHECK(pieces[1].top().z() == doctest::Approx(15.0));
    CHECK(pieces[1].base().z() == doctest::Approx(20.0));
    CHECK(pieces[1].components().size() == 2);
    CHECK(pieces[2].top().z() == doctest::Approx(20.0));
    CHECK(pieces[2].base().z() == doctest::Approx(25.0));
    CHECK(pieces[2].components()[0] == lith("shale"));

    // Части покрывают объединение без двойного учёта
    CHECK(totalThickness(pieces) == doctest::Approx(a.unionWith(b).thickness()));
    CHECK(totalThickness(b.merge(a)) == doctest::Approx(15.0));

    SUBCASE("without blending only two pieces remain") {
        auto two = a.merge(b, false);
        REQUIRE(two.size() == 2);
        CHECK(two[0].base().z() == doctest::Approx(15.0));
        CHECK(two[1].top().z() == doctest::Approx(15.0));
        CHECK(two[1].base().z() == doctest::Approx(25.0));
        CHECK(two[1].components()[0] == lith("shale"));
    }

    SUBCASE("disjoint intervals cannot merge") {
        CHECK_THROWS_AS((void)a.merge(Interval(30.0, 40.0)), IntervalError);
    }
}

TEST_CASE("merge of a contained interval") {
    Interval outer = bed(0.0, 100.0, "sandstone");
    Interval inner = bed(40.0, 60.0, "shale");

    auto pieces = outer.merge(inner);
    REQUIRE(pieces.size() == 3);
    CHECK(pieces[0].base().z() == doctest::Approx(40.0));
    CHECK(pieces[1].top().z() == doctest::Approx(40.0));
    CHECK(pieces[1].base().z() == doctest::Approx(60.0));
    CHECK(pieces[1].components().size() == 2);
    CHECK(pieces[2].top().z() == doctest::Approx(60.0));
    CHECK(totalThickness(pieces) == doctest::Approx(100.0));

    SUBCASE("a shared top drops the empty upper tail") {
        auto flush = outer.merge(bed(0.0, 30.0, "shale"));
        REQUIRE(flush.size() == 2);
        CHECK(flush[0].base().z() == doctest::Approx(30.0));
        CHECK(flush[1].base().z() == doctest::Approx(100.0));
    }
}

TEST_CASE("merge of elevation intervals returns pieces from the top") {
    Interval a = bed(25.0, 15.0, "sandstone");
    Interval b = bed(20.0, 10.0, "shale");

    auto pieces = a.merge(b);
    REQUIRE(pieces.size() == 3);
    CHECK(pieces[0].top().z() == doctest::Approx(25.0));
    CHECK(pieces[0].base().z() == doctest::Approx(20.0));
    CHECK(pieces[1].base().z() == doctest::Approx(15.0));
    CHECK(pieces[2].base().z() == doctest::Approx(10.0));
    CHECK(totalThickness(pieces) == doctest::Approx(15.0));
}

TEST_CASE("union") {
    Interval a = bed(10.0, 20.0, "sandstone");

    Interval u = a.unionWith(bed(20.0, 30.0, "shale"));
    CHECK(u.top().z() == doctest::Approx(10.0));
    CHECK(u.base().z() == doctest::Approx(30.0));
    CHECK(u.components().size() == 2);

    Interval v = a + bed(5.0, 15.0, "shale");
    CHECK(v.top().z() == doctest::Approx(5.0));
    CHECK(v.base().z() == doctest::Approx(20.0));

    CHECK_THROWS_AS((void)a.unionWith(Interval(25.0, 30.0)), IntervalError);
}

TEST_CASE("difference") {
    SUBCASE("contained interval leaves two tails") {
        Interval outer(0.0, 100.0);
        Interval inner(40.0, 60.0);
        auto diff = outer.difference(inner);
        using Pieces = std::pair<Interval, Interval>;
        REQUIRE(std::holds_alternative<Pieces>(diff));
        const auto& [upper, lower] = std::get<Pieces>(diff);
        CHECK(upper.top().z() == doctest::Approx(0.0));
        CHECK(upper.base().z() == doctest::Approx(40.0));
        CHECK(lower.top().z() == doctest::Approx(60.0));
        CHECK(lower.base().z() == doctest::Approx(100.0));
        CHECK(upper.thickness() + lower.thickness() ==
              doctest::Approx(outer.thickness() - inner.thickness()));
    }

    SUBCASE("partial overlap keeps the surviving tail") {
        auto above = Interval(10.0, 20.0).difference(Interval(15.0, 25.0));
        REQUIRE(std::holds_alternative<Interval>(above));
        CHECK(std::get<Interval>(above).base().z() == doctest::Approx(15.0));

        auto below = Interval(15.0, 25.0).difference(Interval(10.0, 20.0));
        REQUIRE(std::holds_alternative<Interval>(below));
        CHECK(std::get<Interval>(below).top().z() == doctest::Approx(20.0));
        CHECK(std::get<Interval>(below).base().z() == doctest::Approx(25.0));
    }

    SUBCASE("touching or distant intervals leave self unchanged") {
        auto touching = Interval(10.0, 20.0).difference(Interval(20.0, 30.0));
        REQUIRE(std::holds_alternative<Interval>(touching));
        CHECK(std::get<Interval>(touching).thickness() == doctest::Approx(10.0));

        auto distant = Interval(10.0, 20.0).difference(Interval(50.0, 60.0));
        CHECK(std::holds_alternative<Interval>(distant));
    }

    SUBCASE("identical or covered extent leaves nothing") {
        CHECK(std::holds_alternative<std::monostate>(Interval(10.0, 20.0).difference(Interval(10.0, 20.0))));
        CHECK(std::holds_alternative<std::monostate>(Interval(12.0, 18.0).difference(Interval(10.0, 20.0))));
    }

    SUBCASE("shared top leaves a single lower tail") {
        auto diff = Interval(0.0, 100.0).difference(Interval(0.0, 30.0));
        REQUIRE(std::holds_alternative<Interval>(diff));
        CHECK(std::get<Interval>(diff).top().z() == doctest::Approx(30.0));
    }
}

TEST_CASE("adding a component") {
    Interval iv(10.0, 20.0, "grey sandstone");
    Interval with = iv + lith("limestone");
    REQUIRE(with.components().size() == 1);
    CHECK(with.description() == "grey sandstone with Limestone");
    CHECK(iv.components().empty());

    Interval blank(10.0, 20.0);
    CHECK(blank.plus(lith("shale")).description() == "Shale");
}

TEST_CASE("invert swaps top and base") {
    Interval iv(Position::fromBounds(9.0, 11.0), Position(20.0));
    Interval flipped = iv.inverted();
    CHECK(flipped.top().z() == doctest::Approx(20.0));
    CHECK(flipped.base().z() == doctest::Approx(10.0));
    CHECK(flipped.base().upper() == doctest::Approx(11.0));
    CHECK(flipped.order() == Order::Elevation);
    CHECK(flipped.thickness() == doctest::Approx(iv.thickness()));
}

TEST_CASE("ordering operators compare tops") {
    CHECK(Interval(10.0, 20.0) < Interval(15.0, 30.0));
    CHECK_FALSE(Interval(15.0, 30.0) < Interval(10.0, 20.0));
    CHECK(Interval(20.0, 10.0) < Interval(15.0, 5.0));
    CHECK(Interval(10.0, 20.0) == Interval(10.0, 40.0));
}
