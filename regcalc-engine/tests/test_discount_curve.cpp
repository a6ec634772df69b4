#include <catch2/catch.hpp>
#include <sstream>
#include <stdexcept>
#include "discount_curve.hpp"
#include "macro_context.hpp"
#include "errors.hpp"

using namespace regcalc;
using Catch::Matchers::WithinRel;

TEST_CASE("Flat curve returns one rate for every tenor", "[curve]") {
    FlatCurveResolver curve(0.12);
    REQUIRE(curve.rate_for_tenor(1) == 0.12);
    REQUIRE(curve.rate_for_tenor(30) == 0.12);
    REQUIRE_THROWS_AS(FlatCurveResolver(-1.5), ValidationError);
}

TEST_CASE("Flat curve from macro base rate", "[curve]") {
    MacroContextParams params;
    params.base_rate = 0.165;
    MacroContext macro(params);

    FlatCurveResolver curve(macro);
    REQUIRE(curve.rate_for_tenor(10) == 0.165);
}

TEST_CASE("Term structure fills gaps and extrapolates flat", "[curve]") {
    TermStructureResolver curve;
    curve.set_rate(2, 0.10);
    curve.set_rate(5, 0.12);

    REQUIRE(curve.last_tenor() == 5);
    // Short end takes the first populated point
    REQUIRE(curve.rate_for_tenor(1) == 0.10);
    REQUIRE(curve.rate_for_tenor(2) == 0.10);
    REQUIRE(curve.rate_for_tenor(4) == 0.10);
    REQUIRE(curve.rate_for_tenor(5) == 0.12);
    REQUIRE(curve.rate_for_tenor(40) == 0.12);
}

TEST_CASE("Term structure cumulative discount factor", "[curve]") {
    TermStructureResolver curve;
    curve.set_rate(1, 0.10);
    curve.set_rate(2, 0.20);

    REQUIRE(curve.cumulative_discount_factor(0) == 1.0);
    REQUIRE_THAT(curve.cumulative_discount_factor(2), WithinRel(1.0 / (1.10 * 1.20), 1e-12));
}

TEST_CASE("Term structure validation", "[curve]") {
    TermStructureResolver curve;
    REQUIRE_THROWS_AS(curve.rate_for_tenor(1), ValidationError);
    REQUIRE_THROWS_AS(curve.set_rate(0, 0.1), std::out_of_range);
    REQUIRE_THROWS_AS(curve.set_rate(51, 0.1), std::out_of_range);
    REQUIRE_THROWS_AS(curve.set_rate(3, -1.0), ValidationError);
}

TEST_CASE("Term structure loads from CSV", "[curve][csv]") {
    std::istringstream csv(
        "tenor,rate\n"
        "1,0.150\n"
        "3,0.155\n"
        "10,0.160\n");

    TermStructureResolver curve = TermStructureResolver::load_from_csv(csv);
    REQUIRE(curve.last_tenor() == 10);
    REQUIRE(curve.rate_for_tenor(2) == 0.150);
    REQUIRE(curve.rate_for_tenor(7) == 0.155);
    REQUIRE(curve.rate_for_tenor(25) == 0.160);

    std::istringstream missing_column("tenor,yield\n1,0.15\n");
    REQUIRE_THROWS_AS(TermStructureResolver::load_from_csv(missing_column), ValidationError);
}
