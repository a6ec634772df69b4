#include <catch2/catch.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>
#include "numeric.hpp"
#include "errors.hpp"

using namespace regcalc;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Rounding
// ============================================================================

TEST_CASE("round_to_precision rounds half away from zero", "[numeric][rounding]") {
    REQUIRE(round_to_precision(1.2345, 3) == 1.235);
    REQUIRE(round_to_precision(-1.2345, 3) == -1.235);
    REQUIRE(round_to_precision(2.5, 0) == 3.0);
    REQUIRE(round_to_precision(-2.5, 0) == -3.0);
    REQUIRE(round_to_precision(1.2344, 3) == 1.234);
}

TEST_CASE("round_to_precision treats inexact decimal ties as ties", "[numeric][rounding]") {
    // 2.0005 is stored as 2.000499999...
    REQUIRE(round_to_precision(2.0005, 3) == 2.001);
    REQUIRE(round_to_precision(1.0005, 3) == 1.001);
    REQUIRE(round_to_precision(0.125, 2) == 0.13);
}

TEST_CASE("round_to_precision never returns negative zero", "[numeric][rounding]") {
    double rounded = round_to_precision(-0.0001, 3);
    REQUIRE(rounded == 0.0);
    REQUIRE_FALSE(std::signbit(rounded));
}

TEST_CASE("round_to_precision rejects non-finite values", "[numeric][rounding]") {
    REQUIRE_THROWS_AS(round_to_precision(std::numeric_limits<double>::quiet_NaN(), 3), ComputationError);
    REQUIRE_THROWS_AS(round_to_precision(std::numeric_limits<double>::infinity(), 3), ComputationError);
    REQUIRE_THROWS_AS(round_to_precision(1.0, -1), ValidationError);
}

TEST_CASE("Rounding config defaults to currency 3 and ratio 6 decimals", "[numeric][rounding]") {
    RoundingConfig rounding;
    REQUIRE(rounding.currency_decimals == 3);
    REQUIRE(rounding.ratio_decimals == 6);
    REQUIRE(round_amount(123.45678, rounding) == 123.457);
    REQUIRE(round_ratio(0.12345678, rounding) == 0.123457);
}

TEST_CASE("Fixed-point canonical forms", "[numeric][rounding]") {
    REQUIRE(to_fixed_units(12.3456, 3) == 12346);
    REQUIRE(to_fixed_units(-0.5, 0) == -1);
    REQUIRE(format_fixed(1.5, 3) == "1.500");
    REQUIRE(format_fixed(2.0005, 3) == "2.001");
    REQUIRE(format_fixed(-3.14159, 2) == "-3.14");
}

// ============================================================================
// Discounting
// ============================================================================

TEST_CASE("Discrete discount factor", "[numeric][discount]") {
    REQUIRE_THAT(discount_factor(0.19, 1.0, DiscountMethod::Discrete), WithinAbs(0.8403, 1e-4));
    REQUIRE_THAT(discount_factor(0.10, 2.0, DiscountMethod::Discrete), WithinRel(1.0 / 1.21, 1e-12));
    REQUIRE_THROWS_AS(discount_factor(-1.0, 1.0, DiscountMethod::Discrete), ValidationError);
}

TEST_CASE("Discount factors equal one at time zero", "[numeric][discount]") {
    REQUIRE(discount_factor(0.15, 0.0, DiscountMethod::Discrete) == 1.0);
    REQUIRE(discount_factor(0.15, 0.0, DiscountMethod::Continuous) == 1.0);
    REQUIRE_THROWS_AS(discount_factor(0.15, -1.0, DiscountMethod::Continuous), ValidationError);
}

TEST_CASE("Discrete and continuous forms agree at equivalent rates", "[numeric][discount]") {
    for (double r : {0.01, 0.05, 0.125, 0.19, 0.30}) {
        double c = to_continuous_rate(r);
        REQUIRE_THAT(to_discrete_rate(c), WithinRel(r, 1e-12));
        for (double t : {1.0, 2.5, 5.0, 10.0, 30.0}) {
            double discrete = discount_factor(r, t, DiscountMethod::Discrete);
            double continuous = discount_factor(c, t, DiscountMethod::Continuous);
            RoundingConfig rounding;
            REQUIRE(round_ratio(discrete, rounding) == round_ratio(continuous, rounding));
        }
    }
}

TEST_CASE("safe_divide falls back on zero or non-finite denominators", "[numeric]") {
    REQUIRE(safe_divide(10.0, 4.0) == 2.5);
    REQUIRE(safe_divide(10.0, 0.0) == 0.0);
    REQUIRE(safe_divide(10.0, 0.0, -1.0) == -1.0);
    REQUIRE(safe_divide(10.0, std::numeric_limits<double>::infinity(), 7.0) == 7.0);
    REQUIRE(safe_divide(10.0, std::numeric_limits<double>::quiet_NaN()) == 0.0);
}

// ============================================================================
// Statistics
// ============================================================================

TEST_CASE("Sample statistics", "[numeric][statistics]") {
    std::vector<double> values = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    double mean = calculate_mean(values);
    REQUIRE(mean == 5.0);
    REQUIRE_THAT(calculate_std_dev(values, mean), WithinRel(2.0, 1e-12));

    REQUIRE(calculate_mean({}) == 0.0);
    REQUIRE(calculate_std_dev({3.0}, 3.0) == 0.0);
}

TEST_CASE("Percentile interpolates linearly", "[numeric][statistics]") {
    std::vector<double> sorted = {10.0, 20.0, 30.0, 40.0, 50.0};
    REQUIRE(calculate_percentile(sorted, 0.0) == 10.0);
    REQUIRE(calculate_percentile(sorted, 100.0) == 50.0);
    REQUIRE(calculate_percentile(sorted, 50.0) == 30.0);
    REQUIRE_THAT(calculate_percentile(sorted, 90.0), WithinRel(46.0, 1e-12));
    REQUIRE(calculate_percentile({}, 50.0) == 0.0);
    REQUIRE(calculate_percentile({7.0}, 95.0) == 7.0);
}

TEST_CASE("Tail mean averages values strictly above the threshold", "[numeric][statistics]") {
    std::vector<double> sorted = {1.0, 2.0, 3.0, 4.0, 5.0};
    REQUIRE(calculate_tail_mean(sorted, 3.0) == 4.5);
    REQUIRE(calculate_tail_mean(sorted, 5.0) == 5.0);
    REQUIRE(calculate_tail_mean(sorted, 0.0) == 3.0);
}

// ============================================================================
// Distributions
// ============================================================================

TEST_CASE("Normal distribution wrappers", "[numeric][distribution]") {
    REQUIRE_THAT(normal_quantile(0.995), WithinAbs(2.5758, 1e-4));
    REQUIRE_THAT(normal_quantile(0.95), WithinAbs(1.6449, 1e-4));
    REQUIRE_THAT(normal_cdf(0.0), WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(normal_cdf(normal_quantile(0.9)), WithinAbs(0.9, 1e-10));
    REQUIRE_THROWS_AS(normal_quantile(0.0), ValidationError);
    REQUIRE_THROWS_AS(normal_quantile(1.0), ValidationError);
}

TEST_CASE("Beta quantile", "[numeric][distribution]") {
    // Beta(1, 1) is uniform
    REQUIRE_THAT(beta_quantile(1.0, 1.0, 0.3), WithinAbs(0.3, 1e-10));
    REQUIRE(beta_quantile(2.0, 8.0, 0.025) < beta_quantile(2.0, 8.0, 0.975));
    REQUIRE_THROWS_AS(beta_quantile(0.0, 1.0, 0.5), ValidationError);
}

TEST_CASE("Discount method names", "[numeric]") {
    REQUIRE(to_string(DiscountMethod::Discrete) == "discrete");
    REQUIRE(parse_discount_method("continuous") == DiscountMethod::Continuous);
    REQUIRE_THROWS_AS(parse_discount_method("monthly"), ValidationError);
}
