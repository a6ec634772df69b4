#include <catch2/catch.hpp>
#include <numeric>
#include <vector>
#include "errors.hpp"
#include "liability/csm.hpp"
#include "numeric.hpp"

using namespace regcalc;
using namespace regcalc::liability;
using Catch::Matchers::WithinAbs;

TEST_CASE("CSM at initial recognition", "[csm]") {
    RoundingConfig rounding;

    SECTION("Profitable group carries a CSM") {
        CSMResult r = recognise_csm(1000.0, 100.0, 700.0, 50.0, rounding);
        REQUIRE_FALSE(r.onerous);
        REQUIRE_THAT(r.csm, WithinAbs(150.0, 1e-9));
        REQUIRE(r.loss_component == 0.0);
    }

    SECTION("Onerous group recognises a loss component") {
        CSMResult r = recognise_csm(1000.0, 100.0, 900.0, 50.0, rounding);
        REQUIRE(r.onerous);
        REQUIRE(r.csm == 0.0);
        REQUIRE_THAT(r.loss_component, WithinAbs(50.0, 1e-9));
    }

    SECTION("Break-even is not onerous") {
        CSMResult r = recognise_csm(1000.0, 100.0, 850.0, 50.0, rounding);
        REQUIRE_FALSE(r.onerous);
        REQUIRE(r.csm == 0.0);
        REQUIRE(r.loss_component == 0.0);
    }

    SECTION("Break-even with inexact decimal inputs is not onerous") {
        // 0.3 - 0.1 - 0.2 is about -2.8e-17 in binary floating point
        CSMResult r = recognise_csm(0.3, 0.1, 0.2, 0.0, rounding);
        REQUIRE_FALSE(r.onerous);
        REQUIRE(r.csm == 0.0);
        REQUIRE(r.loss_component == 0.0);
    }

    SECTION("Loss below half a unit of precision rounds to break-even") {
        CSMResult r = recognise_csm(1000.0, 0.0, 1000.0004, 0.0, rounding);
        REQUIRE_FALSE(r.onerous);
        REQUIRE(r.loss_component == 0.0);
    }

    SECTION("Negative BEL increases the margin") {
        CSMResult r = recognise_csm(100.0, 0.0, -50.0, 10.0, rounding);
        REQUIRE_THAT(r.csm, WithinAbs(140.0, 1e-9));
    }

    SECTION("Validation") {
        REQUIRE_THROWS_AS(recognise_csm(-1.0, 0.0, 0.0, 0.0, rounding), ValidationError);
        REQUIRE_THROWS_AS(recognise_csm(100.0, 0.0, 0.0, -1.0, rounding), ValidationError);
    }
}

TEST_CASE("CSM release by coverage units", "[csm][release]") {
    REQUIRE_THAT(csm_release(1000.0, 1.0, 4.0), WithinAbs(250.0, 1e-9));
    REQUIRE_THAT(csm_release(1000.0, 4.0, 4.0), WithinAbs(1000.0, 1e-9));
    REQUIRE(csm_release(1000.0, 0.0, 0.0) == 0.0);

    REQUIRE_THROWS_AS(csm_release(1000.0, 3.0, 2.0), ValidationError);
    REQUIRE_THROWS_AS(csm_release(1000.0, -1.0, 2.0), ValidationError);
    REQUIRE_THROWS_AS(csm_release(-1.0, 1.0, 2.0), ValidationError);
}

TEST_CASE("GMM roll-forward", "[csm][roll_forward]") {
    RoundingConfig rounding;
    GMMRollForwardInputs in;
    in.opening_csm = 1000.0;
    in.new_business_csm = 200.0;
    in.locked_in_rate = 0.03;
    in.changes_future_service = -50.0;
    in.coverage_units_current = 1.0;
    in.coverage_units_remaining = 4.0;

    SECTION("Movements reconcile") {
        CSMRollForward rf = roll_forward_gmm(in, rounding);
        REQUIRE(rf.model == "GMM");
        REQUIRE_THAT(rf.interest_accretion, WithinAbs(30.0, 1e-9));
        REQUIRE_THAT(rf.pre_release, WithinAbs(1180.0, 1e-9));
        REQUIRE_THAT(rf.release, WithinAbs(295.0, 1e-9));
        REQUIRE_THAT(rf.closing, WithinAbs(885.0, 1e-9));
        REQUIRE(rf.change_fv_underlying == 0.0);
    }

    SECTION("Unfavourable changes floor the balance at zero") {
        in.changes_future_service = -5000.0;
        CSMRollForward rf = roll_forward_gmm(in, rounding);
        REQUIRE(rf.pre_release == 0.0);
        REQUIRE(rf.release == 0.0);
        REQUIRE(rf.closing == 0.0);
    }

    SECTION("Current units above remaining are rejected") {
        in.coverage_units_current = 5.0;
        REQUIRE_THROWS_AS(roll_forward_gmm(in, rounding), ValidationError);
    }

    SECTION("Negative opening balance is rejected") {
        in.opening_csm = -1.0;
        REQUIRE_THROWS_AS(roll_forward_gmm(in, rounding), ValidationError);
    }
}

TEST_CASE("VFA roll-forward", "[csm][roll_forward]") {
    RoundingConfig rounding;
    VFARollForwardInputs in;
    in.opening_csm = 1000.0;
    in.change_fv_underlying = 100.0;
    in.changes_fcf_non_variable = -20.0;
    in.currency_effect = 10.0;
    in.coverage_units_current = 1.0;
    in.coverage_units_remaining = 2.0;

    CSMRollForward rf = roll_forward_vfa(in, rounding);
    REQUIRE(rf.model == "VFA");
    REQUIRE(rf.interest_accretion == 0.0);
    REQUIRE_THAT(rf.pre_release, WithinAbs(1090.0, 1e-9));
    REQUIRE_THAT(rf.release, WithinAbs(545.0, 1e-9));
    REQUIRE_THAT(rf.closing, WithinAbs(545.0, 1e-9));

    SECTION("Final period releases everything") {
        in.coverage_units_remaining = 1.0;
        CSMRollForward last = roll_forward_vfa(in, rounding);
        REQUIRE_THAT(last.release, WithinAbs(1090.0, 1e-9));
        REQUIRE(last.closing == 0.0);
    }
}

TEST_CASE("Projected CSM release pattern", "[csm][projection]") {
    RoundingConfig rounding;

    SECTION("No accretion releases the whole balance") {
        auto pattern = project_csm_release(1000.0, {1.0, 1.0, 2.0}, 0.0, rounding);
        REQUIRE(pattern.size() == 3);
        REQUIRE(pattern[0].period == 1);
        REQUIRE_THAT(pattern[0].release, WithinAbs(250.0, 1e-9));
        REQUIRE_THAT(pattern[1].opening, WithinAbs(750.0, 1e-9));
        REQUIRE_THAT(pattern[1].release, WithinAbs(250.0, 1e-9));
        REQUIRE_THAT(pattern[2].release, WithinAbs(500.0, 1e-9));
        REQUIRE(pattern[2].closing == 0.0);
    }

    SECTION("Accretion adds to the first period release") {
        auto pattern = project_csm_release(1000.0, {1.0, 1.0, 2.0}, 0.10, rounding);
        REQUIRE_THAT(pattern[0].interest_accretion, WithinAbs(100.0, 1e-9));
        REQUIRE_THAT(pattern[0].release, WithinAbs(275.0, 1e-9));
        REQUIRE_THAT(pattern[0].closing, WithinAbs(825.0, 1e-9));
        REQUIRE_THAT(pattern[2].closing, WithinAbs(0.0, 1e-9));

        double released = 0.0;
        double accreted = 0.0;
        for (const auto& p : pattern) {
            released += p.release;
            accreted += p.interest_accretion;
        }
        REQUIRE_THAT(released, WithinAbs(1000.0 + accreted, 0.01));
    }

    SECTION("Empty coverage units") {
        REQUIRE(project_csm_release(1000.0, {}, 0.05, rounding).empty());
    }

    SECTION("Negative units are rejected") {
        REQUIRE_THROWS_AS(project_csm_release(1000.0, {1.0, -1.0}, 0.0, rounding), ValidationError);
    }
}

TEST_CASE("Coverage units by method", "[csm][coverage_units]") {
    CoverageUnitInputs in;

    SECTION("Quantity of benefits decays with mortality") {
        in.sum_insured = 1000.0;
        in.mortality_rate = 0.1;
        auto units = coverage_units(CoverageUnitsMethod::Quantity, in, 3);
        REQUIRE(units.size() == 3);
        REQUIRE_THAT(units[0], WithinAbs(900.0, 1e-9));
        REQUIRE_THAT(units[1], WithinAbs(810.0, 1e-9));
        REQUIRE_THAT(units[2], WithinAbs(729.0, 1e-9));
    }

    SECTION("Expected period of coverage decays with lapses") {
        in.lapse_rate = 0.2;
        auto units = coverage_units(CoverageUnitsMethod::ExpectedPeriod, in, 3);
        REQUIRE_THAT(units[0], WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(units[1], WithinAbs(0.8, 1e-12));
        REQUIRE_THAT(units[2], WithinAbs(0.64, 1e-12));
    }

    SECTION("Time-weighted units grow with the expected return") {
        in.sum_insured = 100.0;
        in.expected_return = 0.1;
        auto units = coverage_units(CoverageUnitsMethod::TimeWeighted, in, 3);
        REQUIRE_THAT(units[0], WithinAbs(100.0, 1e-9));
        REQUIRE_THAT(units[1], WithinAbs(110.0, 1e-9));
        REQUIRE_THAT(units[2], WithinAbs(121.0, 1e-9));
    }

    SECTION("Premium pattern is padded with zeros") {
        in.premium_pattern = {5.0, 3.0};
        auto units = coverage_units(CoverageUnitsMethod::PremiumPattern, in, 3);
        REQUIRE(units == std::vector<double>{5.0, 3.0, 0.0});

        in.premium_pattern.clear();
        auto uniform = coverage_units(CoverageUnitsMethod::PremiumPattern, in, 3);
        REQUIRE(uniform == std::vector<double>{1.0, 1.0, 1.0});
    }

    SECTION("Invalid rates") {
        in.mortality_rate = 1.5;
        REQUIRE_THROWS_AS(coverage_units(CoverageUnitsMethod::Quantity, in, 3), ValidationError);
        in.lapse_rate = -0.1;
        REQUIRE_THROWS_AS(coverage_units(CoverageUnitsMethod::ExpectedPeriod, in, 3), ValidationError);
    }

    SECTION("Method names") {
        REQUIRE(parse_coverage_units_method("Time_Weighted") == CoverageUnitsMethod::TimeWeighted);
        REQUIRE(to_string(CoverageUnitsMethod::ExpectedPeriod) == "expected_period");
        REQUIRE_THROWS_AS(parse_coverage_units_method("straight_line"), ValidationError);
    }
}
