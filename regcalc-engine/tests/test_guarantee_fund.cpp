#include <catch2/catch.hpp>
#include <string>
#include <vector>
#include "solvency/guarantee_fund.hpp"

using namespace regcalc;
using namespace regcalc::solvency;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

struct FundFixture {
    GuaranteeFundConfig config;
    RoundingConfig rounding;
    InMemoryAuditTrail audit;
    GuaranteeFundEngine engine;

    FundFixture() : engine(config, rounding, audit) {}
};

// Well capitalised, long-established member
InsurerProfile insurer_a() {
    InsurerProfile insurer;
    insurer.name = "Insurer A";
    insurer.gross_premiums = 5000000000.0;
    insurer.reserves = 3000000000.0;
    insurer.solvency_ratio = 2.5;
    insurer.loss_ratio = 0.55;
    insurer.combined_ratio = 0.85;
    insurer.years_in_market = 15;
    insurer.pd = 0.02;
    insurer.recovery = 0.40;
    return insurer;
}

// Thin margin and an underwriting loss
InsurerProfile insurer_b() {
    InsurerProfile insurer;
    insurer.name = "Insurer B";
    insurer.gross_premiums = 3000000000.0;
    insurer.reserves = 2000000000.0;
    insurer.solvency_ratio = 1.3;
    insurer.loss_ratio = 0.75;
    insurer.combined_ratio = 1.02;
    insurer.years_in_market = 7;
    insurer.pd = 0.08;
    insurer.recovery = 0.30;
    insurer.premium_growth = 0.10;
    return insurer;
}

} // anonymous namespace

// ============================================================================
// Risk classes and contributions
// ============================================================================

TEST_CASE("Risk class follows the member score", "[guarantee_fund][risk_class]") {
    FundFixture f;

    RiskClassAssessment strong = f.engine.determine_risk_class(2.5, 0.55, 0.85, 15);
    REQUIRE(strong.score == 8);
    REQUIRE(strong.risk_class == RiskClass::Low);

    RiskClassAssessment weak = f.engine.determine_risk_class(1.3, 0.75, 1.02, 7);
    REQUIRE(weak.score == 1);
    REQUIRE(weak.risk_class == RiskClass::High);

    // 2 + 1 + 1 + 0
    RiskClassAssessment middle = f.engine.determine_risk_class(1.6, 0.70, 0.95, 3);
    REQUIRE(middle.score == 4);
    REQUIRE(middle.risk_class == RiskClass::Medium);

    REQUIRE_THROWS_AS(f.engine.determine_risk_class(-0.1, 0.5, 0.9, 1), ValidationError);
}

TEST_CASE("Risk class names parse case-insensitively", "[guarantee_fund][risk_class]") {
    REQUIRE(parse_risk_class("LOW") == RiskClass::Low);
    REQUIRE(parse_risk_class("medium_risk") == RiskClass::Medium);
    REQUIRE(parse_risk_class("High") == RiskClass::High);
    REQUIRE(to_string(RiskClass::High) == "high_risk");
    REQUIRE_THROWS_AS(parse_risk_class("moderate"), ValidationError);
}

TEST_CASE("Contribution applies the class rate to gross premiums", "[guarantee_fund][contribution]") {
    FundFixture f;

    SECTION("Scored from the member ratios") {
        ContributionResult a = f.engine.calculate_contribution(insurer_a());
        REQUIRE(a.class_basis == "scored");
        REQUIRE(a.risk_class == RiskClass::Low);
        REQUIRE(a.rate == 0.005);
        REQUIRE_THAT(a.contribution, WithinAbs(25000000.0, 0.01));

        ContributionResult b = f.engine.calculate_contribution(insurer_b());
        REQUIRE(b.risk_class == RiskClass::High);
        REQUIRE_THAT(b.contribution, WithinAbs(60000000.0, 0.01));
    }

    SECTION("Assigned class wins over scoring") {
        InsurerProfile insurer = insurer_b();
        insurer.risk_class = RiskClass::Low;
        ContributionResult result = f.engine.calculate_contribution(insurer);
        REQUIRE(result.class_basis == "assigned");
        REQUIRE(result.score == 0);
        REQUIRE_THAT(result.contribution, WithinAbs(15000000.0, 0.01));
    }

    SECTION("No solvency ratio defaults to medium risk") {
        InsurerProfile insurer = insurer_a();
        insurer.solvency_ratio.reset();
        ContributionResult result = f.engine.calculate_contribution(insurer);
        REQUIRE(result.class_basis == "default");
        REQUIRE(result.risk_class == RiskClass::Medium);
        REQUIRE_THAT(result.contribution, WithinAbs(50000000.0, 0.01));
    }

    SECTION("Invalid member is rejected with the field name") {
        InsurerProfile insurer = insurer_a();
        insurer.pd = 1.5;
        try {
            f.engine.calculate_contribution(insurer);
            FAIL("Expected ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.field() == "pd");
        }
    }
}

// ============================================================================
// Fund adequacy
// ============================================================================

TEST_CASE("Fund adequacy compares balance with expected claims", "[guarantee_fund][adequacy]") {
    FundFixture f;

    SECTION("Inadequate today, adequate with the contributions pipeline") {
        FundAdequacyResult result = f.engine.assess_fund_adequacy(90.0, 100.0, 40.0);
        REQUIRE_THAT(result.current_ratio, WithinAbs(0.9, 1e-9));
        REQUIRE_THAT(result.projected_ratio, WithinAbs(1.3, 1e-9));
        REQUIRE_FALSE(result.adequate);
        REQUIRE(result.will_be_adequate);
        REQUIRE_THAT(result.shortfall, WithinAbs(30.0, 0.01));
        REQUIRE(result.surplus == 0.0);
    }

    SECTION("Surplus above the required cover") {
        FundAdequacyResult result = f.engine.assess_fund_adequacy(200.0, 100.0);
        REQUIRE(result.adequate);
        REQUIRE_THAT(result.surplus, WithinAbs(80.0, 0.01));
        REQUIRE(result.shortfall == 0.0);
    }

    SECTION("No expected claims") {
        FundAdequacyResult result = f.engine.assess_fund_adequacy(10.0, 0.0);
        REQUIRE(result.current_ratio == f.config.no_claims_ratio);
        REQUIRE(result.adequate);
    }

    SECTION("Negative balance") {
        REQUIRE_THROWS_AS(f.engine.assess_fund_adequacy(-1.0, 100.0), ValidationError);
    }
}

// ============================================================================
// Early warning
// ============================================================================

TEST_CASE("Early warning scores member deterioration", "[guarantee_fund][early_warning]") {
    FundFixture f;

    SECTION("Healthy member") {
        EarlyWarning warning = f.engine.early_warning_indicators(insurer_a());
        REQUIRE(warning.risk_score == 0);
        REQUIRE(warning.level == WarningLevel::Normal);
        REQUIRE(warning.warnings.empty());
    }

    SECTION("Thin margin and combined ratio above 100%") {
        EarlyWarning warning = f.engine.early_warning_indicators(insurer_b());
        REQUIRE(warning.risk_score == 3);
        REQUIRE(warning.level == WarningLevel::Elevated);
        REQUIRE(warning.warnings.size() == 2);
    }

    SECTION("Insolvent member with heavy losses") {
        InsurerProfile insurer = insurer_b();
        insurer.solvency_ratio = 0.9;
        insurer.loss_ratio = 0.95;
        insurer.combined_ratio = 1.0;
        EarlyWarning warning = f.engine.early_warning_indicators(insurer);
        REQUIRE(warning.risk_score == 9);
        REQUIRE(warning.level == WarningLevel::Critical);
        REQUIRE(warning.recommended_action == "immediate supervisory intervention");
    }

    SECTION("Missing solvency ratio is read as 150%") {
        InsurerProfile insurer = insurer_a();
        insurer.solvency_ratio.reset();
        insurer.premium_growth = -0.30;
        EarlyWarning warning = f.engine.early_warning_indicators(insurer);
        REQUIRE(warning.solvency_ratio == 1.5);
        REQUIRE(warning.risk_score == 2);
        REQUIRE(warning.level == WarningLevel::Elevated);
    }
}

// ============================================================================
// Bankruptcy simulation
// ============================================================================

TEST_CASE("Bankruptcy simulation of member failures", "[guarantee_fund][simulation]") {
    FundFixture f;
    std::vector<InsurerProfile> members{insurer_a(), insurer_b()};

    SECTION("Expected claims near PD x reserves x LGD, one audit record") {
        BankruptcySimulationResult result = f.engine.simulate_bankruptcy(members, 5000);
        REQUIRE(result.simulations == 5000);
        REQUIRE(result.insurers == 2);
        REQUIRE(result.correlation == f.config.default_correlation);
        // 0.02 x 3bn x 0.6 + 0.08 x 2bn x 0.7
        REQUIRE_THAT(result.expected_claims, WithinRel(148000000.0, 0.25));
        REQUIRE_THAT(result.assumed_fund, WithinAbs(500000000.0, 0.01));
        REQUIRE(result.var_99 >= result.var_95);
        REQUIRE(result.fund_adequacy > 1.0);
        REQUIRE(result.input_digest.size() == 64);

        REQUIRE(f.audit.size() == 1);
        REQUIRE(f.audit.records()[0].operation == "solvency.simulate_bankruptcy");
    }

    SECTION("Same inputs give the same result") {
        BankruptcySimulationResult a = f.engine.simulate_bankruptcy(members, 2000, 0.4);
        BankruptcySimulationResult b = f.engine.simulate_bankruptcy(members, 2000, 0.4);
        REQUIRE(a.expected_claims == b.expected_claims);
        REQUIRE(a.result_digest == b.result_digest);
    }

    SECTION("Simulation count is clamped to the maximum") {
        BankruptcySimulationResult result = f.engine.simulate_bankruptcy(members, f.config.max_simulations + 1);
        REQUIRE(result.simulations == f.config.max_simulations);
    }

    SECTION("Empty member list") {
        BankruptcySimulationResult result = f.engine.simulate_bankruptcy({});
        REQUIRE(result.empty());
        REQUIRE(result.fund_adequacy == 1.0);
        REQUIRE(f.audit.size() == 0);
    }

    SECTION("Zero simulations") {
        REQUIRE_THROWS_AS(f.engine.simulate_bankruptcy(members, 0), ValidationError);
        REQUIRE(f.audit.size() == 0);
    }

    SECTION("Correlation outside [0, 1)") {
        REQUIRE_THROWS_AS(f.engine.simulate_bankruptcy(members, 100, 1.0), ValidationError);
        REQUIRE_THROWS_AS(f.engine.simulate_bankruptcy(members, 100, -0.1), ValidationError);
    }
}

// ============================================================================
// Fund assessment
// ============================================================================

TEST_CASE("Fund assessment combines contributions, claims and adequacy", "[guarantee_fund][assess]") {
    FundFixture f;

    SECTION("Contributions feed the adequacy pipeline") {
        GuaranteeFundAssessment result = f.engine.assess({insurer_a(), insurer_b()}, 50000000000.0);
        REQUIRE(result.contributions.size() == 2);
        REQUIRE_THAT(result.total_contributions, WithinAbs(85000000.0, 0.01));
        REQUIRE(result.adequacy.contributions_pipeline == result.total_contributions);
        REQUIRE(result.adequacy.expected_claims == result.bankruptcy.expected_claims);
        REQUIRE(result.bankruptcy.simulations == f.config.simulations);
        REQUIRE(result.adequacy.adequate);

        REQUIRE(f.audit.size() == 1);
        REQUIRE(f.audit.records()[0].operation == "solvency.assess_guarantee_fund");
        REQUIRE(f.audit.records()[0].regulatory_reference == f.config.regulatory_reference);
    }

    SECTION("Empty member list gives an empty assessment") {
        GuaranteeFundAssessment result = f.engine.assess({}, 1000.0);
        REQUIRE(result.empty());
        REQUIRE(result.total_contributions == 0.0);
        REQUIRE(result.bankruptcy.empty());
        REQUIRE(f.audit.size() == 0);
    }

    SECTION("Negative fund balance") {
        try {
            f.engine.assess({insurer_a()}, -5.0);
            FAIL("Expected ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.field() == "fund_balance");
        }
        REQUIRE(f.audit.size() == 0);
    }

    SECTION("Unnamed member") {
        InsurerProfile insurer = insurer_a();
        insurer.name.clear();
        REQUIRE_THROWS_AS(f.engine.assess({insurer}, 1000.0), ValidationError);
    }
}
