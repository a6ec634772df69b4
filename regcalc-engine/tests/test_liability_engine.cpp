#include <catch2/catch.hpp>
#include <cmath>
#include <optional>
#include <string>
#include <vector>
#include "liability/liability_engine.hpp"

using namespace regcalc;
using namespace regcalc::liability;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

struct LiabilityFixture {
    LiabilityConfig config;
    RoundingConfig rounding;
    InMemoryAuditTrail audit;
    LiabilityEngine engine;
    MacroContext macro;

    LiabilityFixture() : engine(config, rounding, audit), macro(MacroContextParams()) {}
};

// Single premium of 100M, claims of 80M growing 2% a year, 5M expenses, ten years
CashFlowSchedule scenario_two_schedule() {
    CashFlowSchedule schedule;
    double claims = 80000000.0;
    for (uint32_t t = 1; t <= 10; ++t) {
        schedule.add(PeriodCashFlow(t, t == 1 ? 100000000.0 : 0.0, claims, 5000000.0));
        claims *= 1.02;
    }
    return schedule;
}

// Profitable: level premiums well above outflows in every period
CashFlowSchedule profitable_schedule() {
    CashFlowSchedule schedule;
    schedule.add(PeriodCashFlow(1, 400000.0, 100000.0, 20000.0));
    schedule.add(PeriodCashFlow(2, 400000.0, 120000.0, 20000.0));
    schedule.add(PeriodCashFlow(3, 400000.0, 140000.0, 20000.0));
    return schedule;
}

// Default macro base rate 10%, ten-year illiquidity factor 0.70 on 0.5%
constexpr double TEN_YEAR_RATE = 0.10 + 0.005 * 0.70;

double expected_bel(const CashFlowSchedule& schedule, double rate, double lapse) {
    double bel = 0.0;
    for (const auto& p : schedule.periods()) {
        bel += p.net_cash_flow() * std::pow(1.0 - lapse, p.period - 1.0) * std::exp(-rate * p.period);
    }
    return bel;
}

} // anonymous namespace

// ============================================================================
// Discount rate and BEL
// ============================================================================

TEST_CASE("Discount rate adds a term-dependent illiquidity premium", "[liability][discount]") {
    LiabilityFixture f;

    auto short_term = f.engine.resolve_discount_rate(2, f.macro);
    REQUIRE(short_term.base_rate == 0.10);
    REQUIRE(short_term.illiquidity_factor == 0.80);
    REQUIRE_THAT(short_term.rate, WithinAbs(0.104, 1e-12));

    REQUIRE(f.engine.resolve_discount_rate(4, f.macro).illiquidity_factor == 0.75);

    auto long_term = f.engine.resolve_discount_rate(10, f.macro);
    REQUIRE(long_term.illiquidity_factor == 0.70);
    REQUIRE_THAT(long_term.rate, WithinAbs(TEN_YEAR_RATE, 1e-12));

    REQUIRE_THROWS_AS(f.engine.resolve_discount_rate(0, f.macro), ValidationError);
}

TEST_CASE("Discount curve resolver supplies the base rate", "[liability][discount]") {
    LiabilityConfig config;
    RoundingConfig rounding;
    InMemoryAuditTrail audit;
    TermStructureResolver curve;
    curve.set_rate(1, 0.07);
    curve.set_rate(5, 0.08);
    LiabilityEngine engine(config, rounding, audit, &curve);
    MacroContext macro{MacroContextParams()};

    auto resolution = engine.resolve_discount_rate(10, macro);
    REQUIRE(resolution.base_rate == 0.08);
    REQUIRE_THAT(resolution.rate, WithinAbs(0.08 + 0.0035, 1e-12));
}

TEST_CASE("BEL discounts lapse-adjusted net cash flows", "[liability][bel]") {
    LiabilityFixture f;
    CashFlowSchedule schedule = scenario_two_schedule();

    BELResult bel = f.engine.calculate_bel(schedule, f.macro);
    REQUIRE(bel.net_cash_flows.size() == 10);
    REQUIRE(bel.lapse_rate == 0.05);
    REQUIRE(bel.survival_factors[0] == 1.0);
    REQUIRE_THAT(bel.survival_factors[2], WithinAbs(0.9025, 1e-12));
    REQUIRE_THAT(bel.bel, WithinRel(expected_bel(schedule, TEN_YEAR_RATE, 0.05), 1e-9));
    REQUIRE(bel.bel > 0.0);

    SECTION("Schedule lapse rate overrides the default") {
        schedule.set_lapse_rate(0.0);
        BELResult no_lapse = f.engine.calculate_bel(schedule, f.macro);
        REQUIRE_THAT(no_lapse.bel, WithinRel(expected_bel(schedule, TEN_YEAR_RATE, 0.0), 1e-9));
        REQUIRE(no_lapse.bel > bel.bel);
    }

    SECTION("Invalid schedule is rejected") {
        REQUIRE_THROWS_AS(f.engine.calculate_bel(CashFlowSchedule(), f.macro), ValidationError);
    }
}

// ============================================================================
// Measurement
// ============================================================================

TEST_CASE("Scenario 2: onerous ten-year group under CoC", "[liability][measurement]") {
    LiabilityFixture f;
    CashFlowSchedule schedule = scenario_two_schedule();

    LiabilityMeasurement m = f.engine.measure_liability(schedule, 10000000.0, RAMethod::CoC,
                                                        MeasurementModel::GMM, f.macro);

    double bel = expected_bel(schedule, TEN_YEAR_RATE, 0.05);
    REQUIRE_THAT(m.bel.bel, WithinRel(bel, 1e-9));

    double pv_capital = 0.0;
    for (uint32_t t = 1; t <= 10; ++t) {
        pv_capital += 0.10 * bel * (1.0 - (t - 1) / 10.0) * std::exp(-TEN_YEAR_RATE * t);
    }
    REQUIRE(m.ra.ra >= 0.0);
    REQUIRE_THAT(m.ra.ra, WithinRel(0.065 * pv_capital, 1e-9));

    REQUIRE(m.model == MeasurementModel::GMM);
    REQUIRE(m.csm.onerous);
    REQUIRE(m.csm.csm == 0.0);
    REQUIRE(m.csm.loss_component > 0.0);
    REQUIRE_THAT(m.csm.loss_component, WithinAbs(m.bel.bel + m.ra.ra + 10000000.0 - 100000000.0, 0.01));
    REQUIRE_THAT(m.fulfilment_cash_flows, WithinAbs(m.bel.bel + m.ra.ra, 0.001));
    REQUIRE_THAT(m.total_liability, WithinAbs(m.fulfilment_cash_flows + m.csm.loss_component, 0.001));
    REQUIRE_FALSE(m.paa.has_value());

    REQUIRE(m.input_digest.size() == 64);
    REQUIRE(m.result_digest.size() == 64);

    auto records = f.audit.records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].operation == "liability.measure_liability");
    REQUIRE(records[0].input_digest == m.input_digest);
    REQUIRE(records[0].regulatory_reference == "IFRS 17 Insurance Contracts");
}

TEST_CASE("Profitable group carries a CSM and no loss", "[liability][measurement]") {
    LiabilityFixture f;
    LiabilityMeasurement m = f.engine.measure_liability(profitable_schedule(), 50000.0, RAMethod::VaR,
                                                        MeasurementModel::GMM, f.macro);
    REQUIRE_FALSE(m.csm.onerous);
    REQUIRE(m.csm.csm > 0.0);
    REQUIRE(m.csm.loss_component == 0.0);
    REQUIRE_THAT(m.csm.csm, WithinAbs(1200000.0 - 50000.0 - m.bel.bel - m.ra.ra, 0.01));
    REQUIRE(m.ra.simulations == f.config.simulations);
}

TEST_CASE("Measurement is reproducible", "[liability][determinism]") {
    LiabilityFixture f;
    auto a = f.engine.measure_liability(profitable_schedule(), 0.0, RAMethod::TVaR, MeasurementModel::GMM, f.macro);
    auto b = f.engine.measure_liability(profitable_schedule(), 0.0, RAMethod::TVaR, MeasurementModel::GMM, f.macro);
    REQUIRE(a.ra.ra == b.ra.ra);
    REQUIRE(a.input_digest == b.input_digest);
    REQUIRE(a.result_digest == b.result_digest);
    REQUIRE(f.audit.size() == 2);
}

TEST_CASE("Invalid measurement inputs leave no audit record", "[liability][validation]") {
    LiabilityFixture f;
    REQUIRE_THROWS_AS(f.engine.measure_liability(profitable_schedule(), -1.0, RAMethod::CoC,
                                                 MeasurementModel::GMM, f.macro),
                      ValidationError);
    REQUIRE_THROWS_AS(f.engine.measure_liability(CashFlowSchedule(), 0.0, RAMethod::CoC,
                                                 MeasurementModel::GMM, f.macro),
                      ValidationError);
    REQUIRE(f.audit.size() == 0);
}

TEST_CASE("VFA eligibility and fallback", "[liability][vfa]") {
    LiabilityFixture f;

    VFAEligibility partial = f.engine.check_vfa_eligibility(VFAFeatures(true, false, true));
    REQUIRE_FALSE(partial.eligible);
    REQUIRE(partial.failed_criteria == std::vector<std::string>{"variable_payout_portion"});
    REQUIRE(f.engine.check_vfa_eligibility(VFAFeatures(true, true, true)).eligible);

    SECTION("No features falls back to GMM") {
        auto m = f.engine.measure_liability(profitable_schedule(), 0.0, RAMethod::CoC,
                                            MeasurementModel::VFA, f.macro);
        REQUIRE(m.requested_model == MeasurementModel::VFA);
        REQUIRE(m.model == MeasurementModel::GMM);
    }

    SECTION("Ineligible features fall back to GMM") {
        REQUIRE(f.engine.resolve_measurement_model(MeasurementModel::VFA, VFAFeatures(false, true, true)) ==
                MeasurementModel::GMM);
    }

    SECTION("Eligible features keep VFA") {
        auto m = f.engine.measure_liability(profitable_schedule(), 0.0, RAMethod::CoC, MeasurementModel::VFA,
                                            f.macro, VFAFeatures(true, true, true));
        REQUIRE(m.model == MeasurementModel::VFA);
        REQUIRE(m.csm.csm > 0.0);
    }

    SECTION("Other models pass through") {
        REQUIRE(f.engine.resolve_measurement_model(MeasurementModel::PAA, std::nullopt) == MeasurementModel::PAA);
    }
}

TEST_CASE("Premium allocation approach", "[liability][paa]") {
    LiabilityFixture f;

    SECTION("Multi-period coverage defers acquisition costs") {
        PAAResult paa = f.engine.measure_paa(1000.0, 120.0, 30.0, 12);
        REQUIRE(paa.dac == 120.0);
        REQUIRE(paa.acquisition_expensed == 0.0);
        REQUIRE(paa.dac_amortisation.size() == 12);
        REQUIRE_THAT(paa.dac_amortisation[0], WithinAbs(10.0, 1e-9));
        REQUIRE_THAT(paa.lrc, WithinAbs(850.0, 1e-9));
    }

    SECTION("Single-period coverage expenses acquisition costs") {
        PAAResult paa = f.engine.measure_paa(1000.0, 120.0, 30.0, 1);
        REQUIRE(paa.dac == 0.0);
        REQUIRE(paa.acquisition_expensed == 120.0);
        REQUIRE(paa.dac_amortisation.empty());
        REQUIRE_THAT(paa.lrc, WithinAbs(970.0, 1e-9));
    }

    SECTION("PAA measurement reports the LRC as the liability") {
        auto m = f.engine.measure_liability(scenario_two_schedule(), 10000000.0, RAMethod::CoC,
                                            MeasurementModel::PAA, f.macro);
        REQUIRE(m.paa.has_value());
        REQUIRE(m.paa->coverage_periods == 10);
        REQUIRE(m.paa->dac == 10000000.0);
        REQUIRE_THAT(m.total_liability, WithinAbs(100000000.0 - 10000000.0 - m.ra.ra, 0.001));
    }

    SECTION("Validation") {
        REQUIRE_THROWS_AS(f.engine.measure_paa(1000.0, 120.0, 30.0, 0), ValidationError);
        REQUIRE_THROWS_AS(f.engine.measure_paa(-1.0, 120.0, 30.0, 12), ValidationError);
        REQUIRE_THROWS_AS(f.engine.measure_paa(1000.0, 120.0, -30.0, 12), ValidationError);
    }
}

// ============================================================================
// Portfolio
// ============================================================================

TEST_CASE("Portfolio measurement isolates failing groups", "[liability][portfolio]") {
    LiabilityFixture f;

    std::vector<ContractGroup> groups(3);
    groups[0].group_id = "ONEROUS";
    groups[0].schedule = scenario_two_schedule();
    groups[0].acquisition_costs = 10000000.0;
    groups[1].group_id = "BROKEN";
    groups[2].group_id = "PROFITABLE";
    groups[2].schedule = profitable_schedule();
    groups[2].ra_method = RAMethod::VaR;

    LiabilityPortfolioResult portfolio = f.engine.measure_portfolio(groups, f.macro);

    REQUIRE(portfolio.results.size() == 2);
    REQUIRE(portfolio.results[0].group_id == "ONEROUS");
    REQUIRE(portfolio.results[1].group_id == "PROFITABLE");
    REQUIRE(portfolio.failures.size() == 1);
    REQUIRE(portfolio.failures[0].item_id == "BROKEN");
    REQUIRE(portfolio.onerous_groups == std::vector<std::string>{"ONEROUS"});

    double bel = portfolio.results[0].bel.bel + portfolio.results[1].bel.bel;
    REQUIRE_THAT(portfolio.total_bel, WithinAbs(bel, 0.001));
    REQUIRE_THAT(portfolio.total_csm, WithinAbs(portfolio.results[1].csm.csm, 0.001));
    REQUIRE_THAT(portfolio.total_loss_component, WithinAbs(portfolio.results[0].csm.loss_component, 0.001));

    auto records = f.audit.records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].operation == "liability.measure_portfolio");
}

TEST_CASE("Empty portfolio", "[liability][portfolio]") {
    LiabilityFixture f;
    LiabilityPortfolioResult portfolio = f.engine.measure_portfolio({}, f.macro);
    REQUIRE(portfolio.empty());
    REQUIRE(portfolio.total_liability == 0.0);
    REQUIRE(f.audit.size() == 0);
}

// ============================================================================
// Roll-forward, incurred claims, insurance finance
// ============================================================================

TEST_CASE("Engine roll-forward is audited", "[liability][roll_forward]") {
    LiabilityFixture f;
    GMMRollForwardInputs gmm;
    gmm.opening_csm = 1000.0;
    gmm.locked_in_rate = 0.03;
    gmm.coverage_units_current = 1.0;
    gmm.coverage_units_remaining = 4.0;
    CSMRollForward rf = f.engine.roll_forward_gmm(gmm);
    REQUIRE_THAT(rf.closing, WithinAbs(772.5, 1e-9));

    VFARollForwardInputs vfa;
    vfa.opening_csm = 500.0;
    vfa.coverage_units_current = 1.0;
    vfa.coverage_units_remaining = 1.0;
    CSMRollForward vrf = f.engine.roll_forward_vfa(vfa);
    REQUIRE(vrf.closing == 0.0);

    auto records = f.audit.records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].operation == "liability.roll_forward_gmm");
    REQUIRE(records[1].operation == "liability.roll_forward_vfa");
    REQUIRE(records[0].result_digest == rf.result_digest);
}

TEST_CASE("Liability for incurred claims", "[liability][lic]") {
    LiabilityFixture f;
    LICInputs in;
    in.reported_claims = 600.0;
    in.ibnr = 250.0;
    in.ibner = 50.0;
    in.ulae = 60.0;
    in.alae = 40.0;

    SECTION("Undiscounted") {
        LICResult lic = f.engine.measure_incurred_claims(in, 0.75);
        double ra = 1000.0 * 0.15 * normal_quantile(0.75);
        REQUIRE(lic.base == 1000.0);
        REQUIRE_THAT(lic.ra, WithinAbs(ra, 0.001));
        REQUIRE(lic.discount_factor == 1.0);
        REQUIRE_THAT(lic.lic, WithinAbs(1000.0 + ra, 0.001));
    }

    SECTION("Discounted over the settlement duration") {
        LICResult lic = f.engine.measure_incurred_claims(in, 0.75, 0.05);
        REQUIRE_THAT(lic.discount_factor, WithinRel(std::exp(-0.10), 1e-12));
        REQUIRE(lic.lic < 1000.0 + lic.ra);
    }

    SECTION("Median confidence adds no RA") {
        REQUIRE(f.engine.measure_incurred_claims(in, 0.5).ra == 0.0);
    }

    SECTION("Validation") {
        in.ibnr = -1.0;
        REQUIRE_THROWS_AS(f.engine.measure_incurred_claims(in, 0.75), ValidationError);
        REQUIRE(f.audit.size() == 0);
    }
}

TEST_CASE("Insurance finance income or expense", "[liability][finance]") {
    LiabilityFixture f;
    InsuranceFinanceInputs in;
    in.opening_liability = 1000.0;
    in.closing_liability = 1100.0;
    in.opening_rate = 0.05;
    in.closing_rate = 0.06;

    SECTION("All in profit or loss") {
        InsuranceFinanceResult r = f.engine.insurance_finance(in);
        REQUIRE_THAT(r.interest_accretion, WithinAbs(50.0, 1e-9));
        REQUIRE_THAT(r.rate_change_effect, WithinAbs(-50.0, 1e-9));
        REQUIRE_THAT(r.assumption_change_effect, WithinAbs(100.0, 1e-9));
        REQUIRE_THAT(r.total, WithinAbs(100.0, 1e-9));
        REQUIRE(r.pnl == r.total);
        REQUIRE(r.oci == 0.0);
    }

    SECTION("OCI option moves the rate effect") {
        in.oci_option = true;
        InsuranceFinanceResult r = f.engine.insurance_finance(in);
        REQUIRE_THAT(r.oci, WithinAbs(-50.0, 1e-9));
        REQUIRE_THAT(r.pnl, WithinAbs(150.0, 1e-9));
        REQUIRE_THAT(r.pnl + r.oci, WithinAbs(r.total, 1e-9));
    }

    REQUIRE(f.audit.size() == 1);
}

// ============================================================================
// Presentation helpers
// ============================================================================

TEST_CASE("Net and gross split", "[liability][reinsurance]") {
    LiabilityFixture f;
    LiabilityMeasurement m;
    m.bel.bel = 1000.0;
    m.ra.ra = 100.0;
    m.csm.csm = 200.0;
    m.total_liability = 1300.0;

    NetGrossSplit direct = f.engine.split_net_gross(m, ContractType::Direct);
    REQUIRE(direct.net.total_liability == 1300.0);
    REQUIRE(direct.relief.total_liability == 0.0);

    NetGrossSplit held = f.engine.split_net_gross(m, ContractType::ReinsuranceHeld);
    REQUIRE(held.gross.bel == 1000.0);
    REQUIRE_THAT(held.relief.bel, WithinAbs(400.0, 1e-9));
    REQUIRE_THAT(held.net.total_liability, WithinAbs(780.0, 1e-9));

    NetGrossSplit issued = f.engine.split_net_gross(m, ContractType::ReinsuranceIssued);
    REQUIRE(issued.net.bel == 1000.0);
    REQUIRE_THAT(issued.gross.bel, WithinAbs(1250.0, 1e-9));
    REQUIRE_THAT(issued.gross.csm, WithinAbs(250.0, 1e-9));

    REQUIRE(parse_contract_type("Reinsurance_Held") == ContractType::ReinsuranceHeld);
}

TEST_CASE("Profitability grouping", "[liability][profitability]") {
    LiabilityFixture f;
    REQUIRE(f.engine.classify_profitability(-10.0, 100.0) == ProfitabilityGroup::Onerous);
    REQUIRE(f.engine.classify_profitability(2.0, 100.0) == ProfitabilityGroup::NoSignificantRisk);
    REQUIRE(f.engine.classify_profitability(10.0, 100.0) == ProfitabilityGroup::Remaining);
    REQUIRE(f.engine.classify_profitability(0.0, 0.0) == ProfitabilityGroup::NoSignificantRisk);
    REQUIRE(f.engine.classify_profitability(-1.0, 0.0) == ProfitabilityGroup::Onerous);
    REQUIRE_THROWS_AS(f.engine.classify_profitability(1.0, -100.0), ValidationError);
}

TEST_CASE("Engine diversification uses configured correlations", "[liability][diversification]") {
    LiabilityFixture f;
    DiversifiedRA d = f.engine.diversify({{"mortality", 100.0}, {"lapse", 50.0}});
    REQUIRE(d.correlations[0][1] == 0.50);
    REQUIRE_THAT(d.diversified, WithinAbs(std::sqrt(17500.0), 0.001));

    DiversifiedRA unlisted = f.engine.diversify({{"mortality", 100.0}, {"catastrophe", 100.0}});
    REQUIRE(unlisted.correlations[0][1] == 0.25);

    auto records = f.audit.records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].operation == "liability.diversify");
}

TEST_CASE("Engine CSM release projection", "[liability][projection]") {
    LiabilityFixture f;
    auto pattern = f.engine.project_csm_release(900.0, {1.0, 1.0, 1.0}, 0.0);
    REQUIRE(pattern.size() == 3);
    REQUIRE_THAT(pattern[0].release, WithinAbs(300.0, 1e-9));
    REQUIRE(pattern[2].closing == 0.0);
}
