#include "solvency_engine.hpp"
#include "../serialization.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <random>

namespace regcalc {
namespace solvency {

namespace {

const char* const ENGINE_NAME = "solvency";

void require_non_negative(double value, const std::string& field) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ValidationError(field, "must be non-negative");
    }
}

void require_finite(double value, const std::string& field) {
    if (!std::isfinite(value)) {
        throw ValidationError(field, "must be finite");
    }
}

double root_sum_of_squares(std::initializer_list<double> values) {
    double sum = 0.0;
    for (double v : values) {
        sum += v * v;
    }
    return std::sqrt(sum);
}

// Draws from N(mean, sd); a zero deviation yields the mean
std::vector<double> draw_normal(std::mt19937_64& rng, double mean, double sd, size_t count) {
    std::vector<double> draws(count, mean);
    if (sd > 0.0) {
        std::normal_distribution<double> dist(mean, sd);
        for (size_t i = 0; i < count; ++i) {
            draws[i] = dist(rng);
        }
    }
    return draws;
}

} // anonymous namespace

// ============================================================================
// Enumerations
// ============================================================================

std::string to_string(InsurerType type) {
    switch (type) {
        case InsurerType::LifeNonLife: return "life_non_life";
        case InsurerType::Reinsurance: return "reinsurance";
    }
    return "life_non_life";
}

InsurerType parse_insurer_type(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "life_non_life") return InsurerType::LifeNonLife;
    if (v == "reinsurance") return InsurerType::Reinsurance;
    throw ValidationError("insurer_type", "unknown insurer type '" + value + "'");
}

std::string to_string(SolvencyStatus status) {
    switch (status) {
        case SolvencyStatus::Excellent: return "excellent";
        case SolvencyStatus::Good: return "good";
        case SolvencyStatus::Adequate: return "adequate";
        case SolvencyStatus::Insufficient: return "insufficient";
    }
    return "insufficient";
}

// ============================================================================
// Result types
// ============================================================================

MarginOptions::MarginOptions()
    : correction_coefficient(),
      compulsory_lines(false),
      annuity_reserves(0.0),
      mathematical_reserves(0.0),
      insurer_type(InsurerType::LifeNonLife) {}

MinimumMarginResult::MinimumMarginResult()
    : premium_base(0.0),
      claims_base(0.0),
      correction_coefficient(0.0),
      mmp_premiums(0.0),
      mmp_claims(0.0),
      base_margin(0.0),
      life_addon(0.0),
      compulsory_loading(0.0),
      guaranteed_fund(0.0),
      guaranteed_fund_applied(false),
      mmp(0.0) {}

OwnFundsInputs::OwnFundsInputs()
    : equity(0.0),
      illiquid_assets(0.0),
      intangible_assets(0.0),
      subordinated_debt(0.0),
      repo_amount(0.0),
      reserves(0.0) {}

IFRSAdjustments::IFRSAdjustments() : ecl(0.0), csm(0.0) {}

IFRSAdjustments::IFRSAdjustments(double ecl_amount, double csm_amount)
    : ecl(ecl_amount), csm(csm_amount) {}

RepoCheck::RepoCheck()
    : repo_amount(0.0), reserves(0.0), ratio(0.0), limit(0.0), breach(false), penalty(0.0) {}

OwnFundsResult::OwnFundsResult()
    : equity(0.0),
      ecl_adjustment(0.0),
      csm_adjustment(0.0),
      illiquid_assets(0.0),
      intangible_assets(0.0),
      pre_subordinated(0.0),
      subordinated_debt(0.0),
      subordinated_cap(0.0),
      subordinated_included(0.0),
      subordinated_excess(0.0),
      repo(),
      fmp(0.0) {}

RatioResult::RatioResult()
    : fmp(0.0), mmp(0.0), ratio(0.0), compliant(false), status(SolvencyStatus::Insufficient) {}

ScenarioStress::ScenarioStress()
    : name(), own_funds_shock(0.0), margin_shock(0.0), fmp(0.0), mmp(0.0), ratio(0.0), compliant(false) {}

MonteCarloStress::MonteCarloStress()
    : simulations(0),
      seed(0),
      own_funds_volatility(0.0),
      margin_volatility(0.0),
      confidence(0.0),
      mean_ratio(0.0),
      tail_ratio(0.0),
      probability_below_minimum(0.0) {}

StressTestResult::StressTestResult() : base_ratio(0.0), scenarios(), monte_carlo() {}

MarketRiskExposures::MarketRiskExposures()
    : equity_type1(0.0), equity_type2(0.0), property(0.0), interest_rate_sensitivity(0.0), spread(0.0) {}

UnderwritingRisks::UnderwritingRisks()
    : premium_risk(0.0), reserve_risk(0.0), catastrophe_risk(0.0) {}

SCRResult::SCRResult()
    : scr_equity(0.0),
      scr_property(0.0),
      scr_interest_rate(0.0),
      scr_spread(0.0),
      scr_market(0.0),
      scr_underwriting(0.0),
      scr_counterparty(0.0),
      bscr(0.0),
      scr_operational(0.0),
      scr(0.0) {}

IFRSImpactResult::IFRSImpactResult()
    : pre_fmp(0.0),
      pre_mmp(0.0),
      pre_ratio(0.0),
      ecl_impact(0.0),
      csm_impact(0.0),
      bel_ra_impact(0.0),
      post_fmp(0.0),
      post_mmp(0.0),
      post_ratio(0.0),
      ratio_change_pp(0.0) {}

HighLiquidCheck::HighLiquidCheck()
    : high_liquid_assets(0.0), short_term_liabilities(0.0), ratio(0.0), required(0.0), compliant(false) {}

// ============================================================================
// Minimum margin
// ============================================================================

double tiered_margin(double base, const TierSchedule& tiers, double correction_coefficient) {
    double tier1 = tiers.rate_tier1 * std::min(base, tiers.threshold);
    double tier2 = tiers.rate_tier2 * std::max(0.0, base - tiers.threshold);
    return std::max(0.0, tier1 + tier2) * correction_coefficient;
}

SolvencyEngine::SolvencyEngine(const SolvencyConfig& config, const RoundingConfig& rounding, AuditSink& audit)
    : config_(config), rounding_(rounding), audit_(audit) {}

void SolvencyEngine::record(const ExecutionContext& ctx, const AuditRecord& record) const {
    audit_.append(record);
    Logger::get_instance().log_audit_appended(ctx, record.input_digest, record.result_digest);
}

double SolvencyEngine::guaranteed_fund(InsurerType type, const MacroContext& macro) const {
    double units = (type == InsurerType::Reinsurance)
        ? config_.guaranteed_fund_units_reinsurance
        : config_.guaranteed_fund_units_primary;
    return units * macro.monthly_calculation_index();
}

MinimumMarginResult SolvencyEngine::calculate_minimum_margin(double premium_base, double claims_base,
                                                             const MarginOptions& options,
                                                             const MacroContext& macro) const {
    require_non_negative(premium_base, "premium_base");
    require_non_negative(claims_base, "claims_base");
    require_non_negative(options.annuity_reserves, "annuity_reserves");
    require_non_negative(options.mathematical_reserves, "mathematical_reserves");

    double k = options.correction_coefficient ? *options.correction_coefficient
                                              : config_.correction_coefficient_default;
    if (!std::isfinite(k) || k < config_.correction_coefficient_min || k > config_.correction_coefficient_max) {
        throw ValidationError("correction_coefficient", "must be in [" +
                              format_fixed(config_.correction_coefficient_min, 2) + ", " +
                              format_fixed(config_.correction_coefficient_max, 2) + "]");
    }

    MinimumMarginResult result;
    result.premium_base = round_amount(premium_base, rounding_);
    result.claims_base = round_amount(claims_base, rounding_);
    result.correction_coefficient = k;

    double mmp_premiums = tiered_margin(premium_base, config_.premium_tiers, k);
    double mmp_claims = tiered_margin(claims_base, config_.claims_tiers, k);
    double base_margin = std::max(mmp_premiums, mmp_claims);
    double life_addon = config_.annuity_reserve_rate * options.annuity_reserves +
                        config_.mathematical_reserve_rate * options.mathematical_reserves;
    double loading = options.compulsory_lines ? config_.compulsory_loading * base_margin : 0.0;
    double floor = guaranteed_fund(options.insurer_type, macro);
    double total = base_margin + life_addon + loading;

    result.mmp_premiums = round_amount(mmp_premiums, rounding_);
    result.mmp_claims = round_amount(mmp_claims, rounding_);
    result.base_margin = round_amount(base_margin, rounding_);
    result.life_addon = round_amount(life_addon, rounding_);
    result.compulsory_loading = round_amount(loading, rounding_);
    result.guaranteed_fund = round_amount(floor, rounding_);
    result.guaranteed_fund_applied = total < floor;
    result.mmp = round_amount(std::max(total, floor), rounding_);
    return result;
}

// ============================================================================
// Own funds
// ============================================================================

RepoCheck SolvencyEngine::check_repo_limit(double repo_amount, double reserves,
                                           const CalendarDate& valuation_date) const {
    require_non_negative(repo_amount, "repo_amount");
    require_non_negative(reserves, "reserves");

    RepoCheck check;
    check.repo_amount = round_amount(repo_amount, rounding_);
    check.reserves = round_amount(reserves, rounding_);
    check.limit = (valuation_date < config_.repo_limit_switch_date)
        ? config_.repo_limit_before
        : config_.repo_limit_after;

    if (reserves > 0.0) {
        double ratio = repo_amount / reserves;
        check.ratio = round_ratio(ratio, rounding_);
        check.breach = ratio > check.limit;
        if (check.breach) {
            check.penalty = round_amount((ratio - check.limit) * reserves * config_.repo_penalty_rate, rounding_);
        }
    } else {
        // No reserves to measure against: any repo is a breach without a penalty base
        check.breach = repo_amount > 0.0;
    }
    return check;
}

OwnFundsResult SolvencyEngine::calculate_own_funds(const OwnFundsInputs& inputs,
                                                   const IFRSAdjustments& adjustments,
                                                   const MacroContext& macro) const {
    require_finite(inputs.equity, "equity");
    require_non_negative(inputs.illiquid_assets, "illiquid_assets");
    require_non_negative(inputs.intangible_assets, "intangible_assets");
    require_non_negative(inputs.subordinated_debt, "subordinated_debt");
    require_non_negative(adjustments.ecl, "ecl_adjustment");
    require_non_negative(adjustments.csm, "csm_adjustment");

    OwnFundsResult result;
    result.repo = check_repo_limit(inputs.repo_amount, inputs.reserves, macro.valuation_date());

    double pre_subordinated = inputs.equity - adjustments.ecl - inputs.illiquid_assets -
                              inputs.intangible_assets + adjustments.csm;
    double cap = std::max(0.0, pre_subordinated * config_.subordinated_debt_cap);
    double included = std::min(inputs.subordinated_debt, cap);

    result.equity = round_amount(inputs.equity, rounding_);
    result.ecl_adjustment = round_amount(adjustments.ecl, rounding_);
    result.csm_adjustment = round_amount(adjustments.csm, rounding_);
    result.illiquid_assets = round_amount(inputs.illiquid_assets, rounding_);
    result.intangible_assets = round_amount(inputs.intangible_assets, rounding_);
    result.pre_subordinated = round_amount(pre_subordinated, rounding_);
    result.subordinated_debt = round_amount(inputs.subordinated_debt, rounding_);
    result.subordinated_cap = round_amount(cap, rounding_);
    result.subordinated_included = round_amount(included, rounding_);
    result.subordinated_excess = round_amount(std::max(0.0, inputs.subordinated_debt - cap), rounding_);
    result.fmp = round_amount(pre_subordinated + included - result.repo.penalty, rounding_);
    return result;
}

// ============================================================================
// Ratio and stress
// ============================================================================

SolvencyStatus SolvencyEngine::classify_status(double ratio) const {
    if (ratio >= config_.status_excellent) return SolvencyStatus::Excellent;
    if (ratio >= config_.status_good) return SolvencyStatus::Good;
    if (ratio >= config_.minimum_ratio) return SolvencyStatus::Adequate;
    return SolvencyStatus::Insufficient;
}

RatioResult SolvencyEngine::calculate_ratio(double fmp, double mmp) const {
    require_finite(fmp, "fmp");
    require_finite(mmp, "mmp");

    RatioResult result;
    result.fmp = round_amount(fmp, rounding_);
    result.mmp = round_amount(mmp, rounding_);
    if (mmp <= 0.0) {
        result.ratio = 0.0;
        result.compliant = false;
        result.status = SolvencyStatus::Insufficient;
        return result;
    }
    result.ratio = round_ratio(fmp / mmp, rounding_);
    result.compliant = result.ratio >= config_.minimum_ratio;
    result.status = classify_status(result.ratio);
    return result;
}

std::vector<ScenarioStress> SolvencyEngine::stress_scenarios(double fmp, double mmp) const {
    std::vector<ScenarioStress> scenarios;
    scenarios.reserve(config_.stress_scenarios.size());
    for (const auto& scenario : config_.stress_scenarios) {
        ScenarioStress s;
        s.name = scenario.name;
        s.own_funds_shock = scenario.own_funds_shock;
        s.margin_shock = scenario.margin_shock;
        double stressed_fmp = fmp * (1.0 + scenario.own_funds_shock);
        double stressed_mmp = mmp * (1.0 + scenario.margin_shock);
        s.fmp = round_amount(stressed_fmp, rounding_);
        s.mmp = round_amount(stressed_mmp, rounding_);
        s.ratio = round_ratio(safe_divide(stressed_fmp, std::max(0.0, stressed_mmp)), rounding_);
        s.compliant = stressed_mmp > 0.0 && s.ratio >= config_.minimum_ratio;
        scenarios.push_back(s);
    }
    return scenarios;
}

MonteCarloStress SolvencyEngine::simulate_ratio_distribution(double fmp, double mmp) const {
    require_finite(fmp, "fmp");
    require_finite(mmp, "mmp");

    MonteCarloStress result;
    result.seed = config_.seed;
    result.own_funds_volatility = config_.own_funds_volatility;
    result.margin_volatility = config_.margin_volatility;
    result.confidence = config_.tail_confidence;
    result.simulations = config_.stress_simulations;
    if (result.simulations > config_.max_simulations) {
        ExecutionContext ctx(ENGINE_NAME, "simulate_ratio_distribution");
        Logger::get_instance().log_warning(ctx, "stress_simulations " + std::to_string(result.simulations) +
                                                " clamped to " + std::to_string(config_.max_simulations));
        result.simulations = config_.max_simulations;
    }
    if (result.simulations == 0) {
        return result;
    }

    // Own-funds draws first, then margin draws, from one seeded stream
    std::mt19937_64 rng(config_.seed);
    std::vector<double> fmp_draws = draw_normal(rng, fmp, std::fabs(fmp) * config_.own_funds_volatility,
                                                result.simulations);
    std::vector<double> mmp_draws = draw_normal(rng, mmp, std::fabs(mmp) * config_.margin_volatility,
                                                result.simulations);

    std::vector<double> ratios(result.simulations);
    size_t below = 0;
    for (size_t i = 0; i < result.simulations; ++i) {
        ratios[i] = fmp_draws[i] / std::max(mmp_draws[i], 1.0);
        if (ratios[i] < config_.minimum_ratio) {
            ++below;
        }
    }
    std::sort(ratios.begin(), ratios.end());

    result.mean_ratio = round_ratio(calculate_mean(ratios), rounding_);
    result.tail_ratio = round_ratio(calculate_percentile(ratios, (1.0 - config_.tail_confidence) * 100.0), rounding_);
    result.probability_below_minimum = round_ratio(
        static_cast<double>(below) / static_cast<double>(result.simulations), rounding_);
    return result;
}

StressTestResult SolvencyEngine::stress_test(double fmp, double mmp) const {
    StressTestResult result;
    result.base_ratio = round_ratio(safe_divide(fmp, std::max(0.0, mmp)), rounding_);
    result.scenarios = stress_scenarios(fmp, mmp);
    result.monte_carlo = simulate_ratio_distribution(fmp, mmp);
    return result;
}

// ============================================================================
// Audited operations
// ============================================================================

SolvencyPosition SolvencyEngine::assess_solvency(double premium_base,
                                                 double claims_base,
                                                 const OwnFundsInputs& own_funds,
                                                 const IFRSAdjustments& adjustments,
                                                 const MacroContext& macro,
                                                 const MarginOptions& options) const {
    ExecutionContext ctx(ENGINE_NAME, "assess_solvency");
    auto& logger = Logger::get_instance();
    logger.log_calculation_start(ctx, 1);

    SolvencyPosition position;
    try {
        position.minimum_margin = calculate_minimum_margin(premium_base, claims_base, options, macro);
        position.own_funds = calculate_own_funds(own_funds, adjustments, macro);
    } catch (const ValidationError& e) {
        logger.log_validation_error(ctx, e.field(), e.what());
        throw;
    }
    position.ratio = calculate_ratio(position.own_funds.fmp, position.minimum_margin.mmp);
    position.stress = stress_test(position.own_funds.fmp, position.minimum_margin.mmp);

    if (position.own_funds.repo.breach) {
        logger.log_warning(ctx, "repo exposure ratio " + format_fixed(position.own_funds.repo.ratio, 6) +
                                " exceeds limit " + format_fixed(position.own_funds.repo.limit, 2));
    }

    nlohmann::json inputs;
    inputs["premium_base"] = premium_base;
    inputs["claims_base"] = claims_base;
    inputs["own_funds"] = own_funds;
    inputs["adjustments"] = adjustments;
    inputs["options"] = options;
    inputs["macro"] = macro;
    position.input_digest = digest_json(inputs, rounding_);
    position.result_digest = digest_json(strip_digests(position), rounding_);

    AuditRecord audit_record;
    audit_record.timestamp = utc_timestamp();
    audit_record.operation = "solvency.assess_solvency";
    audit_record.input_digest = position.input_digest;
    audit_record.result_digest = position.result_digest;
    audit_record.regulatory_reference = config_.regulatory_reference;
    record(ctx, audit_record);

    CalculationMetrics metrics;
    metrics.items_processed = 1;
    logger.log_calculation_complete(ctx, metrics);
    return position;
}

SCRResult SolvencyEngine::calculate_scr(const MarketRiskExposures& market,
                                        const UnderwritingRisks& underwriting,
                                        double scr_counterparty,
                                        double gross_premiums,
                                        double technical_provisions) const {
    require_non_negative(market.equity_type1, "equity_type1");
    require_non_negative(market.equity_type2, "equity_type2");
    require_non_negative(market.property, "property");
    require_non_negative(market.interest_rate_sensitivity, "interest_rate_sensitivity");
    require_non_negative(market.spread, "spread");
    require_non_negative(underwriting.premium_risk, "premium_risk");
    require_non_negative(underwriting.reserve_risk, "reserve_risk");
    require_non_negative(underwriting.catastrophe_risk, "catastrophe_risk");
    require_non_negative(scr_counterparty, "scr_counterparty");
    require_non_negative(gross_premiums, "gross_premiums");
    require_non_negative(technical_provisions, "technical_provisions");

    ExecutionContext ctx(ENGINE_NAME, "calculate_scr");
    const ScrShocks& shocks = config_.scr;

    double equity = market.equity_type1 * shocks.equity_type1 + market.equity_type2 * shocks.equity_type2;
    double property = market.property * shocks.property;
    double interest = market.interest_rate_sensitivity * shocks.interest_rate;
    double spread = market.spread * shocks.spread;
    double scr_market = root_sum_of_squares({equity, property, interest, spread});
    double scr_uw = root_sum_of_squares(
        {underwriting.premium_risk, underwriting.reserve_risk, underwriting.catastrophe_risk});
    double bscr = root_sum_of_squares({scr_market, scr_uw, scr_counterparty});
    double operational = std::min(config_.operational_bscr_cap * bscr,
                                  std::max(config_.operational_premium_rate * gross_premiums,
                                           config_.operational_provision_rate * technical_provisions));

    SCRResult result;
    result.scr_equity = round_amount(equity, rounding_);
    result.scr_property = round_amount(property, rounding_);
    result.scr_interest_rate = round_amount(interest, rounding_);
    result.scr_spread = round_amount(spread, rounding_);
    result.scr_market = round_amount(scr_market, rounding_);
    result.scr_underwriting = round_amount(scr_uw, rounding_);
    result.scr_counterparty = round_amount(scr_counterparty, rounding_);
    result.bscr = round_amount(bscr, rounding_);
    result.scr_operational = round_amount(operational, rounding_);
    result.scr = round_amount(bscr + operational, rounding_);

    nlohmann::json inputs;
    inputs["market"] = market;
    inputs["underwriting"] = underwriting;
    inputs["scr_counterparty"] = scr_counterparty;
    inputs["gross_premiums"] = gross_premiums;
    inputs["technical_provisions"] = technical_provisions;
    result.input_digest = digest_json(inputs, rounding_);
    result.result_digest = digest_json(strip_digests(result), rounding_);

    AuditRecord audit_record;
    audit_record.timestamp = utc_timestamp();
    audit_record.operation = "solvency.calculate_scr";
    audit_record.input_digest = result.input_digest;
    audit_record.result_digest = result.result_digest;
    audit_record.regulatory_reference = config_.regulatory_reference;
    record(ctx, audit_record);
    return result;
}

IFRSImpactResult SolvencyEngine::analyze_ifrs_impact(double pre_fmp, double pre_mmp, double ecl_impact,
                                                     double csm_impact, double bel_ra_impact) const {
    require_finite(pre_fmp, "pre_fmp");
    require_finite(pre_mmp, "pre_mmp");
    require_non_negative(ecl_impact, "ecl_impact");
    require_non_negative(csm_impact, "csm_impact");
    require_finite(bel_ra_impact, "bel_ra_impact");

    ExecutionContext ctx(ENGINE_NAME, "analyze_ifrs_impact");
    double pre_ratio = safe_divide(pre_fmp, std::max(0.0, pre_mmp));
    double post_fmp = pre_fmp - ecl_impact + csm_impact;
    double post_mmp = pre_mmp - bel_ra_impact;
    double post_ratio = safe_divide(post_fmp, std::max(0.0, post_mmp));

    IFRSImpactResult result;
    result.pre_fmp = round_amount(pre_fmp, rounding_);
    result.pre_mmp = round_amount(pre_mmp, rounding_);
    result.pre_ratio = round_ratio(pre_ratio, rounding_);
    result.ecl_impact = round_amount(ecl_impact, rounding_);
    result.csm_impact = round_amount(csm_impact, rounding_);
    result.bel_ra_impact = round_amount(bel_ra_impact, rounding_);
    result.post_fmp = round_amount(post_fmp, rounding_);
    result.post_mmp = round_amount(post_mmp, rounding_);
    result.post_ratio = round_ratio(post_ratio, rounding_);
    result.ratio_change_pp = round_ratio((post_ratio - pre_ratio) * 100.0, rounding_);

    nlohmann::json inputs;
    inputs["pre_fmp"] = pre_fmp;
    inputs["pre_mmp"] = pre_mmp;
    inputs["ecl_impact"] = ecl_impact;
    inputs["csm_impact"] = csm_impact;
    inputs["bel_ra_impact"] = bel_ra_impact;
    result.input_digest = digest_json(inputs, rounding_);
    result.result_digest = digest_json(strip_digests(result), rounding_);
    record(ctx, make_audit_record("solvency.analyze_ifrs_impact", inputs, strip_digests(result),
                                  config_.regulatory_reference, rounding_));
    return result;
}

HighLiquidCheck SolvencyEngine::check_high_liquid_ratio(double high_liquid_assets,
                                                        double short_term_liabilities) const {
    require_non_negative(high_liquid_assets, "high_liquid_assets");
    require_non_negative(short_term_liabilities, "short_term_liabilities");

    ExecutionContext ctx(ENGINE_NAME, "check_high_liquid_ratio");
    HighLiquidCheck check;
    check.high_liquid_assets = round_amount(high_liquid_assets, rounding_);
    check.short_term_liabilities = round_amount(short_term_liabilities, rounding_);
    check.required = config_.high_liquid_ratio_minimum;
    check.ratio = round_ratio(safe_divide(high_liquid_assets, short_term_liabilities), rounding_);
    check.compliant = check.ratio >= check.required;

    nlohmann::json inputs;
    inputs["high_liquid_assets"] = high_liquid_assets;
    inputs["short_term_liabilities"] = short_term_liabilities;
    record(ctx, make_audit_record("solvency.check_high_liquid_ratio", inputs, nlohmann::json(check),
                                  config_.regulatory_reference, rounding_));
    return check;
}

} // namespace solvency
} // namespace regcalc
