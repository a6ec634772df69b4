#ifndef REGCALC_SOLVENCY_SOLVENCY_ENGINE_HPP
#define REGCALC_SOLVENCY_SOLVENCY_ENGINE_HPP

#include "../audit_trail.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../logger.hpp"
#include "../macro_context.hpp"
#include "../numeric.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace regcalc {
namespace solvency {

enum class InsurerType : uint8_t {
    LifeNonLife = 0,
    Reinsurance = 1
};

std::string to_string(InsurerType type);
InsurerType parse_insurer_type(const std::string& value);

enum class SolvencyStatus : uint8_t {
    Excellent = 0,
    Good = 1,
    Adequate = 2,
    Insufficient = 3
};

std::string to_string(SolvencyStatus status);

// rate_tier1 x min(base, threshold) + rate_tier2 x max(0, base - threshold),
// floored at zero, times the correction coefficient
double tiered_margin(double base, const TierSchedule& tiers, double correction_coefficient);

// Inputs to the minimum margin beyond the premium and claims bases
struct MarginOptions {
    std::optional<double> correction_coefficient;   // Config default when absent
    bool compulsory_lines;                          // Portfolio includes compulsory lines
    double annuity_reserves;
    double mathematical_reserves;
    InsurerType insurer_type;

    MarginOptions();
};

struct MinimumMarginResult {
    double premium_base;
    double claims_base;
    double correction_coefficient;
    double mmp_premiums;
    double mmp_claims;
    double base_margin;                  // max(mmp_premiums, mmp_claims)
    double life_addon;
    double compulsory_loading;
    double guaranteed_fund;
    bool guaranteed_fund_applied;        // Floor was binding
    double mmp;

    MinimumMarginResult();
};

struct OwnFundsInputs {
    double equity;
    double illiquid_assets;
    double intangible_assets;
    double subordinated_debt;
    double repo_amount;
    double reserves;                     // Insurance reserves the repo limit is measured against

    OwnFundsInputs();
};

// Adjustments carried over from the credit and liability engines
struct IFRSAdjustments {
    double ecl;
    double csm;

    IFRSAdjustments();
    IFRSAdjustments(double ecl_amount, double csm_amount);
};

struct RepoCheck {
    double repo_amount;
    double reserves;
    double ratio;
    double limit;                        // Depends on the valuation date
    bool breach;
    double penalty;

    RepoCheck();
};

struct OwnFundsResult {
    double equity;
    double ecl_adjustment;
    double csm_adjustment;
    double illiquid_assets;
    double intangible_assets;
    double pre_subordinated;             // Own funds before subordinated debt
    double subordinated_debt;
    double subordinated_cap;
    double subordinated_included;
    double subordinated_excess;          // Excluded, not an error
    RepoCheck repo;
    double fmp;

    OwnFundsResult();
};

struct RatioResult {
    double fmp;
    double mmp;
    double ratio;                        // 0 when MMP is not positive
    bool compliant;
    SolvencyStatus status;

    RatioResult();
};

struct ScenarioStress {
    std::string name;
    double own_funds_shock;
    double margin_shock;
    double fmp;
    double mmp;
    double ratio;
    bool compliant;

    ScenarioStress();
};

struct MonteCarloStress {
    size_t simulations;
    uint64_t seed;
    double own_funds_volatility;
    double margin_volatility;
    double confidence;
    double mean_ratio;
    double tail_ratio;                   // Ratio quantile at 1 - confidence
    double probability_below_minimum;

    MonteCarloStress();
};

struct StressTestResult {
    double base_ratio;
    std::vector<ScenarioStress> scenarios;
    MonteCarloStress monte_carlo;

    StressTestResult();
};

struct SolvencyPosition {
    MinimumMarginResult minimum_margin;
    OwnFundsResult own_funds;
    RatioResult ratio;
    StressTestResult stress;
    std::string input_digest;
    std::string result_digest;
};

struct MarketRiskExposures {
    double equity_type1;
    double equity_type2;
    double property;
    double interest_rate_sensitivity;
    double spread;

    MarketRiskExposures();
};

struct UnderwritingRisks {
    double premium_risk;
    double reserve_risk;
    double catastrophe_risk;

    UnderwritingRisks();
};

struct SCRResult {
    double scr_equity;
    double scr_property;
    double scr_interest_rate;
    double scr_spread;
    double scr_market;
    double scr_underwriting;
    double scr_counterparty;
    double bscr;
    double scr_operational;
    double scr;
    std::string input_digest;
    std::string result_digest;

    SCRResult();
};

struct IFRSImpactResult {
    double pre_fmp;
    double pre_mmp;
    double pre_ratio;
    double ecl_impact;
    double csm_impact;
    double bel_ra_impact;
    double post_fmp;
    double post_mmp;
    double post_ratio;
    double ratio_change_pp;              // Percentage points
    std::string input_digest;
    std::string result_digest;

    IFRSImpactResult();
};

struct HighLiquidCheck {
    double high_liquid_assets;
    double short_term_liabilities;
    double ratio;
    double required;
    bool compliant;

    HighLiquidCheck();
};

/**
 * Solvency engine: tiered minimum margin, own funds with IFRS adjustments,
 * solvency ratio, stress tests and standard-formula SCR.
 *
 * Holds references to its configuration and audit sink; both must outlive
 * the engine. Monte-Carlo stress draws from a generator seeded from the
 * configuration on every call, so repeated calls give identical results.
 */
class SolvencyEngine {
public:
    SolvencyEngine(const SolvencyConfig& config, const RoundingConfig& rounding, AuditSink& audit);

    MinimumMarginResult calculate_minimum_margin(double premium_base, double claims_base,
                                                 const MarginOptions& options,
                                                 const MacroContext& macro) const;

    double guaranteed_fund(InsurerType type, const MacroContext& macro) const;

    RepoCheck check_repo_limit(double repo_amount, double reserves, const CalendarDate& valuation_date) const;

    OwnFundsResult calculate_own_funds(const OwnFundsInputs& inputs, const IFRSAdjustments& adjustments,
                                       const MacroContext& macro) const;

    RatioResult calculate_ratio(double fmp, double mmp) const;

    SolvencyStatus classify_status(double ratio) const;

    std::vector<ScenarioStress> stress_scenarios(double fmp, double mmp) const;

    MonteCarloStress simulate_ratio_distribution(double fmp, double mmp) const;

    // ------------------------------------------------------------------------
    // Audited operations
    // ------------------------------------------------------------------------

    SolvencyPosition assess_solvency(double premium_base,
                                     double claims_base,
                                     const OwnFundsInputs& own_funds,
                                     const IFRSAdjustments& adjustments,
                                     const MacroContext& macro,
                                     const MarginOptions& options = MarginOptions()) const;

    SCRResult calculate_scr(const MarketRiskExposures& market,
                            const UnderwritingRisks& underwriting,
                            double scr_counterparty,
                            double gross_premiums,
                            double technical_provisions) const;

    IFRSImpactResult analyze_ifrs_impact(double pre_fmp, double pre_mmp, double ecl_impact,
                                         double csm_impact, double bel_ra_impact) const;

    HighLiquidCheck check_high_liquid_ratio(double high_liquid_assets, double short_term_liabilities) const;

private:
    const SolvencyConfig& config_;
    const RoundingConfig& rounding_;
    AuditSink& audit_;

    StressTestResult stress_test(double fmp, double mmp) const;

    void record(const ExecutionContext& ctx, const AuditRecord& record) const;
};

} // namespace solvency
} // namespace regcalc

#endif // REGCALC_SOLVENCY_SOLVENCY_ENGINE_HPP
