#ifndef REGCALC_CONFIG_HPP
#define REGCALC_CONFIG_HPP

#include "credit/exposure.hpp"
#include "logger.hpp"
#include "macro_context.hpp"
#include "numeric.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace regcalc {

// ============================================================================
// Credit risk
// ============================================================================

// Significant-increase-in-credit-risk thresholds
struct StageThresholds {
    uint32_t stage2_days_past_due;   // Stage 2 when dpd > this
    uint32_t stage3_days_past_due;   // Stage 3 when dpd > this
    double pd_relative_increase;     // Stage 2 when pd / pd_origination > this
    double pd_absolute_increase;     // Stage 2 when pd - pd_origination > this

    StageThresholds();
};

struct LogisticPDCoefficients {
    double intercept;
    double gdp_growth;               // Per percentage point of GDP growth
    double inflation;                // Per percentage point of inflation

    LogisticPDCoefficients();
};

struct CreditConfig {
    StageThresholds thresholds;
    std::map<credit::CollateralType, double> lgd_by_collateral;
    std::map<credit::FacilityType, double> ccf_by_facility;
    double default_ccf;
    double reference_inflation;          // LGD macro factor pivots
    double reference_base_rate;
    double lgd_inflation_sensitivity;
    double lgd_rate_sensitivity;
    uint32_t max_remaining_term;         // Longest accepted exposure term, in periods
    double stage3_uplift;                // Max days-on-default uplift
    uint32_t stage3_uplift_days;         // Days at which the uplift saturates
    LogisticPDCoefficients logistic;
    double default_asset_correlation;    // Correlated-default simulation
    size_t max_simulations;
    uint64_t seed;
    std::string regulatory_reference;

    CreditConfig();

    double base_lgd(credit::CollateralType type) const;
    double ccf(credit::FacilityType type) const;
};

// ============================================================================
// Insurance liability
// ============================================================================

struct ReinsuranceConfig {
    double held_relief;              // Share of gross ceded under reinsurance held
    double issued_relief;            // Share added back for reinsurance issued

    ReinsuranceConfig();
};

struct LiabilityConfig {
    double illiquidity_premium;
    std::map<uint32_t, double> illiquidity_term_factors;  // Max term (inclusive) -> factor
    double long_term_illiquidity_factor;                  // Beyond the last listed term
    DiscountMethod discount_method;
    double default_lapse_rate;
    double var_confidence;
    double tvar_confidence;
    double cte_confidence;
    double single_period_volatility;     // sigma = |mean| * this for one-period schedules
    double coc_rate;
    double coc_capital_factor;           // Capital = factor * |BEL|
    size_t simulations;
    size_t max_simulations;
    uint64_t seed;
    std::map<std::pair<std::string, std::string>, double> risk_correlations;
    double default_risk_correlation;
    double lic_coefficient_of_variation;
    double lic_discount_duration;
    double finance_duration;             // Liability duration for rate-change effect
    double profitability_band;           // Onerous / no-significant-risk margin band
    ReinsuranceConfig reinsurance;
    std::string regulatory_reference;

    LiabilityConfig();

    double illiquidity_factor(uint32_t term) const;

    // Symmetric lookup; identical risks correlate at 1
    double risk_correlation(const std::string& a, const std::string& b) const;
    void set_risk_correlation(const std::string& a, const std::string& b, double rho);
};

// ============================================================================
// Solvency
// ============================================================================

// Two-bracket progressive rate schedule
struct TierSchedule {
    double rate_tier1;
    double threshold;
    double rate_tier2;

    TierSchedule();
    TierSchedule(double r1, double t, double r2);
};

struct StressScenarioConfig {
    std::string name;
    double own_funds_shock;          // Relative change applied to own funds
    double margin_shock;             // Relative change applied to the minimum margin

    StressScenarioConfig();
    StressScenarioConfig(const std::string& n, double of, double mm);
};

struct ScrShocks {
    double equity_type1;
    double equity_type2;
    double property;
    double interest_rate;
    double spread;

    ScrShocks();
};

// Insurance payment guarantee fund: member contributions and fund adequacy
struct GuaranteeFundConfig {
    double rate_low_risk;                       // Contribution rate on gross premiums
    double rate_medium_risk;
    double rate_high_risk;
    double required_adequacy_ratio;             // Fund balance / expected claims
    double fund_share_of_reserves;              // Assumed fund in the bankruptcy simulation
    double no_claims_adequacy;                  // Simulated adequacy when expected claims are zero
    double no_claims_ratio;                     // Balance ratio when expected claims are zero
    double default_pd;                          // Member defaults when a profile omits them
    double default_recovery;
    double default_correlation;
    size_t simulations;
    size_t max_simulations;
    uint64_t seed;
    std::string regulatory_reference;

    GuaranteeFundConfig();
};

struct SolvencyConfig {
    TierSchedule premium_tiers;
    TierSchedule claims_tiers;
    double correction_coefficient_default;
    double correction_coefficient_min;
    double correction_coefficient_max;
    double annuity_reserve_rate;
    double mathematical_reserve_rate;
    double compulsory_loading;
    double guaranteed_fund_units_primary;       // x monthly calculation index
    double guaranteed_fund_units_reinsurance;
    double subordinated_debt_cap;               // Share of pre-subordinated own funds
    double repo_limit_before;
    double repo_limit_after;
    CalendarDate repo_limit_switch_date;
    double repo_penalty_rate;
    std::vector<StressScenarioConfig> stress_scenarios;
    size_t stress_simulations;
    size_t max_simulations;
    double own_funds_volatility;
    double margin_volatility;
    double tail_confidence;                     // Ratio quantile reported at 1 - this
    uint64_t seed;
    double minimum_ratio;
    double status_excellent;
    double status_good;
    ScrShocks scr;
    double operational_bscr_cap;
    double operational_premium_rate;
    double operational_provision_rate;
    double high_liquid_ratio_minimum;
    GuaranteeFundConfig guarantee_fund;
    std::string regulatory_reference;

    SolvencyConfig();
};

// ============================================================================
// Engine configuration
// ============================================================================

struct EngineConfig {
    RoundingConfig rounding;
    CreditConfig credit;
    LiabilityConfig liability;
    SolvencyConfig solvency;
    LoggerConfig logging;

    EngineConfig();
};

// Throws ConfigError naming the first invalid value
void validate_engine_config(const EngineConfig& config);

/**
 * Parse an engine configuration from JSON. Keys that are present override
 * the defaults; string values may reference ${ENV} variables.
 *
 * @throws ConfigError if the JSON is malformed or a value is invalid
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);
EngineConfig parse_engine_config_from_file(const std::string& file_path);

MacroContext parse_macro_context_from_string(const std::string& json_string);
MacroContext parse_macro_context_from_file(const std::string& file_path);

// Supports ${VAR_NAME} and $VAR_NAME; unset variables expand to ""
std::string expand_environment_variables(const std::string& value);

} // namespace regcalc

#endif // REGCALC_CONFIG_HPP
