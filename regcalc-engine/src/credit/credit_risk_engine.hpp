#ifndef REGCALC_CREDIT_CREDIT_RISK_ENGINE_HPP
#define REGCALC_CREDIT_CREDIT_RISK_ENGINE_HPP

#include "../audit_trail.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../logger.hpp"
#include "../macro_context.hpp"
#include "../numeric.hpp"
#include "default_simulation.hpp"
#include "exposure.hpp"
#include "staging.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace regcalc {
namespace credit {

// Expected credit loss for one exposure, with its per-period breakdown
struct ECLResult {
    std::string exposure_id;
    Stage stage;
    std::vector<std::string> stage_triggers;
    ScenarioKind scenario;
    double scenario_multiplier;
    double pd_adjusted;
    double lgd_adjusted;
    double ead;
    uint32_t horizon;                         // Periods measured (1 for Stage 1)
    std::vector<double> pd_values;            // Marginal survival-weighted PD_t
    std::vector<double> ead_values;           // Amortised EAD_t
    std::vector<double> discount_factors;     // 1 / (1 + EIR)^t
    std::vector<double> period_losses;
    double stage3_uplift;                     // 1 unless Stage 3
    double exposure_bound;                    // Sum of EAD_t, upper bound on ECL
    double ecl;
    std::string input_digest;
    std::string result_digest;

    ECLResult();
};

struct PortfolioECLResult {
    ScenarioKind scenario;
    double total_gca;
    double total_ead;
    double total_ecl;
    double coverage_ratio;                    // total_ecl / total_gca
    std::array<double, 3> ecl_by_stage;
    std::array<double, 3> gca_by_stage;
    std::array<size_t, 3> count_by_stage;
    double stage3_coverage;
    std::vector<ECLResult> results;           // Input order, failed items omitted
    std::vector<ItemFailure> failures;
    double execution_time_ms;
    std::string input_digest;
    std::string result_digest;

    PortfolioECLResult();

    bool empty() const { return results.empty() && failures.empty(); }
};

struct StressedECL {
    ScenarioKind scenario;
    double multiplier;
    double ecl;
    double change_pct;                        // (multiplier - 1) * 100

    StressedECL();
};

struct ECLStressResult {
    double base_ecl;
    std::vector<StressedECL> scenarios;       // Base, Adverse, Severe

    ECLStressResult();
};

// Beta-Binomial posterior for a default rate
struct BayesianPDEstimate {
    uint64_t defaults;
    uint64_t observations;
    double posterior_alpha;
    double posterior_beta;
    double pd_mean;
    double ci_lower;                          // 2.5% posterior quantile
    double ci_upper;                          // 97.5% posterior quantile

    BayesianPDEstimate();
};

/**
 * Credit risk engine: staging, PD/LGD/EAD estimation and discounted
 * expected-credit-loss aggregation.
 *
 * The engine holds references to its configuration and audit sink; both must
 * outlive it. Every audited operation appends exactly one record.
 */
class CreditRiskEngine {
public:
    CreditRiskEngine(const CreditConfig& config, const RoundingConfig& rounding, AuditSink& audit);

    // ------------------------------------------------------------------------
    // Estimators
    // ------------------------------------------------------------------------

    double scenario_multiplier(const MacroContext& macro, ScenarioKind scenario) const;

    // PD x multiplier, capped at 1
    double adjust_pd(double pd_historical, double multiplier) const;

    // Multiplicative macro factor applied to LGD
    double lgd_macro_factor(const MacroContext& macro) const;

    // Collateral-aware, macro-scaled LGD clamped to [0, 1]
    double adjust_lgd(const Exposure& exposure, double ead, const MacroContext& macro) const;

    // GCA + undrawn x CCF(facility)
    double exposure_at_default(double gross_carrying_amount, double undrawn_amount,
                               FacilityType facility) const;

    double downturn_lgd(double average_lgd, double lgd_std_dev, double confidence) const;

    BayesianPDEstimate estimate_pd_bayesian(uint64_t defaults, uint64_t observations,
                                            double prior_alpha = 1.0,
                                            double prior_beta = 1.0) const;

    // Inputs in percentage points (3.5 means 3.5%)
    double estimate_pd_logistic(double gdp_growth_pct, double inflation_pct) const;

    // Differences of a non-decreasing cumulative PD curve
    std::vector<double> marginal_pds(const std::vector<double>& cumulative) const;

    // ------------------------------------------------------------------------
    // Audited operations
    // ------------------------------------------------------------------------

    ECLResult classify_and_quantify_ecl(const Exposure& exposure, const MacroContext& macro,
                                        ScenarioKind scenario) const;

    // Measure at an explicitly supplied stage (overrides, what-if)
    ECLResult quantify_ecl(const Exposure& exposure, Stage stage, const MacroContext& macro,
                           ScenarioKind scenario) const;

    PortfolioECLResult quantify_portfolio(const std::vector<Exposure>& exposures,
                                          const MacroContext& macro,
                                          ScenarioKind scenario) const;

    ECLStressResult stress_test(double base_ecl, const MacroContext& macro) const;

    // Obligor PD/LGD/EAD come from the same estimators as the ECL path
    DefaultSimulationResult simulate_portfolio_defaults(
        const std::vector<Exposure>& exposures,
        const MacroContext& macro,
        ScenarioKind scenario,
        DefaultSimulationParams params) const;

private:
    const CreditConfig& config_;
    const RoundingConfig& rounding_;
    AuditSink& audit_;

    ECLResult compute_ecl(const Exposure& exposure, const StageAssessment& assessment,
                          const MacroContext& macro, ScenarioKind scenario) const;

    void record(const ExecutionContext& ctx, const AuditRecord& record) const;
};

} // namespace credit
} // namespace regcalc

#endif // REGCALC_CREDIT_CREDIT_RISK_ENGINE_HPP
