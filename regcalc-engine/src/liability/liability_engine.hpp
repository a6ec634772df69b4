#ifndef REGCALC_LIABILITY_LIABILITY_ENGINE_HPP
#define REGCALC_LIABILITY_LIABILITY_ENGINE_HPP

#include "../audit_trail.hpp"
#include "../config.hpp"
#include "../discount_curve.hpp"
#include "../errors.hpp"
#include "../logger.hpp"
#include "../macro_context.hpp"
#include "../numeric.hpp"
#include "cash_flow_schedule.hpp"
#include "csm.hpp"
#include "risk_adjustment.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace regcalc {
namespace liability {

enum class MeasurementModel : uint8_t {
    GMM = 0,    // General measurement model
    VFA = 1,    // Variable fee approach
    PAA = 2     // Premium allocation approach
};

std::string to_string(MeasurementModel model);
MeasurementModel parse_measurement_model(const std::string& value);

// Direct-participation features tested for VFA eligibility
struct VFAFeatures {
    bool substantial_share_fair_value;   // Substantial share of fair-value returns on underlying items
    bool variable_payout_portion;        // Substantial portion of payouts varies with underlying items
    bool investment_service;             // Investment-related service is provided

    VFAFeatures();
    VFAFeatures(bool share, bool payout, bool service);
};

struct VFAEligibility {
    bool eligible;                       // All three criteria hold
    bool substantial_share_fair_value;
    bool variable_payout_portion;
    bool investment_service;
    std::vector<std::string> failed_criteria;

    VFAEligibility();
};

struct DiscountRateResolution {
    uint32_t term;
    double base_rate;
    double illiquidity_factor;
    double illiquidity_premium;          // premium x factor
    double rate;                         // base + illiquidity_premium

    DiscountRateResolution();
};

struct BELResult {
    DiscountRateResolution discount;
    DiscountMethod method;
    double lapse_rate;
    std::vector<double> net_cash_flows;
    std::vector<double> survival_factors;
    std::vector<double> discount_factors;
    std::vector<double> discounted_cash_flows;
    double bel;                          // Signed; negative is a net asset

    BELResult();
};

struct PAAResult {
    uint32_t coverage_periods;
    double premiums;
    double acquisition_costs;
    double dac;                          // Deferred when coverage exceeds one period
    double acquisition_expensed;         // Expensed immediately otherwise
    double ra;
    double lrc;                          // premiums - DAC - RA
    std::vector<double> dac_amortisation;

    PAAResult();
};

struct LiabilityMeasurement {
    std::string group_id;
    MeasurementModel requested_model;
    MeasurementModel model;              // After VFA eligibility fallback
    double premiums;
    double acquisition_costs;
    BELResult bel;
    RAResult ra;
    CSMResult csm;
    std::optional<PAAResult> paa;
    double fulfilment_cash_flows;        // BEL + RA
    double total_liability;
    std::string input_digest;
    std::string result_digest;

    LiabilityMeasurement();
};

// One contract group in a portfolio run
struct ContractGroup {
    std::string group_id;
    CashFlowSchedule schedule;
    double acquisition_costs;
    RAMethod ra_method;
    MeasurementModel model;
    std::optional<VFAFeatures> vfa_features;

    ContractGroup();
};

struct LiabilityPortfolioResult {
    double total_bel;
    double total_ra;
    double total_csm;
    double total_loss_component;
    double total_liability;
    std::vector<std::string> onerous_groups;
    std::vector<LiabilityMeasurement> results;      // Input order, failed items omitted
    std::vector<ItemFailure> failures;
    double execution_time_ms;
    std::string input_digest;
    std::string result_digest;

    LiabilityPortfolioResult();

    bool empty() const { return results.empty() && failures.empty(); }
};

struct LICInputs {
    double reported_claims;
    double ibnr;
    double ibner;
    double ulae;
    double alae;

    LICInputs();
};

// Liability for incurred claims
struct LICResult {
    double base;                         // reported + IBNR + IBNER + ULAE + ALAE
    double ra;
    double confidence_level;
    double discount_factor;              // 1 when undiscounted
    double lic;
    std::string input_digest;
    std::string result_digest;

    LICResult();
};

struct InsuranceFinanceInputs {
    double opening_liability;
    double closing_liability;
    double opening_rate;
    double closing_rate;
    bool oci_option;                     // Disaggregate rate effects to OCI

    InsuranceFinanceInputs();
};

struct InsuranceFinanceResult {
    double interest_accretion;
    double rate_change_effect;
    double assumption_change_effect;     // Residual
    double total;
    double pnl;
    double oci;
    bool oci_option;
    std::string input_digest;
    std::string result_digest;

    InsuranceFinanceResult();
};

enum class ContractType : uint8_t {
    Direct = 0,
    ReinsuranceHeld = 1,
    ReinsuranceIssued = 2
};

std::string to_string(ContractType type);
ContractType parse_contract_type(const std::string& value);

struct LiabilityComponents {
    double bel;
    double ra;
    double csm;
    double total_liability;

    LiabilityComponents();
};

struct NetGrossSplit {
    ContractType type;
    double relief_rate;
    LiabilityComponents gross;
    LiabilityComponents relief;
    LiabilityComponents net;

    NetGrossSplit();
};

enum class ProfitabilityGroup : uint8_t {
    Onerous = 0,
    NoSignificantRisk = 1,   // No significant possibility of becoming onerous
    Remaining = 2
};

std::string to_string(ProfitabilityGroup group);

/**
 * Insurance liability engine: discount-rate resolution, BEL, risk
 * adjustment, CSM and measurement-model dispatch.
 *
 * The engine holds references to its configuration, audit sink and (when
 * given) discount-curve resolver; all must outlive it. Without a resolver the
 * base rate is the macro context's base rate.
 */
class LiabilityEngine {
public:
    LiabilityEngine(const LiabilityConfig& config, const RoundingConfig& rounding, AuditSink& audit,
                    const DiscountCurveResolver* curve = nullptr);

    DiscountRateResolution resolve_discount_rate(uint32_t term, const MacroContext& macro) const;

    BELResult calculate_bel(const CashFlowSchedule& schedule, const MacroContext& macro) const;

    RAResult calculate_risk_adjustment(const CashFlowSchedule& schedule, RAMethod method,
                                       const BELResult& bel) const;

    // Correlations come from the configured risk-pair table
    DiversifiedRA diversify(const std::vector<RiskComponent>& components) const;

    VFAEligibility check_vfa_eligibility(const VFAFeatures& features) const;

    // VFA falls back to GMM (with a logged warning) when ineligible or
    // when no features are supplied
    MeasurementModel resolve_measurement_model(MeasurementModel requested,
                                               const std::optional<VFAFeatures>& features) const;

    PAAResult measure_paa(double premiums, double acquisition_costs, double ra,
                          uint32_t coverage_periods) const;

    // ------------------------------------------------------------------------
    // Audited operations
    // ------------------------------------------------------------------------

    LiabilityMeasurement measure_liability(const CashFlowSchedule& schedule,
                                           double acquisition_costs,
                                           RAMethod ra_method,
                                           MeasurementModel model,
                                           const MacroContext& macro,
                                           const std::optional<VFAFeatures>& vfa_features = std::nullopt) const;

    LiabilityPortfolioResult measure_portfolio(const std::vector<ContractGroup>& groups,
                                               const MacroContext& macro) const;

    CSMRollForward roll_forward_gmm(const GMMRollForwardInputs& inputs) const;
    CSMRollForward roll_forward_vfa(const VFARollForwardInputs& inputs) const;

    LICResult measure_incurred_claims(const LICInputs& inputs, double confidence,
                                      std::optional<double> discount_rate = std::nullopt) const;

    InsuranceFinanceResult insurance_finance(const InsuranceFinanceInputs& inputs) const;

    // ------------------------------------------------------------------------
    // Presentation helpers
    // ------------------------------------------------------------------------

    NetGrossSplit split_net_gross(const LiabilityMeasurement& measurement, ContractType type) const;

    ProfitabilityGroup classify_profitability(double expected_profit, double premium) const;

    std::vector<CSMReleasePeriod> project_csm_release(double csm, const std::vector<double>& coverage_units,
                                                      double locked_in_rate) const;

private:
    const LiabilityConfig& config_;
    const RoundingConfig& rounding_;
    AuditSink& audit_;
    const DiscountCurveResolver* curve_;

    LiabilityMeasurement compute_measurement(const std::string& group_id,
                                             const CashFlowSchedule& schedule,
                                             double acquisition_costs,
                                             RAMethod ra_method,
                                             MeasurementModel model,
                                             const MacroContext& macro,
                                             const std::optional<VFAFeatures>& vfa_features) const;

    void record(const ExecutionContext& ctx, const AuditRecord& record) const;
};

} // namespace liability
} // namespace regcalc

#endif // REGCALC_LIABILITY_LIABILITY_ENGINE_HPP
