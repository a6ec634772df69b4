#ifndef REGCALC_SOLVENCY_GUARANTEE_FUND_HPP
#define REGCALC_SOLVENCY_GUARANTEE_FUND_HPP

#include "../audit_trail.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../logger.hpp"
#include "../numeric.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace regcalc {
namespace solvency {

enum class RiskClass : uint8_t {
    Low = 0,
    Medium = 1,
    High = 2
};

std::string to_string(RiskClass risk_class);
RiskClass parse_risk_class(const std::string& value);

enum class WarningLevel : uint8_t {
    Normal = 0,
    Elevated = 1,
    High = 2,
    Critical = 3
};

std::string to_string(WarningLevel level);

// Member insurer of the guarantee fund
struct InsurerProfile {
    std::string name;
    double gross_premiums;
    double reserves;
    std::optional<double> solvency_ratio;   // Risk class is scored only when present
    double loss_ratio;
    double combined_ratio;
    uint32_t years_in_market;
    std::optional<double> pd;               // Config default when absent
    std::optional<double> recovery;
    double premium_growth;                  // Year-on-year, as a fraction
    std::optional<RiskClass> risk_class;    // Overrides scoring

    InsurerProfile();

    void validate() const;
};

struct RiskClassAssessment {
    RiskClass risk_class;
    int score;

    RiskClassAssessment();
};

struct ContributionResult {
    std::string insurer;
    double premium_base;
    RiskClass risk_class;
    std::string class_basis;                // "assigned", "scored" or "default"
    int score;                              // 0 unless scored
    double rate;
    double contribution;

    ContributionResult();
};

struct BankruptcySimulationResult {
    size_t simulations;
    size_t insurers;
    double correlation;
    double expected_claims;
    double var_95;
    double var_99;
    double assumed_fund;                    // Share of member reserves
    double probability_of_shortfall;        // P(claims > assumed fund)
    double fund_adequacy;                   // Assumed fund / expected claims
    std::string input_digest;
    std::string result_digest;

    BankruptcySimulationResult();

    bool empty() const { return insurers == 0; }
};

struct FundAdequacyResult {
    double fund_balance;
    double expected_claims;
    double contributions_pipeline;
    double current_ratio;
    double projected_ratio;                 // Including the contributions pipeline
    double required_ratio;
    bool adequate;
    bool will_be_adequate;
    double shortfall;
    double surplus;

    FundAdequacyResult();
};

struct GuaranteeFundAssessment {
    std::vector<ContributionResult> contributions;
    double total_contributions;
    double fund_balance;
    BankruptcySimulationResult bankruptcy;
    FundAdequacyResult adequacy;
    std::string input_digest;
    std::string result_digest;

    GuaranteeFundAssessment();

    bool empty() const { return contributions.empty(); }
};

struct EarlyWarning {
    std::string insurer;
    int risk_score;
    WarningLevel level;
    std::vector<std::string> warnings;
    std::string recommended_action;
    double solvency_ratio;
    double loss_ratio;
    double combined_ratio;
    double premium_growth;

    EarlyWarning();
};

/**
 * Guarantee fund engine: member risk classes and contributions, a
 * correlated-bankruptcy simulation of fund claims, fund adequacy and
 * early-warning indicators.
 *
 * Member bankruptcies use the one-factor Gaussian copula of the credit
 * engine with EAD = reserves and LGD = 1 - recovery. An empty member list
 * gives an empty result and no audit record.
 */
class GuaranteeFundEngine {
public:
    GuaranteeFundEngine(const GuaranteeFundConfig& config, const RoundingConfig& rounding, AuditSink& audit);

    RiskClassAssessment determine_risk_class(double solvency_ratio, double loss_ratio,
                                             double combined_ratio, uint32_t years_in_market) const;

    double contribution_rate(RiskClass risk_class) const;

    ContributionResult calculate_contribution(const InsurerProfile& insurer) const;

    FundAdequacyResult assess_fund_adequacy(double fund_balance, double expected_claims,
                                            double contributions_pipeline = 0.0) const;

    EarlyWarning early_warning_indicators(const InsurerProfile& insurer) const;

    // ------------------------------------------------------------------------
    // Audited operations
    // ------------------------------------------------------------------------

    BankruptcySimulationResult simulate_bankruptcy(const std::vector<InsurerProfile>& insurers,
                                                   std::optional<size_t> num_simulations = std::nullopt,
                                                   std::optional<double> correlation = std::nullopt) const;

    GuaranteeFundAssessment assess(const std::vector<InsurerProfile>& insurers, double fund_balance) const;

private:
    const GuaranteeFundConfig& config_;
    const RoundingConfig& rounding_;
    AuditSink& audit_;

    BankruptcySimulationResult run_simulation(const std::vector<InsurerProfile>& insurers,
                                              size_t num_simulations, double correlation) const;

    void record(const ExecutionContext& ctx, const AuditRecord& record) const;
};

} // namespace solvency
} // namespace regcalc

#endif // REGCALC_SOLVENCY_GUARANTEE_FUND_HPP
