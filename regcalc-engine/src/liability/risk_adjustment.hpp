#ifndef REGCALC_LIABILITY_RISK_ADJUSTMENT_HPP
#define REGCALC_LIABILITY_RISK_ADJUSTMENT_HPP

#include "../numeric.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace regcalc {
namespace liability {

enum class RAMethod : uint8_t {
    VaR = 0,     // Quantile of simulated total net cash flow
    TVaR = 1,    // Mean above the VaR quantile
    CoC = 2,     // Cost of capital on a run-off capital profile
    CTE = 3      // Discrete tail integral; equals TVaR when alpha*N is an integer
};

std::string to_string(RAMethod method);
RAMethod parse_ra_method(const std::string& value);

struct RASimulationParams {
    size_t num_simulations;
    uint64_t seed;
    double single_period_volatility;   // sigma = |mean| * this when only one period

    RASimulationParams();
};

struct RAResult {
    RAMethod method;
    double confidence_level;
    double ra;
    size_t simulations;          // 0 for CoC
    double expected_value;       // Mean simulated total (MC methods)
    double tail_value;           // VaR, TVaR or CTE statistic (MC methods)
    double capital;              // CoC only
    double pv_capital;           // CoC only
    double coc_rate;             // CoC only

    RAResult();
};

// Monte-Carlo methods. Each period's net cash flow is drawn from
// Normal(mean_cf, std_cf) where mean/std are taken across the series;
// the simulated total is the sum over periods. RA = max(0, statistic - mean).
// Throws ValidationError on an empty series or confidence outside (0, 1).
RAResult risk_adjustment_var(const std::vector<double>& net_cash_flows, double confidence,
                             const RASimulationParams& params);
RAResult risk_adjustment_tvar(const std::vector<double>& net_cash_flows, double confidence,
                              const RASimulationParams& params);
RAResult risk_adjustment_cte(const std::vector<double>& net_cash_flows, double confidence,
                             const RASimulationParams& params);

// RA = coc_rate x sum_t capital x (1 - (t-1)/term) x DF_t
RAResult risk_adjustment_coc(double capital, uint32_t term, double coc_rate,
                             double discount_rate, DiscountMethod method);

// Named risk component for diversification
struct RiskComponent {
    std::string risk;
    double ra;
};

struct DiversifiedRA {
    std::vector<RiskComponent> components;
    std::vector<std::vector<double>> correlations;
    double undiversified;        // Sum of component RAs
    double diversified;          // sqrt(sum_ij rho_ij RA_i RA_j)
    double diversification_benefit;

    DiversifiedRA();
};

// Throws ValidationError for a negative component, a matrix that is not
// square, symmetric and unit-diagonal with entries in [-1, 1], and
// ComputationError when the quadratic form or the benefit is negative.
DiversifiedRA diversify_risk_adjustment(const std::vector<RiskComponent>& components,
                                        const std::vector<std::vector<double>>& correlations);

} // namespace liability
} // namespace regcalc

#endif // REGCALC_LIABILITY_RISK_ADJUSTMENT_HPP
