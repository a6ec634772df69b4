#include "risk_adjustment.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <random>

namespace regcalc {
namespace liability {

std::string to_string(RAMethod method) {
    switch (method) {
        case RAMethod::VaR: return "var";
        case RAMethod::TVaR: return "tvar";
        case RAMethod::CoC: return "coc";
        case RAMethod::CTE: return "cte";
    }
    return "var";
}

RAMethod parse_ra_method(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "var") return RAMethod::VaR;
    if (v == "tvar") return RAMethod::TVaR;
    if (v == "coc") return RAMethod::CoC;
    if (v == "cte") return RAMethod::CTE;
    throw ValidationError("ra_method", "unknown risk adjustment method '" + value + "'");
}

RASimulationParams::RASimulationParams()
    : num_simulations(1000), seed(42), single_period_volatility(0.10) {}

RAResult::RAResult()
    : method(RAMethod::VaR),
      confidence_level(0.0),
      ra(0.0),
      simulations(0),
      expected_value(0.0),
      tail_value(0.0),
      capital(0.0),
      pv_capital(0.0),
      coc_rate(0.0) {}

DiversifiedRA::DiversifiedRA()
    : undiversified(0.0), diversified(0.0), diversification_benefit(0.0) {}

// ============================================================================
// Monte-Carlo helpers
// ============================================================================

namespace {

void validate_simulation_inputs(const std::vector<double>& net_cash_flows, double confidence,
                                const RASimulationParams& params) {
    if (net_cash_flows.empty()) {
        throw ValidationError("net_cash_flows", "series is empty");
    }
    for (double cf : net_cash_flows) {
        if (!std::isfinite(cf)) {
            throw ValidationError("net_cash_flows", "must be finite");
        }
    }
    if (!(confidence > 0.0 && confidence < 1.0)) {
        throw ValidationError("confidence_level", "must be in (0, 1)");
    }
    if (params.num_simulations == 0) {
        throw ValidationError("num_simulations", "must be positive");
    }
}

// Simulated totals, sorted ascending
std::vector<double> simulate_totals(const std::vector<double>& net_cash_flows,
                                    const RASimulationParams& params) {
    const double mean_cf = calculate_mean(net_cash_flows);
    const double std_cf = net_cash_flows.size() > 1
        ? calculate_std_dev(net_cash_flows, mean_cf)
        : std::fabs(mean_cf) * params.single_period_volatility;

    std::vector<double> totals(params.num_simulations, mean_cf * static_cast<double>(net_cash_flows.size()));

    // Degenerate distribution: every draw equals the mean
    if (std_cf > 0.0) {
        std::mt19937_64 rng(params.seed);
        std::normal_distribution<double> dist(mean_cf, std_cf);
        for (size_t s = 0; s < params.num_simulations; ++s) {
            double total = 0.0;
            for (size_t t = 0; t < net_cash_flows.size(); ++t) {
                total += dist(rng);
            }
            totals[s] = total;
        }
    }

    std::sort(totals.begin(), totals.end());
    return totals;
}

RAResult finish(RAMethod method, double confidence, const std::vector<double>& totals,
                double expected, double statistic) {
    RAResult result;
    result.method = method;
    result.confidence_level = confidence;
    result.simulations = totals.size();
    result.expected_value = expected;
    result.tail_value = statistic;
    result.ra = std::max(0.0, statistic - expected);
    return result;
}

} // anonymous namespace

// ============================================================================
// Monte-Carlo methods
// ============================================================================

RAResult risk_adjustment_var(const std::vector<double>& net_cash_flows, double confidence,
                             const RASimulationParams& params) {
    validate_simulation_inputs(net_cash_flows, confidence, params);
    std::vector<double> totals = simulate_totals(net_cash_flows, params);
    double expected = calculate_mean(totals);
    double var = calculate_percentile(totals, confidence * 100.0);
    return finish(RAMethod::VaR, confidence, totals, expected, var);
}

RAResult risk_adjustment_tvar(const std::vector<double>& net_cash_flows, double confidence,
                              const RASimulationParams& params) {
    validate_simulation_inputs(net_cash_flows, confidence, params);
    std::vector<double> totals = simulate_totals(net_cash_flows, params);
    double expected = calculate_mean(totals);
    double var = calculate_percentile(totals, confidence * 100.0);
    double tvar = calculate_tail_mean(totals, var);
    return finish(RAMethod::TVaR, confidence, totals, expected, tvar);
}

RAResult risk_adjustment_cte(const std::vector<double>& net_cash_flows, double confidence,
                             const RASimulationParams& params) {
    validate_simulation_inputs(net_cash_flows, confidence, params);
    std::vector<double> totals = simulate_totals(net_cash_flows, params);
    double expected = calculate_mean(totals);

    // Tail starts at floor(alpha * N); the epsilon absorbs binary error in alpha
    const double n = static_cast<double>(totals.size());
    size_t tail_start = static_cast<size_t>(std::floor(confidence * n + 1e-9));
    double cte = totals.back();
    if (tail_start < totals.size()) {
        double sum = 0.0;
        for (size_t i = tail_start; i < totals.size(); ++i) {
            sum += totals[i];
        }
        cte = sum / static_cast<double>(totals.size() - tail_start);
    }
    return finish(RAMethod::CTE, confidence, totals, expected, cte);
}

RAResult risk_adjustment_coc(double capital, uint32_t term, double coc_rate,
                             double discount_rate, DiscountMethod method) {
    if (!std::isfinite(capital) || capital < 0.0) {
        throw ValidationError("capital", "must be non-negative");
    }
    if (term == 0) {
        throw ValidationError("term", "must be at least one period");
    }
    if (!std::isfinite(coc_rate) || coc_rate < 0.0) {
        throw ValidationError("coc_rate", "must be non-negative");
    }

    double pv_capital = 0.0;
    for (uint32_t t = 1; t <= term; ++t) {
        double capital_t = capital * (1.0 - static_cast<double>(t - 1) / static_cast<double>(term));
        pv_capital += capital_t * discount_factor(discount_rate, static_cast<double>(t), method);
    }

    RAResult result;
    result.method = RAMethod::CoC;
    result.confidence_level = 0.995;
    result.capital = capital;
    result.pv_capital = pv_capital;
    result.coc_rate = coc_rate;
    result.ra = coc_rate * pv_capital;
    return result;
}

// ============================================================================
// Diversification
// ============================================================================

DiversifiedRA diversify_risk_adjustment(const std::vector<RiskComponent>& components,
                                        const std::vector<std::vector<double>>& correlations) {
    const size_t n = components.size();
    if (correlations.size() != n) {
        throw ValidationError("correlations", "matrix size does not match component count");
    }
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(components[i].ra) || components[i].ra < 0.0) {
            throw ValidationError("ra[" + components[i].risk + "]", "must be non-negative");
        }
        if (correlations[i].size() != n) {
            throw ValidationError("correlations", "matrix is not square");
        }
        if (correlations[i][i] != 1.0) {
            throw ValidationError("correlations", "diagonal must be 1");
        }
        for (size_t j = 0; j < n; ++j) {
            double rho = correlations[i][j];
            if (!std::isfinite(rho) || rho < -1.0 || rho > 1.0) {
                throw ValidationError("correlations", "entries must be in [-1, 1]");
            }
            if (rho != correlations[j][i]) {
                throw ValidationError("correlations", "matrix is not symmetric");
            }
        }
    }

    DiversifiedRA result;
    result.components = components;
    result.correlations = correlations;

    double quadratic = 0.0;
    for (size_t i = 0; i < n; ++i) {
        result.undiversified += components[i].ra;
        for (size_t j = 0; j < n; ++j) {
            quadratic += correlations[i][j] * components[i].ra * components[j].ra;
        }
    }

    const double tolerance = 1e-12 * std::max(1.0, result.undiversified * result.undiversified);
    if (quadratic < -tolerance) {
        throw ComputationError("diversified RA quadratic form is negative; correlation matrix is inconsistent");
    }
    result.diversified = std::sqrt(std::max(0.0, quadratic));

    double benefit = result.undiversified - result.diversified;
    if (benefit < -1e-9 * std::max(1.0, result.undiversified)) {
        throw ComputationError("diversification benefit is negative; correlation inputs are inconsistent");
    }
    result.diversification_benefit = std::max(0.0, benefit);
    return result;
}

} // namespace liability
} // namespace regcalc
