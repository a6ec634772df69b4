#ifndef REGCALC_CREDIT_DEFAULT_SIMULATION_HPP
#define REGCALC_CREDIT_DEFAULT_SIMULATION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace regcalc {
namespace credit {

// Single obligor as seen by the portfolio loss simulation
struct Obligor {
    std::string id;
    double pd;
    double ead;
    double lgd;
};

struct DefaultSimulationParams {
    size_t num_simulations;
    double asset_correlation;                // Equicorrelation rho in [0, 1)
    uint64_t seed;
    std::optional<double> loss_threshold;    // Defaults to 10% of total EAD

    DefaultSimulationParams();
};

struct DefaultSimulationResult {
    size_t simulations;
    size_t obligors;
    double total_exposure;
    double expected_loss;
    double loss_std_dev;
    double var_95;
    double var_99;
    double expected_shortfall_99;
    double mean_default_count;
    double loss_threshold;
    double probability_exceeding_threshold;

    DefaultSimulationResult();

    bool empty() const { return obligors == 0; }
};

// One-factor Gaussian copula: obligor i defaults in a draw when
// Phi(sqrt(rho) * M + sqrt(1 - rho) * e_i) < PD_i, losing EAD_i * LGD_i.
// The pairwise asset correlation is rho for every pair.
// An empty obligor list yields an empty result.
DefaultSimulationResult simulate_correlated_defaults(
    const std::vector<Obligor>& obligors,
    const DefaultSimulationParams& params
);

} // namespace credit
} // namespace regcalc

#endif // REGCALC_CREDIT_DEFAULT_SIMULATION_HPP
