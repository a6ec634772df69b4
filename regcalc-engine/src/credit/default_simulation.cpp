#include "default_simulation.hpp"
#include "../errors.hpp"
#include "../numeric.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

namespace regcalc {
namespace credit {

DefaultSimulationParams::DefaultSimulationParams()
    : num_simulations(1000), asset_correlation(0.30), seed(42), loss_threshold() {}

DefaultSimulationResult::DefaultSimulationResult()
    : simulations(0),
      obligors(0),
      total_exposure(0.0),
      expected_loss(0.0),
      loss_std_dev(0.0),
      var_95(0.0),
      var_99(0.0),
      expected_shortfall_99(0.0),
      mean_default_count(0.0),
      loss_threshold(0.0),
      probability_exceeding_threshold(0.0) {}

DefaultSimulationResult simulate_correlated_defaults(
    const std::vector<Obligor>& obligors,
    const DefaultSimulationParams& params)
{
    if (params.num_simulations == 0) {
        throw ValidationError("num_simulations", "must be positive");
    }
    if (!(params.asset_correlation >= 0.0 && params.asset_correlation < 1.0)) {
        throw ValidationError("asset_correlation", "must be in [0, 1)");
    }

    DefaultSimulationResult result;
    if (obligors.empty()) {
        return result;
    }

    // Default barriers in asset-return space
    std::vector<double> barriers;
    std::vector<double> loss_given_default;
    barriers.reserve(obligors.size());
    loss_given_default.reserve(obligors.size());
    for (const auto& o : obligors) {
        if (!std::isfinite(o.pd) || o.pd < 0.0 || o.pd > 1.0) {
            throw ValidationError("pd", "obligor " + o.id + " PD must be in [0, 1]");
        }
        if (!std::isfinite(o.lgd) || o.lgd < 0.0 || o.lgd > 1.0) {
            throw ValidationError("lgd", "obligor " + o.id + " LGD must be in [0, 1]");
        }
        if (!std::isfinite(o.ead) || o.ead < 0.0) {
            throw ValidationError("ead", "obligor " + o.id + " EAD must be non-negative");
        }
        if (o.pd <= 0.0) {
            barriers.push_back(-std::numeric_limits<double>::infinity());
        } else if (o.pd >= 1.0) {
            barriers.push_back(std::numeric_limits<double>::infinity());
        } else {
            barriers.push_back(normal_quantile(o.pd));
        }
        loss_given_default.push_back(o.ead * o.lgd);
        result.total_exposure += o.ead;
    }

    const double threshold = params.loss_threshold ? *params.loss_threshold : 0.10 * result.total_exposure;
    const double systematic_weight = std::sqrt(params.asset_correlation);
    const double idiosyncratic_weight = std::sqrt(1.0 - params.asset_correlation);

    std::mt19937_64 rng(params.seed);
    std::normal_distribution<double> normal(0.0, 1.0);

    std::vector<double> losses;
    losses.reserve(params.num_simulations);
    double total_defaults = 0.0;
    size_t exceedances = 0;

    for (size_t s = 0; s < params.num_simulations; ++s) {
        const double market = normal(rng);
        double loss = 0.0;
        for (size_t i = 0; i < barriers.size(); ++i) {
            const double asset = systematic_weight * market + idiosyncratic_weight * normal(rng);
            if (asset < barriers[i]) {
                loss += loss_given_default[i];
                total_defaults += 1.0;
            }
        }
        if (loss > threshold) {
            ++exceedances;
        }
        losses.push_back(loss);
    }

    const double n = static_cast<double>(params.num_simulations);
    result.simulations = params.num_simulations;
    result.obligors = obligors.size();
    result.expected_loss = calculate_mean(losses);
    result.loss_std_dev = calculate_std_dev(losses, result.expected_loss);
    std::sort(losses.begin(), losses.end());
    result.var_95 = calculate_percentile(losses, 95.0);
    result.var_99 = calculate_percentile(losses, 99.0);
    result.expected_shortfall_99 = calculate_tail_mean(losses, result.var_99);
    result.mean_default_count = total_defaults / n;
    result.loss_threshold = threshold;
    result.probability_exceeding_threshold = static_cast<double>(exceedances) / n;
    return result;
}

} // namespace credit
} // namespace regcalc
