#include "numeric.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <numeric>
#include <sstream>
#include <boost/math/distributions/beta.hpp>
#include <boost/math/distributions/normal.hpp>

namespace regcalc {

// ============================================================================
// RoundingConfig Implementation
// ============================================================================

RoundingConfig::RoundingConfig()
    : currency_decimals(3), ratio_decimals(6), digest_decimals(9) {}

std::string to_string(DiscountMethod method) {
    switch (method) {
        case DiscountMethod::Discrete: return "discrete";
        case DiscountMethod::Continuous: return "continuous";
    }
    return "unknown";
}

DiscountMethod parse_discount_method(const std::string& value) {
    if (value == "discrete") return DiscountMethod::Discrete;
    if (value == "continuous") return DiscountMethod::Continuous;
    throw ValidationError("discount_method", "unknown method '" + value + "'");
}

// ============================================================================
// Rounding
// ============================================================================

double round_to_precision(double value, int decimals) {
    if (!std::isfinite(value)) {
        throw ComputationError("Cannot round non-finite value");
    }
    if (decimals < 0 || decimals > 12) {
        throw ValidationError("decimals", "must be between 0 and 12");
    }

    const double factor = std::pow(10.0, decimals);
    const double scaled = std::fabs(value) * factor;
    double whole = std::floor(scaled);
    const double frac = scaled - whole;

    // A few ulps of slack so that 2.0005 * 1000 = 2000.4999999999998 counts as a tie
    const double ulp = std::nextafter(scaled, std::numeric_limits<double>::infinity()) - scaled;
    if (frac + 8.0 * ulp >= 0.5) {
        whole += 1.0;
    }

    if (whole == 0.0) {
        return 0.0;
    }
    return std::copysign(whole / factor, value);
}

double round_amount(double value, const RoundingConfig& rounding) {
    return round_to_precision(value, rounding.currency_decimals);
}

double round_ratio(double value, const RoundingConfig& rounding) {
    return round_to_precision(value, rounding.ratio_decimals);
}

int64_t to_fixed_units(double value, int decimals) {
    double rounded = round_to_precision(value, decimals);
    return static_cast<int64_t>(std::llround(rounded * std::pow(10.0, decimals)));
}

std::string format_fixed(double value, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << round_to_precision(value, decimals);
    return oss.str();
}

// ============================================================================
// Discounting
// ============================================================================

double discount_factor(double rate, double t, DiscountMethod method) {
    if (t < 0.0) {
        throw ValidationError("t", "discount time must be non-negative");
    }
    switch (method) {
        case DiscountMethod::Discrete:
            if (rate <= -1.0) {
                throw ValidationError("rate", "discrete rate must exceed -100%");
            }
            return 1.0 / std::pow(1.0 + rate, t);
        case DiscountMethod::Continuous:
            return std::exp(-rate * t);
    }
    throw ValidationError("method", "unknown discount method");
}

double to_continuous_rate(double discrete_rate) {
    if (discrete_rate <= -1.0) {
        throw ValidationError("rate", "discrete rate must exceed -100%");
    }
    return std::log1p(discrete_rate);
}

double to_discrete_rate(double continuous_rate) {
    return std::expm1(continuous_rate);
}

double safe_divide(double numerator, double denominator, double fallback) {
    if (denominator == 0.0 || !std::isfinite(denominator)) {
        return fallback;
    }
    return numerator / denominator;
}

// ============================================================================
// Sample statistics
// ============================================================================

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double calculate_std_dev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq_diff = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq_diff += diff * diff;
    }
    return std::sqrt(sum_sq_diff / static_cast<double>(values.size()));
}

double calculate_percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (std::clamp(p, 0.0, 100.0) / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[lower_idx];
    }

    double frac = pos - static_cast<double>(lower_idx);
    return sorted_values[lower_idx] * (1.0 - frac) + sorted_values[upper_idx] * frac;
}

double calculate_tail_mean(const std::vector<double>& sorted_values, double threshold) {
    auto first = std::upper_bound(sorted_values.begin(), sorted_values.end(), threshold);
    if (first == sorted_values.end()) {
        return threshold;
    }
    double sum = std::accumulate(first, sorted_values.end(), 0.0);
    return sum / static_cast<double>(std::distance(first, sorted_values.end()));
}

// ============================================================================
// Distributions
// ============================================================================

double normal_quantile(double p) {
    if (!(p > 0.0 && p < 1.0)) {
        throw ValidationError("confidence", "probability must be in (0, 1)");
    }
    return boost::math::quantile(boost::math::normal(), p);
}

double normal_cdf(double x) {
    return boost::math::cdf(boost::math::normal(), x);
}

double beta_quantile(double alpha, double beta, double p) {
    if (alpha <= 0.0 || beta <= 0.0) {
        throw ValidationError("beta_parameters", "alpha and beta must be positive");
    }
    if (!(p >= 0.0 && p <= 1.0)) {
        throw ValidationError("probability", "must be in [0, 1]");
    }
    return boost::math::quantile(boost::math::beta_distribution<double>(alpha, beta), p);
}

} // namespace regcalc
