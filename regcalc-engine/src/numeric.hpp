#ifndef REGCALC_NUMERIC_HPP
#define REGCALC_NUMERIC_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace regcalc {

// Rounding precision shared by all three engines
struct RoundingConfig {
    int currency_decimals;   // Currency amounts (default 3)
    int ratio_decimals;      // Ratios and percentages (default 6)
    int digest_decimals;     // Fixed-point numbers in audit digests (default 9)

    RoundingConfig();
};

enum class DiscountMethod : uint8_t {
    Discrete = 0,    // 1 / (1 + r)^t
    Continuous = 1   // exp(-r * t)
};

std::string to_string(DiscountMethod method);
DiscountMethod parse_discount_method(const std::string& value);

// ============================================================================
// Rounding
// ============================================================================

// Round half away from zero to the given number of decimals.
// Decimal ties that are not exactly representable in binary (2.0005) still
// round away from zero. Throws ComputationError on NaN/Inf.
double round_to_precision(double value, int decimals);

double round_amount(double value, const RoundingConfig& rounding);
double round_ratio(double value, const RoundingConfig& rounding);

// Canonical fixed-point forms used for digests
int64_t to_fixed_units(double value, int decimals);
std::string format_fixed(double value, int decimals);

// ============================================================================
// Discounting
// ============================================================================

double discount_factor(double rate, double t, DiscountMethod method);

// Equivalent-rate conversions: discrete r <-> continuous ln(1 + r)
double to_continuous_rate(double discrete_rate);
double to_discrete_rate(double continuous_rate);

// Returns fallback when the denominator is zero or not finite
double safe_divide(double numerator, double denominator, double fallback = 0.0);

// ============================================================================
// Sample statistics
// ============================================================================

double calculate_mean(const std::vector<double>& values);

// Population standard deviation
double calculate_std_dev(const std::vector<double>& values, double mean);

// Linear-interpolated percentile, p in [0, 100]; values sorted ascending
double calculate_percentile(const std::vector<double>& sorted_values, double p);

// Mean of sorted values strictly above threshold; threshold itself if none
double calculate_tail_mean(const std::vector<double>& sorted_values, double threshold);

// ============================================================================
// Distributions (Boost.Math)
// ============================================================================

double normal_quantile(double p);
double normal_cdf(double x);
double beta_quantile(double alpha, double beta, double p);

} // namespace regcalc

#endif // REGCALC_NUMERIC_HPP
