#ifndef REGCALC_MACRO_CONTEXT_HPP
#define REGCALC_MACRO_CONTEXT_HPP

#include <array>
#include <cstdint>
#include <map>
#include <string>

namespace regcalc {

// Calendar date without time zone (valuation dates, regulatory switch dates)
struct CalendarDate {
    int year;
    int month;
    int day;

    CalendarDate();
    CalendarDate(int y, int m, int d);

    // Parse "YYYY-MM-DD"; throws ValidationError on malformed input
    static CalendarDate parse(const std::string& iso);
    std::string to_string() const;

    bool operator<(const CalendarDate& other) const;
    bool operator==(const CalendarDate& other) const;
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
};

enum class ScenarioKind : uint8_t {
    Base = 0,
    Adverse = 1,
    Severe = 2,
    Weighted = 3     // Probability-weighted blend of the three
};

std::string to_string(ScenarioKind kind);
ScenarioKind parse_scenario_kind(const std::string& value);

// Macro scenario multipliers and their probability weights, indexed by
// Base/Adverse/Severe
struct MacroScenarios {
    std::array<double, 3> multipliers;
    std::array<double, 3> weights;

    MacroScenarios();
};

struct MacroContextParams {
    CalendarDate valuation_date;
    double base_rate;                       // Central bank base rate (fraction)
    double inflation_rate;                  // Annual CPI inflation (fraction)
    double gdp_growth;                      // Real GDP growth (fraction)
    std::map<std::string, double> fx_rates; // Currency code -> units of reporting currency
    double monthly_calculation_index;       // Statutory monthly index for guaranteed fund
    MacroScenarios scenarios;

    MacroContextParams();
};

// Immutable snapshot of macroeconomic inputs shared by all engines.
// Validated once on construction; never mutated afterwards.
class MacroContext {
public:
    static constexpr double WEIGHT_TOLERANCE = 1e-9;

    explicit MacroContext(const MacroContextParams& params);

    const CalendarDate& valuation_date() const { return params_.valuation_date; }
    double base_rate() const { return params_.base_rate; }
    double inflation_rate() const { return params_.inflation_rate; }
    double gdp_growth() const { return params_.gdp_growth; }
    double monthly_calculation_index() const { return params_.monthly_calculation_index; }
    const std::map<std::string, double>& fx_rates() const { return params_.fx_rates; }
    const MacroScenarios& scenarios() const { return params_.scenarios; }
    const MacroContextParams& params() const { return params_; }

    // Throws ValidationError if the currency is unknown
    double fx_rate(const std::string& currency) const;

    // Multiplier for a single scenario, or sum(weight_i * multiplier_i) for Weighted
    double multiplier(ScenarioKind kind) const;
    double weighted_multiplier() const;

private:
    const MacroContextParams params_;

    static const MacroContextParams& validate(const MacroContextParams& params);
};

} // namespace regcalc

#endif // REGCALC_MACRO_CONTEXT_HPP
