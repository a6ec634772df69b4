#include "macro_context.hpp"
#include "errors.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace regcalc {

// ============================================================================
// CalendarDate Implementation
// ============================================================================

CalendarDate::CalendarDate() : year(2025), month(1), day(1) {}

CalendarDate::CalendarDate(int y, int m, int d) : year(y), month(m), day(d) {}

CalendarDate CalendarDate::parse(const std::string& iso) {
    int y = 0, m = 0, d = 0;
    char sep1 = 0, sep2 = 0;
    std::istringstream iss(iso);
    iss >> y >> sep1 >> m >> sep2 >> d;
    if (!iss || sep1 != '-' || sep2 != '-' || m < 1 || m > 12 || d < 1 || d > 31) {
        throw ValidationError("date", "expected YYYY-MM-DD, got '" + iso + "'");
    }
    return CalendarDate(y, m, d);
}

std::string CalendarDate::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << '-'
        << std::setw(2) << month << '-' << std::setw(2) << day;
    return oss.str();
}

bool CalendarDate::operator<(const CalendarDate& other) const {
    if (year != other.year) return year < other.year;
    if (month != other.month) return month < other.month;
    return day < other.day;
}

bool CalendarDate::operator==(const CalendarDate& other) const {
    return year == other.year && month == other.month && day == other.day;
}

std::string to_string(ScenarioKind kind) {
    switch (kind) {
        case ScenarioKind::Base: return "base";
        case ScenarioKind::Adverse: return "adverse";
        case ScenarioKind::Severe: return "severe";
        case ScenarioKind::Weighted: return "weighted";
    }
    return "unknown";
}

ScenarioKind parse_scenario_kind(const std::string& value) {
    if (value == "base") return ScenarioKind::Base;
    if (value == "adverse") return ScenarioKind::Adverse;
    if (value == "severe") return ScenarioKind::Severe;
    if (value == "weighted") return ScenarioKind::Weighted;
    throw ValidationError("scenario", "unknown scenario '" + value + "'");
}

// ============================================================================
// MacroScenarios / MacroContextParams Implementation
// ============================================================================

MacroScenarios::MacroScenarios()
    : multipliers{1.35, 1.80, 2.40},
      weights{0.55, 0.35, 0.10} {}

MacroContextParams::MacroContextParams()
    : valuation_date(),
      base_rate(0.10),
      inflation_rate(0.05),
      gdp_growth(0.03),
      fx_rates(),
      monthly_calculation_index(3932.0),
      scenarios() {}

// ============================================================================
// MacroContext Implementation
// ============================================================================

MacroContext::MacroContext(const MacroContextParams& params)
    : params_(validate(params)) {}

const MacroContextParams& MacroContext::validate(const MacroContextParams& params) {
    if (!std::isfinite(params.base_rate) || params.base_rate <= -1.0) {
        throw ValidationError("base_rate", "must be finite and above -100%");
    }
    if (!std::isfinite(params.inflation_rate)) {
        throw ValidationError("inflation_rate", "must be finite");
    }
    if (!std::isfinite(params.gdp_growth)) {
        throw ValidationError("gdp_growth", "must be finite");
    }
    if (!(params.monthly_calculation_index > 0.0)) {
        throw ValidationError("monthly_calculation_index", "must be positive");
    }
    for (const auto& [currency, rate] : params.fx_rates) {
        if (!std::isfinite(rate) || rate <= 0.0) {
            throw ValidationError("fx_rates." + currency, "must be positive");
        }
    }

    double weight_sum = 0.0;
    for (size_t i = 0; i < params.scenarios.weights.size(); ++i) {
        const double w = params.scenarios.weights[i];
        const double m = params.scenarios.multipliers[i];
        const std::string name = to_string(static_cast<ScenarioKind>(i));
        if (!std::isfinite(w) || w < 0.0) {
            throw ValidationError("scenarios." + name + ".weight", "must be non-negative");
        }
        if (!std::isfinite(m) || m <= 0.0) {
            throw ValidationError("scenarios." + name + ".multiplier", "must be positive");
        }
        weight_sum += w;
    }
    if (std::fabs(weight_sum - 1.0) > WEIGHT_TOLERANCE) {
        throw ValidationError("scenarios.weights", "must sum to 1");
    }
    return params;
}

double MacroContext::fx_rate(const std::string& currency) const {
    auto it = params_.fx_rates.find(currency);
    if (it == params_.fx_rates.end()) {
        throw ValidationError("fx_rates", "no rate for currency '" + currency + "'");
    }
    return it->second;
}

double MacroContext::multiplier(ScenarioKind kind) const {
    switch (kind) {
        case ScenarioKind::Base:
        case ScenarioKind::Adverse:
        case ScenarioKind::Severe:
            return params_.scenarios.multipliers[static_cast<size_t>(kind)];
        case ScenarioKind::Weighted:
            return weighted_multiplier();
    }
    throw ValidationError("scenario", "unknown scenario kind");
}

double MacroContext::weighted_multiplier() const {
    double total = 0.0;
    for (size_t i = 0; i < params_.scenarios.weights.size(); ++i) {
        total += params_.scenarios.weights[i] * params_.scenarios.multipliers[i];
    }
    return total;
}

} // namespace regcalc
