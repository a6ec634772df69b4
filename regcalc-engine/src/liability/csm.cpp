#include "csm.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace regcalc {
namespace liability {

CSMResult::CSMResult() : csm(0.0), loss_component(0.0), onerous(false) {}

GMMRollForwardInputs::GMMRollForwardInputs()
    : opening_csm(0.0),
      new_business_csm(0.0),
      locked_in_rate(0.0),
      changes_future_service(0.0),
      currency_effect(0.0),
      coverage_units_current(0.0),
      coverage_units_remaining(0.0) {}

VFARollForwardInputs::VFARollForwardInputs()
    : opening_csm(0.0),
      new_business_csm(0.0),
      change_fv_underlying(0.0),
      changes_fcf_non_variable(0.0),
      currency_effect(0.0),
      coverage_units_current(0.0),
      coverage_units_remaining(0.0) {}

CSMRollForward::CSMRollForward()
    : model("GMM"),
      opening(0.0),
      new_business(0.0),
      interest_accretion(0.0),
      changes_future_service(0.0),
      change_fv_underlying(0.0),
      changes_fcf_non_variable(0.0),
      currency_effect(0.0),
      pre_release(0.0),
      release(0.0),
      closing(0.0) {}

CSMReleasePeriod::CSMReleasePeriod()
    : period(0), opening(0.0), interest_accretion(0.0), release(0.0), closing(0.0) {}

CoverageUnitInputs::CoverageUnitInputs()
    : sum_insured(1000000.0),
      mortality_rate(0.001),
      lapse_rate(0.05),
      expected_return(0.08),
      premium_pattern() {}

namespace {

void require_finite(double value, const std::string& field) {
    if (!std::isfinite(value)) {
        throw ValidationError(field, "must be finite");
    }
}

void require_non_negative(double value, const std::string& field) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ValidationError(field, "must be non-negative");
    }
}

void require_coverage_units(double current, double remaining) {
    require_non_negative(current, "coverage_units_current");
    require_non_negative(remaining, "coverage_units_remaining");
    if (current > remaining) {
        throw ValidationError("coverage_units_current", "cannot exceed remaining coverage units");
    }
}

void round_movements(CSMRollForward& rf, const RoundingConfig& rounding) {
    rf.opening = round_amount(rf.opening, rounding);
    rf.new_business = round_amount(rf.new_business, rounding);
    rf.interest_accretion = round_amount(rf.interest_accretion, rounding);
    rf.changes_future_service = round_amount(rf.changes_future_service, rounding);
    rf.change_fv_underlying = round_amount(rf.change_fv_underlying, rounding);
    rf.changes_fcf_non_variable = round_amount(rf.changes_fcf_non_variable, rounding);
    rf.currency_effect = round_amount(rf.currency_effect, rounding);
    rf.pre_release = round_amount(rf.pre_release, rounding);
    rf.release = round_amount(rf.release, rounding);
    rf.closing = round_amount(rf.closing, rounding);
}

} // anonymous namespace

// ============================================================================
// Initial recognition and release
// ============================================================================

CSMResult recognise_csm(double premiums, double acquisition_costs, double bel, double ra,
                        const RoundingConfig& rounding) {
    require_non_negative(premiums, "premiums");
    require_non_negative(acquisition_costs, "acquisition_costs");
    require_finite(bel, "bel");
    require_non_negative(ra, "ra");

    CSMResult result;
    // Branch on the rounded margin so representation error at break-even is not a loss
    const double margin = round_amount(premiums - acquisition_costs - bel - ra, rounding);
    if (margin < 0.0) {
        result.onerous = true;
        result.loss_component = -margin;
    } else if (margin > 0.0) {
        result.csm = margin;
    }
    return result;
}

double csm_release(double csm, double coverage_units_current, double coverage_units_remaining) {
    require_non_negative(csm, "csm");
    require_coverage_units(coverage_units_current, coverage_units_remaining);
    return csm * safe_divide(coverage_units_current, coverage_units_remaining);
}

// ============================================================================
// Roll-forward
// ============================================================================

CSMRollForward roll_forward_gmm(const GMMRollForwardInputs& inputs, const RoundingConfig& rounding) {
    require_non_negative(inputs.opening_csm, "opening_csm");
    require_non_negative(inputs.new_business_csm, "new_business_csm");
    require_finite(inputs.locked_in_rate, "locked_in_rate");
    require_finite(inputs.changes_future_service, "changes_future_service");
    require_finite(inputs.currency_effect, "currency_effect");
    require_coverage_units(inputs.coverage_units_current, inputs.coverage_units_remaining);

    CSMRollForward rf;
    rf.model = "GMM";
    rf.opening = inputs.opening_csm;
    rf.new_business = inputs.new_business_csm;
    rf.interest_accretion = inputs.opening_csm * inputs.locked_in_rate;
    rf.changes_future_service = inputs.changes_future_service;
    rf.currency_effect = inputs.currency_effect;
    rf.pre_release = std::max(0.0, rf.opening + rf.new_business + rf.interest_accretion +
                                   rf.changes_future_service + rf.currency_effect);
    rf.release = csm_release(rf.pre_release, inputs.coverage_units_current, inputs.coverage_units_remaining);
    rf.closing = std::max(0.0, rf.pre_release - rf.release);
    round_movements(rf, rounding);
    return rf;
}

CSMRollForward roll_forward_vfa(const VFARollForwardInputs& inputs, const RoundingConfig& rounding) {
    require_non_negative(inputs.opening_csm, "opening_csm");
    require_non_negative(inputs.new_business_csm, "new_business_csm");
    require_finite(inputs.change_fv_underlying, "change_fv_underlying");
    require_finite(inputs.changes_fcf_non_variable, "changes_fcf_non_variable");
    require_finite(inputs.currency_effect, "currency_effect");
    require_coverage_units(inputs.coverage_units_current, inputs.coverage_units_remaining);

    CSMRollForward rf;
    rf.model = "VFA";
    rf.opening = inputs.opening_csm;
    rf.new_business = inputs.new_business_csm;
    rf.change_fv_underlying = inputs.change_fv_underlying;
    rf.changes_fcf_non_variable = inputs.changes_fcf_non_variable;
    rf.currency_effect = inputs.currency_effect;
    rf.pre_release = std::max(0.0, rf.opening + rf.new_business + rf.change_fv_underlying +
                                   rf.changes_fcf_non_variable + rf.currency_effect);
    rf.release = csm_release(rf.pre_release, inputs.coverage_units_current, inputs.coverage_units_remaining);
    rf.closing = std::max(0.0, rf.pre_release - rf.release);
    round_movements(rf, rounding);
    return rf;
}

std::vector<CSMReleasePeriod> project_csm_release(double csm, const std::vector<double>& coverage_units,
                                                  double locked_in_rate, const RoundingConfig& rounding) {
    require_non_negative(csm, "csm");
    require_finite(locked_in_rate, "locked_in_rate");

    // Suffix sums give the remaining units at the start of each period
    std::vector<double> remaining(coverage_units.size() + 1, 0.0);
    for (size_t i = coverage_units.size(); i-- > 0;) {
        require_non_negative(coverage_units[i], "coverage_units[" + std::to_string(i) + "]");
        remaining[i] = remaining[i + 1] + coverage_units[i];
    }

    std::vector<CSMReleasePeriod> pattern;
    pattern.reserve(coverage_units.size());
    double balance = csm;
    for (size_t i = 0; i < coverage_units.size(); ++i) {
        CSMReleasePeriod p;
        p.period = static_cast<uint32_t>(i + 1);
        p.opening = balance;
        p.interest_accretion = balance * locked_in_rate;
        double pre_release = std::max(0.0, balance + p.interest_accretion);
        p.release = pre_release * safe_divide(coverage_units[i], remaining[i]);
        p.closing = std::max(0.0, pre_release - p.release);
        balance = p.closing;

        p.opening = round_amount(p.opening, rounding);
        p.interest_accretion = round_amount(p.interest_accretion, rounding);
        p.release = round_amount(p.release, rounding);
        p.closing = round_amount(p.closing, rounding);
        pattern.push_back(p);
    }
    return pattern;
}

// ============================================================================
// Coverage units
// ============================================================================

std::string to_string(CoverageUnitsMethod method) {
    switch (method) {
        case CoverageUnitsMethod::Quantity: return "quantity";
        case CoverageUnitsMethod::ExpectedPeriod: return "expected_period";
        case CoverageUnitsMethod::TimeWeighted: return "time_weighted";
        case CoverageUnitsMethod::PremiumPattern: return "premium_pattern";
    }
    return "quantity";
}

CoverageUnitsMethod parse_coverage_units_method(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "quantity") return CoverageUnitsMethod::Quantity;
    if (v == "expected_period") return CoverageUnitsMethod::ExpectedPeriod;
    if (v == "time_weighted") return CoverageUnitsMethod::TimeWeighted;
    if (v == "premium_pattern") return CoverageUnitsMethod::PremiumPattern;
    throw ValidationError("coverage_units_method", "unknown method '" + value + "'");
}

std::vector<double> coverage_units(CoverageUnitsMethod method, const CoverageUnitInputs& inputs,
                                   uint32_t periods) {
    std::vector<double> units;
    units.reserve(periods);

    switch (method) {
        case CoverageUnitsMethod::Quantity: {
            require_non_negative(inputs.sum_insured, "sum_insured");
            if (!(inputs.mortality_rate >= 0.0 && inputs.mortality_rate <= 1.0)) {
                throw ValidationError("mortality_rate", "must be in [0, 1]");
            }
            double survival = 1.0;
            for (uint32_t t = 1; t <= periods; ++t) {
                survival *= 1.0 - inputs.mortality_rate;
                units.push_back(inputs.sum_insured * survival);
            }
            break;
        }
        case CoverageUnitsMethod::ExpectedPeriod: {
            if (!(inputs.lapse_rate >= 0.0 && inputs.lapse_rate <= 1.0)) {
                throw ValidationError("lapse_rate", "must be in [0, 1]");
            }
            double in_force = 1.0;
            for (uint32_t t = 1; t <= periods; ++t) {
                units.push_back(in_force);
                in_force *= 1.0 - inputs.lapse_rate;
            }
            break;
        }
        case CoverageUnitsMethod::TimeWeighted: {
            require_non_negative(inputs.sum_insured, "sum_insured");
            if (!std::isfinite(inputs.expected_return) || inputs.expected_return <= -1.0) {
                throw ValidationError("expected_return", "must be finite and above -100%");
            }
            double account_value = inputs.sum_insured;
            for (uint32_t t = 1; t <= periods; ++t) {
                units.push_back(account_value);
                account_value *= 1.0 + inputs.expected_return;
            }
            break;
        }
        case CoverageUnitsMethod::PremiumPattern: {
            for (uint32_t t = 0; t < periods; ++t) {
                if (inputs.premium_pattern.empty()) {
                    units.push_back(1.0);
                } else if (t < inputs.premium_pattern.size()) {
                    require_non_negative(inputs.premium_pattern[t], "premium_pattern");
                    units.push_back(inputs.premium_pattern[t]);
                } else {
                    units.push_back(0.0);
                }
            }
            break;
        }
    }
    return units;
}

} // namespace liability
} // namespace regcalc
