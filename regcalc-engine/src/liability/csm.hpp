#ifndef REGCALC_LIABILITY_CSM_HPP
#define REGCALC_LIABILITY_CSM_HPP

#include "../numeric.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace regcalc {
namespace liability {

// Contractual service margin at initial recognition.
// At most one of csm / loss_component is positive.
struct CSMResult {
    double csm;
    double loss_component;
    bool onerous;

    CSMResult();
};

// CSM = premiums - acquisition_costs - BEL - RA; a negative result is
// recognised as a loss component and the CSM is set to zero.
CSMResult recognise_csm(double premiums, double acquisition_costs, double bel, double ra,
                        const RoundingConfig& rounding);

// Release = csm x current / remaining; zero when remaining is zero.
// Throws ValidationError unless 0 <= current <= remaining.
double csm_release(double csm, double coverage_units_current, double coverage_units_remaining);

struct GMMRollForwardInputs {
    double opening_csm;
    double new_business_csm;
    double locked_in_rate;               // Interest accretion rate
    double changes_future_service;
    double currency_effect;
    double coverage_units_current;
    double coverage_units_remaining;

    GMMRollForwardInputs();
};

struct VFARollForwardInputs {
    double opening_csm;
    double new_business_csm;
    double change_fv_underlying;         // Entity share of the fair-value change
    double changes_fcf_non_variable;
    double currency_effect;
    double coverage_units_current;
    double coverage_units_remaining;

    VFARollForwardInputs();
};

// Every movement line of one period's CSM roll-forward.
// The release is taken from the pre-release balance; closing is floored at zero.
struct CSMRollForward {
    std::string model;                   // "GMM" or "VFA"
    double opening;
    double new_business;
    double interest_accretion;           // GMM
    double changes_future_service;       // GMM
    double change_fv_underlying;         // VFA
    double changes_fcf_non_variable;     // VFA
    double currency_effect;
    double pre_release;
    double release;
    double closing;
    std::string input_digest;
    std::string result_digest;

    CSMRollForward();
};

CSMRollForward roll_forward_gmm(const GMMRollForwardInputs& inputs, const RoundingConfig& rounding);
CSMRollForward roll_forward_vfa(const VFARollForwardInputs& inputs, const RoundingConfig& rounding);

struct CSMReleasePeriod {
    uint32_t period;
    double opening;
    double interest_accretion;
    double release;
    double closing;

    CSMReleasePeriod();
};

// Accrete at the locked-in rate, then release csm x CU_t / sum_{k>=t} CU_k
// each period. Throws ValidationError on negative CSM or coverage units.
std::vector<CSMReleasePeriod> project_csm_release(double csm, const std::vector<double>& coverage_units,
                                                  double locked_in_rate, const RoundingConfig& rounding);

// ============================================================================
// Coverage units
// ============================================================================

enum class CoverageUnitsMethod : uint8_t {
    Quantity = 0,          // Sum insured x cumulative survival
    ExpectedPeriod = 1,    // Probability in force after lapse
    TimeWeighted = 2,      // Account value growing at the expected return
    PremiumPattern = 3     // Premium per period (uniform when none given)
};

std::string to_string(CoverageUnitsMethod method);
CoverageUnitsMethod parse_coverage_units_method(const std::string& value);

struct CoverageUnitInputs {
    double sum_insured;
    double mortality_rate;
    double lapse_rate;
    double expected_return;
    std::vector<double> premium_pattern;

    CoverageUnitInputs();
};

std::vector<double> coverage_units(CoverageUnitsMethod method, const CoverageUnitInputs& inputs,
                                   uint32_t periods);

} // namespace liability
} // namespace regcalc

#endif // REGCALC_LIABILITY_CSM_HPP
