#include "staging.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include <cmath>

namespace regcalc {
namespace credit {

int stage_number(Stage stage) {
    return static_cast<int>(stage);
}

StagingInputs::StagingInputs()
    : days_past_due(0), pd_current(0.0), pd_at_origination(0.0), flags() {}

StagingInputs::StagingInputs(const Exposure& exposure)
    : days_past_due(exposure.days_past_due),
      pd_current(exposure.pd_annual),
      pd_at_origination(exposure.pd_at_origination),
      flags(exposure.flags) {}

StageAssessment::StageAssessment() : stage(Stage::Stage1), triggers() {}

StageAssessment determine_stage(const StagingInputs& inputs, const StageThresholds& thresholds) {
    if (!std::isfinite(inputs.pd_current) || inputs.pd_current < 0.0 || inputs.pd_current > 1.0) {
        throw ValidationError("pd_current", "must be in [0, 1]");
    }
    if (!std::isfinite(inputs.pd_at_origination) || inputs.pd_at_origination < 0.0 ||
        inputs.pd_at_origination > 1.0) {
        throw ValidationError("pd_at_origination", "must be in [0, 1]");
    }

    StageAssessment result;

    // Credit-impaired
    if (inputs.days_past_due > thresholds.stage3_days_past_due) {
        result.triggers.push_back("days_past_due>" + std::to_string(thresholds.stage3_days_past_due));
    }
    if (inputs.flags.default_event) {
        result.triggers.push_back("default_event");
    }
    if (!result.triggers.empty()) {
        result.stage = Stage::Stage3;
        return result;
    }

    // Significant increase in credit risk
    if (inputs.days_past_due > thresholds.stage2_days_past_due) {
        result.triggers.push_back("days_past_due>" + std::to_string(thresholds.stage2_days_past_due));
    }
    if (inputs.pd_at_origination > 0.0 &&
        inputs.pd_current / inputs.pd_at_origination > thresholds.pd_relative_increase) {
        result.triggers.push_back("pd_relative_increase");
    }
    if (inputs.pd_current - inputs.pd_at_origination > thresholds.pd_absolute_increase) {
        result.triggers.push_back("pd_absolute_increase");
    }
    if (inputs.flags.restructuring) {
        result.triggers.push_back("restructuring");
    }
    if (inputs.flags.watchlist) {
        result.triggers.push_back("watchlist");
    }
    if (inputs.flags.covenant_breach) {
        result.triggers.push_back("covenant_breach");
    }

    result.stage = result.triggers.empty() ? Stage::Stage1 : Stage::Stage2;
    return result;
}

} // namespace credit
} // namespace regcalc
