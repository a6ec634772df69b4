#ifndef REGCALC_CREDIT_STAGING_HPP
#define REGCALC_CREDIT_STAGING_HPP

#include "exposure.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace regcalc {

struct StageThresholds;

namespace credit {

// Impairment stage. Ordered: a higher value is never less impaired.
enum class Stage : uint8_t {
    Stage1 = 1,    // 12-month ECL
    Stage2 = 2,    // Lifetime ECL, significant increase in credit risk
    Stage3 = 3     // Lifetime ECL, credit-impaired
};

int stage_number(Stage stage);

struct StagingInputs {
    uint32_t days_past_due;
    double pd_current;
    double pd_at_origination;
    QualitativeFlags flags;

    StagingInputs();
    explicit StagingInputs(const Exposure& exposure);
};

struct StageAssessment {
    Stage stage;
    std::vector<std::string> triggers;   // Every rule that fired, in evaluation order

    StageAssessment();
};

// Pure function of current facts; no stored history.
// Throws ValidationError if either PD is outside [0, 1].
StageAssessment determine_stage(const StagingInputs& inputs, const StageThresholds& thresholds);

} // namespace credit
} // namespace regcalc

#endif // REGCALC_CREDIT_STAGING_HPP
