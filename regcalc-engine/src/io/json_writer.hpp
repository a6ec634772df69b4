#ifndef REGCALC_IO_JSON_WRITER_HPP
#define REGCALC_IO_JSON_WRITER_HPP

#include "../audit_trail.hpp"
#include "../credit/credit_risk_engine.hpp"
#include "../liability/liability_engine.hpp"
#include "../solvency/guarantee_fund.hpp"
#include "../solvency/solvency_engine.hpp"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace regcalc {
namespace io {

// One CLI run; sections are present only for the engines that ran
struct RegcalcReport {
    std::optional<credit::PortfolioECLResult> credit;
    std::optional<credit::ECLStressResult> credit_stress;
    std::optional<liability::LiabilityMeasurement> liability;
    std::optional<solvency::SolvencyPosition> solvency;
    std::optional<solvency::GuaranteeFundAssessment> guarantee_fund;
    std::vector<solvency::EarlyWarning> early_warnings;
    std::vector<AuditRecord> audit_records;
    double execution_time_ms;

    RegcalcReport();
};

nlohmann::json report_to_json(const RegcalcReport& report);

// Write the report as JSON; amounts keep their rounded values
void write_report_json(std::ostream& os, const RegcalcReport& report, bool pretty_print = true);

// Throws std::runtime_error if the file cannot be opened
void write_report_json(const std::string& filepath, const RegcalcReport& report, bool pretty_print = true);

} // namespace io
} // namespace regcalc

#endif // REGCALC_IO_JSON_WRITER_HPP
