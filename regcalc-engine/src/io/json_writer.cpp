#include "json_writer.hpp"
#include "../serialization.hpp"
#include <fstream>
#include <stdexcept>

namespace regcalc {
namespace io {

RegcalcReport::RegcalcReport()
    : credit(),
      credit_stress(),
      liability(),
      solvency(),
      guarantee_fund(),
      early_warnings(),
      audit_records(),
      execution_time_ms(0.0) {}

nlohmann::json report_to_json(const RegcalcReport& report) {
    nlohmann::json j = nlohmann::json::object();

    if (report.credit) {
        j["credit"] = *report.credit;
        j["credit"]["execution_time_ms"] = report.credit->execution_time_ms;
        if (report.credit_stress) {
            j["credit"]["stress"] = *report.credit_stress;
        }
    }
    if (report.liability) {
        j["liability"] = *report.liability;
    }
    if (report.solvency) {
        j["solvency"] = *report.solvency;
    }
    if (report.guarantee_fund) {
        j["guarantee_fund"] = *report.guarantee_fund;
        j["guarantee_fund"]["early_warnings"] = report.early_warnings;
    }

    j["audit"] = report.audit_records;
    j["execution_time_ms"] = report.execution_time_ms;
    return j;
}

void write_report_json(std::ostream& os, const RegcalcReport& report, bool pretty_print) {
    nlohmann::json j = report_to_json(report);
    if (pretty_print) {
        os << j.dump(2) << "\n";
    } else {
        os << j.dump() << "\n";
    }
}

void write_report_json(const std::string& filepath, const RegcalcReport& report, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_report_json(file, report, pretty_print);
}

} // namespace io
} // namespace regcalc
