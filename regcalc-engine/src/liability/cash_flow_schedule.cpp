#include "cash_flow_schedule.hpp"
#include "../errors.hpp"
#include "../io/csv_reader.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace regcalc {
namespace liability {

PeriodCashFlow::PeriodCashFlow()
    : period(1), premiums(0.0), claims(0.0), expenses(0.0), acquisition_costs(0.0) {}

PeriodCashFlow::PeriodCashFlow(uint32_t p, double prem, double clm, double exp, double acq)
    : period(p), premiums(prem), claims(clm), expenses(exp), acquisition_costs(acq) {}

double PeriodCashFlow::net_cash_flow() const {
    return claims + expenses + acquisition_costs - premiums;
}

// ============================================================================
// CashFlowSchedule Implementation
// ============================================================================

CashFlowSchedule::CashFlowSchedule() : periods_(), lapse_rate_() {}

void CashFlowSchedule::add(const PeriodCashFlow& period) {
    periods_.push_back(period);
}

const PeriodCashFlow& CashFlowSchedule::get(size_t index) const {
    if (index >= periods_.size()) {
        throw std::out_of_range("Cash flow period index out of range");
    }
    return periods_[index];
}

uint32_t CashFlowSchedule::term() const {
    return periods_.empty() ? 0 : periods_.back().period;
}

double CashFlowSchedule::total_premiums() const {
    double total = 0.0;
    for (const auto& p : periods_) {
        total += p.premiums;
    }
    return total;
}

std::vector<double> CashFlowSchedule::net_cash_flows() const {
    std::vector<double> flows;
    flows.reserve(periods_.size());
    for (const auto& p : periods_) {
        flows.push_back(p.net_cash_flow());
    }
    return flows;
}

void CashFlowSchedule::set_lapse_rate(double rate) {
    lapse_rate_ = rate;
}

namespace {

void require_amount(double value, const std::string& field, uint32_t period) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ValidationError(field, "must be a non-negative amount in period " + std::to_string(period));
    }
}

} // anonymous namespace

void CashFlowSchedule::validate() const {
    if (periods_.empty()) {
        throw ValidationError("cash_flows", "schedule is empty");
    }
    for (size_t i = 0; i < periods_.size(); ++i) {
        const auto& p = periods_[i];
        if (p.period != i + 1) {
            throw ValidationError("period", "expected period " + std::to_string(i + 1) +
                                            ", found " + std::to_string(p.period));
        }
        require_amount(p.premiums, "premiums", p.period);
        require_amount(p.claims, "claims", p.period);
        require_amount(p.expenses, "expenses", p.period);
        require_amount(p.acquisition_costs, "acquisition_costs", p.period);
    }
    if (lapse_rate_ && (!std::isfinite(*lapse_rate_) || *lapse_rate_ < 0.0 || *lapse_rate_ >= 1.0)) {
        throw ValidationError("lapse_rate", "must be in [0, 1)");
    }
}

CashFlowSchedule CashFlowSchedule::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

CashFlowSchedule CashFlowSchedule::load_from_csv(std::istream& is) {
    CsvReader reader(is);
    reader.read_header();

    for (const char* column : {"period", "premiums", "claims", "expenses"}) {
        if (!reader.has_column(column)) {
            throw ValidationError(column, "required column missing from cash flow CSV");
        }
    }

    auto number = [&reader](const std::vector<std::string>& row, const std::string& column) {
        std::string value = reader.field(row, column);
        if (value.empty()) {
            return 0.0;
        }
        try {
            return std::stod(value);
        } catch (const std::exception&) {
            throw ValidationError(column, "non-numeric value '" + value + "' on line " +
                                          std::to_string(reader.line_number()));
        }
    };

    CashFlowSchedule schedule;
    while (reader.has_more()) {
        std::vector<std::string> row = reader.read_row();
        if (row.empty()) {
            continue;
        }
        double period = number(row, "period");
        if (period < 1.0 || period != std::floor(period)) {
            throw ValidationError("period", "must be a positive integer on line " +
                                            std::to_string(reader.line_number()));
        }
        PeriodCashFlow cf;
        cf.period = static_cast<uint32_t>(period);
        cf.premiums = number(row, "premiums");
        cf.claims = number(row, "claims");
        cf.expenses = number(row, "expenses");
        cf.acquisition_costs = number(row, "acquisition_costs");
        schedule.add(cf);
    }
    return schedule;
}

} // namespace liability
} // namespace regcalc
