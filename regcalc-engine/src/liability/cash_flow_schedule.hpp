#ifndef REGCALC_LIABILITY_CASH_FLOW_SCHEDULE_HPP
#define REGCALC_LIABILITY_CASH_FLOW_SCHEDULE_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace regcalc {
namespace liability {

// Expected cash flows of one projection period (1-indexed)
struct PeriodCashFlow {
    uint32_t period;
    double premiums;
    double claims;
    double expenses;
    double acquisition_costs;

    PeriodCashFlow();
    PeriodCashFlow(uint32_t p, double prem, double clm, double exp, double acq = 0.0);

    // Outflows minus inflows; positive is a liability
    double net_cash_flow() const;
};

class CashFlowSchedule {
public:
    CashFlowSchedule();

    void add(const PeriodCashFlow& period);

    const PeriodCashFlow& get(size_t index) const;
    size_t size() const { return periods_.size(); }
    bool empty() const { return periods_.empty(); }
    const std::vector<PeriodCashFlow>& periods() const { return periods_; }

    // Number of periods covered (last period index)
    uint32_t term() const;

    double total_premiums() const;
    std::vector<double> net_cash_flows() const;

    // Lapse rate for survival weighting; engine default when absent
    const std::optional<double>& lapse_rate() const { return lapse_rate_; }
    void set_lapse_rate(double rate);

    // Throws ValidationError: empty schedule, periods not 1..n in order,
    // negative or non-finite amounts, lapse outside [0, 1)
    void validate() const;

    // CSV columns: period,premiums,claims,expenses[,acquisition_costs]
    static CashFlowSchedule load_from_csv(const std::string& filepath);
    static CashFlowSchedule load_from_csv(std::istream& is);

private:
    std::vector<PeriodCashFlow> periods_;
    std::optional<double> lapse_rate_;
};

} // namespace liability
} // namespace regcalc

#endif // REGCALC_LIABILITY_CASH_FLOW_SCHEDULE_HPP
