#include <catch2/catch.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include "errors.hpp"
#include "liability/cash_flow_schedule.hpp"

using namespace regcalc;
using namespace regcalc::liability;
using Catch::Matchers::WithinAbs;

namespace {

CashFlowSchedule three_periods() {
    CashFlowSchedule schedule;
    schedule.add(PeriodCashFlow(1, 1000.0, 400.0, 50.0, 20.0));
    schedule.add(PeriodCashFlow(2, 0.0, 450.0, 50.0));
    schedule.add(PeriodCashFlow(3, 0.0, 500.0, 50.0));
    return schedule;
}

std::string field_of(const CashFlowSchedule& schedule) {
    try {
        schedule.validate();
    } catch (const ValidationError& e) {
        return e.field();
    }
    return "";
}

} // anonymous namespace

TEST_CASE("PeriodCashFlow net flow is outflows minus premiums", "[cash_flows]") {
    PeriodCashFlow cf(1, 1000.0, 400.0, 50.0, 20.0);
    REQUIRE_THAT(cf.net_cash_flow(), WithinAbs(-530.0, 1e-12));

    PeriodCashFlow defaults;
    REQUIRE(defaults.period == 1);
    REQUIRE(defaults.net_cash_flow() == 0.0);
}

TEST_CASE("CashFlowSchedule accessors", "[cash_flows]") {
    CashFlowSchedule schedule = three_periods();

    REQUIRE(schedule.size() == 3);
    REQUIRE_FALSE(schedule.empty());
    REQUIRE(schedule.term() == 3);
    REQUIRE_THAT(schedule.total_premiums(), WithinAbs(1000.0, 1e-12));
    REQUIRE(schedule.get(1).claims == 450.0);
    REQUIRE_THROWS_AS(schedule.get(3), std::out_of_range);

    auto flows = schedule.net_cash_flows();
    REQUIRE(flows.size() == 3);
    REQUIRE_THAT(flows[0], WithinAbs(-530.0, 1e-12));
    REQUIRE_THAT(flows[2], WithinAbs(550.0, 1e-12));

    CashFlowSchedule empty;
    REQUIRE(empty.term() == 0);
    REQUIRE_FALSE(empty.lapse_rate().has_value());
}

TEST_CASE("CashFlowSchedule validation", "[cash_flows][validation]") {
    SECTION("Valid schedule") {
        REQUIRE_NOTHROW(three_periods().validate());
    }

    SECTION("Empty schedule") {
        REQUIRE(field_of(CashFlowSchedule()) == "cash_flows");
    }

    SECTION("Periods must run 1..T without gaps") {
        CashFlowSchedule schedule;
        schedule.add(PeriodCashFlow(1, 100.0, 50.0, 5.0));
        schedule.add(PeriodCashFlow(3, 0.0, 50.0, 5.0));
        REQUIRE(field_of(schedule) == "period");
    }

    SECTION("Negative amounts") {
        CashFlowSchedule schedule;
        schedule.add(PeriodCashFlow(1, 100.0, -1.0, 5.0));
        REQUIRE(field_of(schedule) == "claims");

        CashFlowSchedule acquisition;
        acquisition.add(PeriodCashFlow(1, 100.0, 1.0, 5.0, -2.0));
        REQUIRE(field_of(acquisition) == "acquisition_costs");
    }

    SECTION("Lapse rate outside [0, 1)") {
        CashFlowSchedule schedule = three_periods();
        schedule.set_lapse_rate(1.0);
        REQUIRE(field_of(schedule) == "lapse_rate");

        schedule.set_lapse_rate(0.0);
        REQUIRE_NOTHROW(schedule.validate());
    }
}

TEST_CASE("CashFlowSchedule loads from CSV", "[cash_flows][csv]") {
    std::istringstream csv(
        "period,premiums,claims,expenses,acquisition_costs\n"
        "1,1000,400,50,20\n"
        "2,0,450,50,\n"
        "\n"
        "3,0,500,50,0\n");

    CashFlowSchedule schedule = CashFlowSchedule::load_from_csv(csv);
    REQUIRE(schedule.size() == 3);
    REQUIRE(schedule.get(0).acquisition_costs == 20.0);
    REQUIRE(schedule.get(1).acquisition_costs == 0.0);
    REQUIRE(schedule.term() == 3);
    REQUIRE_NOTHROW(schedule.validate());
}

TEST_CASE("CashFlowSchedule CSV errors", "[cash_flows][csv]") {
    SECTION("Acquisition column is optional") {
        std::istringstream csv("period,premiums,claims,expenses\n1,10,5,1\n");
        CashFlowSchedule schedule = CashFlowSchedule::load_from_csv(csv);
        REQUIRE(schedule.get(0).acquisition_costs == 0.0);
    }

    SECTION("Missing required column") {
        std::istringstream csv("period,premiums,claims\n1,10,5\n");
        try {
            CashFlowSchedule::load_from_csv(csv);
            FAIL("Expected missing column error");
        } catch (const ValidationError& e) {
            REQUIRE(e.field() == "expenses");
        }
    }

    SECTION("Non-numeric amount") {
        std::istringstream csv("period,premiums,claims,expenses\n1,ten,5,1\n");
        try {
            CashFlowSchedule::load_from_csv(csv);
            FAIL("Expected non-numeric error");
        } catch (const ValidationError& e) {
            REQUIRE(e.field() == "premiums");
            REQUIRE(std::string(e.what()).find("line 2") != std::string::npos);
        }
    }

    SECTION("Fractional period") {
        std::istringstream csv("period,premiums,claims,expenses\n1.5,10,5,1\n");
        REQUIRE_THROWS_AS(CashFlowSchedule::load_from_csv(csv), ValidationError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(CashFlowSchedule::load_from_csv(std::string("/nonexistent/cash_flows.csv")),
                          std::runtime_error);
    }
}
