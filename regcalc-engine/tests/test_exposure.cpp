#include <catch2/catch.hpp>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include "credit/exposure.hpp"
#include "errors.hpp"

using namespace regcalc;
using namespace regcalc::credit;

namespace {

Exposure make_exposure() {
    Exposure e;
    e.exposure_id = "LOAN-1";
    e.gross_carrying_amount = 1000000.0;
    e.pd_annual = 0.02;
    e.pd_at_origination = 0.02;
    e.effective_rate = 0.15;
    e.remaining_term = 5;
    return e;
}

} // anonymous namespace

TEST_CASE("Exposure defaults", "[exposure]") {
    Exposure e;
    REQUIRE(e.remaining_term == 1);
    REQUIRE(e.days_past_due == 0);
    REQUIRE_FALSE(e.lgd.has_value());
    REQUIRE(e.collateral_type == CollateralType::Unsecured);
    REQUIRE(e.facility_type == FacilityType::CreditLines);
    REQUIRE_FALSE(e.flags.default_event);
    REQUIRE_FALSE(e.flags.any_stage2_trigger());
}

TEST_CASE("Exposure validation names the first bad field", "[exposure][validation]") {
    Exposure e = make_exposure();
    REQUIRE_NOTHROW(e.validate());

    auto expect_field = [](const Exposure& exposure, const std::string& field) {
        try {
            exposure.validate();
            FAIL("Expected ValidationError for " << field);
        } catch (const ValidationError& err) {
            REQUIRE(err.field() == field);
        }
    };

    SECTION("Empty id") {
        e.exposure_id.clear();
        expect_field(e, "exposure_id");
    }

    SECTION("Negative GCA") {
        e.gross_carrying_amount = -1.0;
        expect_field(e, "gross_carrying_amount");
    }

    SECTION("PD above one") {
        e.pd_annual = 1.2;
        expect_field(e, "pd_annual");
    }

    SECTION("LGD outside [0, 1]") {
        e.lgd = -0.1;
        expect_field(e, "lgd");
    }

    SECTION("Effective rate at -100%") {
        e.effective_rate = -1.0;
        expect_field(e, "effective_rate");
    }

    SECTION("Negative undrawn amount") {
        e.undrawn_amount = -5.0;
        expect_field(e, "undrawn_amount");
    }

    SECTION("Term beyond the accepted maximum") {
        e.remaining_term = MAX_REMAINING_TERM + 1;
        expect_field(e, "remaining_term");

        e.remaining_term = 4000000000u;
        expect_field(e, "remaining_term");
    }

    SECTION("Term at the maximum is accepted") {
        e.remaining_term = MAX_REMAINING_TERM;
        REQUIRE_NOTHROW(e.validate());
        REQUIRE_THROWS_AS(e.validate(120), ValidationError);
    }
}

TEST_CASE("Counts must be whole, non-negative and fit 32 bits", "[exposure][validation]") {
    REQUIRE(checked_count(0.0, "days_past_due", "row 1") == 0u);
    REQUIRE(checked_count(360.0, "remaining_term", "row 1") == 360u);
    REQUIRE(checked_count(4294967295.0, "remaining_term", "row 1") == 4294967295u);

    try {
        checked_count(-3.0, "remaining_term", "row 7");
        FAIL("Expected ValidationError");
    } catch (const ValidationError& e) {
        REQUIRE(e.field() == "remaining_term");
        REQUIRE(std::string(e.what()).find("row 7") != std::string::npos);
    }

    REQUIRE_THROWS_AS(checked_count(2.5, "remaining_term", "row 1"), ValidationError);
    REQUIRE_THROWS_AS(checked_count(4294967296.0, "remaining_term", "row 1"), ValidationError);
    REQUIRE_THROWS_AS(checked_count(std::numeric_limits<double>::quiet_NaN(), "days_past_due", "row 1"),
                      ValidationError);
    REQUIRE_THROWS_AS(checked_count(std::numeric_limits<double>::infinity(), "days_past_due", "row 1"),
                      ValidationError);
}

TEST_CASE("Collateral and facility names", "[exposure]") {
    REQUIRE(parse_collateral_type("secured_real_estate") == CollateralType::SecuredRealEstate);
    REQUIRE(parse_collateral_type("") == CollateralType::Unsecured);
    REQUIRE(to_string(CollateralType::Sovereign) == "sovereign");
    REQUIRE(parse_facility_type("letters_of_credit") == FacilityType::LettersOfCredit);
    REQUIRE(to_string(FacilityType::UnusedLimits) == "unused_limits");
    REQUIRE_THROWS_AS(parse_collateral_type("gold"), ValidationError);
    REQUIRE_THROWS_AS(parse_facility_type("overdraft"), ValidationError);
}

TEST_CASE("ExposureSet loads header-addressed CSV", "[exposure][csv]") {
    std::istringstream csv(
        "exposure_id,gross_carrying_amount,pd,pd_origination,lgd,effective_rate,remaining_term,"
        "days_past_due,collateral_type,collateral_value,undrawn_amount,facility_type,"
        "default_event,restructuring,watchlist,covenant_breach,branch\n"
        "A,500000000,0.095,0.03,0.69,0.19,3,0,unsecured,0,0,credit_lines,0,0,0,0,Almaty\n"
        "B,100000000,0.02,,,0.15,5,45,secured_real_estate,40000000,20000000,guarantees,false,true,no,0,\n");

    ExposureSet set = ExposureSet::load_from_csv(csv);
    REQUIRE(set.size() == 2);

    const Exposure& a = set.get(0);
    REQUIRE(a.exposure_id == "A");
    REQUIRE(a.gross_carrying_amount == 500000000.0);
    REQUIRE(a.pd_annual == 0.095);
    REQUIRE(a.pd_at_origination == 0.03);
    REQUIRE(a.lgd.has_value());
    REQUIRE(*a.lgd == 0.69);
    REQUIRE(a.remaining_term == 3);
    REQUIRE(a.attributes.at("branch") == "Almaty");

    const Exposure& b = set.get(1);
    // Missing origination PD falls back to the current PD
    REQUIRE(b.pd_at_origination == 0.02);
    REQUIRE_FALSE(b.lgd.has_value());
    REQUIRE(b.days_past_due == 45);
    REQUIRE(b.collateral_type == CollateralType::SecuredRealEstate);
    REQUIRE(b.facility_type == FacilityType::Guarantees);
    REQUIRE(b.flags.restructuring);
    REQUIRE_FALSE(b.flags.watchlist);
    REQUIRE(b.attributes.count("branch") == 0);

    REQUIRE_THROWS_AS(set.get(2), std::out_of_range);
}

TEST_CASE("ExposureSet CSV errors", "[exposure][csv]") {
    SECTION("Missing required column") {
        std::istringstream csv("exposure_id,pd,effective_rate,remaining_term\nA,0.01,0.1,2\n");
        REQUIRE_THROWS_AS(ExposureSet::load_from_csv(csv), ValidationError);
    }

    SECTION("Unknown collateral names the line") {
        std::istringstream csv(
            "exposure_id,gross_carrying_amount,pd,effective_rate,remaining_term,collateral_type\n"
            "A,100,0.01,0.1,2,unsecured\n"
            "B,100,0.01,0.1,2,gold\n");
        try {
            ExposureSet::load_from_csv(csv);
            FAIL("Expected ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.field() == "collateral_type");
            REQUIRE(std::string(e.what()).find("line 3") != std::string::npos);
        }
    }

    SECTION("Non-numeric amount") {
        std::istringstream csv(
            "exposure_id,gross_carrying_amount,pd,effective_rate,remaining_term\n"
            "A,lots,0.01,0.1,2\n");
        REQUIRE_THROWS_AS(ExposureSet::load_from_csv(csv), ValidationError);
    }

    SECTION("Fractional term") {
        std::istringstream csv(
            "exposure_id,gross_carrying_amount,pd,effective_rate,remaining_term\n"
            "A,100,0.01,0.1,2.5\n");
        REQUIRE_THROWS_AS(ExposureSet::load_from_csv(csv), ValidationError);
    }

    SECTION("Negative days past due") {
        std::istringstream csv(
            "exposure_id,gross_carrying_amount,pd,effective_rate,remaining_term,days_past_due\n"
            "A,100,0.01,0.1,2,-3\n");
        REQUIRE_THROWS_AS(ExposureSet::load_from_csv(csv), ValidationError);
    }

    SECTION("Term too large for a count") {
        std::istringstream csv(
            "exposure_id,gross_carrying_amount,pd,effective_rate,remaining_term\n"
            "A,100,0.01,0.1,5000000000\n");
        try {
            ExposureSet::load_from_csv(csv);
            FAIL("Expected ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.field() == "remaining_term");
            REQUIRE(std::string(e.what()).find("line 2") != std::string::npos);
        }
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(ExposureSet::load_from_csv("/nonexistent/exposures.csv"), std::runtime_error);
    }
}

TEST_CASE("Empty CSV yields an empty set", "[exposure][csv]") {
    std::istringstream csv("");
    ExposureSet set = ExposureSet::load_from_csv(csv);
    REQUIRE(set.empty());
}
