#include "exposure.hpp"
#include "../errors.hpp"
#include "../io/csv_reader.hpp"
#include "../io/parquet_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>

namespace regcalc {
namespace credit {

std::string to_string(CollateralType type) {
    switch (type) {
        case CollateralType::Unsecured: return "unsecured";
        case CollateralType::SecuredRealEstate: return "secured_real_estate";
        case CollateralType::SecuredVehicles: return "secured_vehicles";
        case CollateralType::SecuredDeposits: return "secured_deposits";
        case CollateralType::Sovereign: return "sovereign";
    }
    return "unknown";
}

std::string to_string(FacilityType type) {
    switch (type) {
        case FacilityType::CreditLines: return "credit_lines";
        case FacilityType::Guarantees: return "guarantees";
        case FacilityType::LettersOfCredit: return "letters_of_credit";
        case FacilityType::UnusedLimits: return "unused_limits";
    }
    return "unknown";
}

CollateralType parse_collateral_type(const std::string& value) {
    if (value == "unsecured" || value.empty()) return CollateralType::Unsecured;
    if (value == "secured_real_estate") return CollateralType::SecuredRealEstate;
    if (value == "secured_vehicles") return CollateralType::SecuredVehicles;
    if (value == "secured_deposits") return CollateralType::SecuredDeposits;
    if (value == "sovereign") return CollateralType::Sovereign;
    throw ValidationError("collateral_type", "unknown collateral type '" + value + "'");
}

FacilityType parse_facility_type(const std::string& value) {
    if (value == "credit_lines" || value.empty()) return FacilityType::CreditLines;
    if (value == "guarantees") return FacilityType::Guarantees;
    if (value == "letters_of_credit") return FacilityType::LettersOfCredit;
    if (value == "unused_limits") return FacilityType::UnusedLimits;
    throw ValidationError("facility_type", "unknown facility type '" + value + "'");
}

// ============================================================================
// QualitativeFlags / Exposure Implementation
// ============================================================================

QualitativeFlags::QualitativeFlags()
    : default_event(false),
      restructuring(false),
      watchlist(false),
      covenant_breach(false) {}

bool QualitativeFlags::any_stage2_trigger() const {
    return restructuring || watchlist || covenant_breach;
}

Exposure::Exposure()
    : exposure_id(),
      gross_carrying_amount(0.0),
      pd_annual(0.0),
      pd_at_origination(0.0),
      lgd(),
      effective_rate(0.0),
      remaining_term(1),
      days_past_due(0),
      collateral_type(CollateralType::Unsecured),
      collateral_value(0.0),
      undrawn_amount(0.0),
      facility_type(FacilityType::CreditLines),
      flags(),
      attributes() {}

namespace {

void require_probability(double value, const std::string& field) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw ValidationError(field, "must be in [0, 1]");
    }
}

void require_non_negative(double value, const std::string& field) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ValidationError(field, "must be a non-negative amount");
    }
}

} // anonymous namespace

void Exposure::validate(uint32_t max_remaining_term) const {
    if (exposure_id.empty()) {
        throw ValidationError("exposure_id", "must not be empty");
    }
    require_non_negative(gross_carrying_amount, "gross_carrying_amount");
    require_probability(pd_annual, "pd_annual");
    require_probability(pd_at_origination, "pd_at_origination");
    if (lgd) {
        require_probability(*lgd, "lgd");
    }
    if (!std::isfinite(effective_rate) || effective_rate <= -1.0) {
        throw ValidationError("effective_rate", "must be finite and above -100%");
    }
    if (remaining_term > max_remaining_term) {
        throw ValidationError("remaining_term", "must not exceed " + std::to_string(max_remaining_term) + " periods");
    }
    require_non_negative(collateral_value, "collateral_value");
    require_non_negative(undrawn_amount, "undrawn_amount");
}

uint32_t checked_count(double value, const std::string& field, const std::string& location) {
    if (!std::isfinite(value) || value < 0.0 || value != std::floor(value)) {
        throw ValidationError(field, "must be a non-negative integer on " + location);
    }
    if (value > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
        throw ValidationError(field, "is out of range on " + location);
    }
    return static_cast<uint32_t>(value);
}

// ============================================================================
// ExposureSet Implementation
// ============================================================================

void ExposureSet::add(const Exposure& exposure) {
    exposures_.push_back(exposure);
}

void ExposureSet::add(Exposure&& exposure) {
    exposures_.push_back(std::move(exposure));
}

const Exposure& ExposureSet::get(size_t index) const {
    if (index >= exposures_.size()) {
        throw std::out_of_range("Exposure index out of range");
    }
    return exposures_[index];
}

size_t ExposureSet::size() const {
    return exposures_.size();
}

bool ExposureSet::empty() const {
    return exposures_.empty();
}

void ExposureSet::reserve(size_t count) {
    exposures_.reserve(count);
}

void ExposureSet::clear() {
    exposures_.clear();
}

ExposureSet ExposureSet::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

ExposureSet ExposureSet::load_from_parquet(const std::string& filepath) {
    return io::ParquetReader::load_exposures(filepath);
}

namespace {

bool parse_flag(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return v == "1" || v == "true" || v == "yes" || v == "y";
}

double parse_double(const std::string& value, const std::string& column, size_t line,
                    double fallback) {
    if (value.empty()) {
        return fallback;
    }
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw ValidationError(column, "non-numeric value '" + value + "' on line " + std::to_string(line));
    }
}

uint32_t parse_count(const std::string& value, const std::string& column, size_t line) {
    return checked_count(parse_double(value, column, line, 0.0), column, "line " + std::to_string(line));
}

// Columns consumed into Exposure fields; anything else becomes an attribute
const std::set<std::string>& core_columns() {
    static const std::set<std::string> columns = {
        "exposure_id", "gross_carrying_amount", "pd", "pd_origination", "lgd",
        "effective_rate", "remaining_term", "days_past_due", "collateral_type",
        "collateral_value", "undrawn_amount", "facility_type", "default_event",
        "restructuring", "watchlist", "covenant_breach"
    };
    return columns;
}

} // anonymous namespace

ExposureSet ExposureSet::load_from_csv(std::istream& is) {
    ExposureSet es;
    CsvReader reader(is);

    auto header = reader.read_header();
    if (header.empty()) {
        return es;
    }
    for (const char* required : {"exposure_id", "gross_carrying_amount", "pd", "effective_rate", "remaining_term"}) {
        if (!reader.has_column(required)) {
            throw ValidationError(required, "required CSV column is missing");
        }
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) {
            break;
        }
        const size_t line = reader.line_number();

        Exposure e;
        e.exposure_id = reader.field(row, "exposure_id");
        e.gross_carrying_amount = parse_double(reader.field(row, "gross_carrying_amount"), "gross_carrying_amount", line, 0.0);
        e.pd_annual = parse_double(reader.field(row, "pd"), "pd", line, 0.0);
        e.pd_at_origination = parse_double(reader.field(row, "pd_origination"), "pd_origination", line, e.pd_annual);

        std::string lgd_str = reader.field(row, "lgd");
        if (!lgd_str.empty()) {
            e.lgd = parse_double(lgd_str, "lgd", line, 0.0);
        }

        e.effective_rate = parse_double(reader.field(row, "effective_rate"), "effective_rate", line, 0.0);
        e.remaining_term = parse_count(reader.field(row, "remaining_term"), "remaining_term", line);
        e.days_past_due = parse_count(reader.field(row, "days_past_due"), "days_past_due", line);
        try {
            e.collateral_type = parse_collateral_type(reader.field(row, "collateral_type"));
            e.facility_type = parse_facility_type(reader.field(row, "facility_type"));
        } catch (const ValidationError& ex) {
            std::string message = std::string(ex.what()).substr(ex.field().size() + 2);
            throw ValidationError(ex.field(), message + " on line " + std::to_string(line));
        }
        e.collateral_value = parse_double(reader.field(row, "collateral_value"), "collateral_value", line, 0.0);
        e.undrawn_amount = parse_double(reader.field(row, "undrawn_amount"), "undrawn_amount", line, 0.0);
        e.flags.default_event = parse_flag(reader.field(row, "default_event"));
        e.flags.restructuring = parse_flag(reader.field(row, "restructuring"));
        e.flags.watchlist = parse_flag(reader.field(row, "watchlist"));
        e.flags.covenant_breach = parse_flag(reader.field(row, "covenant_breach"));

        for (size_t i = 0; i < row.size() && i < header.size(); ++i) {
            if (!row[i].empty() && core_columns().count(header[i]) == 0) {
                e.attributes[header[i]] = row[i];
            }
        }

        es.add(std::move(e));
    }

    return es;
}

} // namespace credit
} // namespace regcalc
