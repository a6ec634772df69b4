#include "discount_curve.hpp"
#include "errors.hpp"
#include "macro_context.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace regcalc {

// ============================================================================
// FlatCurveResolver Implementation
// ============================================================================

FlatCurveResolver::FlatCurveResolver(double rate) : rate_(rate) {
    if (!std::isfinite(rate) || rate <= -1.0) {
        throw ValidationError("rate", "must be finite and above -100%");
    }
}

FlatCurveResolver::FlatCurveResolver(const MacroContext& macro)
    : rate_(macro.base_rate()) {}

double FlatCurveResolver::rate_for_tenor(uint32_t /*tenor*/) const {
    return rate_;
}

// ============================================================================
// TermStructureResolver Implementation
// ============================================================================

TermStructureResolver::TermStructureResolver() : last_tenor_(0) {
    rates_.fill(0.0);
    populated_.fill(false);
}

void TermStructureResolver::set_rate(uint32_t tenor, double rate) {
    if (tenor < 1 || tenor > MAX_TENOR) {
        throw std::out_of_range("Tenor must be between 1 and 50");
    }
    if (!std::isfinite(rate) || rate <= -1.0) {
        throw ValidationError("rate", "tenor " + std::to_string(tenor) + " rate must be above -100%");
    }
    rates_[tenor - 1] = rate;
    populated_[tenor - 1] = true;
    if (tenor > last_tenor_) {
        last_tenor_ = tenor;
    }
}

double TermStructureResolver::rate_for_tenor(uint32_t tenor) const {
    if (last_tenor_ == 0) {
        throw ValidationError("curve", "term structure has no points");
    }
    uint32_t t = std::max<uint32_t>(1, std::min(tenor, last_tenor_));
    for (uint32_t k = t; k >= 1; --k) {
        if (populated_[k - 1]) {
            return rates_[k - 1];
        }
    }
    for (uint32_t k = t + 1; k <= last_tenor_; ++k) {
        if (populated_[k - 1]) {
            return rates_[k - 1];
        }
    }
    throw ValidationError("curve", "term structure has no points");
}

double TermStructureResolver::cumulative_discount_factor(uint32_t tenor) const {
    if (tenor > MAX_TENOR) {
        throw std::out_of_range("Tenor must be between 0 and 50");
    }
    double factor = 1.0;
    for (uint32_t t = 1; t <= tenor; ++t) {
        factor /= (1.0 + rate_for_tenor(t));
    }
    return factor;
}

TermStructureResolver TermStructureResolver::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

TermStructureResolver TermStructureResolver::load_from_csv(std::istream& is) {
    TermStructureResolver curve;
    CsvReader reader(is);

    reader.read_header();
    if (!reader.has_column("tenor") || !reader.has_column("rate")) {
        throw ValidationError("curve", "CSV requires columns tenor,rate");
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) {
            break;
        }
        try {
            uint32_t tenor = static_cast<uint32_t>(std::stoul(reader.field(row, "tenor")));
            curve.set_rate(tenor, std::stod(reader.field(row, "rate")));
        } catch (const std::invalid_argument&) {
            throw ValidationError("curve", "non-numeric value on line " +
                                  std::to_string(reader.line_number()));
        }
    }
    return curve;
}

} // namespace regcalc
