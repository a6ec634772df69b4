#ifndef REGCALC_DISCOUNT_CURVE_HPP
#define REGCALC_DISCOUNT_CURVE_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <string>

namespace regcalc {

class MacroContext;

// Returns a base (risk-free) rate for a tenor in periods.
// Curve storage and interpolation live outside the engines; they only
// consume resolved points through this interface.
class DiscountCurveResolver {
public:
    virtual ~DiscountCurveResolver() = default;

    virtual double rate_for_tenor(uint32_t tenor) const = 0;
};

// Flat curve at a single rate (usually the macro base rate)
class FlatCurveResolver : public DiscountCurveResolver {
public:
    explicit FlatCurveResolver(double rate);
    explicit FlatCurveResolver(const MacroContext& macro);

    double rate_for_tenor(uint32_t tenor) const override;

private:
    double rate_;
};

// Resolved spot rates by tenor (1-50). An unpopulated tenor takes the
// nearest populated tenor below it (above it for the short end), so
// tenors beyond the last point extrapolate flat.
class TermStructureResolver : public DiscountCurveResolver {
public:
    static constexpr uint32_t MAX_TENOR = 50;

    TermStructureResolver();

    void set_rate(uint32_t tenor, double rate);
    double rate_for_tenor(uint32_t tenor) const override;

    // Cumulative discount factor, product of 1/(1+r_t) for t = 1..tenor
    double cumulative_discount_factor(uint32_t tenor) const;

    uint32_t last_tenor() const { return last_tenor_; }

    // CSV with columns tenor,rate
    static TermStructureResolver load_from_csv(const std::string& filepath);
    static TermStructureResolver load_from_csv(std::istream& is);

private:
    std::array<double, MAX_TENOR> rates_;
    std::array<bool, MAX_TENOR> populated_;
    uint32_t last_tenor_;
};

} // namespace regcalc

#endif // REGCALC_DISCOUNT_CURVE_HPP
