#ifndef REGCALC_CREDIT_EXPOSURE_HPP
#define REGCALC_CREDIT_EXPOSURE_HPP

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace regcalc {
namespace credit {

enum class CollateralType : uint8_t {
    Unsecured = 0,
    SecuredRealEstate = 1,
    SecuredVehicles = 2,
    SecuredDeposits = 3,
    Sovereign = 4
};

enum class FacilityType : uint8_t {
    CreditLines = 0,
    Guarantees = 1,
    LettersOfCredit = 2,
    UnusedLimits = 3
};

// Longest accepted remaining term, in periods
constexpr uint32_t MAX_REMAINING_TERM = 600;

std::string to_string(CollateralType type);
std::string to_string(FacilityType type);
CollateralType parse_collateral_type(const std::string& value);
FacilityType parse_facility_type(const std::string& value);

// Whole non-negative count that fits in uint32_t; `location` names the row in errors
uint32_t checked_count(double value, const std::string& field, const std::string& location);

// Qualitative significant-increase-in-credit-risk indicators
struct QualitativeFlags {
    bool default_event;
    bool restructuring;
    bool watchlist;
    bool covenant_breach;

    QualitativeFlags();

    // True if any Stage 2 qualitative trigger is set (default_event excluded)
    bool any_stage2_trigger() const;
};

struct Exposure {
    std::string exposure_id;
    double gross_carrying_amount;     // GCA
    double pd_annual;                 // Current 12-month PD
    double pd_at_origination;         // PD at initial recognition
    std::optional<double> lgd;        // Contractual LGD; absent/0 uses collateral default
    double effective_rate;            // Effective interest rate (EIR)
    uint32_t remaining_term;          // Periods to maturity
    uint32_t days_past_due;
    CollateralType collateral_type;
    double collateral_value;
    double undrawn_amount;
    FacilityType facility_type;
    QualitativeFlags flags;
    std::map<std::string, std::string> attributes;  // Extra descriptive columns

    Exposure();

    // Throws ValidationError naming the first out-of-domain field
    void validate(uint32_t max_remaining_term = MAX_REMAINING_TERM) const;
};

class ExposureSet {
public:
    void add(const Exposure& exposure);
    void add(Exposure&& exposure);

    const Exposure& get(size_t index) const;
    size_t size() const;
    bool empty() const;

    const std::vector<Exposure>& exposures() const { return exposures_; }
    std::vector<Exposure>& exposures() { return exposures_; }

    void reserve(size_t count);
    void clear();

    // Header-addressed CSV; see exposure.cpp for the column list
    static ExposureSet load_from_csv(const std::string& filepath);
    static ExposureSet load_from_csv(std::istream& is);

    static ExposureSet load_from_parquet(const std::string& filepath);

private:
    std::vector<Exposure> exposures_;
};

} // namespace credit
} // namespace regcalc

#endif // REGCALC_CREDIT_EXPOSURE_HPP
