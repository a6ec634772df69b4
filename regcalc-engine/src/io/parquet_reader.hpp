#ifndef REGCALC_PARQUET_READER_HPP
#define REGCALC_PARQUET_READER_HPP

#include "../credit/exposure.hpp"
#include <string>

namespace regcalc {
namespace io {

class ParquetReader {
public:
    /**
     * Load credit exposures from a Parquet file.
     *
     * Expected schema (same names as the CSV loader):
     *   - exposure_id: string
     *   - gross_carrying_amount, pd, effective_rate: float64
     *   - remaining_term: any integer type
     *   - optional: pd_origination, lgd, collateral_value, undrawn_amount (float64),
     *     days_past_due (integer), collateral_type, facility_type (string),
     *     default_event, restructuring, watchlist, covenant_breach (bool)
     *   - Additional string columns are stored in attributes
     *
     * @param filepath Path to Parquet file
     * @return ExposureSet containing loaded exposures
     * @throws std::runtime_error if file cannot be read or schema is invalid
     */
    static credit::ExposureSet load_exposures(const std::string& filepath);
};

} // namespace io
} // namespace regcalc

#endif // REGCALC_PARQUET_READER_HPP
