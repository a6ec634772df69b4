#include "parquet_reader.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/schema.h>
#include <set>
#endif

namespace regcalc {
namespace io {

#ifdef HAVE_ARROW

namespace {

// Numeric cell of any integer or floating column, or fallback when null/absent
double numeric_value(const std::shared_ptr<arrow::Array>& column, int64_t row, double fallback) {
    if (!column || column->IsNull(row)) {
        return fallback;
    }
    switch (column->type_id()) {
        case arrow::Type::DOUBLE:
            return std::static_pointer_cast<arrow::DoubleArray>(column)->Value(row);
        case arrow::Type::FLOAT:
            return std::static_pointer_cast<arrow::FloatArray>(column)->Value(row);
        case arrow::Type::INT64:
            return static_cast<double>(std::static_pointer_cast<arrow::Int64Array>(column)->Value(row));
        case arrow::Type::INT32:
            return std::static_pointer_cast<arrow::Int32Array>(column)->Value(row);
        case arrow::Type::UINT64:
            return static_cast<double>(std::static_pointer_cast<arrow::UInt64Array>(column)->Value(row));
        case arrow::Type::UINT32:
            return std::static_pointer_cast<arrow::UInt32Array>(column)->Value(row);
        case arrow::Type::UINT16:
            return std::static_pointer_cast<arrow::UInt16Array>(column)->Value(row);
        case arrow::Type::UINT8:
            return std::static_pointer_cast<arrow::UInt8Array>(column)->Value(row);
        default:
            throw std::runtime_error("Unsupported numeric column type: " + column->type()->ToString());
    }
}

std::string string_value(const std::shared_ptr<arrow::Array>& column, int64_t row) {
    if (!column || column->IsNull(row)) {
        return std::string();
    }
    if (column->type_id() != arrow::Type::STRING) {
        throw std::runtime_error("Expected string column, got " + column->type()->ToString());
    }
    return std::static_pointer_cast<arrow::StringArray>(column)->GetString(row);
}

bool bool_value(const std::shared_ptr<arrow::Array>& column, int64_t row) {
    if (!column || column->IsNull(row)) {
        return false;
    }
    if (column->type_id() == arrow::Type::BOOL) {
        return std::static_pointer_cast<arrow::BooleanArray>(column)->Value(row);
    }
    return numeric_value(column, row, 0.0) != 0.0;
}

} // anonymous namespace

credit::ExposureSet ParquetReader::load_exposures(const std::string& filepath) {
    credit::ExposureSet es;

    auto infile_result = arrow::io::ReadableFile::Open(filepath, arrow::default_memory_pool());
    if (!infile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + filepath + " - " +
                                 infile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::ReadableFile> infile = *infile_result;

    std::unique_ptr<parquet::arrow::FileReader> arrow_reader;
    auto status = parquet::arrow::OpenFile(infile, arrow::default_memory_pool(), &arrow_reader);
    if (!status.ok()) {
        throw std::runtime_error("Cannot create Parquet reader: " + status.ToString());
    }

    std::shared_ptr<arrow::Table> table;
    status = arrow_reader->ReadTable(&table);
    if (!status.ok()) {
        throw std::runtime_error("Cannot read Parquet table: " + status.ToString());
    }

    // One chunk per column so rows can be addressed directly
    auto combined = table->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        throw std::runtime_error("Cannot combine Parquet chunks: " + combined.status().ToString());
    }
    table = *combined;

    auto schema = table->schema();
    auto column = [&](const std::string& name) -> std::shared_ptr<arrow::Array> {
        int idx = schema->GetFieldIndex(name);
        if (idx < 0 || table->column(idx)->num_chunks() == 0) {
            return nullptr;
        }
        return table->column(idx)->chunk(0);
    };

    auto id_col = column("exposure_id");
    auto gca_col = column("gross_carrying_amount");
    auto pd_col = column("pd");
    auto eir_col = column("effective_rate");
    auto term_col = column("remaining_term");
    if (!id_col || !gca_col || !pd_col || !eir_col || !term_col) {
        throw std::runtime_error("Parquet file missing required columns. Expected: exposure_id, "
                                 "gross_carrying_amount, pd, effective_rate, remaining_term");
    }

    auto pd_orig_col = column("pd_origination");
    auto lgd_col = column("lgd");
    auto dpd_col = column("days_past_due");
    auto collateral_type_col = column("collateral_type");
    auto collateral_value_col = column("collateral_value");
    auto undrawn_col = column("undrawn_amount");
    auto facility_col = column("facility_type");
    auto default_col = column("default_event");
    auto restructuring_col = column("restructuring");
    auto watchlist_col = column("watchlist");
    auto covenant_col = column("covenant_breach");

    static const std::set<std::string> core = {
        "exposure_id", "gross_carrying_amount", "pd", "pd_origination", "lgd",
        "effective_rate", "remaining_term", "days_past_due", "collateral_type",
        "collateral_value", "undrawn_amount", "facility_type", "default_event",
        "restructuring", "watchlist", "covenant_breach"
    };

    int64_t num_rows = table->num_rows();
    es.reserve(static_cast<size_t>(num_rows));

    for (int64_t i = 0; i < num_rows; ++i) {
        credit::Exposure e;
        e.exposure_id = string_value(id_col, i);
        e.gross_carrying_amount = numeric_value(gca_col, i, 0.0);
        e.pd_annual = numeric_value(pd_col, i, 0.0);
        e.pd_at_origination = numeric_value(pd_orig_col, i, e.pd_annual);
        if (lgd_col && !lgd_col->IsNull(i)) {
            e.lgd = numeric_value(lgd_col, i, 0.0);
        }
        e.effective_rate = numeric_value(eir_col, i, 0.0);
        const std::string location = "row " + std::to_string(i + 1);
        e.remaining_term = credit::checked_count(numeric_value(term_col, i, 1.0), "remaining_term", location);
        e.days_past_due = credit::checked_count(numeric_value(dpd_col, i, 0.0), "days_past_due", location);
        e.collateral_type = credit::parse_collateral_type(string_value(collateral_type_col, i));
        e.collateral_value = numeric_value(collateral_value_col, i, 0.0);
        e.undrawn_amount = numeric_value(undrawn_col, i, 0.0);
        e.facility_type = credit::parse_facility_type(string_value(facility_col, i));
        e.flags.default_event = bool_value(default_col, i);
        e.flags.restructuring = bool_value(restructuring_col, i);
        e.flags.watchlist = bool_value(watchlist_col, i);
        e.flags.covenant_breach = bool_value(covenant_col, i);

        for (int col_idx = 0; col_idx < schema->num_fields(); ++col_idx) {
            const std::string& col_name = schema->field(col_idx)->name();
            if (core.count(col_name) != 0) {
                continue;
            }
            auto extra = column(col_name);
            if (extra && extra->type_id() == arrow::Type::STRING && !extra->IsNull(i)) {
                e.attributes[col_name] = string_value(extra, i);
            }
        }

        es.add(std::move(e));
    }

    return es;
}

#else // !HAVE_ARROW

credit::ExposureSet ParquetReader::load_exposures(const std::string& filepath) {
    (void)filepath;
    throw std::runtime_error("Apache Arrow not available. Rebuild with Arrow/Parquet installed to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace io
} // namespace regcalc
