#include "parquet_reader.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/schema.h>
#endif

namespace debtcalc {

#ifdef HAVE_ARROW

namespace {

int64_t period_at(const std::shared_ptr<arrow::Array>& chunk, int64_t i) {
    switch (chunk->type_id()) {
        case arrow::Type::INT64:
            return std::static_pointer_cast<arrow::Int64Array>(chunk)->Value(i);
        case arrow::Type::INT32:
            return std::static_pointer_cast<arrow::Int32Array>(chunk)->Value(i);
        default:
            throw std::runtime_error("Parquet period column must be int32 or int64");
    }
}

} // anonymous namespace

std::vector<double> ParquetReader::load_period_values(const std::string& filepath,
                                                      const std::string& value_column) {
    // Open Parquet file
    std::shared_ptr<arrow::io::ReadableFile> infile;
    auto status = arrow::io::ReadableFile::Open(filepath, arrow::default_memory_pool(), &infile);
    if (!status.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + filepath + " - " + status.ToString());
    }

    std::unique_ptr<parquet::arrow::FileReader> arrow_reader;
    status = parquet::arrow::OpenFile(infile, arrow::default_memory_pool(), &arrow_reader);
    if (!status.ok()) {
        throw std::runtime_error("Cannot create Parquet reader: " + status.ToString());
    }

    std::shared_ptr<arrow::Table> table;
    status = arrow_reader->ReadTable(&table);
    if (!status.ok()) {
        throw std::runtime_error("Cannot read Parquet table: " + status.ToString());
    }

    auto schema = table->schema();
    int period_idx = schema->GetFieldIndex("period");
    int value_idx = schema->GetFieldIndex(value_column);
    if (period_idx < 0 || value_idx < 0) {
        throw std::runtime_error("Parquet file missing required columns. Expected: period, " +
                                 value_column);
    }

    auto periods = table->column(period_idx);
    auto values = table->column(value_idx);
    if (values->type()->id() != arrow::Type::DOUBLE) {
        throw std::runtime_error("Parquet column '" + value_column + "' must be float64");
    }

    std::vector<double> out;
    out.reserve(static_cast<size_t>(table->num_rows()));

    // Both columns come from the same row groups, so chunks line up
    for (int c = 0; c < periods->num_chunks(); ++c) {
        auto period_chunk = periods->chunk(c);
        auto value_chunk = std::static_pointer_cast<arrow::DoubleArray>(values->chunk(c));

        for (int64_t i = 0; i < period_chunk->length(); ++i) {
            if (period_chunk->IsNull(i) || value_chunk->IsNull(i)) {
                throw std::runtime_error("Parquet series contains null values");
            }
            int64_t period = period_at(period_chunk, i);
            if (period != static_cast<int64_t>(out.size()) + 1) {
                throw std::runtime_error("Parquet periods must be contiguous from 1; got " +
                                         std::to_string(period));
            }
            out.push_back(value_chunk->Value(i));
        }
    }

    if (out.empty()) {
        throw std::runtime_error("Parquet file contains no rows: " + filepath);
    }
    return out;
}

#else // !HAVE_ARROW

std::vector<double> ParquetReader::load_period_values(const std::string& filepath,
                                                      const std::string& value_column) {
    (void)filepath;
    (void)value_column;
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace debtcalc
