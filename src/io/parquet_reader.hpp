#ifndef DEBTCALC_PARQUET_READER_HPP
#define DEBTCALC_PARQUET_READER_HPP

#include <string>
#include <vector>

namespace debtcalc {

class ParquetReader {
public:
    /**
     * Load a per-period series (CFADS or exchange rates) from a Parquet file.
     *
     * Expected schema:
     *   - period: int32 or int64, contiguous from 1
     *   - <value_column>: float64
     *
     * @param filepath Path to Parquet file
     * @param value_column Name of the value column ("cfads", "rate")
     * @return Values ordered by period
     * @throws std::runtime_error if file cannot be read or schema is invalid
     */
    static std::vector<double> load_period_values(const std::string& filepath,
                                                  const std::string& value_column);
};

} // namespace debtcalc

#endif // DEBTCALC_PARQUET_READER_HPP
