#ifndef DEBTCALC_CSV_READER_HPP
#define DEBTCALC_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace debtcalc {

class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    static std::string trim(const std::string& s);
};

// Reads a two-column "period,value" table (header row first). Periods must
// run 1, 2, 3, ... without gaps. Blank lines are skipped.
// Throws ConfigParseError on malformed rows or non-contiguous periods.
std::vector<double> read_period_values_csv(std::istream& is, const std::string& what);

} // namespace debtcalc

#endif // DEBTCALC_CSV_READER_HPP
