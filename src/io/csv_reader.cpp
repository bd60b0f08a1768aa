#include "csv_reader.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace debtcalc {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    std::string line;

    if (!std::getline(is_, line)) {
        return row;
    }
    ++line_number_;

    // Tolerate CRLF files
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::stringstream ss(line);
    std::string cell;

    while (std::getline(ss, cell, delimiter_)) {
        row.push_back(trim(cell));
    }

    return row;
}

bool CsvReader::has_more() const {
    return is_.good() && is_.peek() != EOF;
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::vector<double> read_period_values_csv(std::istream& is, const std::string& what) {
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    } else {
        throw ConfigParseError("Empty " + what + " CSV");
    }

    std::vector<double> values;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;

        if (row.size() < 2) {
            throw ConfigParseError(what + " CSV requires columns: period,value (line " +
                                   std::to_string(reader.line_number()) + ")");
        }

        size_t period = 0;
        double value = 0.0;
        try {
            period = static_cast<size_t>(std::stoul(row[0]));
            value = std::stod(row[1]);
        } catch (const std::exception& e) {
            throw ConfigParseError("Invalid " + what + " CSV row at line " +
                                   std::to_string(reader.line_number()) + ": " + e.what());
        }

        if (period != values.size() + 1) {
            throw ConfigParseError(what + " CSV periods must be contiguous from 1; got period " +
                                   std::to_string(period) + " at line " +
                                   std::to_string(reader.line_number()));
        }
        values.push_back(value);
    }

    if (values.empty()) {
        throw ConfigParseError(what + " CSV contains no data rows");
    }
    return values;
}

} // namespace debtcalc
