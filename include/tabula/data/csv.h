#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tabula::data {

struct CsvAttributes {
    char delimiter = ',';
    char quoteChar = '"';
    bool hasHeader = false;

    static CsvAttributes defaultCsv() { return {}; }
    static CsvAttributes defaultCsvWithHeader() { return {',', '"', true}; }
    static CsvAttributes defaultTsv() { return {'\t', '"', false}; }
};

// Splits one record into fields. A quoted field may contain the delimiter, and a doubled quote
// inside it stands for a literal quote.
std::vector<std::string> parseCsvLine(std::string_view line, const CsvAttributes& attrs);

} // namespace tabula::data
