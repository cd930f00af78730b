#include <tabula/data/csv.h>

namespace tabula::data {

std::vector<std::string> parseCsvLine(std::string_view line, const CsvAttributes& attrs) {
    std::vector<std::string> fields;
    std::string current;
    bool inQuotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (inQuotes) {
            if (c == attrs.quoteChar) {
                if (i + 1 < line.size() && line[i + 1] == attrs.quoteChar) {
                    current += c;
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == attrs.quoteChar) {
            inQuotes = true;
        } else if (c == attrs.delimiter) {
            fields.push_back(std::move(current));
            current.clear();
        } else if (c != '\r') {
            current += c;
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

} // namespace tabula::data
