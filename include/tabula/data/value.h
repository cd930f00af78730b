#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tabula::data {

// A single cell. std::monostate is null.
using Value = std::variant<std::monostate, bool, std::int32_t, std::int64_t, float, double, std::string>;

using Row = std::vector<Value>;

inline bool isNull(const Value& v) noexcept {
    return std::holds_alternative<std::monostate>(v);
}

// Canonical text of a value: "null", "true"/"false", decimal integers, and floating point values
// in shortest round-trip form that always reads as floating point ("2.0", "0.5", "1e+20").
std::string renderValue(const Value& v);

// "[v1,v2,...]"
std::string renderRow(const Row& row);

} // namespace tabula::data
