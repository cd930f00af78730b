#include <tabula/data/value.h>

#include <type_traits>

#include <spdlog/fmt/fmt.h>

namespace tabula::data {

namespace {

template <typename F> std::string renderFloating(F v) {
    auto text = fmt::format("{}", v);
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

} // namespace

std::string renderValue(const Value& v) {
    return std::visit(
        [](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return x ? "true" : "false";
            } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
                return renderFloating(x);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return x;
            } else {
                return std::to_string(x);
            }
        },
        v);
}

std::string renderRow(const Row& row) {
    std::string out = "[";
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += renderValue(row[i]);
    }
    out += ']';
    return out;
}

} // namespace tabula::data
