#include <tabula/data/schema.h>

#include <charconv>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include <tabula/common/string_utils.h>

namespace tabula::data {

namespace {

constexpr FieldType kAllTypes[] = {FieldType::String, FieldType::Integer, FieldType::Long,
                                   FieldType::Float,  FieldType::Double,  FieldType::Boolean};

template <typename T> Result<Value> parseNumber(std::string_view text, FieldType type) {
    T parsed{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Cannot parse '{}' as {}", text, fieldTypeName(type))};
    }
    return Value{parsed};
}

Result<SchemaEntry> parseEntry(std::string_view piece, char typeSeparator) {
    auto sep = piece.find(typeSeparator);
    if (sep == std::string_view::npos) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Schema entry '{}' is missing the '{}' type separator",
                                 common::trimmed(piece), typeSeparator)};
    }
    auto name = common::trimmed(piece.substr(0, sep));
    auto typeName = common::trimmed(piece.substr(sep + 1));
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Schema entry '{}' has an empty field name",
                                 common::trimmed(piece))};
    }
    auto type = parseFieldType(typeName);
    if (!type) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Unknown type '{}' for field '{}'", typeName, name)};
    }
    return SchemaEntry{std::move(name), *type};
}

} // namespace

const char* fieldTypeName(FieldType type) {
    switch (type) {
        case FieldType::String: return "String";
        case FieldType::Integer: return "Integer";
        case FieldType::Long: return "Long";
        case FieldType::Float: return "Float";
        case FieldType::Double: return "Double";
        case FieldType::Boolean: return "Boolean";
    }
    return "String";
}

std::optional<FieldType> parseFieldType(std::string_view name) {
    for (auto type : kAllTypes) {
        if (common::iequals(name, fieldTypeName(type))) {
            return type;
        }
    }
    return std::nullopt;
}

Result<Value> parseValue(std::string_view text, FieldType type) {
    if (type == FieldType::String) {
        return Value{std::string(text)};
    }

    auto value = common::trimmed(text);
    if (value.empty()) {
        return Value{};
    }

    switch (type) {
        case FieldType::Integer: return parseNumber<std::int32_t>(value, type);
        case FieldType::Long: return parseNumber<std::int64_t>(value, type);
        case FieldType::Float: return parseNumber<float>(value, type);
        case FieldType::Double: return parseNumber<double>(value, type);
        case FieldType::Boolean:
            if (common::iequals(value, "true")) {
                return Value{true};
            }
            if (common::iequals(value, "false")) {
                return Value{false};
            }
            return Error{ErrorCode::InvalidData,
                         fmt::format("Cannot parse '{}' as Boolean", value)};
        case FieldType::String: break;
    }
    return Value{std::string(text)};
}

std::string SchemaEntry::toString() const {
    return name + ": " + fieldTypeName(type);
}

Result<SchemaDescription> SchemaDescription::fromString(std::string_view text,
                                                        SchemaDelimiters delimiters) {
    std::vector<SchemaEntry> entries;
    for (const auto& piece : common::split(text, delimiters.fieldSeparator)) {
        if (common::trimmed(piece).empty()) {
            continue;
        }
        auto entry = parseEntry(piece, delimiters.typeSeparator);
        if (!entry) {
            return entry.error();
        }
        entries.push_back(std::move(entry).value());
    }
    return SchemaDescription{std::move(entries)};
}

Result<SchemaDescription> SchemaDescription::fromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("fields") || !json["fields"].is_array()) {
        return Error{ErrorCode::InvalidArgument, "Schema JSON must be an object with a 'fields' array"};
    }

    std::vector<SchemaEntry> entries;
    for (const auto& field : json["fields"]) {
        if (!field.is_object() || !field.contains("name") || !field.contains("type") ||
            !field["name"].is_string() || !field["type"].is_string()) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Malformed schema field: {}", field.dump())};
        }
        auto name = field["name"].get<std::string>();
        auto typeName = field["type"].get<std::string>();
        auto type = parseFieldType(typeName);
        if (!type) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Unknown type '{}' for field '{}'", typeName, name)};
        }
        entries.push_back(SchemaEntry{std::move(name), *type});
    }
    return SchemaDescription{std::move(entries)};
}

Result<SchemaDescription> SchemaDescription::fromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("Cannot open schema file {}", path.string())};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto content = buffer.str();

    auto head = common::trimmed(content);
    if (!head.empty() && head.front() == '{') {
        auto json = nlohmann::json::parse(content, nullptr, false);
        if (json.is_discarded()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Schema file {} is not valid JSON", path.string())};
        }
        return fromJson(json);
    }

    std::vector<SchemaEntry> entries;
    for (auto line : common::split(content, '\n')) {
        if (auto hash = line.find('#'); hash != std::string::npos) {
            line.erase(hash);
        }
        common::trim(line);
        if (line.empty()) {
            continue;
        }
        auto entry = parseEntry(line, ':');
        if (!entry) {
            return Error{entry.error().code,
                         fmt::format("{}: {}", path.string(), entry.error().message)};
        }
        entries.push_back(std::move(entry).value());
    }
    return SchemaDescription{std::move(entries)};
}

std::filesystem::path SchemaDescription::schemaPathFor(const std::filesystem::path& dataPath) {
    auto schemaPath = dataPath;
    schemaPath.replace_extension(".schema");
    return schemaPath;
}

nlohmann::json SchemaDescription::toJson() const {
    auto fields = nlohmann::json::array();
    for (const auto& e : entries_) {
        fields.push_back({{"name", e.name}, {"type", fieldTypeName(e.type)}});
    }
    return nlohmann::json{{"fields", std::move(fields)}};
}

std::string SchemaDescription::toString() const {
    std::string out;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (i > 0) {
            out += "; ";
        }
        out += entries_[i].toString();
    }
    return out;
}

} // namespace tabula::data
