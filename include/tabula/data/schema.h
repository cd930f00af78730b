#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include <tabula/core/types.h>
#include <tabula/data/value.h>

namespace tabula::data {

enum class FieldType { String, Integer, Long, Float, Double, Boolean };

const char* fieldTypeName(FieldType type);

// Case-insensitive lookup of a type tag ("String", "integer", ...).
std::optional<FieldType> parseFieldType(std::string_view name);

// Parses the text of one field. An empty string is null except for String fields.
Result<Value> parseValue(std::string_view text, FieldType type);

struct SchemaEntry {
    std::string name;
    FieldType type;

    // "name: Type"
    std::string toString() const;

    bool operator==(const SchemaEntry&) const = default;
};

// Separators of the compact schema string. The defaults give "a: String; b: Integer".
struct SchemaDelimiters {
    char fieldSeparator = ';';
    char typeSeparator = ':';
};

/**
 * Ordered list of (name, type) fields.
 *
 * The canonical rendering joins "name: Type" entries with "; ". Parsing a canonical rendering
 * and rendering it again yields the same string, and two descriptions compare equal iff their
 * renderings do, so field order is significant.
 */
class SchemaDescription {
public:
    SchemaDescription() = default;
    explicit SchemaDescription(std::vector<SchemaEntry> entries) : entries_(std::move(entries)) {}

    static Result<SchemaDescription> fromString(std::string_view text,
                                                SchemaDelimiters delimiters = {});

    // {"fields":[{"name":"a","type":"String"}, ...]}
    static Result<SchemaDescription> fromJson(const nlohmann::json& json);

    // One "name: Type" entry per line with '#' comments, or the JSON form when the file
    // starts with '{'.
    static Result<SchemaDescription> fromFile(const std::filesystem::path& path);

    // Schema file that accompanies a data file: same stem, ".schema" extension.
    static std::filesystem::path schemaPathFor(const std::filesystem::path& dataPath);

    nlohmann::json toJson() const;
    std::string toString() const;

    const std::vector<SchemaEntry>& entries() const noexcept { return entries_; }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    bool operator==(const SchemaDescription& other) const { return toString() == other.toString(); }

private:
    std::vector<SchemaEntry> entries_;
};

} // namespace tabula::data
