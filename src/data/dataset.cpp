#include <tabula/data/dataset.h>

#include <algorithm>
#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>

#include <tabula/common/string_utils.h>

namespace tabula::data {

namespace {

Result<Row> parseRecord(const std::vector<std::string>& fields, const SchemaDescription& schema,
                        std::string_view recordText) {
    if (fields.size() != schema.size()) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Record '{}' has {} fields, schema '{}' expects {}", recordText,
                                 fields.size(), schema.toString(), schema.size())};
    }

    Row row;
    row.reserve(fields.size());
    for (std::size_t i = 0; i < fields.size(); ++i) {
        auto value = parseValue(fields[i], schema.entries()[i].type);
        if (!value) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Record '{}', field '{}': {}", recordText,
                                     schema.entries()[i].name, value.error().message)};
        }
        row.push_back(std::move(value).value());
    }
    return row;
}

} // namespace

Dataset::Dataset(std::shared_ptr<compute::ComputeContext> context, SchemaDescription schema,
                 std::vector<Row> rows)
    : context_(std::move(context)), schema_(std::move(schema)) {
    if (!context_) {
        throw compute::LifecycleError("Cannot create a dataset without a compute context");
    }
    context_->requireActive("create a dataset");

    partitions_.resize(std::max<std::size_t>(1, context_->parallelism()));
    for (std::size_t i = 0; i < rows.size(); ++i) {
        partitions_[i % partitions_.size()].push_back(std::move(rows[i]));
    }
}

std::vector<Row> Dataset::collect() const {
    std::vector<std::vector<Row>> gathered(partitions_.size());
    context_->parallelFor(partitions_.size(),
                          [&](std::size_t p) { gathered[p] = partitions_[p]; });

    std::vector<Row> rows;
    for (auto& part : gathered) {
        std::move(part.begin(), part.end(), std::back_inserter(rows));
    }
    return rows;
}

std::vector<std::string> Dataset::collectRendered() const {
    std::vector<std::vector<std::string>> gathered(partitions_.size());
    context_->parallelFor(partitions_.size(), [&](std::size_t p) {
        gathered[p].reserve(partitions_[p].size());
        for (const auto& row : partitions_[p]) {
            gathered[p].push_back(renderRow(row));
        }
    });

    std::vector<std::string> rendered;
    for (auto& part : gathered) {
        std::move(part.begin(), part.end(), std::back_inserter(rendered));
    }
    return rendered;
}

std::size_t Dataset::count() const {
    context_->requireActive("count a dataset");
    std::size_t total = 0;
    for (const auto& part : partitions_) {
        total += part.size();
    }
    return total;
}

Result<Dataset> Dataset::unionAll(const Dataset& other) const {
    if (context_ != other.context_) {
        return Error{ErrorCode::InvalidArgument, "Cannot union datasets from different contexts"};
    }
    if (schema_ != other.schema_) {
        return Error{ErrorCode::SchemaMismatch,
                     fmt::format("Cannot union '{}' with '{}'", schema_.toString(),
                                 other.schema_.toString())};
    }

    auto rows = collect();
    auto more = other.collect();
    std::move(more.begin(), more.end(), std::back_inserter(rows));
    return Dataset(context_, schema_, std::move(rows));
}

QuerySession::QuerySession(std::shared_ptr<compute::ComputeContext> context)
    : context_(std::move(context)) {
    if (!context_) {
        throw compute::LifecycleError("Cannot open a query session without a compute context");
    }
}

Result<Dataset> QuerySession::createDataset(std::string_view schema,
                                            std::string_view data) const {
    auto parsed = SchemaDescription::fromString(schema);
    if (!parsed) {
        return parsed.error();
    }

    const CsvAttributes attrs = CsvAttributes::defaultCsv();
    std::vector<Row> rows;
    for (const auto& piece : common::split(data, ';')) {
        auto record = common::trimmed(piece);
        if (record.empty()) {
            continue;
        }
        auto row = parseRecord(parseCsvLine(record, attrs), parsed.value(), record);
        if (!row) {
            return row.error();
        }
        rows.push_back(std::move(row).value());
    }
    return createDataset(std::move(parsed).value(), std::move(rows));
}

Result<Dataset> QuerySession::createDataset(SchemaDescription schema,
                                            std::vector<Row> rows) const {
    for (const auto& row : rows) {
        if (row.size() != schema.size()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Row {} does not match schema '{}'", renderRow(row),
                                     schema.toString())};
        }
    }
    return Dataset(context_, std::move(schema), std::move(rows));
}

Result<Dataset> QuerySession::readCsv(const std::filesystem::path& path,
                                      const CsvAttributes& attrs,
                                      std::optional<SchemaDescription> schema) const {
    if (!schema) {
        auto fromFile = SchemaDescription::fromFile(SchemaDescription::schemaPathFor(path));
        if (!fromFile) {
            return fromFile.error();
        }
        schema = std::move(fromFile).value();
    }

    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, fmt::format("Cannot open {}", path.string())};
    }

    std::vector<Row> rows;
    std::string line;
    bool skipHeader = attrs.hasHeader;
    while (std::getline(in, line)) {
        if (common::trimmed(line).empty()) {
            continue;
        }
        if (skipHeader) {
            skipHeader = false;
            continue;
        }
        auto row = parseRecord(parseCsvLine(line, attrs), *schema, line);
        if (!row) {
            return Error{row.error().code,
                         fmt::format("{}: {}", path.string(), row.error().message)};
        }
        rows.push_back(std::move(row).value());
    }

    spdlog::debug("Read {} rows from {}", rows.size(), path.string());
    return createDataset(std::move(*schema), std::move(rows));
}

} // namespace tabula::data
