#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tabula/compute/compute_context.h>
#include <tabula/core/types.h>
#include <tabula/data/csv.h>
#include <tabula/data/schema.h>
#include <tabula/data/value.h>

namespace tabula::data {

/**
 * Rows with a schema, spread round-robin over one partition per worker of the owning context.
 *
 * Rows come back from collect() partition by partition, so with more than one partition their
 * order differs from the order they were supplied in. Callers must not rely on row order.
 * Every materializing call requires the owning context to still be active.
 */
class Dataset {
public:
    // Throws compute::LifecycleError when the context is null or not active.
    Dataset(std::shared_ptr<compute::ComputeContext> context, SchemaDescription schema,
            std::vector<Row> rows);

    const SchemaDescription& schema() const noexcept { return schema_; }
    std::size_t numPartitions() const noexcept { return partitions_.size(); }

    std::vector<Row> collect() const;

    // renderRow() of every row, computed on the workers; same order as collect().
    std::vector<std::string> collectRendered() const;

    std::size_t count() const;

    // Rows of both datasets. The schemas must render identically and both datasets must live on
    // the same context.
    Result<Dataset> unionAll(const Dataset& other) const;

private:
    std::shared_ptr<compute::ComputeContext> context_;
    SchemaDescription schema_;
    std::vector<std::vector<Row>> partitions_;
};

// Entry point for building datasets on a context.
class QuerySession {
public:
    explicit QuerySession(std::shared_ptr<compute::ComputeContext> context);

    compute::ComputeContext& context() const { return *context_; }

    // Rows are separated by ';' and fields by ','; see parseValue() for field syntax.
    Result<Dataset> createDataset(std::string_view schema, std::string_view data) const;

    Result<Dataset> createDataset(SchemaDescription schema, std::vector<Row> rows) const;

    // Reads a delimited file. Without an explicit schema the ".schema" file next to it is used.
    Result<Dataset> readCsv(const std::filesystem::path& path,
                            const CsvAttributes& attrs = CsvAttributes::defaultCsv(),
                            std::optional<SchemaDescription> schema = std::nullopt) const;

private:
    std::shared_ptr<compute::ComputeContext> context_;
};

} // namespace tabula::data
