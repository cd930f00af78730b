#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <tabula/app/app_config.h>
#include <tabula/compute/compute_context.h>
#include <tabula/core/types.h>
#include <tabula/data/dataset.h>

namespace tabula::app {

// Application state for one run: its configuration plus a query session on an externally
// supplied compute context. Owned by whoever called init(); there is no global instance.
class Application {
public:
    static Result<std::unique_ptr<Application>>
    init(const std::vector<std::string>& args, std::shared_ptr<compute::ComputeContext> context);

    const AppConfig& config() const noexcept { return config_; }
    compute::ComputeContext& context() const { return session_.context(); }
    const data::QuerySession& session() const noexcept { return session_; }

    Result<data::Dataset> createDataset(std::string_view schema, std::string_view data) const;

    // Relative paths resolve against the input directory.
    Result<data::Dataset>
    readCsv(const std::filesystem::path& path,
            const data::CsvAttributes& attrs = data::CsvAttributes::defaultCsv()) const;

private:
    Application(AppConfig config, std::shared_ptr<compute::ComputeContext> context);

    AppConfig config_;
    data::QuerySession session_;
};

} // namespace tabula::app
