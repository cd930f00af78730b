#include <tabula/app/application.h>

#include <spdlog/spdlog.h>

#include <tabula/common/string_utils.h>

namespace tabula::app {

Application::Application(AppConfig config, std::shared_ptr<compute::ComputeContext> context)
    : config_(std::move(config)), session_(std::move(context)) {}

Result<std::unique_ptr<Application>>
Application::init(const std::vector<std::string>& args,
                  std::shared_ptr<compute::ComputeContext> context) {
    if (!context || !context->isActive()) {
        return Error{ErrorCode::InvalidState, "Application requires an active compute context"};
    }

    auto config = AppConfig::parse(args);
    if (!config) {
        return config.error();
    }

    spdlog::info("Initialized application on '{}' (data dir {}, modules [{}])", context->name(),
                 config.value().dataDir.string(), common::join(config.value().modules, ", "));
    return std::unique_ptr<Application>(
        new Application(std::move(config).value(), std::move(context)));
}

Result<data::Dataset> Application::createDataset(std::string_view schema,
                                                 std::string_view data) const {
    return session_.createDataset(schema, data);
}

Result<data::Dataset> Application::readCsv(const std::filesystem::path& path,
                                           const data::CsvAttributes& attrs) const {
    auto resolved = path.is_absolute() ? path : config_.inputDir / path;
    return session_.readCsv(resolved, attrs);
}

} // namespace tabula::app
