#include <tabula/logging/log_config.h>

#include <algorithm>
#include <memory>

#include <spdlog/spdlog.h>

namespace tabula::logging {

namespace {

std::shared_ptr<spdlog::logger> lookup(const std::string& name) {
    if (name == kRootLogger) {
        return spdlog::default_logger();
    }
    return spdlog::get(name);
}

} // namespace

std::vector<std::string> SpdlogConfig::registeredLoggers() const {
    std::vector<std::string> names;
    spdlog::apply_all(
        [&names](const std::shared_ptr<spdlog::logger>& logger) { names.push_back(logger->name()); });

    // The default logger is normally registered under "", but may have been replaced by one that
    // never went through the registry.
    if (spdlog::default_logger_raw() != nullptr &&
        std::find(names.begin(), names.end(), kRootLogger) == names.end()) {
        names.insert(names.begin(), kRootLogger);
    }
    return names;
}

void SpdlogConfig::setLoggerLevel(const std::string& name, Level level) {
    if (auto logger = lookup(name)) {
        logger->set_level(level);
    }
}

std::optional<Level> SpdlogConfig::loggerLevel(const std::string& name) const {
    if (auto logger = lookup(name)) {
        return logger->level();
    }
    return std::nullopt;
}

LogConfig& defaultLogConfig() {
    static SpdlogConfig instance;
    return instance;
}

} // namespace tabula::logging
