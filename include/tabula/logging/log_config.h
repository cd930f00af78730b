#pragma once

#include <optional>
#include <string>
#include <vector>

#include <spdlog/common.h>

namespace tabula::logging {

using Level = spdlog::level::level_enum;

// Name under which the root (default) logger is listed.
inline constexpr const char* kRootLogger = "";

// Process-wide logging configuration: the set of registered loggers and their levels.
// Injected into components that need to adjust verbosity so tests can substitute a fake.
class LogConfig {
public:
    virtual ~LogConfig() = default;

    // Names of all currently registered loggers, the root logger included.
    virtual std::vector<std::string> registeredLoggers() const = 0;

    virtual void setLoggerLevel(const std::string& name, Level level) = 0;

    virtual std::optional<Level> loggerLevel(const std::string& name) const = 0;
};

// LogConfig over the global spdlog registry; the root logger is spdlog's default logger.
class SpdlogConfig final : public LogConfig {
public:
    std::vector<std::string> registeredLoggers() const override;
    void setLoggerLevel(const std::string& name, Level level) override;
    std::optional<Level> loggerLevel(const std::string& name) const override;
};

// Shared instance used when no explicit configuration is supplied.
LogConfig& defaultLogConfig();

} // namespace tabula::logging
