#pragma once

#include <tabula/logging/log_config.h>

namespace tabula::logging {

// Verbosity used while a compute context is up: errors only.
inline constexpr Level kErrorsOnly = spdlog::level::err;
// Verbosity used when a suite asks for logging to be disabled.
inline constexpr Level kSilent = spdlog::level::off;

// Forces every registered logger to one level. This is not a scoped save/restore: the new level
// stays in effect for the rest of the process until setLevel is called again.
class LogLevelController {
public:
    explicit LogLevelController(LogConfig& config) : config_(config) {}

    void setLevel(Level target) noexcept;

    LogConfig& config() const noexcept { return config_; }

private:
    LogConfig& config_;
};

} // namespace tabula::logging
