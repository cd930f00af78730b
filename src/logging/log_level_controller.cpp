#include <tabula/logging/log_level_controller.h>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace tabula::logging {

void LogLevelController::setLevel(Level target) noexcept {
    // The logging subsystem itself is what failed, so failures go to stderr.
    std::vector<std::string> names;
    try {
        names = config_.registeredLoggers();
    } catch (const std::exception& e) {
        std::cerr << "Warning: failed to list loggers: " << e.what() << std::endl;
        return;
    }

    for (const auto& name : names) {
        try {
            config_.setLoggerLevel(name, target);
        } catch (const std::exception& e) {
            std::cerr << "Warning: failed to set level of logger '" << name << "' to "
                      << spdlog::level::to_string_view(target).data() << ": " << e.what()
                      << std::endl;
        }
    }
}

} // namespace tabula::logging
