#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <tabula/core/types.h>

namespace tabula::app {

// Module name that selects nothing to run.
inline constexpr const char* kNoModule = "None";

struct AppConfig {
    std::vector<std::string> modules;
    std::filesystem::path dataDir;
    std::filesystem::path inputDir;
    std::filesystem::path outputDir;
    std::map<std::string, std::string> props;

    // Parses an argument vector without the program name:
    //   -m,--run-module NAME...   modules to run ("None" runs nothing)
    //   --data-dir DIR            required
    //   --input-dir DIR           defaults to <data-dir>/input
    //   --output-dir DIR          defaults to <data-dir>/output
    //   --props KEY=VALUE...
    static Result<AppConfig> parse(const std::vector<std::string>& args);

    // Modules other than the "None" placeholder.
    std::vector<std::string> modulesToRun() const;

    std::optional<std::string> prop(const std::string& key) const;
};

} // namespace tabula::app
