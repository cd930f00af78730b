#include <tabula/app/app_config.h>

#include <CLI/CLI.hpp>

#include <tabula/common/string_utils.h>

namespace tabula::app {

Result<AppConfig> AppConfig::parse(const std::vector<std::string>& args) {
    AppConfig config;
    std::vector<std::string> rawProps;

    CLI::App cli{"tabula application", "tabula"};
    cli.add_option("-m,--run-module", config.modules, "Modules to run");
    cli.add_option("--data-dir", config.dataDir, "Top level data directory")->required();
    cli.add_option("--input-dir", config.inputDir, "Input directory (default <data-dir>/input)");
    cli.add_option("--output-dir", config.outputDir,
                   "Output directory (default <data-dir>/output)");
    cli.add_option("--props", rawProps, "Properties as key=value");

    // CLI11 consumes a vector argument list from the back.
    std::vector<std::string> reversed(args.rbegin(), args.rend());
    try {
        cli.parse(reversed);
    } catch (const CLI::ParseError& e) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Invalid application arguments: {}", e.what())};
    }

    for (const auto& raw : rawProps) {
        auto eq = raw.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Property '{}' is not of the form key=value", raw)};
        }
        config.props[common::trimmed(std::string_view(raw).substr(0, eq))] =
            common::trimmed(std::string_view(raw).substr(eq + 1));
    }

    if (config.inputDir.empty()) {
        config.inputDir = config.dataDir / "input";
    }
    if (config.outputDir.empty()) {
        config.outputDir = config.dataDir / "output";
    }
    return config;
}

std::vector<std::string> AppConfig::modulesToRun() const {
    std::vector<std::string> out;
    for (const auto& m : modules) {
        if (m != kNoModule) {
            out.push_back(m);
        }
    }
    return out;
}

std::optional<std::string> AppConfig::prop(const std::string& key) const {
    if (auto it = props.find(key); it != props.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace tabula::app
