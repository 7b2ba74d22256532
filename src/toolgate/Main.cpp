// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <core/Version.hpp>
#include <toolgate/App.hpp>
#include <toolgate/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <print>

int main(int argc, char** argv)
{
    using namespace toolgate;

    auto app = CLI::App { std::format("{} - {}", ProductName, ProductDescription) };

    auto configPath = std::string { "config.json" };
    auto logLevel = std::string {};
    auto logFormat = std::string {};
    auto verbose = false;
    auto showVersion = false;

    app.add_option("-c,--config", configPath, "Path to config file")->capture_default_str();
    app.add_option("--log-level", logLevel, "Log level (trace|debug|info|warn|error), overrides the config");
    app.add_option("--log-format", logFormat, "Log format (pretty|json), overrides the config");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_flag("--version", showVersion, "Print the version and exit");

    CLI11_PARSE(app, argc, argv);

    if (showVersion)
    {
        std::println("{} {}", ProductName, ProductVersion);
        return 0;
    }

    auto configResult = loadConfigFromFile(configPath);
    if (!configResult)
    {
        log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // CLI overrides
    if (!logLevel.empty())
        config.logging.level = logLevel;
    if (!logFormat.empty())
        config.logging.format = logFormat;
    if (verbose)
        config.logging.level = "debug";

    auto const level = log::parseLevel(config.logging.level);
    auto const format = log::parseFormat(config.logging.format);
    if (!level || !format)
    {
        log::error("Invalid logging options: level '{}', format '{}'", config.logging.level, config.logging.format);
        return 1;
    }
    log::setLevel(*level);
    log::setFormat(*format);

    auto application = App(std::move(config));
    if (auto initResult = application.initialize(); !initResult)
    {
        log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
