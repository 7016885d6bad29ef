// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcpmux/App.hpp>
#include <mcpmux/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcpmux - chat with an LLM that uses tools from several MCP servers" };

    auto configPath = std::string {};
    auto model = std::string {};
    auto historyWindow = -1;
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--model", model, "LLM model name");
    app.add_option("--history-window", historyWindow, "Number of past turns sent with each request")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        mcpmux::log::setLevel(mcpmux::log::Level::Debug);

    auto configResult = configPath.empty() ? mcpmux::loadConfig() : mcpmux::loadConfigFromFile(configPath);
    if (!configResult)
    {
        mcpmux::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!model.empty())
        config.llm.model = model;
    if (historyWindow >= 0)
        config.conversation.historyWindow = historyWindow;
    if (verbose)
        config.log.level = mcpmux::log::Level::Debug;

    auto application = mcpmux::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        mcpmux::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
