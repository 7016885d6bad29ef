// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <agent/Orchestrator.hpp>
#include <core/Log.hpp>
#include <llm/Conversation.hpp>
#include <llm/LlmClient.hpp>
#include <mcp/CurlHttpClient.hpp>
#include <mcp/ResultNormalizer.hpp>
#include <mcp/ToolClient.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <print>

namespace mcpmux
{

namespace
{

    constexpr auto HistoryPreviewLength = std::size_t { 200 };
    constexpr auto RecentInteractionCount = std::size_t { 10 };

    auto toLower(std::string_view text) -> std::string
    {
        auto lowered = std::string(text);
        std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });
        return lowered;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

} // namespace

auto connectBackends(std::span<const BackendConfig> backends,
                     ToolRegistry& registry,
                     HttpClient& http,
                     InteractionObserver* observer) -> std::vector<BackendFailure>
{
    auto failures = std::vector<BackendFailure> {};
    auto fail = [&](const BackendConfig& backend, Error error) {
        log::error("Backend '{}' not available: {}", backend.name, error.message);
        if (observer)
            observer->onServerConnection(backend.name, backendKindToString(backend.kind), false, 0, error.message);
        failures.push_back(BackendFailure { .name = backend.name, .error = std::move(error) });
    };

    for (const auto& backend: backends)
    {
        if (registry.contains(backend.name))
        {
            fail(backend, Error { ErrorCode::DuplicateServer,
                                  std::format("Server '{}' is already registered", backend.name) });
            continue;
        }

        auto client = makeToolClient(backend, http, observer);
        if (!client)
        {
            fail(backend, client.error());
            continue;
        }

        // ToolClient reports its own connection outcome to the observer.
        if (auto tools = (*client)->initialize(); !tools)
        {
            failures.push_back(BackendFailure { .name = backend.name, .error = tools.error() });
            continue;
        }

        if (auto registered = registry.registerClient(backend.name, std::move(*client)); !registered)
            fail(backend, registered.error());
    }

    return failures;
}

struct App::Impl
{
    AppConfig config;
    std::unique_ptr<HttpClient> http;
    InteractionLog interactions;
    ToolRegistry registry;
    Conversation conversation;
    LlmClient llm;
    Orchestrator orchestrator;
    std::vector<BackendFailure> failures;

    std::mutex logFileMutex;
    std::ofstream logFile;
    bool shutDown = false;

    Impl(AppConfig cfg, std::unique_ptr<HttpClient> client):
        config(std::move(cfg)),
        http(client ? std::move(client) : std::make_unique<CurlHttpClient>()),
        interactions(static_cast<std::size_t>(config.log.interactionCapacity)),
        registry(&interactions),
        llm(makeLlmConfig(config.llm), *http),
        orchestrator(llm, registry, conversation, makeOrchestratorConfig(config))
    {
    }

    static auto makeLlmConfig(const LlmConfig& llm) -> LlmClientConfig
    {
        auto const* const apiKey = std::getenv(llm.apiKeyEnv.c_str());
        return LlmClientConfig {
            .endpoint = llm.endpoint,
            .apiKey = apiKey ? apiKey : "",
            .model = llm.model,
            .maxTokens = llm.maxTokens,
            .timeout = std::chrono::seconds(llm.timeoutSeconds),
        };
    }

    static auto makeOrchestratorConfig(const AppConfig& config) -> OrchestratorConfig
    {
        return OrchestratorConfig {
            .historyWindow = static_cast<std::size_t>(config.conversation.historyWindow),
            .maxResultLength = static_cast<std::size_t>(config.conversation.maxResultLength),
            .maxToolSteps = config.conversation.maxToolSteps,
            .systemPrompt = config.llm.systemPrompt,
        };
    }

    void writeLog(log::Level level, std::string_view message)
    {
        if (level <= log::Level::Warning)
            std::println(stderr, "[{}] {}", log::levelTag(level), message);

        auto const lock = std::lock_guard(logFileMutex);
        if (logFile.is_open())
        {
            auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
            std::println(logFile, "{:%F %T} [{}] {}", now, log::levelTag(level), message);
            logFile.flush();
        }
    }

    void printServers()
    {
        std::println("\nConnected servers ({}):", registry.serverCount());
        for (const auto& server: registry.servers())
            std::println("  + {} ({}): {} tools", server.name, backendKindToString(server.kind), server.toolCount);
        if (!failures.empty())
        {
            std::println("Failed servers ({}):", failures.size());
            for (const auto& failure: failures)
                std::println("  - {}: {}", failure.name, failure.error.message);
        }

        auto const catalog = registry.aggregateCatalog();
        std::println("Tools available to the assistant: {}", catalog.size());
        for (const auto& tool: catalog)
            std::println("  {}.{}", tool.owningServer, tool.name);
        std::println("");
    }

    void printInteractions()
    {
        auto const summary = interactions.summary();
        std::println("\nInteractions: {} total, {} tool calls ({} ok, {} failed), {} connections ({} failed)",
                     summary.total, summary.toolCalls, summary.successfulCalls, summary.failedCalls,
                     summary.connections, summary.failedConnections);
        for (const auto& entry: interactions.recent(RecentInteractionCount))
            std::println("{}", formatInteraction(entry));
        std::println("");
    }

    void printHistory()
    {
        if (conversation.empty())
        {
            std::println("No conversation history yet.");
            return;
        }

        auto index = 0;
        for (const auto& turn: conversation.turns())
        {
            std::println("\n[{}] {}:", ++index, turn.role == Role::User ? "User" : "Assistant");
            if (turn.text.size() > HistoryPreviewLength)
            {
                std::println("{}", truncateText(turn.text, HistoryPreviewLength));
                std::println("[Message truncated - {} total characters]", turn.text.size());
            }
            else
            {
                std::println("{}", turn.text);
            }
        }
        std::println("\nTotal messages: {} (user {}, assistant {})", conversation.size(),
                     conversation.countOf(Role::User), conversation.countOf(Role::Assistant));
    }
};

App::App(AppConfig config, std::unique_ptr<HttpClient> http):
    _impl(std::make_unique<Impl>(std::move(config), std::move(http)))
{
}

App::~App()
{
    shutdown();
}

auto App::initialize() -> VoidResult
{
    log::setLevel(_impl->config.log.level);

    if (!_impl->config.log.file.empty())
    {
        _impl->logFile.open(_impl->config.log.file, std::ios::app);
        if (!_impl->logFile.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot open log file: {}", _impl->config.log.file));
    }
    log::setCallback(
        [impl = _impl.get()](log::Level level, std::string_view message) { impl->writeLog(level, message); });

    for (const auto& invalid: _impl->config.invalidBackends)
    {
        _impl->failures.push_back(BackendFailure { .name = invalid.name, .error = invalid.error });
        _impl->interactions.onServerConnection(invalid.name, "invalid", false, 0, invalid.error.message);
    }

    auto failed = connectBackends(_impl->config.backends, _impl->registry, *_impl->http, &_impl->interactions);
    std::ranges::move(failed, std::back_inserter(_impl->failures));

    log::info("{} backends connected, {} failed", _impl->registry.serverCount(), _impl->failures.size());
    if (_impl->llm.config().apiKey.empty())
        log::warning("Environment variable {} is not set; chat requests will fail", _impl->config.llm.apiKeyEnv);
    return {};
}

auto App::handleInput(std::string_view line) -> bool
{
    auto const input = trim(line);
    if (input.empty())
        return true;

    auto const command = toLower(input);
    if (command == "/quit" || command == "/exit" || command == "/q")
    {
        std::println("Goodbye!");
        return false;
    }
    if (command == "/log")
    {
        _impl->printInteractions();
        return true;
    }
    if (command == "/servers")
    {
        _impl->printServers();
        return true;
    }
    if (command == "/history")
    {
        _impl->printHistory();
        return true;
    }
    if (command == "/clear")
    {
        _impl->conversation.clear();
        std::println("Conversation history cleared.");
        return true;
    }

    std::println("Thinking...");
    auto reply = _impl->orchestrator.processMessage(input);
    if (!reply)
    {
        std::println("\n{}\n", reply.error().message);
        return true;
    }
    std::println("\n{}\n", *reply);
    return true;
}

auto App::run() -> int
{
    std::println("========================================");
    std::println("mcpmux: multi-backend chat");
    std::println("========================================");
    _impl->printServers();
    std::println("Commands: /quit to exit, /log for tool interactions, /history for the conversation,");
    std::println("          /servers for server info, /clear to forget the conversation\n");

    auto line = std::string {};
    while (true)
    {
        std::print("> ");
        std::fflush(stdout);
        if (!std::getline(std::cin, line))
        {
            std::println("");
            break;
        }
        if (!handleInput(line))
            break;
    }

    shutdown();
    return 0;
}

void App::shutdown()
{
    if (_impl->shutDown)
        return;
    _impl->shutDown = true;

    _impl->registry.closeAll();

    if (!_impl->conversation.empty() && !_impl->config.conversation.historyFile.empty())
    {
        auto saved = appendSessionToHistory(_impl->config.conversation.historyFile, _impl->conversation.turns(),
                                            std::chrono::system_clock::now());
        if (saved)
            log::info("Conversation saved to {}", _impl->config.conversation.historyFile);
        else
            log::error("Failed to save conversation: {}", saved.error().message);
    }

    log::setCallback(nullptr);
}

auto App::registry() -> ToolRegistry&
{
    return _impl->registry;
}

auto App::interactions() const -> const InteractionLog&
{
    return _impl->interactions;
}

auto App::failedBackends() const -> std::span<const BackendFailure>
{
    return _impl->failures;
}

} // namespace mcpmux
