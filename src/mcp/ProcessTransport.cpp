// SPDX-License-Identifier: Apache-2.0
#include "ProcessTransport.hpp"

#include <core/Log.hpp>
#include <mcp/FrameCodec.hpp>
#include <mcp/JsonRpc.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <format>
#include <future>
#include <iterator>
#include <mutex>
#include <set>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcpmux
{

namespace
{

    constexpr auto PollInterval = 100; // milliseconds
    constexpr auto StderrTailLimit = std::size_t { 64 } * 1024;
    constexpr auto AbandonedIdLimit = std::size_t { 1024 };

    auto ignoreSigpipeFlag = std::once_flag {};

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto describeExitStatus(int status) -> std::string
    {
        if (WIFEXITED(status))
            return std::format("exit code {}", WEXITSTATUS(status));
        if (WIFSIGNALED(status))
            return std::format("signal {}", WTERMSIG(status));
        return std::format("status {}", status);
    }

    /// @brief Builds the child environment: inherited variables with config overrides applied.
    auto buildEnvironment(const std::map<std::string, std::string>& overrides) -> std::vector<std::string>
    {
        auto envStrings = std::vector<std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto const entry = std::string_view(*e);
                auto const key = entry.substr(0, entry.find('='));
                if (!overrides.contains(std::string(key)))
                    envStrings.emplace_back(entry);
            }
        }
        for (const auto& [key, value]: overrides)
            envStrings.push_back(std::format("{}={}", key, value));
        return envStrings;
    }

    struct PendingRequest
    {
        std::string method;
        std::chrono::steady_clock::time_point issuedAt;
        std::promise<Result<nlohmann::json>> promise;
        std::future<Result<nlohmann::json>> future; // Moved out by the waiter.
        bool completed = false;
    };

    struct UnmatchedResponse
    {
        nlohmann::json message;
        std::chrono::steady_clock::time_point receivedAt;
    };

} // namespace

struct ProcessTransport::Impl
{
    ProcessTransportConfig config;

    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;

    std::atomic<bool> running = false;
    std::atomic<bool> stopping = false;
    std::atomic<int64_t> nextId = 1;

    std::mutex initMutex;
    bool initialized = false;
    nlohmann::json initializeResult;

    std::mutex writeMutex;

    mutable std::mutex pendingMutex;
    std::map<int64_t, PendingRequest> pending;
    std::map<int64_t, UnmatchedResponse> unmatched;
    std::set<int64_t> abandoned;
    std::optional<Error> streamError;

    mutable std::mutex stderrMutex;
    std::condition_variable stderrCondition;
    std::string stderrTail;
    bool stderrClosed = false;

    std::thread readerThread;
    std::thread stderrThread;

    auto writeAll(std::string_view data) -> VoidResult
    {
        auto const lock = std::lock_guard(writeMutex);
        if (stdinWrite < 0)
            return makeError(ErrorCode::TransportError, "Process stdin is closed");

        while (!data.empty())
        {
            auto const written = ::write(stdinWrite, data.data(), data.size());
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                if (errno == EPIPE)
                    return std::unexpected(processDiedError("closed its stdin"));
                return makeError(ErrorCode::TransportError,
                                 std::format("Failed to write to process stdin: {}", std::strerror(errno)));
            }
            data.remove_prefix(static_cast<size_t>(written));
        }
        return {};
    }

    auto stderrSnapshot() const -> std::string
    {
        auto const lock = std::lock_guard(stderrMutex);
        return stderrTail;
    }

    /// @brief Waits until the stderr pipe reached end of file, or @p timeout elapsed.
    void waitForStderrClosed(std::chrono::milliseconds timeout)
    {
        auto lock = std::unique_lock(stderrMutex);
        stderrCondition.wait_for(lock, timeout, [this] { return stderrClosed; });
    }

    auto processDiedError(std::string_view what) -> Error
    {
        waitForStderrClosed(std::chrono::milliseconds(500));
        auto const stderrText = stderrSnapshot();
        if (stderrText.empty())
            return Error { ErrorCode::ProcessDied, std::format("Process '{}' {}", config.command, what) };
        return Error { ErrorCode::ProcessDied,
                       std::format("Process '{}' {}. stderr: {}", config.command, what, stderrText) };
    }

    /// @brief Fulfils the pending entry @p it. Requires pendingMutex to be held.
    ///
    /// An entry whose future was not yet claimed by awaitResponse() stays in the map
    /// until it is, so that a fast response is never lost.
    void complete(std::map<int64_t, PendingRequest>::iterator it, Result<nlohmann::json> response)
    {
        it->second.promise.set_value(std::move(response));
        it->second.completed = true;
        if (!it->second.future.valid())
            pending.erase(it);
    }

    /// @brief Fails every outstanding request and refuses new ones.
    void failAll(Error error)
    {
        auto const lock = std::lock_guard(pendingMutex);
        for (auto it = pending.begin(); it != pending.end();)
        {
            auto const next = std::next(it);
            if (!it->second.completed)
                complete(it, std::unexpected(error));
            it = next;
        }
        streamError = std::move(error);
        running = false;
    }

    void respondToServerRequest(const nlohmann::json& message)
    {
        auto const id = jsonrpc::messageId(message);
        auto const method = message.value("method", "");
        if (!id)
        {
            log::debug("[{}] notification: {}", config.command, method);
            return;
        }

        auto const reply = method == "ping"
                               ? jsonrpc::makeResult(*id, nlohmann::json::object())
                               : jsonrpc::makeErrorResponse(*id, -32601, std::format("Method not found: {}", method));
        if (auto written = writeAll(framing::encodeFrame(reply)); !written)
            log::warning("[{}] failed to answer server request '{}': {}", config.command, method,
                         written.error().message);
    }

    void dispatch(const nlohmann::json& message)
    {
        if (message.is_object() && message.contains("method"))
        {
            respondToServerRequest(message);
            return;
        }

        auto const id = jsonrpc::messageId(message);
        if (!id)
        {
            log::warning("[{}] discarding response without id", config.command);
            return;
        }

        auto const lock = std::lock_guard(pendingMutex);
        if (auto it = pending.find(*id); it != pending.end() && !it->second.completed)
        {
            auto response = jsonrpc::parseResponse(message).and_then(jsonrpc::resultOf);
            log::trace("[{}] response {} after {}ms", config.command, *id,
                       std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now()
                                                                             - it->second.issuedAt)
                           .count());
            complete(it, std::move(response));
            return;
        }

        if (abandoned.erase(*id) > 0)
        {
            log::debug("[{}] discarding late response for timed-out request {}", config.command, *id);
            return;
        }

        log::warning("[{}] retaining response with unknown id {}", config.command, *id);
        unmatched[*id] = UnmatchedResponse { .message = message, .receivedAt = std::chrono::steady_clock::now() };
    }

    void purgeUnmatched()
    {
        auto const now = std::chrono::steady_clock::now();
        auto const lock = std::lock_guard(pendingMutex);
        std::erase_if(unmatched, [&](const auto& item) {
            auto const expired = now - item.second.receivedAt >= config.unmatchedRetention;
            if (expired)
                log::warning("[{}] dropping unmatched response id {}", config.command, item.first);
            return expired;
        });
    }

    void readerLoop()
    {
        auto decoder = framing::FrameDecoder {};
        auto buffer = std::array<char, 4096> {};

        while (!stopping)
        {
            auto pfd = pollfd { .fd = stdoutRead, .events = POLLIN, .revents = 0 };
            auto const ready = ::poll(&pfd, 1, PollInterval);
            purgeUnmatched();

            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                failAll(Error { ErrorCode::TransportError,
                                std::format("Polling process stdout failed: {}", std::strerror(errno)) });
                return;
            }
            if (ready == 0)
                continue;

            auto const bytesRead = ::read(stdoutRead, buffer.data(), buffer.size());
            if (bytesRead < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                failAll(Error { ErrorCode::TransportError,
                                std::format("Reading process stdout failed: {}", std::strerror(errno)) });
                return;
            }
            if (bytesRead == 0)
            {
                if (stopping)
                    failAll(Error { ErrorCode::TransportError, "Transport closed" });
                else
                    failAll(processDiedError("closed its stdout"));
                return;
            }

            decoder.feed(std::string_view(buffer.data(), static_cast<size_t>(bytesRead)));
            while (auto frame = decoder.next())
            {
                if (!*frame)
                {
                    log::warning("[{}] {}; resynchronizing", config.command, frame->error().message);
                    continue;
                }
                dispatch(**frame);
            }
        }
    }

    void stderrLoop()
    {
        auto buffer = std::array<char, 4096> {};
        auto line = std::string {};

        while (!stopping)
        {
            auto pfd = pollfd { .fd = stderrRead, .events = POLLIN, .revents = 0 };
            auto const ready = ::poll(&pfd, 1, PollInterval);
            if (ready < 0 && errno == EINTR)
                continue;
            if (ready <= 0)
            {
                if (ready < 0)
                    break;
                continue;
            }

            auto const bytesRead = ::read(stderrRead, buffer.data(), buffer.size());
            if (bytesRead < 0 && (errno == EINTR || errno == EAGAIN))
                continue;
            if (bytesRead <= 0)
                break;

            auto const chunk = std::string_view(buffer.data(), static_cast<size_t>(bytesRead));
            {
                auto const lock = std::lock_guard(stderrMutex);
                stderrTail.append(chunk);
                if (stderrTail.size() > StderrTailLimit)
                    stderrTail.erase(0, stderrTail.size() - StderrTailLimit);
            }

            line.append(chunk);
            for (auto eol = line.find('\n'); eol != std::string::npos; eol = line.find('\n'))
            {
                log::debug("[{} stderr] {}", config.command, std::string_view(line).substr(0, eol));
                line.erase(0, eol + 1);
            }
        }

        if (!line.empty())
            log::debug("[{} stderr] {}", config.command, line);

        auto const lock = std::lock_guard(stderrMutex);
        stderrClosed = true;
        stderrCondition.notify_all();
    }

    /// @brief Reaps the child if it has exited. Returns the wait status when it has.
    auto tryReap() -> std::optional<int>
    {
        if (childPid <= 0)
            return std::nullopt;
        auto status = 0;
        if (::waitpid(childPid, &status, WNOHANG) == childPid)
        {
            childPid = -1;
            return status;
        }
        return std::nullopt;
    }

    void terminateChild()
    {
        if (childPid <= 0)
            return;

        ::kill(childPid, SIGTERM);
        auto const deadline = std::chrono::steady_clock::now() + config.shutdownGrace;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (tryReap())
                return;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        log::warning("Process '{}' ignored SIGTERM for {}ms, killing it", config.command,
                     config.shutdownGrace.count());
        ::kill(childPid, SIGKILL);
        auto status = 0;
        ::waitpid(childPid, &status, 0);
        childPid = -1;
    }

    void joinThreads()
    {
        stopping = true;
        if (readerThread.joinable())
            readerThread.join();
        if (stderrThread.joinable())
            stderrThread.join();
    }
};

ProcessTransport::ProcessTransport(): _impl(std::make_unique<Impl>())
{
}

ProcessTransport::~ProcessTransport()
{
    close();
}

auto ProcessTransport::start(const ProcessTransportConfig& config) -> VoidResult
{
    if (_impl->running || _impl->childPid > 0)
        return makeError(ErrorCode::TransportError, "Transport already started");

    // Writing to a child that has exited must fail with EPIPE instead of terminating us.
    std::call_once(ignoreSigpipeFlag, [] { std::signal(SIGPIPE, SIG_IGN); });

    _impl->config = config;

    int stdinPipe[2];
    int stdoutPipe[2];
    int stderrPipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::SpawnError, "Failed to create stdin pipe");
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::SpawnError, "Failed to create stdout pipe");
    }
    if (::pipe2(stderrPipe, O_CLOEXEC) != 0)
    {
        for (auto fd: { stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1] })
            ::close(fd);
        return makeError(ErrorCode::SpawnError, "Failed to create stderr pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);
    if (!config.workingDir.empty())
        posix_spawn_file_actions_addchdir_np(&actions, config.workingDir.c_str());

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = buildEnvironment(config.env);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        return makeError(ErrorCode::SpawnError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];
    _impl->stopping = false;
    _impl->streamError.reset();
    _impl->stderrClosed = false;
    _impl->stderrTail.clear();
    _impl->running = true;

    _impl->readerThread = std::thread([impl = _impl.get()] { impl->readerLoop(); });
    _impl->stderrThread = std::thread([impl = _impl.get()] { impl->stderrLoop(); });

    auto const deadline = std::chrono::steady_clock::now() + config.startupGrace;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (auto exitStatus = _impl->tryReap())
        {
            auto error = _impl->processDiedError(
                std::format("exited during startup ({})", describeExitStatus(*exitStatus)));
            close();
            return std::unexpected(std::move(error));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    log::info("MCP server started: {} (pid {})", config.command, pid);
    return {};
}

auto ProcessTransport::initialize(const ClientInfo& clientInfo, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    auto const lock = std::lock_guard(_impl->initMutex);
    if (_impl->initialized)
        return _impl->initializeResult;

    auto params = nlohmann::json {
        { "protocolVersion", McpProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", clientInfo.name },
              { "version", clientInfo.version },
          } },
    };

    auto result = request("initialize", std::move(params), timeout);
    if (!result)
        return result;

    if (auto notified = notify("notifications/initialized"); !notified)
        return std::unexpected(notified.error());

    _impl->initializeResult = std::move(*result);
    _impl->initialized = true;
    return _impl->initializeResult;
}

auto ProcessTransport::request(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    return send(method, std::move(params)).and_then([this, timeout](int64_t id) {
        return awaitResponse(id, timeout);
    });
}

auto ProcessTransport::send(std::string_view method, nlohmann::json params) -> Result<int64_t>
{
    auto const id = _impl->nextId++;
    {
        auto const lock = std::lock_guard(_impl->pendingMutex);
        if (_impl->streamError)
            return std::unexpected(*_impl->streamError);
        if (!_impl->running)
            return makeError(ErrorCode::TransportError, "Transport not running");

        auto entry = PendingRequest {
            .method = std::string(method),
            .issuedAt = std::chrono::steady_clock::now(),
            .promise = {},
            .future = {},
        };
        entry.future = entry.promise.get_future();
        _impl->pending.emplace(id, std::move(entry));
    }

    auto const frame = framing::encodeFrame(jsonrpc::makeRequest(id, method, std::move(params)));
    if (auto written = _impl->writeAll(frame); !written)
    {
        auto const lock = std::lock_guard(_impl->pendingMutex);
        _impl->pending.erase(id);
        return std::unexpected(written.error());
    }

    log::trace("[{}] request {} {}", _impl->config.command, id, method);
    return id;
}

auto ProcessTransport::awaitResponse(int64_t id, std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    auto future = std::future<Result<nlohmann::json>> {};
    auto method = std::string {};
    {
        auto const lock = std::lock_guard(_impl->pendingMutex);
        if (auto it = _impl->unmatched.find(id); it != _impl->unmatched.end())
        {
            auto message = std::move(it->second.message);
            _impl->unmatched.erase(it);
            _impl->pending.erase(id);
            return jsonrpc::parseResponse(message).and_then(jsonrpc::resultOf);
        }

        auto it = _impl->pending.find(id);
        if (it == _impl->pending.end() || !it->second.future.valid())
            return makeError(ErrorCode::InvalidArgument, std::format("No outstanding request with id {}", id));
        future = std::move(it->second.future);
        method = it->second.method;
        if (it->second.completed)
        {
            _impl->pending.erase(it);
            return future.get();
        }
    }

    if (future.wait_for(timeout) == std::future_status::ready)
        return future.get();

    auto const lock = std::lock_guard(_impl->pendingMutex);
    // The reader may have delivered the response while we were acquiring the lock.
    if (future.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
        return future.get();

    _impl->pending.erase(id);
    _impl->abandoned.insert(id);
    if (_impl->abandoned.size() > AbandonedIdLimit)
        _impl->abandoned.erase(_impl->abandoned.begin());

    return makeError(ErrorCode::TimeoutError,
                     std::format("Timed out after {}ms waiting for response to '{}' (id {})", timeout.count(),
                                 method, id));
}

auto ProcessTransport::notify(std::string_view method, nlohmann::json params) -> VoidResult
{
    if (!_impl->running)
        return makeError(ErrorCode::TransportError, "Transport not running");
    return _impl->writeAll(framing::encodeFrame(jsonrpc::makeNotification(method, std::move(params))));
}

void ProcessTransport::close()
{
    if (_impl->childPid <= 0 && !_impl->readerThread.joinable() && !_impl->stderrThread.joinable())
        return;

    _impl->stopping = true;
    {
        // Closing stdin is the polite shutdown request for stdio servers.
        auto const lock = std::lock_guard(_impl->writeMutex);
        closeFd(_impl->stdinWrite);
    }

    _impl->terminateChild();
    _impl->joinThreads();

    closeFd(_impl->stdoutRead);
    closeFd(_impl->stderrRead);

    _impl->failAll(Error { ErrorCode::TransportError, "Transport closed" });
    {
        auto const lock = std::lock_guard(_impl->initMutex);
        _impl->initialized = false;
    }

    log::debug("MCP transport closed: {}", _impl->config.command);
}

auto ProcessTransport::isRunning() const -> bool
{
    return _impl->running;
}

auto ProcessTransport::isInitialized() const -> bool
{
    auto const lock = std::lock_guard(_impl->initMutex);
    return _impl->initialized;
}

auto ProcessTransport::stderrText() const -> std::string
{
    return _impl->stderrSnapshot();
}

auto ProcessTransport::pendingCount() const -> std::size_t
{
    auto const lock = std::lock_guard(_impl->pendingMutex);
    return static_cast<std::size_t>(
        std::ranges::count_if(_impl->pending, [](const auto& item) { return !item.second.completed; }));
}

auto ProcessTransport::unmatchedCount() const -> std::size_t
{
    auto const lock = std::lock_guard(_impl->pendingMutex);
    return _impl->unmatched.size();
}

} // namespace mcpmux
