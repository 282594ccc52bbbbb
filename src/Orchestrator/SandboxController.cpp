/**
 * @file SandboxController.cpp
 * @brief fork/exec sandbox launcher with rlimits and a monitor per sandbox
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/SandboxController.hpp>
#include <Gamebattle/Core/Logger.hpp>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>

namespace Gamebattle::Orchestrator {

const char* toString(KillReason reason) noexcept {
    switch (reason) {
        case KillReason::LimitExceeded:     return "limit";
        case KillReason::StopRequested:     return "stop-requested";
        case KillReason::AdminForced:       return "admin-stop";
        case KillReason::OwnerDisconnected: return "owner-disconnected";
        case KillReason::StoreFailure:      return "store-failure";
        case KillReason::Shutdown:          return "shutdown";
    }
    return "unknown";
}

std::string ExitOutcome::describe() const {
    char buffer[96];
    if (auto* e = std::get_if<Exited>(&status)) {
        std::snprintf(buffer, sizeof(buffer), "exited(%d) after %lldms",
                      e->code, static_cast<long long>(duration.count()));
    } else if (auto* c = std::get_if<Crashed>(&status)) {
        std::snprintf(buffer, sizeof(buffer), "crashed(signal %d) after %lldms",
                      c->signal, static_cast<long long>(duration.count()));
    } else {
        const auto& k = std::get<Killed>(status);
        std::snprintf(buffer, sizeof(buffer), "killed(%s, signal %d) after %lldms",
                      toString(k.reason), k.signal, static_cast<long long>(duration.count()));
    }
    return buffer;
}

namespace {

std::once_flag g_sigpipeOnce;

void ignoreSigpipe() {
    // Writes to a vanished reader must surface as EPIPE
    std::call_once(g_sigpipeOnce, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void signalGroup(pid_t pid, int sig) {
    if (pid <= 0) {
        return;
    }
    if (::kill(-pid, sig) != 0) {
        ::kill(pid, sig);
    }
}

void applyLimit(int resource, uint64_t soft, uint64_t hard) {
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>(soft);
    rl.rlim_max = static_cast<rlim_t>(hard);
    ::setrlimit(resource, &rl);
}

std::vector<std::string> buildArgv(const GameArtifact& artifact, const ResourceLimits& limits,
                                   const std::string& name, const std::string& docker) {
    if (artifact.kind == ArtifactKind::Executable) {
        return artifact.command;
    }

    std::vector<std::string> argv = {docker, "run", "-i", "--rm", "--init"};
    if (limits.isolateNetwork) {
        argv.insert(argv.end(), {"--network", "none"});
    }
    if (limits.memoryBytes != 0) {
        argv.insert(argv.end(), {"--memory", std::to_string(limits.memoryBytes)});
    }
    if (limits.cpuFraction > 0.0) {
        char cpus[32];
        std::snprintf(cpus, sizeof(cpus), "%.2f", limits.cpuFraction);
        argv.insert(argv.end(), {"--cpus", cpus});
    }
    if (limits.maxProcesses != 0) {
        argv.insert(argv.end(), {"--pids-limit", std::to_string(limits.maxProcesses)});
    }
    argv.insert(argv.end(), {"--name", name, artifact.image});
    return argv;
}

/// Run `docker kill <name>` and reap it
void killContainer(const std::string& docker, const std::string& name) {
    pid_t pid = ::fork();
    if (pid < 0) {
        GAMEBATTLE_LOG_WARNING_F("Cannot fork docker kill for %s", name.c_str());
        return;
    }
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execlp(docker.c_str(), docker.c_str(), "kill", name.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

// ============================================================================
// ProcessSandboxController::Impl
// ============================================================================

class ProcessSandboxController::Impl {
public:
    struct Sandbox {
        uint64_t id = 0;
        std::string name;
        ArtifactKind kind = ArtifactKind::Executable;
        pid_t pid = -1;
        std::unique_ptr<SandboxChannel> channel;
        bool streamsTaken = false;

        TimePoint startedAt;
        TimePoint hardDeadline;

        std::optional<KillReason> stopReason;
        std::optional<TimePoint> killAt;
        bool termSent = false;
        bool killSent = false;
        bool limitKilled = false;

        std::optional<ExitOutcome> outcome;
        std::thread monitor;
    };

    Impl(std::shared_ptr<const GameCatalog> catalog, Options options)
        : m_catalog(std::move(catalog))
        , m_options(std::move(options))
        , m_channels(makeChannelFactory(m_options.transport, m_options.runtimeDirectory)) {
        ignoreSigpipe();
    }

    ~Impl() {
        std::vector<std::shared_ptr<Sandbox>> all;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto& [id, sandbox] : m_sandboxes) {
                requestStop(*sandbox, Milliseconds(0), KillReason::Shutdown);
                all.push_back(sandbox);
            }
            m_sandboxes.clear();
        }
        m_cv.notify_all();
        for (auto& sandbox : all) {
            if (sandbox->monitor.joinable()) {
                sandbox->monitor.join();
            }
        }
    }

    Result<SandboxHandle> start(const GameId& gameId, const ResourceLimits& limits) {
        GAMEBATTLE_TRY_ASSIGN(artifact, m_catalog->resolve(gameId));

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_active >= m_options.maxSandboxes) {
                GAMEBATTLE_LOG_WARNING_F("Sandbox quota of %zu reached", m_options.maxSandboxes);
                return ErrorCode::QuotaExceeded;
            }
            ++m_active;
        }

        auto result = launch(artifact, limits);
        if (result.isFailure()) {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_active;
        }
        return result;
    }

    Result<SandboxStreams> attachIO(const SandboxHandle& handle) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto sandbox = find(handle);
        if (!sandbox) {
            return ErrorCode::SandboxNotFound;
        }
        if (sandbox->streamsTaken) {
            return ErrorCode::AlreadyAttached;
        }
        auto streams = sandbox->channel->takeStreams();
        if (streams.isSuccess()) {
            sandbox->streamsTaken = true;
        }
        return streams;
    }

    Result<void> signalStop(const SandboxHandle& handle, Milliseconds grace, KillReason reason) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto sandbox = find(handle);
            if (!sandbox) {
                return ErrorCode::SandboxNotFound;
            }
            requestStop(*sandbox, grace, reason);
        }
        m_cv.notify_all();
        return Result<void>::Success();
    }

    Result<ExitOutcome> wait(const SandboxHandle& handle, std::optional<Milliseconds> timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto sandbox = find(handle);
        if (!sandbox) {
            return ErrorCode::SandboxNotFound;
        }
        auto done = [&] { return sandbox->outcome.has_value(); };
        if (timeout) {
            if (!m_cv.wait_for(lock, *timeout, done)) {
                return ErrorCode::Timeout;
            }
        } else {
            m_cv.wait(lock, done);
        }
        return *sandbox->outcome;
    }

    void release(const SandboxHandle& handle) {
        std::shared_ptr<Sandbox> sandbox;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_sandboxes.find(handle.id);
            if (it == m_sandboxes.end()) {
                return;
            }
            sandbox = it->second;
            m_sandboxes.erase(it);
            if (!sandbox->outcome) {
                requestStop(*sandbox, Milliseconds(0), KillReason::Shutdown);
            }
        }
        m_cv.notify_all();
        if (sandbox->monitor.joinable()) {
            sandbox->monitor.join();
        }
        sandbox->channel.reset();
        GAMEBATTLE_LOG_DEBUG_F("Released sandbox %s", sandbox->name.c_str());
    }

    size_t activeCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_active;
    }

    int processId(const SandboxHandle& handle) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sandboxes.find(handle.id);
        return it == m_sandboxes.end() ? 0 : it->second->pid;
    }

    std::vector<std::string> channelPaths(const SandboxHandle& handle) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sandboxes.find(handle.id);
        if (it == m_sandboxes.end() || !it->second->channel) {
            return {};
        }
        return it->second->channel->paths();
    }

private:
    std::shared_ptr<Sandbox> find(const SandboxHandle& handle) const {
        auto it = m_sandboxes.find(handle.id);
        return it == m_sandboxes.end() ? nullptr : it->second;
    }

    /// Caller holds m_mutex. The first reason wins; a shorter grace tightens the deadline.
    void requestStop(Sandbox& sandbox, Milliseconds grace, KillReason reason) {
        if (sandbox.outcome) {
            return;
        }
        if (!sandbox.stopReason) {
            sandbox.stopReason = reason;
        }
        TimePoint deadline = Clock::now() + grace;
        if (!sandbox.killAt || deadline < *sandbox.killAt) {
            sandbox.killAt = deadline;
        }
    }

    Result<SandboxHandle> launch(const GameArtifact& artifact, const ResourceLimits& limits) {
        auto sandbox = std::make_shared<Sandbox>();
        sandbox->id = m_nextId.fetch_add(1);
        sandbox->name = "gb-" + std::to_string(::getpid()) + "-" + std::to_string(sandbox->id);
        sandbox->kind = artifact.kind;

        std::vector<std::string> args = buildArgv(artifact, limits, sandbox->name, m_options.dockerBinary);
        if (args.empty()) {
            return ErrorCode::LaunchFailed;
        }
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        auto channel = m_channels->create(sandbox->name);
        if (channel.isFailure()) {
            return ErrorCode::LaunchFailed;
        }
        sandbox->channel = std::move(channel).value();

        int statusPipe[2];
        if (::pipe2(statusPipe, O_CLOEXEC) != 0) {
            return ErrorCode::LaunchFailed;
        }
        FileDescriptor statusRead(statusPipe[0]);
        FileDescriptor statusWrite(statusPipe[1]);

        const bool executable = artifact.kind == ArtifactKind::Executable;
        const char* workdir = artifact.workingDirectory.empty() ? nullptr : artifact.workingDirectory.c_str();

        pid_t pid = ::fork();
        if (pid < 0) {
            GAMEBATTLE_LOG_ERROR_F("fork failed: %s", std::strerror(errno));
            return ErrorCode::LaunchFailed;
        }

        if (pid == 0) {
            // Child: async-signal-safe calls only until exec
            ::setpgid(0, 0);
            ::signal(SIGPIPE, SIG_DFL);
            if (executable) {
                if (workdir != nullptr && ::chdir(workdir) != 0) {
                    int err = errno;
                    (void)!::write(statusWrite.get(), &err, sizeof(err));
                    ::_exit(127);
                }
                if (limits.cpuTime.count() > 0) {
                    auto cpu = static_cast<uint64_t>(limits.cpuTime.count());
                    applyLimit(RLIMIT_CPU, cpu, cpu + 1);
                }
                if (limits.memoryBytes != 0) {
                    applyLimit(RLIMIT_AS, limits.memoryBytes, limits.memoryBytes);
                }
                if (limits.maxOutputFileBytes != 0) {
                    applyLimit(RLIMIT_FSIZE, limits.maxOutputFileBytes, limits.maxOutputFileBytes);
                }
                if (limits.isolateNetwork && ::unshare(CLONE_NEWNET) != 0) {
                    // Needs CAP_SYS_ADMIN; never run the game on the host network
                    int err = errno;
                    (void)!::write(statusWrite.get(), &err, sizeof(err));
                    ::_exit(127);
                }
            }
            if (!sandbox->channel->bindChild()) {
                int err = errno;
                (void)!::write(statusWrite.get(), &err, sizeof(err));
                ::_exit(127);
            }
            ::execvp(argv[0], argv.data());
            int err = errno;
            (void)!::write(statusWrite.get(), &err, sizeof(err));
            ::_exit(127);
        }

        ::setpgid(pid, pid);
        statusWrite.reset();
        sandbox->pid = pid;

        int execErrno = 0;
        auto childFailed = [&]() {
            pollfd pfd{statusRead.get(), POLLIN, 0};
            if (::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN)) {
                ssize_t n = ::read(statusRead.get(), &execErrno, sizeof(execErrno));
                return n > 0;
            }
            return false;
        };

        auto connected = sandbox->channel->connect(m_options.launchTimeout, childFailed);
        bool launched = connected.isSuccess();

        if (launched) {
            // EOF on the status pipe means exec succeeded
            pollfd pfd{statusRead.get(), POLLIN, 0};
            int waitMs = static_cast<int>(m_options.launchTimeout.count());
            int ready = ::poll(&pfd, 1, waitMs);
            while (ready < 0 && errno == EINTR) {
                ready = ::poll(&pfd, 1, waitMs);
            }
            if (ready <= 0) {
                launched = false;
            } else {
                ssize_t n = ::read(statusRead.get(), &execErrno, sizeof(execErrno));
                launched = (n == 0);
            }
        }

        if (!launched) {
            if (execErrno != 0) {
                GAMEBATTLE_LOG_ERROR_F("Launching game %s failed: %s",
                                       artifact.id.c_str(), std::strerror(execErrno));
            } else {
                GAMEBATTLE_LOG_ERROR_F("Launching game %s failed: %s", artifact.id.c_str(),
                                       getErrorMessage(connected.errorOr(ErrorCode::Timeout)).data());
            }
            signalGroup(pid, SIGKILL);
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            sandbox->channel->release();
            return ErrorCode::LaunchFailed;
        }

        sandbox->startedAt = Clock::now();
        sandbox->hardDeadline = sandbox->startedAt + limits.wallClock;

        SandboxHandle handle{sandbox->id, sandbox->name};
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sandboxes.emplace(sandbox->id, sandbox);
            sandbox->monitor = std::thread([this, sandbox] { monitor(sandbox); });
        }

        GAMEBATTLE_LOG_INFO_F("Started sandbox %s (pid %d) for game %s",
                              sandbox->name.c_str(), static_cast<int>(pid), artifact.id.c_str());
        return handle;
    }

    void monitor(std::shared_ptr<Sandbox> sandbox) {
        int status = 0;
        for (;;) {
            pid_t r = ::waitpid(sandbox->pid, &status, WNOHANG);
            if (r == sandbox->pid) {
                break;
            }
            if (r < 0 && errno != EINTR) {
                GAMEBATTLE_LOG_ERROR_F("waitpid on sandbox %s failed: %s",
                                       sandbox->name.c_str(), std::strerror(errno));
                status = 0;
                break;
            }

            int sendSignal = 0;
            bool dockerKill = false;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                TimePoint now = Clock::now();

                if (!sandbox->limitKilled && now >= sandbox->hardDeadline) {
                    sandbox->limitKilled = true;
                    sendSignal = SIGKILL;
                    GAMEBATTLE_LOG_WARNING_F("Sandbox %s exceeded its lifetime", sandbox->name.c_str());
                } else if (sandbox->stopReason && !sandbox->termSent) {
                    sandbox->termSent = true;
                    sendSignal = SIGTERM;
                }
                if (sandbox->killAt && !sandbox->killSent && now >= *sandbox->killAt) {
                    sandbox->killSent = true;
                    sendSignal = SIGKILL;
                }
                dockerKill = (sendSignal == SIGKILL && sandbox->kind == ArtifactKind::Container);

                if (sendSignal == 0) {
                    m_cv.wait_for(lock, m_options.pollInterval, [&] {
                        return sandbox->stopReason.has_value() && !sandbox->termSent;
                    });
                }
            }

            if (sendSignal != 0) {
                signalGroup(sandbox->pid, sendSignal);
            }
            if (dockerKill) {
                killContainer(m_options.dockerBinary, sandbox->name);
            }
        }

        ExitOutcome outcome;
        std::lock_guard<std::mutex> lock(m_mutex);
        outcome.duration = std::chrono::duration_cast<Milliseconds>(Clock::now() - sandbox->startedAt);

        int sig = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
        if (sandbox->limitKilled || sig == SIGXCPU || sig == SIGXFSZ) {
            outcome.status = ExitOutcome::Killed{KillReason::LimitExceeded, sig};
        } else if (sandbox->stopReason) {
            outcome.status = ExitOutcome::Killed{*sandbox->stopReason, sig};
        } else if (sig != 0) {
            outcome.status = ExitOutcome::Crashed{sig};
        } else {
            outcome.status = ExitOutcome::Exited{WIFEXITED(status) ? WEXITSTATUS(status) : 0};
        }

        sandbox->outcome = outcome;
        if (sandbox->channel) {
            sandbox->channel->release();
        }
        --m_active;
        m_cv.notify_all();

        GAMEBATTLE_LOG_INFO_F("Sandbox %s %s", sandbox->name.c_str(), outcome.describe().c_str());
    }

    std::shared_ptr<const GameCatalog> m_catalog;
    Options m_options;
    std::unique_ptr<ChannelFactory> m_channels;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<uint64_t, std::shared_ptr<Sandbox>> m_sandboxes;
    size_t m_active = 0;
    std::atomic<uint64_t> m_nextId{1};
};

// ============================================================================
// ProcessSandboxController - Public API
// ============================================================================

ProcessSandboxController::ProcessSandboxController(std::shared_ptr<const GameCatalog> catalog, Options options)
    : m_impl(std::make_unique<Impl>(std::move(catalog), std::move(options))) {
}

ProcessSandboxController::~ProcessSandboxController() = default;

ProcessSandboxController::Options ProcessSandboxController::optionsFrom(const OrchestratorConfig& config) {
    Options options;
    options.maxSandboxes = config.maxSandboxes;
    options.runtimeDirectory = config.runtimeDir;
    options.transport = config.transport;
    options.launchTimeout = config.launchTimeout;
    options.dockerBinary = config.dockerBinary;
    return options;
}

Result<SandboxHandle> ProcessSandboxController::start(const GameId& gameId, const ResourceLimits& limits) {
    return m_impl->start(gameId, limits);
}

Result<SandboxStreams> ProcessSandboxController::attachIO(const SandboxHandle& handle) {
    return m_impl->attachIO(handle);
}

Result<void> ProcessSandboxController::signalStop(const SandboxHandle& handle, Milliseconds grace,
                                                  KillReason reason) {
    return m_impl->signalStop(handle, grace, reason);
}

Result<ExitOutcome> ProcessSandboxController::wait(const SandboxHandle& handle,
                                                   std::optional<Milliseconds> timeout) {
    return m_impl->wait(handle, timeout);
}

void ProcessSandboxController::release(const SandboxHandle& handle) {
    m_impl->release(handle);
}

size_t ProcessSandboxController::activeCount() const {
    return m_impl->activeCount();
}

int ProcessSandboxController::processId(const SandboxHandle& handle) const {
    return m_impl->processId(handle);
}

std::vector<std::string> ProcessSandboxController::channelPaths(const SandboxHandle& handle) const {
    return m_impl->channelPaths(handle);
}

} // namespace Gamebattle::Orchestrator
