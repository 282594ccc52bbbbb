/**
 * @file SandboxController.hpp
 * @brief Launches, monitors and stops sandboxed game processes
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Every sandbox is watched by a monitor thread that enforces the hard
 * wall-clock ceiling, so wait() always resolves. Crashes after launch are
 * reported as an ExitOutcome, never as an error.
 */

#pragma once

#ifndef GAMEBATTLE_ORCHESTRATOR_SANDBOX_CONTROLLER_HPP
#define GAMEBATTLE_ORCHESTRATOR_SANDBOX_CONTROLLER_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <Gamebattle/Orchestrator/Channel.hpp>
#include <Gamebattle/Orchestrator/GameCatalog.hpp>
#include <Gamebattle/Orchestrator/OrchestratorConfig.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace Gamebattle::Orchestrator {

/**
 * @brief Opaque reference to a launched sandbox
 */
struct SandboxHandle {
    uint64_t id = 0;
    std::string name;   ///< Unique name; also the container name and FIFO stem

    [[nodiscard]] bool valid() const noexcept { return id != 0; }
};

/**
 * @brief Why the controller killed a sandbox
 */
enum class KillReason {
    LimitExceeded,       ///< Resource or lifetime ceiling
    StopRequested,       ///< Owner asked to stop
    AdminForced,         ///< Administrator stop
    OwnerDisconnected,   ///< Disconnect grace expired
    StoreFailure,        ///< Bookkeeping could not be kept consistent
    Shutdown             ///< Orchestrator shutting down
};

const char* toString(KillReason reason) noexcept;

/**
 * @brief How a sandbox ended
 */
struct ExitOutcomeExited {
    int code = 0;
};
struct ExitOutcomeCrashed {
    int signal = 0;
};
struct ExitOutcomeKilled {
    KillReason reason = KillReason::StopRequested;
    int signal = 0;
};

struct ExitOutcome {
    using Exited = ExitOutcomeExited;
    using Crashed = ExitOutcomeCrashed;
    using Killed = ExitOutcomeKilled;

    std::variant<Exited, Crashed, Killed> status;
    Milliseconds duration{0};

    [[nodiscard]] bool exited() const noexcept { return std::holds_alternative<Exited>(status); }
    [[nodiscard]] bool crashed() const noexcept { return std::holds_alternative<Crashed>(status); }
    [[nodiscard]] bool killed() const noexcept { return std::holds_alternative<Killed>(status); }

    [[nodiscard]] bool killedByLimit() const noexcept {
        auto* k = std::get_if<Killed>(&status);
        return k != nullptr && k->reason == KillReason::LimitExceeded;
    }

    /// Human readable form for logs
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Sandbox lifecycle interface
 */
class SandboxController {
public:
    virtual ~SandboxController() = default;

    /**
     * @brief Launch a game
     * @return Handle, or ArtifactNotFound, LaunchFailed, QuotaExceeded.
     *         A failed launch leaves no process, channel or quota slot.
     */
    virtual Result<SandboxHandle> start(const GameId& gameId, const ResourceLimits& limits) = 0;

    /**
     * @brief Take the sandbox streams
     * @return Streams once; AlreadyAttached afterwards
     */
    virtual Result<SandboxStreams> attachIO(const SandboxHandle& handle) = 0;

    /**
     * @brief Ask the sandbox to stop; SIGKILL follows after grace. Idempotent.
     */
    virtual Result<void> signalStop(const SandboxHandle& handle, Milliseconds grace, KillReason reason) = 0;

    /**
     * @brief Wait for the sandbox to end
     * @param timeout Give up with Timeout after this long; nullopt waits forever
     */
    virtual Result<ExitOutcome> wait(const SandboxHandle& handle,
                                     std::optional<Milliseconds> timeout = std::nullopt) = 0;

    /**
     * @brief Forget an ended sandbox and free what remains of it
     */
    virtual void release(const SandboxHandle& handle) = 0;

    /// Live sandboxes counted against the quota
    [[nodiscard]] virtual size_t activeCount() const = 0;
};

/**
 * @brief Controller running executables and containers as child processes
 */
class ProcessSandboxController : public SandboxController {
public:
    struct Options {
        size_t maxSandboxes = 64;
        std::string runtimeDirectory = "/tmp/gamebattle";
        ChannelTransport transport = ChannelTransport::Fifo;
        Milliseconds launchTimeout{5000};
        std::string dockerBinary = "docker";
        Milliseconds pollInterval{20};
    };

    ProcessSandboxController(std::shared_ptr<const GameCatalog> catalog, Options options);
    ~ProcessSandboxController() override;

    ProcessSandboxController(const ProcessSandboxController&) = delete;
    ProcessSandboxController& operator=(const ProcessSandboxController&) = delete;

    /// Options derived from the orchestrator configuration
    static Options optionsFrom(const OrchestratorConfig& config);

    Result<SandboxHandle> start(const GameId& gameId, const ResourceLimits& limits) override;
    Result<SandboxStreams> attachIO(const SandboxHandle& handle) override;
    Result<void> signalStop(const SandboxHandle& handle, Milliseconds grace, KillReason reason) override;
    Result<ExitOutcome> wait(const SandboxHandle& handle, std::optional<Milliseconds> timeout) override;
    void release(const SandboxHandle& handle) override;
    size_t activeCount() const override;

    /// Process id of a live sandbox, 0 if unknown
    [[nodiscard]] int processId(const SandboxHandle& handle) const;

    /// Filesystem paths of the sandbox channel
    [[nodiscard]] std::vector<std::string> channelPaths(const SandboxHandle& handle) const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Gamebattle::Orchestrator

#endif // GAMEBATTLE_ORCHESTRATOR_SANDBOX_CONTROLLER_HPP
