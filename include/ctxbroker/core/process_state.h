#pragma once

#include <ctxbroker/core/types.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ctxbroker::core {

using json = nlohmann::json;

// Startup phases in ordinal order. The current phase only ever moves forward.
enum class InitPhase : int {
    Created = 0,
    ConfigLoaded,
    WorkspaceResolved,
    HandshakeValidated,
    HandlersRegistered,
    TransportBound,
    Ready
};

const char* phaseToString(InitPhase phase);

struct ProcessStateSnapshot {
    InitPhase phase = InitPhase::Created;
    bool handshakeValidated = false;
    std::vector<std::filesystem::path> workspacePath;
    bool shuttingDown = false;
    std::string logLevel;
    TimePoint startedAt;
    json orgContext;

    // Primary workspace root, empty before resolution.
    std::filesystem::path primaryWorkspace() const;

    // JSON view for diagnostics; orgContext is always sanitized.
    json toJson() const;
};

/**
 * Process-lifetime record of cross-cutting flags.
 *
 * Constructed once by the entry point (or per test) and handed by reference to every
 * component that needs it. Only the phase runner and the handshake validator write the
 * phase, handshake and workspace fields; everything else reads snapshots.
 */
class ProcessState {
public:
    ProcessState();
    explicit ProcessState(std::string logLevel);

    ProcessState(const ProcessState&) = delete;
    ProcessState& operator=(const ProcessState&) = delete;

    ProcessStateSnapshot get() const;

    InitPhase phase() const;
    bool handshakeValidated() const;
    bool shuttingDown() const;
    std::vector<std::filesystem::path> workspacePath() const;

    // Fails with InvalidState unless `phase` is strictly after the current phase.
    Result<void> markPhase(InitPhase phase);
    // Idempotent.
    void markHandshakeValidated();
    // Fails with InvalidState when already set, InvalidArgument when `paths` is empty.
    Result<void> setWorkspacePath(std::vector<std::filesystem::path> paths);
    // Idempotent; returns true only for the call that flipped the flag.
    bool beginShutdown();

    void setLogLevel(std::string level);
    std::string logLevel() const;

    void setOrgContext(json org);
    // Sanitized copy suitable for anything leaving the process.
    json exposedOrgContext() const;

private:
    mutable std::mutex mutex_;
    InitPhase phase_{InitPhase::Created};
    bool handshakeValidated_{false};
    bool workspaceSet_{false};
    std::vector<std::filesystem::path> workspacePath_;
    bool shuttingDown_{false};
    std::string logLevel_;
    TimePoint startedAt_;
    json orgContext_ = json::object();
};

} // namespace ctxbroker::core
