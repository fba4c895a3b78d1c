#include <ctxbroker/core/process_state.h>
#include <ctxbroker/core/sanitizer.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ctxbroker::core {

namespace {

std::string isoTimestamp(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace

const char* phaseToString(InitPhase phase) {
    switch (phase) {
        case InitPhase::Created: return "Created";
        case InitPhase::ConfigLoaded: return "ConfigLoaded";
        case InitPhase::WorkspaceResolved: return "WorkspaceResolved";
        case InitPhase::HandshakeValidated: return "HandshakeValidated";
        case InitPhase::HandlersRegistered: return "HandlersRegistered";
        case InitPhase::TransportBound: return "TransportBound";
        case InitPhase::Ready: return "Ready";
    }
    return "Unknown";
}

std::filesystem::path ProcessStateSnapshot::primaryWorkspace() const {
    return workspacePath.empty() ? std::filesystem::path{} : workspacePath.front();
}

json ProcessStateSnapshot::toJson() const {
    json paths = json::array();
    for (const auto& p : workspacePath) {
        paths.push_back(p.string());
    }
    return json{{"initializationPhase", phaseToString(phase)},
                {"handshakeValidated", handshakeValidated},
                {"workspacePath", std::move(paths)},
                {"shuttingDown", shuttingDown},
                {"currentLogLevel", logLevel},
                {"startedDate", isoTimestamp(startedAt)},
                {"org", sanitizeSensitiveData(orgContext)}};
}

ProcessState::ProcessState() : ProcessState("info") {}

ProcessState::ProcessState(std::string logLevel)
    : logLevel_(std::move(logLevel)), startedAt_(std::chrono::system_clock::now()) {}

ProcessStateSnapshot ProcessState::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProcessStateSnapshot snap;
    snap.phase = phase_;
    snap.handshakeValidated = handshakeValidated_;
    snap.workspacePath = workspacePath_;
    snap.shuttingDown = shuttingDown_;
    snap.logLevel = logLevel_;
    snap.startedAt = startedAt_;
    snap.orgContext = orgContext_;
    return snap;
}

InitPhase ProcessState::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

bool ProcessState::handshakeValidated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handshakeValidated_;
}

bool ProcessState::shuttingDown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shuttingDown_;
}

std::vector<std::filesystem::path> ProcessState::workspacePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workspacePath_;
}

Result<void> ProcessState::markPhase(InitPhase phase) {
    InitPhase previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = phase_;
        if (static_cast<int>(phase) <= static_cast<int>(previous)) {
            return Error{ErrorCode::InvalidState,
                         std::string("Cannot move initialization phase from ") +
                             phaseToString(previous) + " to " + phaseToString(phase)};
        }
        phase_ = phase;
    }
    // Logged after unlocking; forwarded log records read the state.
    spdlog::debug("Initialization phase {} -> {}", phaseToString(previous), phaseToString(phase));
    return {};
}

void ProcessState::markHandshakeValidated() {
    std::lock_guard<std::mutex> lock(mutex_);
    handshakeValidated_ = true;
}

Result<void> ProcessState::setWorkspacePath(std::vector<std::filesystem::path> paths) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (workspaceSet_) {
        return Error{ErrorCode::InvalidState, "Workspace path is already set"};
    }
    if (paths.empty()) {
        return Error{ErrorCode::InvalidArgument, "Workspace path list must not be empty"};
    }
    workspacePath_ = std::move(paths);
    workspaceSet_ = true;
    return {};
}

bool ProcessState::beginShutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shuttingDown_) {
        return false;
    }
    shuttingDown_ = true;
    return true;
}

void ProcessState::setLogLevel(std::string level) {
    std::lock_guard<std::mutex> lock(mutex_);
    logLevel_ = std::move(level);
}

std::string ProcessState::logLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logLevel_;
}

void ProcessState::setOrgContext(json org) {
    std::lock_guard<std::mutex> lock(mutex_);
    orgContext_ = org.is_null() ? json::object() : std::move(org);
}

json ProcessState::exposedOrgContext() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sanitizeSensitiveData(orgContext_);
}

} // namespace ctxbroker::core
