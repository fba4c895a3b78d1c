#pragma once

#include <ctxbroker/config/server_config.h>
#include <ctxbroker/core/process_state.h>
#include <ctxbroker/core/types.h>
#include <ctxbroker/mcp/handler_registry.h>
#include <ctxbroker/session/handshake_validator.h>
#include <ctxbroker/session/workspace_resolver.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

namespace ctxbroker::session {

using Registrar =
    std::function<Result<void>(mcp::HandlerRegistry& registry, const config::ServerConfig&)>;

struct PhaseHooks {
    std::function<Result<config::ServerConfig>()> loadConfig;
    // Defaults to the identity carried in the config (MCP_CLIENT_NAME / MCP_CLIENT_ROOTS).
    std::function<ClientIdentity(const config::ServerConfig&)> clientIdentity;
    std::vector<Registrar> registrars;
    std::function<Result<void>(const config::ServerConfig&)> bindTransport;
    // Defaults to std::filesystem::current_path().
    std::function<std::filesystem::path()> currentDirectory;
};

struct PhaseFailure {
    core::InitPhase phase;
    Error error;
};

ClientIdentity identityFromConfig(const config::ServerConfig& cfg);

/**
 * Drives startup through the ordered InitPhase sequence, one phase at a time.
 *
 * The first failing phase is recorded and its error returned unchanged; completed phases
 * are not rolled back and nothing after the failure runs. Entering Ready seals the
 * registry.
 */
class PhaseRunner {
public:
    PhaseRunner(core::ProcessState& state, mcp::HandlerRegistry& registry,
                HandshakeValidator& validator, PhaseHooks hooks);

    Result<void> run();

    const std::optional<config::ServerConfig>& config() const { return config_; }
    const std::optional<PhaseFailure>& failure() const { return failure_; }

private:
    Result<void> runPhase(core::InitPhase phase, const std::function<Result<void>()>& action);

    Result<void> loadConfig();
    Result<void> resolveWorkspace();
    Result<void> validateHandshake();
    Result<void> registerHandlers();
    Result<void> bindTransport();

    core::ProcessState& state_;
    mcp::HandlerRegistry& registry_;
    HandshakeValidator& validator_;
    PhaseHooks hooks_;
    std::optional<config::ServerConfig> config_;
    std::optional<PhaseFailure> failure_;
};

} // namespace ctxbroker::session
