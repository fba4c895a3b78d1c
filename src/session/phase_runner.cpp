#include <ctxbroker/session/phase_runner.h>

#include <spdlog/spdlog.h>

namespace ctxbroker::session {

using core::InitPhase;

ClientIdentity identityFromConfig(const config::ServerConfig& cfg) {
    ClientIdentity id;
    id.name = cfg.client.name;
    id.roots = cfg.client.roots;
    id.supportsRoots = !cfg.client.roots.empty();
    return id;
}

PhaseRunner::PhaseRunner(core::ProcessState& state, mcp::HandlerRegistry& registry,
                         HandshakeValidator& validator, PhaseHooks hooks)
    : state_(state), registry_(registry), validator_(validator), hooks_(std::move(hooks)) {}

Result<void> PhaseRunner::runPhase(InitPhase phase, const std::function<Result<void>()>& action) {
    if (failure_) {
        return failure_->error;
    }
    Result<void> outcome;
    try {
        outcome = action();
    } catch (const std::exception& e) {
        outcome = Error{ErrorCode::InternalError, e.what()};
    }
    if (outcome) {
        outcome = state_.markPhase(phase);
    }
    if (!outcome) {
        failure_ = PhaseFailure{phase, outcome.error()};
        spdlog::error("Initialization failed in phase {}: {}", core::phaseToString(phase),
                      outcome.error().message);
    }
    return outcome;
}

Result<void> PhaseRunner::run() {
    if (auto r = runPhase(InitPhase::ConfigLoaded, [this] { return loadConfig(); }); !r)
        return r;
    if (auto r = runPhase(InitPhase::WorkspaceResolved, [this] { return resolveWorkspace(); }); !r)
        return r;
    if (auto r = runPhase(InitPhase::HandshakeValidated, [this] { return validateHandshake(); });
        !r)
        return r;
    if (auto r = runPhase(InitPhase::HandlersRegistered, [this] { return registerHandlers(); });
        !r)
        return r;
    if (auto r = runPhase(InitPhase::TransportBound, [this] { return bindTransport(); }); !r)
        return r;
    if (auto r = runPhase(InitPhase::Ready,
                          [this]() -> Result<void> {
                              registry_.seal();
                              return {};
                          });
        !r)
        return r;
    spdlog::info("Server ready: {} tools, {} prompts, {} resources",
                 registry_.size(mcp::HandlerCategory::Tool),
                 registry_.size(mcp::HandlerCategory::Prompt),
                 registry_.size(mcp::HandlerCategory::Resource));
    return {};
}

Result<void> PhaseRunner::loadConfig() {
    if (!hooks_.loadConfig) {
        return Error{ErrorCode::ConfigurationError, "No configuration source"};
    }
    auto cfg = hooks_.loadConfig();
    if (!cfg)
        return cfg.error();
    config_ = std::move(cfg).value();
    state_.setLogLevel(config_->logLevel);
    return {};
}

Result<void> PhaseRunner::resolveWorkspace() {
    const ClientIdentity client =
        hooks_.clientIdentity ? hooks_.clientIdentity(*config_) : identityFromConfig(*config_);
    const auto cwd =
        hooks_.currentDirectory ? hooks_.currentDirectory() : std::filesystem::current_path();
    auto strategy = selectWorkspaceStrategy(client);
    auto paths = resolveWorkspacePaths(config_->workspaceOverride, *strategy, client, cwd);
    for (std::size_t i = 0; i < paths.size(); ++i) {
        spdlog::info("Workspace root {}{}", paths[i].string(), i == 0 ? " (primary)" : "");
    }
    return state_.setWorkspacePath(std::move(paths));
}

Result<void> PhaseRunner::validateHandshake() {
    return validator_.validate(config_->handshake);
}

Result<void> PhaseRunner::registerHandlers() {
    for (const auto& registrar : hooks_.registrars) {
        if (!registrar)
            continue;
        if (auto r = registrar(registry_, *config_); !r)
            return r;
    }
    return {};
}

Result<void> PhaseRunner::bindTransport() {
    if (!hooks_.bindTransport)
        return {};
    return hooks_.bindTransport(*config_);
}

} // namespace ctxbroker::session
