#include <catch2/catch_test_macros.hpp>

#include <ctxbroker/session/phase_runner.h>

#include <boost/asio/awaitable.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using ctxbroker::Error;
using ctxbroker::ErrorCode;
using ctxbroker::Result;
using ctxbroker::config::ServerConfig;
using ctxbroker::core::InitPhase;
using ctxbroker::core::ProcessState;
using ctxbroker::mcp::CallContext;
using ctxbroker::mcp::HandlerCategory;
using ctxbroker::mcp::HandlerDescriptor;
using ctxbroker::mcp::HandlerRegistry;
using ctxbroker::mcp::json;
using ctxbroker::session::HandshakeValidator;
using ctxbroker::session::HttpResponse;
using ctxbroker::session::IHandshakeClient;
using ctxbroker::session::PhaseHooks;
using ctxbroker::session::PhaseRunner;

namespace {

class CountingClient : public IHandshakeClient {
public:
    Result<HttpResponse> postJson(const std::string&, const std::string&,
                                  std::chrono::milliseconds) override {
        ++calls;
        return HttpResponse{200, R"({"success":true})", "OK"};
    }
    int calls = 0;
};

HandlerDescriptor echoTool(std::string name) {
    HandlerDescriptor d;
    d.name = std::move(name);
    d.category = HandlerCategory::Tool;
    d.inputSchema = json{{"type", "object"}};
    d.description = "echo";
    d.implementation = [](json args, CallContext) -> boost::asio::awaitable<json> {
        co_return args;
    };
    return d;
}

PhaseHooks hooksFor(ServerConfig cfg, std::vector<std::string>* trail) {
    PhaseHooks hooks;
    hooks.loadConfig = [cfg]() -> Result<ServerConfig> { return cfg; };
    hooks.currentDirectory = [] { return std::filesystem::path("/work/here"); };
    hooks.registrars.push_back([trail](HandlerRegistry& reg, const ServerConfig&) -> Result<void> {
        trail->push_back("register");
        return reg.registerHandler(echoTool("echo"));
    });
    hooks.bindTransport = [trail](const ServerConfig&) -> Result<void> {
        trail->push_back("bind");
        return {};
    };
    return hooks;
}

} // namespace

TEST_CASE("PhaseRunner - Missing secret stops at HandshakeValidated with nothing registered",
          "[session][phases][catch2]") {
    ProcessState state;
    HandlerRegistry registry;
    auto client = std::make_shared<CountingClient>();
    HandshakeValidator validator(state, client);

    ServerConfig cfg;
    cfg.handshake.loginUrl = "https://login.example.com";
    std::vector<std::string> trail;
    PhaseRunner runner(state, registry, validator, hooksFor(cfg, &trail));

    auto r = runner.run();
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::ConfigurationError);
    REQUIRE(runner.failure());
    CHECK(runner.failure()->phase == InitPhase::HandshakeValidated);
    CHECK(state.phase() == InitPhase::WorkspaceResolved);
    CHECK(registry.empty());
    CHECK(trail.empty());
    CHECK(client->calls == 0);
}

TEST_CASE("PhaseRunner - Successful startup walks every phase and seals the registry",
          "[session][phases][catch2]") {
    ProcessState state;
    HandlerRegistry registry;
    auto client = std::make_shared<CountingClient>();
    HandshakeValidator validator(state, client);

    ServerConfig cfg;
    cfg.handshake.loginUrl = "https://login.example.com";
    cfg.handshake.password = "pw";
    cfg.workspaceOverride = "/a,/b";
    cfg.logLevel = "debug";
    std::vector<std::string> trail;
    PhaseRunner runner(state, registry, validator, hooksFor(cfg, &trail));

    REQUIRE(runner.run());
    CHECK(state.phase() == InitPhase::Ready);
    CHECK(state.handshakeValidated());
    CHECK(state.logLevel() == "debug");
    CHECK(state.workspacePath() == std::vector<std::filesystem::path>{"/a", "/b"});
    CHECK(trail == std::vector<std::string>{"register", "bind"});
    CHECK(registry.sealed());
    CHECK(client->calls == 1);

    auto late = registry.registerHandler(echoTool("late"));
    REQUIRE_FALSE(late);
    CHECK(late.error().code == ErrorCode::InvalidState);
}

TEST_CASE("PhaseRunner - Workspace falls back to the current directory",
          "[session][phases][catch2]") {
    ProcessState state;
    HandlerRegistry registry;
    HandshakeValidator validator(state, std::make_shared<CountingClient>());

    ServerConfig cfg;
    cfg.handshake.bypass = true;
    std::vector<std::string> trail;
    PhaseRunner runner(state, registry, validator, hooksFor(cfg, &trail));

    REQUIRE(runner.run());
    CHECK(state.workspacePath() == std::vector<std::filesystem::path>{"/work/here"});
}

TEST_CASE("PhaseRunner - Configuration failure is reported at ConfigLoaded",
          "[session][phases][catch2]") {
    ProcessState state;
    HandlerRegistry registry;
    HandshakeValidator validator(state, std::make_shared<CountingClient>());

    PhaseHooks hooks;
    hooks.loadConfig = []() -> Result<ServerConfig> {
        return Error{ErrorCode::ConfigurationError, "Unknown log level: loud"};
    };
    PhaseRunner runner(state, registry, validator, std::move(hooks));

    auto r = runner.run();
    REQUIRE_FALSE(r);
    REQUIRE(runner.failure());
    CHECK(runner.failure()->phase == InitPhase::ConfigLoaded);
    CHECK(state.phase() == InitPhase::Created);
}

TEST_CASE("PhaseRunner - Duplicate registration aborts at HandlersRegistered",
          "[session][phases][catch2]") {
    ProcessState state;
    HandlerRegistry registry;
    HandshakeValidator validator(state, std::make_shared<CountingClient>());

    ServerConfig cfg;
    cfg.handshake.bypass = true;
    std::vector<std::string> trail;
    auto hooks = hooksFor(cfg, &trail);
    hooks.registrars.push_back([](HandlerRegistry& reg, const ServerConfig&) -> Result<void> {
        return reg.registerHandler(echoTool("echo"));
    });
    PhaseRunner runner(state, registry, validator, std::move(hooks));

    auto r = runner.run();
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::DuplicateName);
    CHECK(runner.failure()->phase == InitPhase::HandlersRegistered);
    CHECK(trail == std::vector<std::string>{"register"});
    CHECK_FALSE(registry.sealed());
}

TEST_CASE("PhaseRunner - Exceptions from hooks become InternalError",
          "[session][phases][catch2]") {
    ProcessState state;
    HandlerRegistry registry;
    HandshakeValidator validator(state, std::make_shared<CountingClient>());

    ServerConfig cfg;
    cfg.handshake.bypass = true;
    std::vector<std::string> trail;
    auto hooks = hooksFor(cfg, &trail);
    hooks.bindTransport = [](const ServerConfig&) -> Result<void> {
        throw std::runtime_error("port exploded");
    };
    PhaseRunner runner(state, registry, validator, std::move(hooks));

    auto r = runner.run();
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InternalError);
    CHECK(runner.failure()->phase == InitPhase::TransportBound);
}
