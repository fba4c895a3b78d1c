#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include <boost/asio/io_context.hpp>

#include <ctxbroker/config/server_config.h>
#include <ctxbroker/core/process_state.h>
#include <ctxbroker/core/temp_file_manager.h>
#include <ctxbroker/mcp/builtin_handlers.h>
#include <ctxbroker/mcp/client_log_sink.h>
#include <ctxbroker/mcp/handler_registry.h>
#include <ctxbroker/mcp/http_server.h>
#include <ctxbroker/mcp/mcp_server.h>
#include <ctxbroker/mcp/resource_store.h>
#include <ctxbroker/session/handshake_validator.h>
#include <ctxbroker/session/phase_runner.h>
#include <ctxbroker/version.hpp>

using namespace ctxbroker;

std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    spdlog::info("Received signal {}, shutting down...", signal);
    g_running = false;
}

namespace {

bool setupLogging(const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!logFile.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, 10 * 1024 * 1024, 3));
        }
        auto logger =
            std::make_shared<spdlog::logger>("ctxbroker-mcp", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    auto cli = config::parseCommandLine(argc, argv);
    if (!cli) {
        std::cerr << cli.error().message << std::endl;
        return 1;
    }
    if (cli.value().showHelp) {
        std::cout << cli.value().helpText;
        return 0;
    }
    if (cli.value().showVersion) {
        std::cout << "ctxbroker-mcp " << CTXBROKER_VERSION_STRING << std::endl;
        return 0;
    }

    if (!setupLogging(cli.value().logFile))
        return 1;

    // Resolved once; the phase runner reports a failure here as a ConfigLoaded failure.
    const auto resolved = config::resolveServerConfig(cli.value(), config::processEnvironment());
    const config::ServerConfig defaults;
    const auto& cfg = resolved ? resolved.value() : defaults;

    spdlog::set_level(spdlog::level::info);
    if (auto level = config::parseMcpLogLevel(cfg.logLevel))
        spdlog::set_level(level.value());
    spdlog::info("ctxbroker MCP Server v{}", CTXBROKER_VERSION_STRING);

    core::ProcessState state(cfg.logLevel);
    mcp::HandlerRegistry registry;
    mcp::ResourceStore resources(cfg.maxResources);
    core::TempFileManager tempFiles(cfg.tempDir);

    session::CurlHandshakeClientConfig curlConfig;
    curlConfig.verifyTls = cfg.handshake.strictSsl;
    session::HandshakeValidator validator(
        state, std::make_shared<session::CurlHandshakeClient>(curlConfig));

    mcp::MCPServer server(state, registry, resources);
    boost::asio::io_context ioc;
    std::unique_ptr<mcp::StdioTransport> stdio;
    std::unique_ptr<mcp::HttpMcpServer> http;

    // Mirrors log records to clients that declared the logging capability.
    auto clientLogs = std::make_shared<mcp::ClientLogSink>(server);
    spdlog::default_logger()->sinks().push_back(clientLogs);
    struct ClientLogDetach {
        std::shared_ptr<mcp::ClientLogSink> sink;
        ~ClientLogDetach() { sink->detach(); }
    } clientLogDetach{clientLogs};

    session::PhaseHooks hooks;
    hooks.loadConfig = [&resolved]() { return resolved; };
    hooks.registrars.push_back(
        [&](mcp::HandlerRegistry& reg, const config::ServerConfig&) -> Result<void> {
            return mcp::registerBuiltinHandlers(
                reg, mcp::BuiltinContext{state, resources, tempFiles});
        });
    hooks.bindTransport = [&](const config::ServerConfig& c) -> Result<void> {
        if (c.transport == config::TransportKind::Stdio) {
            stdio = std::make_unique<mcp::StdioTransport>();
            spdlog::info("Transport: STDIO");
            return {};
        }
        mcp::HttpMcpServer::Config httpConfig;
        httpConfig.bindPort = c.httpPort;
        http = std::make_unique<mcp::HttpMcpServer>(ioc, server, state, httpConfig);
        auto port = http->bind();
        if (!port)
            return port.error();
        spdlog::info("Transport: HTTP on port {}", port.value());
        return {};
    };

    session::PhaseRunner runner(state, registry, validator, std::move(hooks));
    if (auto started = runner.run(); !started) {
        const auto phase = runner.failure() ? runner.failure()->phase : state.phase();
        spdlog::critical("Startup failed during {}: {}", core::phaseToString(phase),
                         started.error().message);
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::atomic<bool> finished{false};
    std::thread serverThread([&]() {
        if (http) {
            http->run();
        } else {
            server.serve(*stdio);
        }
        finished = true;
    });

    spdlog::info("MCP server started successfully");
    while (g_running && !finished) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutting down MCP server...");
    state.beginShutdown();
    server.stop();
    if (stdio)
        stdio->close();
    if (http)
        http->stop();
    if (serverThread.joinable())
        serverThread.join();
    spdlog::info("MCP server stopped");
    return 0;
}
