#include <ctxbroker/mcp/client_log_sink.h>
#include <ctxbroker/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <string>

namespace ctxbroker::mcp {

namespace {

thread_local bool forwarding = false;

} // namespace

void ClientLogSink::sink_it_(const spdlog::details::log_msg& msg) {
    auto* server = server_.load();
    if (server == nullptr || forwarding)
        return;

    forwarding = true;
    try {
        server->forwardLog(msg.level, std::string(msg.logger_name.data(), msg.logger_name.size()),
                           std::string(msg.payload.data(), msg.payload.size()));
    } catch (const std::exception& e) {
        // still flagged, so this reaches the other sinks only
        spdlog::warn("Could not forward log record to MCP clients: {}", e.what());
    }
    forwarding = false;
}

} // namespace ctxbroker::mcp
