#pragma once

#include <ctxbroker/core/process_state.h>
#include <ctxbroker/core/types.h>
#include <ctxbroker/mcp/capability_negotiator.h>
#include <ctxbroker/mcp/error_handling.h>
#include <ctxbroker/mcp/handler_registry.h>
#include <ctxbroker/mcp/resource_store.h>
#include <ctxbroker/version.hpp>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ctxbroker::mcp {

using json = nlohmann::json;

/**
 * Transport interface for MCP communication
 */
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual void send(const json& message) = 0;
    // Error codes: Timeout when no input arrived yet, NetworkError once the peer is gone,
    // InvalidData for a line that is not a JSON-RPC message.
    virtual MessageResult receive() = 0;
    virtual bool isConnected() const = 0;
    virtual void close() = 0;
    virtual TransportState getState() const = 0;
};

/**
 * Standard I/O transport. One JSON-RPC message per line in both directions; stdout carries
 * nothing else.
 */
class StdioTransport : public ITransport {
public:
    StdioTransport();
    StdioTransport(std::istream& in, std::ostream& out);

    void send(const json& message) override;
    MessageResult receive() override;
    bool isConnected() const override { return state_.load() == TransportState::Connected; }
    void close() override { state_.store(TransportState::Closing); }
    TransportState getState() const override { return state_.load(); }

private:
    bool isInputAvailable(int timeoutMs) const;

    std::istream& in_;
    std::ostream& out_;
    bool pollStdin_{false};
    int recvTimeoutMs_{500};
    std::atomic<TransportState> state_{TransportState::Connected};
    mutable std::mutex outMutex_;
};

// Delivers a server-initiated message (a notification) to one connected client.
using OutboundSink = std::function<void(const json&)>;

// Per-connection protocol state.
struct McpSession {
    std::string id;
    bool initialized = false;
    std::optional<ClientCapabilities> client;
    // Empty for transports without a server-to-client channel (plain HTTP POST).
    OutboundSink outbound;
};

// Declared at namespace scope so its default member initializers are usable in
// MCPServer's default constructor argument; exposed as MCPServer::Options.
struct MCPServerOptions {
    std::string name = "ctxbroker-mcp";
    std::string version = CTXBROKER_VERSION_STRING;
    std::string instructions;
};

/**
 * JSON-RPC dispatcher sitting on top of the sealed handler registry.
 *
 * Thread-safe: the HTTP transport calls handleRequest from one thread per connection.
 */
class MCPServer {
public:
    using Options = MCPServerOptions;

    MCPServer(core::ProcessState& state, const HandlerRegistry& registry,
              ResourceStore& resources, Options options = {});
    ~MCPServer();

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    // Runs the stdio loop for a single session until exit, EOF or stop().
    void serve(ITransport& transport);
    void stop() { running_ = false; }
    bool isRunning() const { return running_.load(); }

    // Without an id a fresh "session-<n>" is generated; n never repeats for this server.
    std::string createSession(std::optional<std::string> id = std::nullopt);
    bool hasSession(const std::string& id) const;
    bool closeSession(const std::string& id);
    std::size_t sessionCount() const;

    // Returns false when the session does not exist.
    bool attachOutbound(const std::string& sessionId, OutboundSink sink);

    /**
     * Sends a notification to every initialized session that has an outbound channel.
     * When requireLogging is set, only clients that declared the logging capability are
     * addressed. Returns the number of sessions reached. Never logs.
     */
    std::size_t broadcast(const json& notification, bool requireLogging = false);

    // notifications/resources/list_changed; wired to the ResourceStore change listener.
    std::size_t notifyResourceListChanged();

    // notifications/message for records at or above the client-selected MCP level.
    std::size_t forwardLog(spdlog::level::level_enum level, const std::string& logger,
                           const std::string& text);

    // Response JSON, or Error{Success, "notification"} when nothing should be sent.
    MessageResult handleRequest(const json& request, const std::string& sessionId);
    boost::asio::awaitable<MessageResult> handleRequestAsync(json request, std::string sessionId);

    json buildServerCapabilities() const;

    static json createResponse(const json& id, const json& result);
    static json createError(const json& id, int code, const std::string& message);

private:
    json initialize(const json& params, const std::string& sessionId);
    CallContext contextFor(const std::string& sessionId, const json& params) const;

    boost::asio::awaitable<MessageResult> callTool(const json& id, const json& params,
                                                   const std::string& sessionId);
    boost::asio::awaitable<MessageResult> getPrompt(const json& id, const json& params,
                                                    const std::string& sessionId);
    boost::asio::awaitable<MessageResult> readResource(const json& id, const json& params,
                                                       const std::string& sessionId);
    json listResources() const;
    MessageResult setLogLevel(const json& id, const json& params);

    core::ProcessState& state_;
    const HandlerRegistry& registry_;
    ResourceStore& resources_;
    Options options_;
    std::atomic<bool> running_{false};

    // No logging while this is held: forwarded log records take it too.
    mutable std::mutex sessionsMutex_;
    std::unordered_map<std::string, McpSession> sessions_;
    std::uint64_t sessionCounter_{0};
};

} // namespace ctxbroker::mcp
