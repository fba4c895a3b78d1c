#include <ctxbroker/config/server_config.h>
#include <ctxbroker/mcp/mcp_server.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <vector>

namespace ctxbroker::mcp {

namespace {

MessageResult notification() {
    return Error{ErrorCode::Success, "notification"};
}

bool isNotificationMethod(const std::string& method) {
    return method.rfind("notifications/", 0) == 0;
}

// MCP logging levels are syslog names; spdlog's trace folds into debug.
const char* mcpLevelName(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warning";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        default: return "info";
    }
}

} // namespace

MCPServer::MCPServer(core::ProcessState& state, const HandlerRegistry& registry,
                     ResourceStore& resources, Options options)
    : state_(state), registry_(registry), resources_(resources), options_(std::move(options)) {
    resources_.setChangeListener([this] { notifyResourceListChanged(); });
}

MCPServer::~MCPServer() {
    resources_.setChangeListener(nullptr);
}

json MCPServer::createResponse(const json& id, const json& result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json MCPServer::createError(const json& id, int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

json MCPServer::buildServerCapabilities() const {
    return json{{"tools", json({{"listChanged", false}})},
                {"prompts", json({{"listChanged", false}})},
                {"resources", json({{"subscribe", false}, {"listChanged", true}})},
                {"logging", json::object()}};
}

std::string MCPServer::createSession(std::optional<std::string> id) {
    std::string key;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        if (id) {
            key = *id;
        } else {
            do {
                key = "session-" + std::to_string(++sessionCounter_);
            } while (sessions_.count(key) != 0);
        }
        McpSession session;
        session.id = key;
        sessions_[key] = std::move(session);
    }
    spdlog::debug("MCP session {} opened", key);
    return key;
}

bool MCPServer::hasSession(const std::string& id) const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return sessions_.count(id) != 0;
}

bool MCPServer::closeSession(const std::string& id) {
    bool erased = false;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        erased = sessions_.erase(id) != 0;
    }
    if (erased)
        spdlog::debug("MCP session {} closed", id);
    return erased;
}

std::size_t MCPServer::sessionCount() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return sessions_.size();
}

bool MCPServer::attachOutbound(const std::string& sessionId, OutboundSink sink) {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end())
        return false;
    it->second.outbound = std::move(sink);
    return true;
}

std::size_t MCPServer::broadcast(const json& notification, bool requireLogging) {
    std::vector<OutboundSink> targets;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        for (const auto& [id, session] : sessions_) {
            if (!session.outbound || !session.client)
                continue;
            if (requireLogging && !session.client->logging)
                continue;
            targets.push_back(session.outbound);
        }
    }
    for (const auto& send : targets)
        send(notification);
    return targets.size();
}

std::size_t MCPServer::notifyResourceListChanged() {
    return broadcast(json{{"jsonrpc", "2.0"}, {"method", "notifications/resources/list_changed"}});
}

std::size_t MCPServer::forwardLog(spdlog::level::level_enum level, const std::string& logger,
                                  const std::string& text) {
    if (level == spdlog::level::off)
        return 0;
    auto threshold = config::parseMcpLogLevel(state_.logLevel());
    if (level < (threshold ? threshold.value() : spdlog::level::info))
        return 0;
    json params = {{"level", mcpLevelName(level)}, {"data", text}};
    if (!logger.empty())
        params["logger"] = logger;
    json message = {{"jsonrpc", "2.0"},
                    {"method", "notifications/message"},
                    {"params", std::move(params)}};
    return broadcast(message, true);
}

void MCPServer::serve(ITransport& transport) {
    running_ = true;
    const auto sessionId = createSession(std::string("stdio"));
    attachOutbound(sessionId, [&transport](const json& message) { transport.send(message); });
    spdlog::info("MCP server serving stdio session");

    while (running_.load() && transport.isConnected()) {
        auto message = transport.receive();
        if (!message) {
            const auto& err = message.error();
            // idle poll; loop condition picks up stop()
            if (err.code == ErrorCode::Timeout)
                continue;
            if (err.code == ErrorCode::NetworkError) {
                spdlog::info("MCP transport closed: {}", err.message);
                break;
            }
            transport.send(createError(nullptr, protocol::PARSE_ERROR, err.message));
            continue;
        }

        auto response = handleRequest(message.value(), sessionId);
        if (response) {
            transport.send(response.value());
        } else if (response.error().code != ErrorCode::Success) {
            spdlog::warn("MCP request produced no response: {}", response.error().message);
        }
    }

    running_ = false;
    closeSession(sessionId);
    spdlog::info("MCP server loop stopped");
}

MessageResult MCPServer::handleRequest(const json& request, const std::string& sessionId) {
    boost::asio::io_context io;
    auto future =
        boost::asio::co_spawn(io, handleRequestAsync(request, sessionId), boost::asio::use_future);
    io.run();
    try {
        return future.get();
    } catch (const std::exception& e) {
        spdlog::error("MCP request handling failed: {}", e.what());
        return createError(request.is_object() ? request.value("id", json()) : json(),
                           protocol::INTERNAL_ERROR, e.what());
    }
}

boost::asio::awaitable<MessageResult> MCPServer::handleRequestAsync(json request,
                                                                    std::string sessionId) {
    auto valid = json_utils::validate_jsonrpc_message(request);
    if (!valid) {
        co_return createError(request.is_object() ? request.value("id", json()) : json(),
                              protocol::INVALID_REQUEST, valid.error().message);
    }

    const bool isNotification = !request.contains("id");
    const json id = request.value("id", json());
    const std::string method = request.value("method", "");
    const json params = request.contains("params") && request["params"].is_object()
                            ? request["params"]
                            : json::object();

    if (method.empty()) {
        // Responses to server-initiated requests are not expected; drop them
        co_return notification();
    }
    spdlog::debug("MCP {} '{}' (session {})", isNotification ? "notification" : "request",
                  method, sessionId);

    if (state_.shuttingDown() && method != "exit" && !isNotificationMethod(method)) {
        co_return createError(id, protocol::SERVER_SHUTTING_DOWN, "Server is shutting down");
    }

    if (method == "initialize") {
        co_return createResponse(id, initialize(params, sessionId));
    }
    if (method == "notifications/initialized") {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        if (auto it = sessions_.find(sessionId); it != sessions_.end())
            it->second.initialized = true;
        co_return notification();
    }
    if (method == "notifications/roots/list_changed") {
        spdlog::info("Client roots changed; workspace is fixed once resolved, ignoring");
        co_return notification();
    }
    if (method == "notifications/cancelled") {
        co_return notification();
    }
    if (method == "ping") {
        co_return createResponse(id, json::object());
    }
    if (method == "shutdown") {
        spdlog::debug("Shutdown request received, preparing for exit");
        state_.beginShutdown();
        co_return createResponse(id, json::object());
    }
    if (method == "exit") {
        spdlog::debug("Exit request received");
        state_.beginShutdown();
        running_ = false;
        co_return notification();
    }
    if (method == "tools/list") {
        co_return createResponse(id, json{{"tools", registry_.listJson(HandlerCategory::Tool)}});
    }
    if (method == "tools/call") {
        co_return co_await callTool(id, params, sessionId);
    }
    if (method == "prompts/list") {
        co_return createResponse(id,
                                 json{{"prompts", registry_.listJson(HandlerCategory::Prompt)}});
    }
    if (method == "prompts/get") {
        co_return co_await getPrompt(id, params, sessionId);
    }
    if (method == "resources/list") {
        co_return createResponse(id, listResources());
    }
    if (method == "resources/templates/list") {
        co_return createResponse(id, json{{"resourceTemplates", json::array()}});
    }
    if (method == "resources/read") {
        co_return co_await readResource(id, params, sessionId);
    }
    if (method == "logging/setLevel") {
        co_return setLogLevel(id, params);
    }

    if (isNotification) {
        spdlog::debug("Ignoring unknown notification '{}'", method);
        co_return notification();
    }
    co_return createError(id, protocol::METHOD_NOT_FOUND, "Method not found: " + method);
}

json MCPServer::initialize(const json& params, const std::string& sessionId) {
    const auto negotiated = negotiateProtocolVersion(params);
    auto caps = ClientCapabilities::fromInitialize(params, negotiated);
    if (caps.roots) {
        spdlog::info("Client '{}' declares roots; workspace was fixed at startup and stays as is",
                     caps.clientName);
    }

    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        auto& session = sessions_[sessionId];
        session.id = sessionId;
        session.client = caps;
    }

    spdlog::info("MCP client '{}' {} initialized (protocol {})", caps.clientName,
                 caps.clientVersion, negotiated);
    json result = {{"protocolVersion", negotiated},
                   {"serverInfo", {{"name", options_.name}, {"version", options_.version}}},
                   {"capabilities", buildServerCapabilities()}};
    if (!options_.instructions.empty())
        result["instructions"] = options_.instructions;
    return result;
}

CallContext MCPServer::contextFor(const std::string& sessionId, const json& params) const {
    CallContext ctx;
    ctx.sessionId = sessionId;
    if (params.contains("_meta") && params["_meta"].is_object())
        ctx.meta = params["_meta"];
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    if (auto it = sessions_.find(sessionId); it != sessions_.end() && it->second.client) {
        ctx.client = *it->second.client;
    }
    return ctx;
}

boost::asio::awaitable<MessageResult> MCPServer::callTool(const json& id, const json& params,
                                                          const std::string& sessionId) {
    if (!params.contains("name") || !params["name"].is_string()) {
        co_return createError(id, protocol::INVALID_PARAMS, "tools/call requires a tool name");
    }
    const auto name = params["name"].get<std::string>();
    json args = params.contains("arguments") && params["arguments"].is_object()
                    ? params["arguments"]
                    : json::object();
    spdlog::debug("MCP tool call: '{}' with args: {}", name, args.dump());

    auto result =
        co_await registry_.invoke(HandlerCategory::Tool, name, std::move(args),
                                  contextFor(sessionId, params));
    if (!result) {
        if (result.error().code == ErrorCode::NotFound) {
            co_return createResponse(id, makeTextResult("Unknown tool: " + name, true));
        }
        co_return createError(id, jsonRpcCodeFor(result.error().code), result.error().message);
    }
    co_return createResponse(id, result.value());
}

boost::asio::awaitable<MessageResult> MCPServer::getPrompt(const json& id, const json& params,
                                                           const std::string& sessionId) {
    const auto name = params.value("name", std::string());
    json args = params.contains("arguments") && params["arguments"].is_object()
                    ? params["arguments"]
                    : json::object();
    auto result = co_await registry_.invoke(HandlerCategory::Prompt, name, std::move(args),
                                            contextFor(sessionId, params));
    if (!result) {
        co_return createError(id, jsonRpcCodeFor(result.error().code), result.error().message);
    }
    co_return createResponse(id, result.value());
}

json MCPServer::listResources() const {
    json list = registry_.listJson(HandlerCategory::Resource);
    for (auto& entry : resources_.list())
        list.push_back(std::move(entry));
    return json{{"resources", std::move(list)}};
}

boost::asio::awaitable<MessageResult> MCPServer::readResource(const json& id, const json& params,
                                                              const std::string& sessionId) {
    const auto uri = params.value("uri", std::string());
    if (uri.empty()) {
        co_return createError(id, protocol::INVALID_PARAMS, "resources/read requires a uri");
    }

    if (registry_.lookup(HandlerCategory::Resource, uri)) {
        json args{{"uri", uri}};
        auto result = co_await registry_.invoke(HandlerCategory::Resource, uri,
                                                std::move(args), contextFor(sessionId, params));
        if (!result) {
            co_return createError(id, jsonRpcCodeFor(result.error().code),
                                  result.error().message);
        }
        co_return createResponse(id, result.value());
    }

    if (auto stored = resources_.read(uri)) {
        json content = {{"uri", stored->uri}, {"mimeType", stored->mimeType}};
        content["text"] = stored->text.value_or("");
        co_return createResponse(id, json{{"contents", json::array({std::move(content)})}});
    }

    co_return createError(id, protocol::RESOURCE_NOT_FOUND, "Resource not found: " + uri);
}

MessageResult MCPServer::setLogLevel(const json& id, const json& params) {
    const auto level = params.value("level", std::string("info"));
    auto parsed = config::parseMcpLogLevel(level);
    if (!parsed) {
        return createError(id, protocol::INVALID_PARAMS, parsed.error().message);
    }
    spdlog::set_level(parsed.value());
    state_.setLogLevel(level);
    spdlog::info("Log level set to {}", level);
    return createResponse(id, json::object());
}

} // namespace ctxbroker::mcp
