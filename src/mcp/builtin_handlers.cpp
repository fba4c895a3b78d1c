#include <ctxbroker/mcp/builtin_handlers.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ctxbroker::mcp {

namespace {

std::string isoNow() {
    const auto now = std::chrono::system_clock::now();
    const auto t = std::chrono::system_clock::to_time_t(now);
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
       << ms.count() << 'Z';
    return os.str();
}

json serverContextSchema() {
    return json{{"type", "object"},
                {"properties",
                 {{"action",
                   {{"type", "string"},
                    {"enum", {"getCurrentDatetime", "getState", "exportState", "clearCache"}},
                    {"description", "Operation to perform on the server context"}}}}},
                {"required", {"action"}}};
}

Result<ServerContextResponse> exportState(const BuiltinContext& ctx, const json& snapshot) {
    const auto workspace = ctx.state.get().primaryWorkspace();
    auto written = ctx.tempFiles.writeJson(workspace, "serverState", snapshot);
    if (!written)
        return written.error();

    ResourceRef ref;
    ref.uri = fileUriFromPath(written.value());
    ref.name = written.value().filename().string();
    ref.mimeType = "application/json";
    ref.description = "Exported server state";
    ref.text = snapshot.dump(3);
    ctx.resources.publish(ref);
    spdlog::info("Server state exported to {}", written.value().string());

    ServerContextResponse resp;
    resp.action = "exportState";
    resp.result = json{{"path", written.value().string()}, {"uri", ref.uri}};
    resp.exported.push_back(std::move(ref));
    return resp;
}

} // namespace

ServerContextRequest ServerContextRequest::fromJson(const json& j) {
    ServerContextRequest req;
    j.at("action").get_to(req.action);
    return req;
}

json ServerContextRequest::toJson() const {
    return json{{"action", action}};
}

ServerContextResponse ServerContextResponse::fromJson(const json& j) {
    ServerContextResponse resp;
    resp.action = j.value("action", std::string());
    resp.result = j.value("result", json::object());
    return resp;
}

json ServerContextResponse::toJson() const {
    return json{{"action", action}, {"result", result}};
}

Result<void> registerBuiltinHandlers(HandlerRegistry& registry, BuiltinContext context) {
    auto tool = registry.registerTool<ServerContextRequest, ServerContextResponse>(
        kServerContextTool,
        [context](const ServerContextRequest& req,
                  const CallContext&) -> boost::asio::awaitable<Result<ServerContextResponse>> {
            ServerContextResponse resp;
            resp.action = req.action;
            if (req.action == "getCurrentDatetime") {
                resp.result = json{{"now", isoNow()}};
                co_return resp;
            }
            if (req.action == "getState") {
                resp.result = context.state.get().toJson();
                co_return resp;
            }
            if (req.action == "exportState") {
                co_return exportState(context, context.state.get().toJson());
            }
            if (req.action == "clearCache") {
                const auto removed = context.resources.size();
                context.resources.clear();
                resp.result = json{{"cleared", removed}};
                co_return resp;
            }
            co_return Error{ErrorCode::InvalidArgument, "Unknown action: " + req.action};
        },
        serverContextSchema(), "Inspect and manage the server's own context",
        "Server context utilities");
    if (!tool)
        return tool;

    HandlerDescriptor prompt;
    prompt.name = kToolsBasicRunPrompt;
    prompt.category = HandlerCategory::Prompt;
    prompt.inputSchema = json{{"type", "object"}, {"properties", json::object()}};
    prompt.description = "Exercise every registered tool once with basic arguments";
    prompt.title = "Basic tool run";
    prompt.implementation = [&registry](json, CallContext) -> boost::asio::awaitable<json> {
        std::ostringstream text;
        text << "Run each of the following tools once with minimal valid arguments and "
                "report any failure:\n";
        for (const auto& d : registry.listAll(HandlerCategory::Tool)) {
            text << "- " << d.name;
            if (!d.description.empty())
                text << ": " << d.description;
            text << "\n";
        }
        json message = {{"role", "user"}, {"content", {{"type", "text"}, {"text", text.str()}}}};
        co_return json{{"description", "Basic run of all tools"},
                       {"messages", json::array({std::move(message)})}};
    };
    if (auto r = registry.registerHandler(std::move(prompt)); !r)
        return r;

    HandlerDescriptor resource;
    resource.name = kServerStateResource;
    resource.category = HandlerCategory::Resource;
    resource.inputSchema = json{{"type", "object"}};
    resource.description = "Sanitized snapshot of the server process state";
    resource.title = "Server state";
    resource.mimeType = "application/json";
    resource.implementation = [state = &context.state](
                                  json, CallContext) -> boost::asio::awaitable<json> {
        json content = {{"uri", kServerStateResource},
                        {"mimeType", "application/json"},
                        {"text", state->get().toJson().dump(3)}};
        co_return json{{"contents", json::array({std::move(content)})}};
    };
    return registry.registerHandler(std::move(resource));
}

} // namespace ctxbroker::mcp
