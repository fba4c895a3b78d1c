#pragma once

#include <ctxbroker/core/process_state.h>
#include <ctxbroker/core/temp_file_manager.h>
#include <ctxbroker/core/types.h>
#include <ctxbroker/mcp/capability_negotiator.h>
#include <ctxbroker/mcp/handler_registry.h>
#include <ctxbroker/mcp/resource_store.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace ctxbroker::mcp {

inline constexpr const char* kServerContextTool = "serverContextUtils";
inline constexpr const char* kToolsBasicRunPrompt = "tools-basic-run";
inline constexpr const char* kServerStateResource = "mcp://server/state.json";

struct ServerContextRequest {
    using RequestType = ServerContextRequest;

    std::string action;

    static ServerContextRequest fromJson(const json& j);
    json toJson() const;
};

struct ServerContextResponse {
    using ResponseType = ServerContextResponse;

    std::string action;
    json result = json::object();
    std::vector<ResourceRef> exported;

    static ServerContextResponse fromJson(const json& j);
    json toJson() const;
    const std::vector<ResourceRef>& attachments() const { return exported; }
};

// Services the built-in handlers use. All references must outlive the registry.
struct BuiltinContext {
    core::ProcessState& state;
    ResourceStore& resources;
    const core::TempFileManager& tempFiles;
};

// Registers serverContextUtils, tools-basic-run and mcp://server/state.json.
Result<void> registerBuiltinHandlers(HandlerRegistry& registry, BuiltinContext context);

} // namespace ctxbroker::mcp
