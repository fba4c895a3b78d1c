#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ctxbroker::mcp {

using json = nlohmann::json;

// Protocol revisions this server speaks, newest first.
const std::vector<std::string>& supportedProtocolVersions();

// Requested version when supported, otherwise the latest.
std::string negotiateProtocolVersion(const json& initializeParams);

/**
 * Typed capability record for one connection, derived once from the initialize request
 * and never mutated afterwards.
 */
struct ClientCapabilities {
    std::string clientName = "unknown";
    std::string clientVersion = "unknown";
    std::string protocolVersion;

    bool roots = false;
    bool rootsListChanged = false;
    bool sampling = false;
    bool elicitation = false;
    bool logging = false;
    bool resources = false;
    bool resourceLinks = false;

    static ClientCapabilities fromInitialize(const json& params,
                                             const std::string& negotiatedVersion);

    json toJson() const;
};

// Something a handler wants the client to see alongside its result.
struct ResourceRef {
    std::string uri;
    std::string name;
    std::string mimeType;
    std::string description;
    std::optional<std::string> text;
};

enum class AttachmentShape { ResourceLink, InlineResource, Omitted };

const char* attachmentShapeToString(AttachmentShape shape);

// Total over the capability set: link beats inline, inline beats nothing.
AttachmentShape decideAttachment(const ClientCapabilities& caps);

// Appends the attachment (if any) to an MCP content array and reports the chosen shape.
// Omission is logged at debug level and is never an error.
AttachmentShape attachResource(json& content, const ResourceRef& resource,
                               const ClientCapabilities& caps);

} // namespace ctxbroker::mcp
