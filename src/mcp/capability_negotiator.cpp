#include <ctxbroker/mcp/capability_negotiator.h>
#include <ctxbroker/mcp/error_handling.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ctxbroker::mcp {

namespace {

constexpr std::string_view kResourcesSince = "2024-11-05";
constexpr std::string_view kResourceLinksSince = "2025-06-18";

// Protocol revisions are ISO dates, so string order is release order
bool versionAtLeast(const std::string& version, std::string_view minimum) {
    return !version.empty() && std::string_view(version) >= minimum;
}

// nullopt when absent, otherwise whether the value is an explicit false
std::optional<bool> experimentalFlag(const json& caps, const char* key) {
    auto exp = caps.find("experimental");
    if (exp == caps.end() || !exp->is_object())
        return std::nullopt;
    auto it = exp->find(key);
    if (it == exp->end())
        return std::nullopt;
    if (it->is_boolean())
        return it->get<bool>();
    return true;
}

} // namespace

const std::vector<std::string>& supportedProtocolVersions() {
    static const std::vector<std::string> kSupported = {
        std::string(protocol::LATEST_PROTOCOL_VERSION), "2025-03-26", "2024-11-05"};
    return kSupported;
}

std::string negotiateProtocolVersion(const json& params) {
    const auto& supported = supportedProtocolVersions();
    const std::string latest = supported.front();

    std::string requested = latest;
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        requested = params["protocolVersion"].get<std::string>();
    }
    if (std::find(supported.begin(), supported.end(), requested) != supported.end())
        return requested;
    spdlog::info("Client requested unsupported protocol version '{}', using {}", requested,
                 latest);
    return latest;
}

ClientCapabilities ClientCapabilities::fromInitialize(const json& params,
                                                      const std::string& negotiatedVersion) {
    ClientCapabilities caps;
    caps.protocolVersion = negotiatedVersion;

    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const auto& info = params["clientInfo"];
        if (info.contains("name") && info["name"].is_string())
            caps.clientName = info["name"].get<std::string>();
        if (info.contains("version") && info["version"].is_string())
            caps.clientVersion = info["version"].get<std::string>();
    }

    json declared = json::object();
    if (params.is_object() && params.contains("capabilities") &&
        params["capabilities"].is_object()) {
        declared = params["capabilities"];
    }

    caps.roots = declared.contains("roots");
    if (caps.roots && declared["roots"].is_object())
        caps.rootsListChanged = declared["roots"].value("listChanged", false);
    caps.sampling = declared.contains("sampling");
    caps.elicitation = declared.contains("elicitation");
    caps.logging = declared.contains("logging");

    caps.resources = declared.contains("resources") ||
                     versionAtLeast(negotiatedVersion, kResourcesSince);
    caps.resourceLinks = declared.contains("resourceLinks") ||
                         versionAtLeast(negotiatedVersion, kResourceLinksSince);

    if (auto flag = experimentalFlag(declared, "resources"))
        caps.resources = *flag;
    if (auto flag = experimentalFlag(declared, "resourceLinks"))
        caps.resourceLinks = *flag;

    spdlog::debug("Client '{}' {} capabilities: roots={} resources={} resourceLinks={}",
                  caps.clientName, caps.clientVersion, caps.roots, caps.resources,
                  caps.resourceLinks);
    return caps;
}

json ClientCapabilities::toJson() const {
    return json{{"clientName", clientName},     {"clientVersion", clientVersion},
                {"protocolVersion", protocolVersion},
                {"roots", roots},               {"sampling", sampling},
                {"elicitation", elicitation},   {"logging", logging},
                {"resources", resources},       {"resourceLinks", resourceLinks}};
}

const char* attachmentShapeToString(AttachmentShape shape) {
    switch (shape) {
        case AttachmentShape::ResourceLink: return "resource_link";
        case AttachmentShape::InlineResource: return "resource";
        case AttachmentShape::Omitted: return "omitted";
    }
    return "omitted";
}

AttachmentShape decideAttachment(const ClientCapabilities& caps) {
    if (caps.resourceLinks)
        return AttachmentShape::ResourceLink;
    if (caps.resources)
        return AttachmentShape::InlineResource;
    return AttachmentShape::Omitted;
}

AttachmentShape attachResource(json& content, const ResourceRef& resource,
                               const ClientCapabilities& caps) {
    if (!content.is_array())
        content = json::array();

    const auto shape = decideAttachment(caps);
    switch (shape) {
        case AttachmentShape::ResourceLink:
            content.push_back(json{{"type", "resource_link"},
                                   {"uri", resource.uri},
                                   {"name", resource.name},
                                   {"mimeType", resource.mimeType},
                                   {"description", resource.description}});
            break;
        case AttachmentShape::InlineResource: {
            json inner = {{"uri", resource.uri},
                          {"name", resource.name},
                          {"mimeType", resource.mimeType},
                          {"description", resource.description}};
            if (resource.text)
                inner["text"] = *resource.text;
            content.push_back(json{{"type", "resource"}, {"resource", std::move(inner)}});
            break;
        }
        case AttachmentShape::Omitted:
            break;
    }
    spdlog::debug("Attachment {} for client '{}' sent as {}", resource.uri, caps.clientName,
                  attachmentShapeToString(shape));
    return shape;
}

} // namespace ctxbroker::mcp
