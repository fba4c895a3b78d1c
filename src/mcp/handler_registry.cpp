#include <ctxbroker/mcp/handler_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ctxbroker::mcp {

namespace {

// prompts/list advertises arguments rather than a schema
json promptArgumentsFromSchema(const json& schema) {
    json args = json::array();
    if (!schema.contains("properties"))
        return args;
    std::vector<std::string> required;
    if (schema.contains("required")) {
        for (const auto& r : schema["required"])
            required.push_back(r.get<std::string>());
    }
    for (auto it = schema["properties"].begin(); it != schema["properties"].end(); ++it) {
        json arg = {{"name", it.key()},
                    {"required", std::find(required.begin(), required.end(), it.key()) !=
                                     required.end()}};
        if (it.value().is_object() && it.value().contains("description"))
            arg["description"] = it.value()["description"];
        args.push_back(std::move(arg));
    }
    return args;
}

} // namespace

const char* categoryToString(HandlerCategory category) {
    switch (category) {
        case HandlerCategory::Tool: return "tool";
        case HandlerCategory::Prompt: return "prompt";
        case HandlerCategory::Resource: return "resource";
    }
    return "tool";
}

json makeTextResult(std::string text, bool isError) {
    json result = {{"content", json::array({json{{"type", "text"}, {"text", std::move(text)}}})}};
    if (isError)
        result["isError"] = true;
    return result;
}

Result<void> validateInputSchema(const json& schema) {
    if (schema.is_null()) {
        return Error{ErrorCode::InvalidSchema, "inputSchema is missing"};
    }
    if (!schema.is_object()) {
        return Error{ErrorCode::InvalidSchema, "inputSchema must be a JSON object"};
    }
    auto type = schema.find("type");
    if (type == schema.end() || !type->is_string() || type->get<std::string>() != "object") {
        return Error{ErrorCode::InvalidSchema, "inputSchema.type must be \"object\""};
    }
    if (auto props = schema.find("properties"); props != schema.end() && !props->is_object()) {
        return Error{ErrorCode::InvalidSchema, "inputSchema.properties must be an object"};
    }
    if (auto req = schema.find("required"); req != schema.end()) {
        if (!req->is_array()) {
            return Error{ErrorCode::InvalidSchema, "inputSchema.required must be an array"};
        }
        for (const auto& r : *req) {
            if (!r.is_string()) {
                return Error{ErrorCode::InvalidSchema,
                             "inputSchema.required must contain only strings"};
            }
        }
    }
    return {};
}

json HandlerDescriptor::toListEntry() const {
    switch (category) {
        case HandlerCategory::Tool: {
            json tool = {{"name", name}, {"description", description}, {"inputSchema", inputSchema}};
            if (!title.empty())
                tool["title"] = title;
            return tool;
        }
        case HandlerCategory::Prompt: {
            json prompt = {{"name", name},
                           {"description", description},
                           {"arguments", promptArgumentsFromSchema(inputSchema)}};
            if (!title.empty())
                prompt["title"] = title;
            return prompt;
        }
        case HandlerCategory::Resource: {
            json res = {{"uri", name},
                        {"name", title.empty() ? name : title},
                        {"description", description},
                        {"mimeType", mimeType.empty() ? "application/json" : mimeType}};
            return res;
        }
    }
    return json::object();
}

Result<void> HandlerRegistry::registerHandler(HandlerDescriptor descriptor) {
    const char* category = categoryToString(descriptor.category);
    if (sealed_) {
        spdlog::critical("Refusing to register {} '{}' after the server became ready", category,
                         descriptor.name);
        return Error{ErrorCode::InvalidState, std::string("Cannot register ") + category + " '" +
                                                  descriptor.name + "' after ready"};
    }
    if (descriptor.name.empty()) {
        return Error{ErrorCode::InvalidArgument, std::string(category) + " name must not be empty"};
    }
    if (!descriptor.implementation) {
        return Error{ErrorCode::InvalidArgument,
                     std::string(category) + " '" + descriptor.name + "' has no implementation"};
    }
    if (auto valid = validateInputSchema(descriptor.inputSchema); !valid) {
        return Error{ErrorCode::InvalidSchema, std::string(category) + " '" + descriptor.name +
                                                   "': " + valid.error().message};
    }

    Key key{descriptor.category, descriptor.name};
    if (index_.count(key) != 0) {
        return Error{ErrorCode::DuplicateName,
                     std::string(category) + " '" + descriptor.name + "' is already registered"};
    }

    spdlog::debug("Registered {} '{}'", category, descriptor.name);
    index_.emplace(std::move(key), entries_.size());
    entries_.push_back(std::make_shared<const HandlerDescriptor>(std::move(descriptor)));
    return {};
}

Result<HandlerRegistry::DescriptorPtr> HandlerRegistry::lookup(HandlerCategory category,
                                                               std::string_view name) const {
    auto it = index_.find(Key{category, std::string(name)});
    if (it == index_.end()) {
        return Error{ErrorCode::NotFound, std::string("Unknown ") + categoryToString(category) +
                                              ": " + std::string(name)};
    }
    return entries_[it->second];
}

json HandlerRegistry::listJson(HandlerCategory category) const {
    json out = json::array();
    for (const auto& d : listAll(category)) {
        out.push_back(d.toListEntry());
    }
    return out;
}

boost::asio::awaitable<Result<json>> HandlerRegistry::invoke(HandlerCategory category,
                                                             std::string name, json arguments,
                                                             CallContext ctx) const {
    auto found = lookup(category, name);
    if (!found) {
        co_return found.error();
    }
    auto descriptor = found.value();

    std::string failure;
    try {
        json result = co_await descriptor->implementation(std::move(arguments), std::move(ctx));
        co_return result;
    } catch (const std::exception& e) {
        failure = e.what();
    }

    spdlog::error("{} '{}' threw: {}", categoryToString(category), name, failure);
    if (category == HandlerCategory::Tool) {
        co_return makeTextResult("Error: " + failure, true);
    }
    co_return Error{ErrorCode::InternalError, failure};
}

void HandlerRegistry::seal() {
    if (!sealed_) {
        sealed_ = true;
        spdlog::debug("Handler registry sealed with {} entries", entries_.size());
    }
}

std::size_t HandlerRegistry::size(HandlerCategory category) const {
    return static_cast<std::size_t>(std::ranges::distance(listAll(category)));
}

} // namespace ctxbroker::mcp
