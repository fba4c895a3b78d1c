#pragma once

#include <ctxbroker/core/types.h>
#include <ctxbroker/mcp/capability_negotiator.h>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <concepts>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ctxbroker::mcp {

using json = nlohmann::json;

enum class HandlerCategory { Tool, Prompt, Resource };

const char* categoryToString(HandlerCategory category);

// Per-request context handed to every handler invocation.
struct CallContext {
    ClientCapabilities client;
    std::string sessionId;
    json meta = json::object();
};

using HandlerFn = std::function<boost::asio::awaitable<json>(json arguments, CallContext ctx)>;

struct HandlerDescriptor {
    std::string name; // resource URI for resources
    HandlerCategory category = HandlerCategory::Tool;
    json inputSchema;
    std::string description;
    std::string title;
    std::string mimeType; // resources only
    HandlerFn implementation;

    // Entry for tools/list, prompts/list or resources/list.
    json toListEntry() const;
};

// {"content":[{"type":"text","text":...}], "isError": ...}
json makeTextResult(std::string text, bool isError = false);

// Schema rules: object with type "object"; properties (if any) an object; required (if any)
// an array of strings.
Result<void> validateInputSchema(const json& schema);

// C++20 concepts for typed tool registration
template <typename T>
concept ToolRequest = requires {
    typename T::RequestType;
    requires std::same_as<T, typename T::RequestType>;
};

template <typename T>
concept ToolResponse = requires {
    typename T::ResponseType;
    requires std::same_as<T, typename T::ResponseType>;
};

template <typename T>
concept ToolSerializable = requires(const T& t, const json& j) {
    { T::fromJson(j) } -> std::same_as<T>;
    { t.toJson() } -> std::same_as<json>;
};

// Responses that want resources shown to the client expose them here; the wrapper routes
// them through the capability negotiator.
template <typename T>
concept HasAttachments = requires(const T& t) {
    { t.attachments() } -> std::convertible_to<std::vector<ResourceRef>>;
};

// Adapts a typed coroutine handler to the untyped HandlerFn shape.
template <ToolRequest RequestType, ToolResponse ResponseType>
requires ToolSerializable<RequestType> && ToolSerializable<ResponseType>
class AsyncToolWrapper {
public:
    using AsyncHandlerFn = std::function<boost::asio::awaitable<Result<ResponseType>>(
        const RequestType&, const CallContext&)>;

    explicit AsyncToolWrapper(AsyncHandlerFn handler) : handler_(std::move(handler)) {}

    boost::asio::awaitable<json> operator()(json args, CallContext ctx) const {
        std::optional<RequestType> req;
        std::string parseError;
        try {
            req = RequestType::fromJson(args);
        } catch (const json::exception& e) {
            parseError = e.what();
        }
        if (!req) {
            co_return makeTextResult("JSON error: " + parseError, true);
        }

        auto result = co_await handler_(*req, ctx);
        if (!result) {
            co_return makeTextResult("Error: " + result.error().message, true);
        }

        const auto& response = result.value();
        json structured = response.toJson();
        json out = makeTextResult(structured.dump());
        out["structuredContent"] = std::move(structured);
        if constexpr (HasAttachments<ResponseType>) {
            for (const auto& ref : response.attachments()) {
                attachResource(out["content"], ref, ctx.client);
            }
        }
        co_return out;
    }

private:
    AsyncHandlerFn handler_;
};

/**
 * Every invokable capability the server exposes, keyed by (category, name).
 *
 * Populated during the HandlersRegistered phase and sealed on Ready; after that it is
 * read-only and shared by all sessions without locking. Listing preserves registration
 * order.
 */
class HandlerRegistry {
public:
    using DescriptorPtr = std::shared_ptr<const HandlerDescriptor>;

    HandlerRegistry() { entries_.reserve(16); }

    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;

    Result<void> registerHandler(HandlerDescriptor descriptor);

    template <ToolRequest RequestType, ToolResponse ResponseType>
    requires ToolSerializable<RequestType> && ToolSerializable<ResponseType>
    Result<void> registerTool(
        std::string name,
        typename AsyncToolWrapper<RequestType, ResponseType>::AsyncHandlerFn handler,
        json schema, std::string description, std::string title = {}) {
        auto wrapper = AsyncToolWrapper<RequestType, ResponseType>(std::move(handler));
        HandlerDescriptor d;
        d.name = std::move(name);
        d.category = HandlerCategory::Tool;
        d.inputSchema = std::move(schema);
        d.description = std::move(description);
        d.title = std::move(title);
        d.implementation = [wrapper = std::move(wrapper)](
                               json args, CallContext ctx) -> boost::asio::awaitable<json> {
            return wrapper(std::move(args), std::move(ctx));
        };
        return registerHandler(std::move(d));
    }

    Result<DescriptorPtr> lookup(HandlerCategory category, std::string_view name) const;

    // Lazy, restartable view of descriptors in registration order.
    auto listAll(HandlerCategory category) const {
        return entries_ |
               std::views::filter([category](const DescriptorPtr& d) {
                   return d->category == category;
               }) |
               std::views::transform(
                   [](const DescriptorPtr& d) -> const HandlerDescriptor& { return *d; });
    }

    json listJson(HandlerCategory category) const;

    // NotFound when absent. Tool exceptions become an isError tool result; prompt and
    // resource exceptions become InternalError.
    boost::asio::awaitable<Result<json>> invoke(HandlerCategory category, std::string name,
                                                json arguments, CallContext ctx) const;

    void seal();
    bool sealed() const { return sealed_; }

    std::size_t size() const { return entries_.size(); }
    std::size_t size(HandlerCategory category) const;
    bool empty() const { return entries_.empty(); }

private:
    using Key = std::pair<HandlerCategory, std::string>;

    std::vector<DescriptorPtr> entries_;
    std::map<Key, std::size_t> index_;
    bool sealed_{false};
};

} // namespace ctxbroker::mcp
