#pragma once

#include <spdlog/details/null_mutex.h>
#include <spdlog/sinks/base_sink.h>

#include <atomic>

namespace ctxbroker::mcp {

class MCPServer;

/**
 * spdlog sink that mirrors log records to MCP clients as notifications/message.
 *
 * Only sessions whose client declared the logging capability receive records, and only
 * at or above the level chosen with logging/setLevel. Records emitted while a record is
 * being forwarded on the same thread are dropped. detach() before the server goes away.
 */
class ClientLogSink final : public spdlog::sinks::base_sink<spdlog::details::null_mutex> {
public:
    explicit ClientLogSink(MCPServer& server) : server_(&server) {}

    void detach() { server_.store(nullptr); }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

private:
    std::atomic<MCPServer*> server_;
};

} // namespace ctxbroker::mcp
