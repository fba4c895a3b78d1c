#pragma once

#include <ctxbroker/core/types.h>
#include <ctxbroker/mcp/mcp_server.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace ctxbroker::mcp {

namespace http = boost::beast::http;
namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

// Session header of the streamable HTTP transport
inline constexpr const char* kSessionHeader = "Mcp-Session-Id";

/**
 * Minimal HTTP host: one JSON-RPC message per POST, sessions keyed by Mcp-Session-Id.
 *
 * bind() reserves the port (trying the next ones when busy), run() blocks serving
 * connections until stop().
 */
class HttpMcpServer {
public:
    struct Config {
        std::string bindAddress = "127.0.0.1";
        std::uint16_t bindPort = 3000;
        int maxPortAttempts = 10;
    };

    HttpMcpServer(boost::asio::io_context& ioc, MCPServer& mcp, core::ProcessState& state,
                  const Config& cfg);

    // Returns the port actually bound.
    Result<std::uint16_t> bind();
    void run();
    void stop();

    std::uint16_t port() const { return boundPort_; }

    // Exposed for tests: full request -> response without a socket.
    http::response<http::string_body> handle(const http::request<http::string_body>& req);

private:
    void startAccept();
    void handleConnection(tcp::socket socket);
    http::response<http::string_body> handleJsonRpc(const http::request<http::string_body>& req);
    http::response<http::string_body> handleDelete(const http::request<http::string_body>& req);
    http::response<http::string_body> statusPage(const http::request<http::string_body>& req);

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    MCPServer& mcp_;
    core::ProcessState& state_;
    Config cfg_{};
    std::uint16_t boundPort_{0};
    std::atomic<bool> stopping_{false};
};

} // namespace ctxbroker::mcp
