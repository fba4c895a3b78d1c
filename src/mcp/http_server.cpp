#include <ctxbroker/mcp/http_server.h>
#include <ctxbroker/version.hpp>

#include <boost/asio/post.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

using nlohmann::json;

namespace ctxbroker::mcp {

namespace {

constexpr int kSessionErrorCode = -32000;

std::string newSessionId() {
    boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

std::string pathOf(const http::request<http::string_body>& req) {
    std::string target(req.target());
    if (auto q = target.find('?'); q != std::string::npos)
        target.resize(q);
    return target;
}

bool isRpcPath(const std::string& path) {
    return path == "/" || path == "/mcp";
}

void applyCommonHeaders(http::response<http::string_body>& res) {
    res.set(http::field::server, "ctxbroker-mcp");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_expose_headers, kSessionHeader);
    res.keep_alive(false);
}

http::response<http::string_body> jsonResponse(const http::request<http::string_body>& req,
                                               http::status status, const json& body) {
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

http::response<http::string_body> badSession(const http::request<http::string_body>& req,
                                             const std::string& message) {
    return jsonResponse(req, http::status::bad_request,
                        MCPServer::createError(nullptr, kSessionErrorCode,
                                               "Bad Request: " + message));
}

} // namespace

HttpMcpServer::HttpMcpServer(boost::asio::io_context& ioc, MCPServer& mcp,
                             core::ProcessState& state, const Config& cfg)
    : ioc_(ioc), acceptor_(ioc), mcp_(mcp), state_(state), cfg_(cfg) {}

Result<std::uint16_t> HttpMcpServer::bind() {
    beast::error_code ec;
    const auto address = boost::asio::ip::make_address(cfg_.bindAddress, ec);
    if (ec) {
        return Error{ErrorCode::ConfigurationError,
                     "Invalid bind address " + cfg_.bindAddress + ": " + ec.message()};
    }

    const int attempts = std::max(cfg_.maxPortAttempts, 1);
    for (int i = 0; i < attempts; ++i) {
        const int candidate = static_cast<int>(cfg_.bindPort) + i;
        if (candidate > 65535)
            break;
        const tcp::endpoint ep{address, static_cast<std::uint16_t>(candidate)};

        acceptor_.open(ep.protocol(), ec);
        if (ec)
            return Error{ErrorCode::NetworkError, "acceptor open failed: " + ec.message()};
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        acceptor_.bind(ep, ec);
        if (ec == boost::asio::error::address_in_use) {
            spdlog::warn("Port {} is in use, trying {}", candidate, candidate + 1);
            beast::error_code closeEc;
            acceptor_.close(closeEc);
            continue;
        }
        if (ec) {
            beast::error_code closeEc;
            acceptor_.close(closeEc);
            return Error{ErrorCode::NetworkError,
                         "bind to port " + std::to_string(candidate) + " failed: " + ec.message()};
        }
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) {
            beast::error_code closeEc;
            acceptor_.close(closeEc);
            return Error{ErrorCode::NetworkError, "listen failed: " + ec.message()};
        }
        boundPort_ = static_cast<std::uint16_t>(candidate);
        spdlog::info("MCP HTTP listening on {}:{}", cfg_.bindAddress, boundPort_);
        return boundPort_;
    }
    return Error{ErrorCode::NetworkError,
                 "No available port in " + std::to_string(attempts) + " attempts starting at " +
                     std::to_string(cfg_.bindPort)};
}

void HttpMcpServer::run() {
    if (!acceptor_.is_open()) {
        spdlog::error("HttpMcpServer::run called before bind");
        return;
    }
    startAccept();
    ioc_.run();
    spdlog::info("MCP HTTP server stopped");
}

void HttpMcpServer::stop() {
    if (stopping_.exchange(true))
        return;
    boost::asio::post(ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
    });
    ioc_.stop();
}

void HttpMcpServer::startAccept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (stopping_.load())
            return;
        if (ec) {
            spdlog::warn("accept error: {}", ec.message());
        } else {
            std::thread(&HttpMcpServer::handleConnection, this, std::move(socket)).detach();
        }
        if (acceptor_.is_open())
            startAccept();
    });
}

void HttpMcpServer::handleConnection(tcp::socket socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;
    http::request<http::string_body> req;
    http::read(socket, buffer, req, ec);
    if (ec) {
        spdlog::debug("http read error: {}", ec.message());
        return;
    }
    auto res = handle(req);
    http::write(socket, res, ec);
    if (ec)
        spdlog::debug("http write error: {}", ec.message());
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

http::response<http::string_body>
HttpMcpServer::handle(const http::request<http::string_body>& req) {
    const auto path = pathOf(req);
    http::response<http::string_body> res;

    if (req.method() == http::verb::options) {
        res = http::response<http::string_body>{http::status::no_content, req.version()};
        res.set(http::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
        res.set(http::field::access_control_allow_headers,
                std::string("Content-Type, ") + kSessionHeader);
        res.set(http::field::access_control_max_age, "86400");
    } else if (req.method() == http::verb::get && path == "/") {
        res = statusPage(req);
    } else if (req.method() == http::verb::post && isRpcPath(path)) {
        res = handleJsonRpc(req);
    } else if (req.method() == http::verb::delete_ && isRpcPath(path)) {
        res = handleDelete(req);
    } else {
        res = http::response<http::string_body>{http::status::not_found, req.version()};
        res.set(http::field::content_type, "text/plain");
        res.body() = "not found";
        res.prepare_payload();
    }
    applyCommonHeaders(res);
    return res;
}

http::response<http::string_body>
HttpMcpServer::handleJsonRpc(const http::request<http::string_body>& req) {
    auto parsed = json_utils::parse_json(req.body());
    if (!parsed) {
        return jsonResponse(req, http::status::bad_request,
                            MCPServer::createError(nullptr, protocol::PARSE_ERROR,
                                                   parsed.error().message));
    }
    const json& message = parsed.value();

    std::string sessionId;
    if (auto h = req.find(kSessionHeader); h != req.end())
        sessionId = std::string(h->value());

    if (sessionId.empty()) {
        const bool isInitialize = message.is_object() && message.contains("method") &&
                                  message["method"] == "initialize";
        if (!isInitialize)
            return badSession(req, "No valid session ID provided");
        sessionId = mcp_.createSession(newSessionId());
        spdlog::info("HTTP session {} created", sessionId);
    } else if (!mcp_.hasSession(sessionId)) {
        return badSession(req, "Unknown session ID " + sessionId);
    }

    auto result = mcp_.handleRequest(message, sessionId);
    http::response<http::string_body> res;
    if (result) {
        res = jsonResponse(req, http::status::ok, result.value());
    } else if (result.error().code == ErrorCode::Success) {
        res = http::response<http::string_body>{http::status::accepted, req.version()};
        res.prepare_payload();
    } else {
        res = jsonResponse(req, http::status::internal_server_error,
                           MCPServer::createError(message.value("id", json()),
                                                  protocol::INTERNAL_ERROR,
                                                  result.error().message));
    }
    res.set(kSessionHeader, sessionId);
    return res;
}

http::response<http::string_body>
HttpMcpServer::handleDelete(const http::request<http::string_body>& req) {
    std::string sessionId;
    if (auto h = req.find(kSessionHeader); h != req.end())
        sessionId = std::string(h->value());
    if (sessionId.empty() || !mcp_.closeSession(sessionId))
        return badSession(req, "No valid session ID provided");
    http::response<http::string_body> res{http::status::ok, req.version()};
    res.prepare_payload();
    return res;
}

http::response<http::string_body>
HttpMcpServer::statusPage(const http::request<http::string_body>& req) {
    json status = {{"server", "ctxbroker-mcp"},
                   {"version", CTXBROKER_VERSION_STRING},
                   {"transport", "http"},
                   {"port", boundPort_},
                   {"activeSessions", mcp_.sessionCount()},
                   {"state", state_.get().toJson()}};
    return jsonResponse(req, http::status::ok, status);
}

} // namespace ctxbroker::mcp
