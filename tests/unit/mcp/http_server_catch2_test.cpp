#include <catch2/catch_test_macros.hpp>

#include <ctxbroker/core/process_state.h>
#include <ctxbroker/mcp/http_server.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <string>

namespace http = boost::beast::http;

using ctxbroker::ErrorCode;
using ctxbroker::core::ProcessState;
using ctxbroker::mcp::HandlerRegistry;
using ctxbroker::mcp::HttpMcpServer;
using ctxbroker::mcp::json;
using ctxbroker::mcp::kSessionHeader;
using ctxbroker::mcp::MCPServer;
using ctxbroker::mcp::ResourceStore;

namespace {

struct HttpFixture {
    http::request<http::string_body> post(const json& body, const std::string& session = {}) {
        http::request<http::string_body> req{http::verb::post, "/mcp", 11};
        req.set(http::field::content_type, "application/json");
        if (!session.empty())
            req.set(kSessionHeader, session);
        req.body() = body.dump();
        req.prepare_payload();
        return req;
    }

    static json rpc(int id, const std::string& method, json params = json::object()) {
        return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    }

    boost::asio::io_context ioc;
    ProcessState state;
    HandlerRegistry registry;
    ResourceStore resources;
    MCPServer mcp{state, registry, resources};
    HttpMcpServer server{ioc, mcp, state, HttpMcpServer::Config{}};
};

} // namespace

TEST_CASE("HttpMcpServer - Initialize without session creates one",
          "[mcp][http][catch2]") {
    HttpFixture f;

    auto res = f.server.handle(f.post(HttpFixture::rpc(1, "initialize")));
    REQUIRE(res.result() == http::status::ok);
    const std::string session(res[kSessionHeader]);
    REQUIRE_FALSE(session.empty());
    CHECK(json::parse(res.body())["result"].contains("protocolVersion"));
    CHECK(f.mcp.hasSession(session));

    auto ping = f.server.handle(f.post(HttpFixture::rpc(2, "ping"), session));
    CHECK(ping.result() == http::status::ok);
    CHECK(json::parse(ping.body())["id"] == 2);

    auto note = f.server.handle(f.post(
        json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}, session));
    CHECK(note.result() == http::status::accepted);
}

TEST_CASE("HttpMcpServer - Requests without a valid session are rejected",
          "[mcp][http][catch2]") {
    HttpFixture f;

    auto noSession = f.server.handle(f.post(HttpFixture::rpc(1, "tools/list")));
    CHECK(noSession.result() == http::status::bad_request);
    CHECK(json::parse(noSession.body())["error"]["code"] == -32000);

    auto unknown = f.server.handle(f.post(HttpFixture::rpc(1, "tools/list"), "not-a-session"));
    CHECK(unknown.result() == http::status::bad_request);
}

TEST_CASE("HttpMcpServer - Malformed body is a parse error", "[mcp][http][catch2]") {
    HttpFixture f;
    http::request<http::string_body> req{http::verb::post, "/", 11};
    req.body() = "{not json";
    req.prepare_payload();

    auto res = f.server.handle(req);
    CHECK(res.result() == http::status::bad_request);
    CHECK(json::parse(res.body())["error"]["code"] == -32700);
}

TEST_CASE("HttpMcpServer - DELETE closes the session", "[mcp][http][catch2]") {
    HttpFixture f;
    auto init = f.server.handle(f.post(HttpFixture::rpc(1, "initialize")));
    const std::string session(init[kSessionHeader]);

    http::request<http::string_body> del{http::verb::delete_, "/mcp", 11};
    del.set(kSessionHeader, session);
    auto res = f.server.handle(del);
    CHECK(res.result() == http::status::ok);
    CHECK_FALSE(f.mcp.hasSession(session));

    CHECK(f.server.handle(del).result() == http::status::bad_request);
}

TEST_CASE("HttpMcpServer - Status page, CORS preflight and unknown paths",
          "[mcp][http][catch2]") {
    HttpFixture f;

    http::request<http::string_body> get{http::verb::get, "/", 11};
    auto status = f.server.handle(get);
    REQUIRE(status.result() == http::status::ok);
    auto body = json::parse(status.body());
    CHECK(body["server"] == "ctxbroker-mcp");
    CHECK(body["transport"] == "http");
    CHECK(body["activeSessions"] == 0);
    CHECK(body["state"]["initializationPhase"] == "Created");

    http::request<http::string_body> options{http::verb::options, "/mcp", 11};
    auto preflight = f.server.handle(options);
    CHECK(preflight.result() == http::status::no_content);
    CHECK(preflight[http::field::access_control_allow_origin] == "*");

    http::request<http::string_body> other{http::verb::get, "/elsewhere", 11};
    CHECK(f.server.handle(other).result() == http::status::not_found);
}

TEST_CASE("HttpMcpServer - Busy port falls back to the next one",
          "[mcp][http][bind][catch2]") {
    using boost::asio::ip::tcp;
    boost::asio::io_context ioc;
    ProcessState state;
    HandlerRegistry registry;
    ResourceStore resources;
    MCPServer mcp{state, registry, resources};

    // An ephemeral listener keeps the requested port busy for the whole test.
    tcp::acceptor holder(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    const std::uint16_t busy = holder.local_endpoint().port();

    SECTION("next free port is used") {
        HttpMcpServer::Config cfg;
        cfg.bindPort = busy;
        cfg.maxPortAttempts = 10;
        HttpMcpServer server{ioc, mcp, state, cfg};

        auto port = server.bind();
        REQUIRE(port);
        CHECK(port.value() != busy);
        CHECK(port.value() > busy);
        CHECK(port.value() < busy + 10);
        CHECK(server.port() == port.value());
    }
    SECTION("no attempts left") {
        HttpMcpServer::Config cfg;
        cfg.bindPort = busy;
        cfg.maxPortAttempts = 1;
        HttpMcpServer server{ioc, mcp, state, cfg};

        auto port = server.bind();
        REQUIRE_FALSE(port);
        CHECK(port.error().code == ErrorCode::NetworkError);
        CHECK(port.error().message ==
              "No available port in 1 attempts starting at " + std::to_string(busy));
    }
}
