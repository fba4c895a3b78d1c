#include <catch2/catch_test_macros.hpp>

#include <ctxbroker/config/server_config.h>

#include "../../common/test_helpers_catch2.h"

#include <optional>
#include <string>
#include <vector>

using ctxbroker::ErrorCode;
using ctxbroker::config::CommandLineOptions;
using ctxbroker::config::parseCommandLine;
using ctxbroker::config::parseMcpLogLevel;
using ctxbroker::config::processEnvironment;
using ctxbroker::config::resolveServerConfig;
using ctxbroker::config::splitList;
using ctxbroker::config::TransportKind;
using ctxbroker::test::FakeEnvironment;
using ctxbroker::test::ScopedEnvVar;

namespace {

auto parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "ctxbroker-mcp");
    std::vector<const char*> argv;
    for (const auto& a : args)
        argv.push_back(a.c_str());
    return parseCommandLine(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("ServerConfig - Defaults with empty command line and environment",
          "[config][resolve][catch2]") {
    auto cfg = resolveServerConfig(CommandLineOptions{}, FakeEnvironment{}.lookup());
    REQUIRE(cfg);
    CHECK(cfg.value().transport == TransportKind::Stdio);
    CHECK(cfg.value().logLevel == "info");
    CHECK(cfg.value().httpPort == 3000);
    CHECK_FALSE(cfg.value().workspaceOverride.has_value());
    CHECK(cfg.value().handshake.loginUrl.empty());
    CHECK_FALSE(cfg.value().handshake.bypass);
    CHECK(cfg.value().handshake.strictSsl);
    CHECK(cfg.value().handshake.timeout.count() == 8000);
    CHECK(cfg.value().tempDir.retentionDays == 7);
    CHECK(cfg.value().maxResources == 30);
}

TEST_CASE("ServerConfig - Command line wins over environment", "[config][resolve][catch2]") {
    auto cli = parseArgs({"--transport", "http", "--port", "4100", "--log-level", "debug",
                          "--workspace", "/cli/ws", "--password", "cli-secret"});
    REQUIRE(cli);

    FakeEnvironment env;
    env.set("MCP_TRANSPORT", "stdio")
        .set("MCP_HTTP_PORT", "5000")
        .set("LOG_LEVEL", "error")
        .set("WORKSPACE_FOLDER_PATHS", "/env/ws")
        .set("PASSWORD", "env-secret");

    auto cfg = resolveServerConfig(cli.value(), env.lookup());
    REQUIRE(cfg);
    CHECK(cfg.value().transport == TransportKind::Http);
    CHECK(cfg.value().httpPort == 4100);
    CHECK(cfg.value().logLevel == "debug");
    CHECK(cfg.value().workspaceOverride == "/cli/ws");
    CHECK(cfg.value().handshake.password == "cli-secret");
}

TEST_CASE("ServerConfig - Environment fills what the command line leaves unset",
          "[config][resolve][catch2]") {
    FakeEnvironment env;
    env.set("MCP_TRANSPORT", "HTTP")
        .set("PASSWORD", "env-secret")
        .set("CTXBROKER_LOGIN_URL", " https://login.example.com/check ")
        .set("CTXBROKER_BYPASS_HANDSHAKE", "1")
        .set("CTXBROKER_HANDSHAKE_TIMEOUT_MS", "250")
        .set("CTXBROKER_STRICT_SSL", "0")
        .set("CTXBROKER_TMP_RETENTION_DAYS", "2")
        .set("CTXBROKER_MAX_RESOURCES", "5")
        .set("MCP_CLIENT_NAME", "Visual Studio Code")
        .set("MCP_CLIENT_ROOTS", "file:///a, file:///b,,");

    auto cfg = resolveServerConfig(CommandLineOptions{}, env.lookup());
    REQUIRE(cfg);
    CHECK(cfg.value().transport == TransportKind::Http);
    CHECK(cfg.value().handshake.password == "env-secret");
    CHECK(cfg.value().handshake.loginUrl == "https://login.example.com/check");
    CHECK(cfg.value().handshake.bypass);
    CHECK(cfg.value().handshake.timeout.count() == 250);
    CHECK_FALSE(cfg.value().handshake.strictSsl);
    CHECK(cfg.value().tempDir.retentionDays == 2);
    CHECK(cfg.value().maxResources == 5);
    CHECK(cfg.value().client.name == "Visual Studio Code");
    CHECK(cfg.value().client.roots == std::vector<std::string>{"file:///a", "file:///b"});
}

TEST_CASE("ServerConfig - Empty environment values count as unset", "[config][resolve][catch2]") {
    FakeEnvironment env;
    env.set("MCP_HTTP_PORT", "").set("MCP_TRANSPORT", "");
    auto cfg = resolveServerConfig(CommandLineOptions{}, env.lookup());
    REQUIRE(cfg);
    CHECK(cfg.value().httpPort == 3000);
    CHECK(cfg.value().transport == TransportKind::Stdio);
}

TEST_CASE("ServerConfig - Malformed values name their source", "[config][resolve][catch2]") {
    SECTION("transport") {
        FakeEnvironment env;
        env.set("MCP_TRANSPORT", "pigeon");
        auto cfg = resolveServerConfig(CommandLineOptions{}, env.lookup());
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::ConfigurationError);
        CHECK(cfg.error().message.find("MCP_TRANSPORT") != std::string::npos);
    }
    SECTION("port out of range") {
        auto cli = parseArgs({"--port", "70000"});
        REQUIRE(cli);
        auto cfg = resolveServerConfig(cli.value(), FakeEnvironment{}.lookup());
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().message == "Port 70000 from --port is outside 1..65535");
    }
    SECTION("non-numeric timeout") {
        FakeEnvironment env;
        env.set("CTXBROKER_HANDSHAKE_TIMEOUT_MS", "soon");
        auto cfg = resolveServerConfig(CommandLineOptions{}, env.lookup());
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().message ==
              "Invalid numeric value 'soon' for CTXBROKER_HANDSHAKE_TIMEOUT_MS");
    }
    SECTION("unknown log level") {
        FakeEnvironment env;
        env.set("LOG_LEVEL", "chatty");
        auto cfg = resolveServerConfig(CommandLineOptions{}, env.lookup());
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::ConfigurationError);
        CHECK(cfg.error().message.find("LOG_LEVEL") != std::string::npos);
    }
    SECTION("retention window beyond the supported range") {
        FakeEnvironment env;
        env.set("CTXBROKER_TMP_RETENTION_DAYS", "200000");
        auto cfg = resolveServerConfig(CommandLineOptions{}, env.lookup());
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::ConfigurationError);
        CHECK(cfg.error().message ==
              "Retention days 200000 from CTXBROKER_TMP_RETENTION_DAYS is outside 0..36500");
    }
    SECTION("retention window larger than int") {
        FakeEnvironment env;
        env.set("CTXBROKER_TMP_RETENTION_DAYS", "4294967297");
        auto cfg = resolveServerConfig(CommandLineOptions{}, env.lookup());
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::ConfigurationError);
    }
    SECTION("non-boolean bypass") {
        FakeEnvironment env;
        env.set("CTXBROKER_BYPASS_HANDSHAKE", "maybe");
        auto cfg = resolveServerConfig(CommandLineOptions{}, env.lookup());
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::ConfigurationError);
    }
}

TEST_CASE("ServerConfig - Process environment lookup reads the real environment",
          "[config][env][catch2]") {
    ScopedEnvVar set("CTXBROKER_TEST_LOOKUP", std::string("from-process"));
    ScopedEnvVar unset("CTXBROKER_TEST_ABSENT", std::nullopt);

    const auto env = processEnvironment();
    CHECK(env("CTXBROKER_TEST_LOOKUP") == "from-process");
    CHECK_FALSE(env("CTXBROKER_TEST_ABSENT").has_value());
}

TEST_CASE("ServerConfig - Unknown flags are fatal", "[config][cli][catch2]") {
    auto cli = parseArgs({"--frobnicate"});
    REQUIRE_FALSE(cli);
    CHECK(cli.error().code == ErrorCode::ConfigurationError);
}

TEST_CASE("ServerConfig - Help and version do not fail", "[config][cli][catch2]") {
    auto help = parseArgs({"--help"});
    REQUIRE(help);
    CHECK(help.value().showHelp);
    CHECK(help.value().helpText.find("--transport") != std::string::npos);

    auto version = parseArgs({"--version"});
    REQUIRE(version);
    CHECK(version.value().showVersion);
}

TEST_CASE("ServerConfig - MCP log level vocabulary", "[config][loglevel][catch2]") {
    CHECK(parseMcpLogLevel("notice").value() == spdlog::level::info);
    CHECK(parseMcpLogLevel("warning").value() == spdlog::level::warn);
    CHECK(parseMcpLogLevel("WARN").value() == spdlog::level::warn);
    CHECK(parseMcpLogLevel("emergency").value() == spdlog::level::critical);
    auto bad = parseMcpLogLevel("loud");
    REQUIRE_FALSE(bad);
    CHECK(bad.error().message == "Unknown log level: loud");
}

TEST_CASE("ServerConfig - splitList trims and skips blanks", "[config][catch2]") {
    CHECK(splitList(" /a , /b ,, ") == std::vector<std::string>{"/a", "/b"});
    CHECK(splitList("").empty());
}
