#include <catch2/catch_test_macros.hpp>

#include <ctxbroker/mcp/resource_store.h>
#include <ctxbroker/session/workspace_resolver.h>

#include <string>
#include <vector>

namespace fs = std::filesystem;

using ctxbroker::ErrorCode;
using ctxbroker::mcp::fileUriFromPath;
using ctxbroker::session::ClientIdentity;
using ctxbroker::session::GenericRootsWorkspaceStrategy;
using ctxbroker::session::NoRootsWorkspaceStrategy;
using ctxbroker::session::normalizeWorkspaceEntry;
using ctxbroker::session::percentDecode;
using ctxbroker::session::resolveWorkspacePaths;
using ctxbroker::session::RootsApiWorkspaceStrategy;
using ctxbroker::session::selectWorkspaceStrategy;

namespace {

const fs::path kCwd{"/home/dev/project"};

} // namespace

TEST_CASE("WorkspaceResolver - Override comes before client roots without duplicates",
          "[session][workspace][catch2]") {
    ClientIdentity client{"Claude Desktop", true, {"/c", "/a"}};
    GenericRootsWorkspaceStrategy strategy;

    auto paths = resolveWorkspacePaths(std::string("/a,/b"), strategy, client, kCwd);

    CHECK(paths == std::vector<fs::path>{"/a", "/b", "/c"});
}

TEST_CASE("WorkspaceResolver - Falls back to the current directory",
          "[session][workspace][catch2]") {
    ClientIdentity client;
    NoRootsWorkspaceStrategy strategy;

    auto paths = resolveWorkspacePaths(std::nullopt, strategy, client, kCwd);

    CHECK(paths == std::vector<fs::path>{kCwd});
}

TEST_CASE("WorkspaceResolver - file URIs are decoded into local paths",
          "[session][workspace][catch2]") {
    auto p = normalizeWorkspaceEntry("file:///Users/dev/My%20Project/", kCwd);
    REQUIRE(p);
    CHECK(p.value() == fs::path("/Users/dev/My Project"));

    auto local = normalizeWorkspaceEntry("file://localhost/srv/app?x=1#frag", kCwd);
    REQUIRE(local);
    CHECK(local.value() == fs::path("/srv/app"));

    auto remote = normalizeWorkspaceEntry("file://server/share", kCwd);
    REQUIRE_FALSE(remote);
    CHECK(remote.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("WorkspaceResolver - Encoded file URIs decode back to the same path",
          "[session][workspace][catch2]") {
    const fs::path original("/home/dev/My Project/100% done/r\xc3\xa9sum\xc3\xa9.json");
    const auto uri = fileUriFromPath(original);
    CHECK(uri == "file:///home/dev/My%20Project/100%25%20done/r%C3%A9sum%C3%A9.json");

    auto decoded = normalizeWorkspaceEntry(uri, kCwd);
    REQUIRE(decoded);
    CHECK(decoded.value() == original);
}

TEST_CASE("WorkspaceResolver - Relative entries become absolute and normal",
          "[session][workspace][catch2]") {
    auto p = normalizeWorkspaceEntry("  ../other/./src  ", kCwd);
    REQUIRE(p);
    CHECK(p.value() == fs::path("/home/dev/other/src"));

    CHECK_FALSE(normalizeWorkspaceEntry("   ", kCwd));
}

TEST_CASE("WorkspaceResolver - percentDecode leaves malformed escapes alone",
          "[session][workspace][catch2]") {
    CHECK(percentDecode("a%2Fb") == "a/b");
    CHECK(percentDecode("100%") == "100%");
    CHECK(percentDecode("%zz") == "%zz");
}

TEST_CASE("WorkspaceResolver - Roots API clients accept only file URIs",
          "[session][workspace][catch2]") {
    ClientIdentity client{"Visual Studio Code", true, {"file:///ws/one", "/ws/plain"}};
    auto strategy = selectWorkspaceStrategy(client);
    CHECK(std::string(strategy->name()) == "roots-api");

    auto roots = strategy->clientRoots(client, kCwd);
    CHECK(roots == std::vector<fs::path>{"/ws/one"});
}

TEST_CASE("WorkspaceResolver - Strategy selection by client family",
          "[session][workspace][catch2]") {
    CHECK(std::string(selectWorkspaceStrategy({"GitHub Copilot", true, {}})->name()) ==
          "roots-api");
    CHECK(std::string(selectWorkspaceStrategy({"cursor", true, {}})->name()) == "generic-roots");
    CHECK(std::string(selectWorkspaceStrategy({"vscode", false, {}})->name()) == "none");

    ClientIdentity generic{"zed", true, {"file:///z", "relative/dir"}};
    GenericRootsWorkspaceStrategy strategy;
    CHECK(strategy.clientRoots(generic, kCwd) ==
          std::vector<fs::path>{"/z", "/home/dev/project/relative/dir"});

    RootsApiWorkspaceStrategy rootsApi;
    CHECK(rootsApi.clientRoots(ClientIdentity{}, kCwd).empty());
}
