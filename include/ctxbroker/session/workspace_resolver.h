#pragma once

#include <ctxbroker/core/types.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ctxbroker::session {

// What a client told us about itself before the workspace was fixed.
struct ClientIdentity {
    std::string name;
    bool supportsRoots = false;
    std::vector<std::string> roots;
};

// file:// URI (percent-decoded) or plain path -> absolute, lexically normal path without a
// trailing separator. Lexical only; the path need not exist.
Result<std::filesystem::path> normalizeWorkspaceEntry(std::string_view raw,
                                                      const std::filesystem::path& cwd);

std::string percentDecode(std::string_view in);

/**
 * How one client family declares its workspace roots.
 */
class IWorkspaceStrategy {
public:
    virtual ~IWorkspaceStrategy() = default;
    virtual const char* name() const = 0;
    // Accepted client roots, normalized, in declaration order.
    virtual std::vector<std::filesystem::path>
    clientRoots(const ClientIdentity& client, const std::filesystem::path& cwd) const = 0;
};

// VS Code family: roots arrive through the roots API and are always file:// URIs.
class RootsApiWorkspaceStrategy final : public IWorkspaceStrategy {
public:
    const char* name() const override { return "roots-api"; }
    std::vector<std::filesystem::path> clientRoots(const ClientIdentity& client,
                                                   const std::filesystem::path& cwd) const override;
};

// Other clients with the roots capability: file:// URIs or plain paths.
class GenericRootsWorkspaceStrategy final : public IWorkspaceStrategy {
public:
    const char* name() const override { return "generic-roots"; }
    std::vector<std::filesystem::path> clientRoots(const ClientIdentity& client,
                                                   const std::filesystem::path& cwd) const override;
};

// Clients without roots contribute nothing.
class NoRootsWorkspaceStrategy final : public IWorkspaceStrategy {
public:
    const char* name() const override { return "none"; }
    std::vector<std::filesystem::path> clientRoots(const ClientIdentity&,
                                                   const std::filesystem::path&) const override {
        return {};
    }
};

std::unique_ptr<IWorkspaceStrategy> selectWorkspaceStrategy(const ClientIdentity& client);

/**
 * Merges the explicit override (comma separated), the strategy's client roots and finally
 * `cwd`, deduplicated in priority order. Never empty. Never touches the filesystem.
 */
std::vector<std::filesystem::path>
resolveWorkspacePaths(const std::optional<std::string>& override,
                      const IWorkspaceStrategy& strategy, const ClientIdentity& client,
                      const std::filesystem::path& cwd);

} // namespace ctxbroker::session
