#include <ctxbroker/config/server_config.h>
#include <ctxbroker/session/workspace_resolver.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace ctxbroker::session {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kFileScheme = "file://";

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool isFileUri(std::string_view s) {
    if (s.size() < kFileScheme.size())
        return false;
    for (std::size_t i = 0; i < kFileScheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != kFileScheme[i])
            return false;
    }
    return true;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string lowerCopy(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isRootsApiClient(const std::string& clientName) {
    const auto n = lowerCopy(clientName);
    return n.find("visual studio code") != std::string::npos ||
           n.find("vscode") != std::string::npos || n.find("copilot") != std::string::npos;
}

void appendUnique(std::vector<fs::path>& out, fs::path p) {
    if (std::find(out.begin(), out.end(), p) == out.end())
        out.push_back(std::move(p));
}

std::vector<fs::path> normalizeAll(const std::vector<std::string>& entries, const fs::path& cwd,
                                   bool requireFileUri, const char* strategy) {
    std::vector<fs::path> out;
    for (const auto& raw : entries) {
        auto entry = trimView(raw);
        if (entry.empty())
            continue;
        if (requireFileUri && !isFileUri(entry)) {
            spdlog::warn("Workspace strategy {} ignores non file:// root '{}'", strategy, raw);
            continue;
        }
        auto normalized = normalizeWorkspaceEntry(entry, cwd);
        if (!normalized) {
            spdlog::warn("Ignoring workspace root '{}': {}", raw, normalized.error().message);
            continue;
        }
        appendUnique(out, normalized.value());
    }
    return out;
}

} // namespace

std::string percentDecode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

Result<fs::path> normalizeWorkspaceEntry(std::string_view raw, const fs::path& cwd) {
    auto entry = trimView(raw);
    if (entry.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty workspace entry"};
    }

    std::string local;
    if (isFileUri(entry)) {
        auto rest = entry.substr(kFileScheme.size());
        if (rest.rfind("localhost/", 0) == 0) {
            rest.remove_prefix(std::string_view("localhost").size());
        }
        if (rest.empty() || rest.front() != '/') {
            return Error{ErrorCode::InvalidArgument,
                         "file URI must name a local absolute path: " + std::string(entry)};
        }
        // Query and fragment are not part of the path
        if (auto cut = rest.find_first_of("?#"); cut != std::string_view::npos)
            rest = rest.substr(0, cut);
        local = percentDecode(rest);
    } else {
        local = std::string(entry);
    }

    fs::path p(local);
    if (p.is_relative())
        p = cwd / p;
    p = p.lexically_normal();
    if (!p.has_filename() && p != p.root_path())
        p = p.parent_path();
    return p;
}

std::vector<fs::path> RootsApiWorkspaceStrategy::clientRoots(const ClientIdentity& client,
                                                             const fs::path& cwd) const {
    return normalizeAll(client.roots, cwd, true, name());
}

std::vector<fs::path> GenericRootsWorkspaceStrategy::clientRoots(const ClientIdentity& client,
                                                                 const fs::path& cwd) const {
    return normalizeAll(client.roots, cwd, false, name());
}

std::unique_ptr<IWorkspaceStrategy> selectWorkspaceStrategy(const ClientIdentity& client) {
    std::unique_ptr<IWorkspaceStrategy> strategy;
    if (!client.supportsRoots) {
        strategy = std::make_unique<NoRootsWorkspaceStrategy>();
    } else if (isRootsApiClient(client.name)) {
        strategy = std::make_unique<RootsApiWorkspaceStrategy>();
    } else {
        strategy = std::make_unique<GenericRootsWorkspaceStrategy>();
    }
    spdlog::debug("Workspace strategy for client '{}': {}", client.name, strategy->name());
    return strategy;
}

std::vector<fs::path> resolveWorkspacePaths(const std::optional<std::string>& override,
                                            const IWorkspaceStrategy& strategy,
                                            const ClientIdentity& client, const fs::path& cwd) {
    std::vector<fs::path> out;

    if (override) {
        for (auto& p : normalizeAll(config::splitList(*override), cwd, false, "override"))
            appendUnique(out, std::move(p));
    }
    for (auto& p : strategy.clientRoots(client, cwd))
        appendUnique(out, std::move(p));

    if (out.empty()) {
        auto fallback = normalizeWorkspaceEntry(cwd.string(), cwd);
        out.push_back(fallback ? fallback.value() : cwd);
        spdlog::info("No workspace override or client roots; using current directory {}",
                     out.front().string());
    }
    return out;
}

} // namespace ctxbroker::session
