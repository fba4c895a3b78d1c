#include <ctxbroker/config/server_config.h>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace ctxbroker::config {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

struct Sourced {
    std::string value;
    std::string source;
};

// First non-empty of CLI value and environment variable, remembering where it came from.
std::optional<Sourced> pick(const std::optional<std::string>& cliValue, const char* flag,
                            const EnvLookup& env, const char* var) {
    if (cliValue && !cliValue->empty())
        return Sourced{*cliValue, flag};
    if (env) {
        if (auto v = env(var); v && !v->empty())
            return Sourced{*v, var};
    }
    return std::nullopt;
}

std::optional<Sourced> fromEnv(const EnvLookup& env, const char* var) {
    return pick(std::nullopt, "", env, var);
}

Result<long long> parseInteger(const Sourced& s) {
    const std::string text = trim(s.value);
    long long out = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return Error{ErrorCode::ConfigurationError,
                     "Invalid numeric value '" + s.value + "' for " + s.source};
    }
    return out;
}

Result<bool> parseBool(const Sourced& s) {
    const auto v = toLower(trim(s.value));
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return Error{ErrorCode::ConfigurationError,
                 "Invalid boolean value '" + s.value + "' for " + s.source};
}

} // namespace

const char* transportToString(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http: return "http";
    }
    return "stdio";
}

EnvLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        if (const char* v = std::getenv(name.c_str()))
            return std::string(v);
        return std::nullopt;
    };
}

Result<spdlog::level::level_enum> parseMcpLogLevel(const std::string& level) {
    const auto l = toLower(trim(level));
    if (l == "trace")
        return spdlog::level::trace;
    if (l == "debug")
        return spdlog::level::debug;
    if (l == "info" || l == "notice")
        return spdlog::level::info;
    if (l == "warning" || l == "warn")
        return spdlog::level::warn;
    if (l == "error")
        return spdlog::level::err;
    if (l == "critical" || l == "alert" || l == "emergency")
        return spdlog::level::critical;
    return Error{ErrorCode::ConfigurationError, "Unknown log level: " + level};
}

std::vector<std::string> splitList(const std::string& value, char separator) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= value.size()) {
        auto end = value.find(separator, start);
        if (end == std::string::npos)
            end = value.size();
        auto item = trim(value.substr(start, end - start));
        if (!item.empty())
            out.push_back(std::move(item));
        start = end + 1;
    }
    return out;
}

Result<CommandLineOptions> parseCommandLine(int argc, const char* const* argv) {
    CLI::App app{"ctxbroker MCP server - session and protocol broker for domain tool handlers"};
    CommandLineOptions opts;

    std::string transport, logLevel, port, workspace, password;
    app.add_option("-t,--transport", transport, "Transport: stdio or http");
    app.add_option("-l,--log-level", logLevel,
                   "Log level (trace, debug, info, notice, warning, error, critical)");
    app.add_option("-p,--port", port, "HTTP port (http transport only)");
    app.add_option("-w,--workspace", workspace, "Comma-separated workspace paths or file:// URIs");
    app.add_option("--password", password, "Handshake secret (overrides $PASSWORD)");
    app.add_option("--log-file", opts.logFile, "Rotating log file path (optional)");
    app.add_flag("--bypass-handshake", opts.bypassHandshake,
                 "Skip the remote access handshake (logged as a warning)");
    app.add_flag("-v,--version", opts.showVersion, "Print version and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp&) {
        opts.showHelp = true;
        opts.helpText = app.help();
        return opts;
    } catch (const CLI::ParseError& e) {
        return Error{ErrorCode::ConfigurationError, std::string("Command line: ") + e.what()};
    }

    if (app.count("--transport"))
        opts.transport = transport;
    if (app.count("--log-level"))
        opts.logLevel = logLevel;
    if (app.count("--port"))
        opts.port = port;
    if (app.count("--workspace"))
        opts.workspace = workspace;
    if (app.count("--password"))
        opts.password = password;
    return opts;
}

Result<ServerConfig> resolveServerConfig(const CommandLineOptions& cli, const EnvLookup& env) {
    ServerConfig cfg;

    if (auto t = pick(cli.transport, "--transport", env, "MCP_TRANSPORT")) {
        const auto v = toLower(trim(t->value));
        if (v == "stdio") {
            cfg.transport = TransportKind::Stdio;
        } else if (v == "http") {
            cfg.transport = TransportKind::Http;
        } else {
            return Error{ErrorCode::ConfigurationError,
                         "Invalid transport '" + t->value + "' for " + t->source +
                             " (expected stdio or http)"};
        }
    }

    if (auto l = pick(cli.logLevel, "--log-level", env, "LOG_LEVEL")) {
        if (auto parsed = parseMcpLogLevel(l->value); !parsed) {
            return Error{ErrorCode::ConfigurationError,
                         parsed.error().message + " (from " + l->source + ")"};
        }
        cfg.logLevel = toLower(trim(l->value));
    }

    if (auto p = pick(cli.port, "--port", env, "MCP_HTTP_PORT")) {
        auto n = parseInteger(*p);
        if (!n)
            return n.error();
        if (n.value() < 1 || n.value() > 65535) {
            return Error{ErrorCode::ConfigurationError,
                         "Port " + p->value + " from " + p->source + " is outside 1..65535"};
        }
        cfg.httpPort = static_cast<std::uint16_t>(n.value());
    }

    if (auto w = pick(cli.workspace, "--workspace", env, "WORKSPACE_FOLDER_PATHS")) {
        cfg.workspaceOverride = w->value;
    }

    cfg.logFile = cli.logFile;

    if (auto s = pick(cli.password, "--password", env, "PASSWORD")) {
        cfg.handshake.password = s->value;
    }
    if (auto u = fromEnv(env, "CTXBROKER_LOGIN_URL")) {
        cfg.handshake.loginUrl = trim(u->value);
    }
    cfg.handshake.bypass = cli.bypassHandshake;
    if (!cfg.handshake.bypass) {
        if (auto b = fromEnv(env, "CTXBROKER_BYPASS_HANDSHAKE")) {
            auto flag = parseBool(*b);
            if (!flag)
                return flag.error();
            cfg.handshake.bypass = flag.value();
        }
    }
    if (auto t = fromEnv(env, "CTXBROKER_HANDSHAKE_TIMEOUT_MS")) {
        auto n = parseInteger(*t);
        if (!n)
            return n.error();
        if (n.value() <= 0) {
            return Error{ErrorCode::ConfigurationError,
                         "Handshake timeout must be positive (" + t->source + ")"};
        }
        cfg.handshake.timeout = std::chrono::milliseconds(n.value());
    }
    if (auto s = fromEnv(env, "CTXBROKER_STRICT_SSL")) {
        auto flag = parseBool(*s);
        if (!flag)
            return flag.error();
        cfg.handshake.strictSsl = flag.value();
    }

    if (auto r = fromEnv(env, "CTXBROKER_TMP_RETENTION_DAYS")) {
        auto n = parseInteger(*r);
        if (!n)
            return n.error();
        if (n.value() < 0 || n.value() > core::kMaxRetentionDays) {
            return Error{ErrorCode::ConfigurationError,
                         "Retention days " + r->value + " from " + r->source + " is outside 0.." +
                             std::to_string(core::kMaxRetentionDays)};
        }
        cfg.tempDir.retentionDays = static_cast<int>(n.value());
    }
    if (auto m = fromEnv(env, "CTXBROKER_MAX_RESOURCES")) {
        auto n = parseInteger(*m);
        if (!n)
            return n.error();
        if (n.value() < 1) {
            return Error{ErrorCode::ConfigurationError,
                         "Max resources must be at least 1 (" + m->source + ")"};
        }
        cfg.maxResources = static_cast<std::size_t>(n.value());
    }

    if (auto c = fromEnv(env, "MCP_CLIENT_NAME"))
        cfg.client.name = trim(c->value);
    if (auto r = fromEnv(env, "MCP_CLIENT_ROOTS"))
        cfg.client.roots = splitList(r->value);

    spdlog::debug("Resolved configuration: transport={} logLevel={} port={} workspace={}",
                  transportToString(cfg.transport), cfg.logLevel, cfg.httpPort,
                  cfg.workspaceOverride.value_or("<none>"));
    return cfg;
}

} // namespace ctxbroker::config
