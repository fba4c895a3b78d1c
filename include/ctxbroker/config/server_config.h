#pragma once

#include <ctxbroker/core/temp_file_manager.h>
#include <ctxbroker/core/types.h>

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ctxbroker::config {

enum class TransportKind { Stdio, Http };

const char* transportToString(TransportKind kind);

// Raw command-line values. Unset options stay empty so the environment can fill them in.
struct CommandLineOptions {
    std::optional<std::string> transport;
    std::optional<std::string> logLevel;
    std::optional<std::string> port;
    std::optional<std::string> workspace;
    std::optional<std::string> password;
    std::string logFile;
    bool bypassHandshake = false;

    bool showHelp = false;
    bool showVersion = false;
    std::string helpText;
};

struct HandshakeSettings {
    std::string loginUrl;
    std::string password;
    bool bypass = false;
    std::chrono::milliseconds timeout{8000};
    bool strictSsl = true;
};

struct ClientIdentitySettings {
    std::string name;
    std::vector<std::string> roots;
};

struct ServerConfig {
    TransportKind transport = TransportKind::Stdio;
    std::string logLevel = "info";
    std::uint16_t httpPort = 3000;
    std::optional<std::string> workspaceOverride;
    std::string logFile;
    HandshakeSettings handshake;
    core::TempDirSettings tempDir;
    std::size_t maxResources = 30;
    ClientIdentitySettings client;
};

// Returns the value of an environment variable, or nullopt when it is unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup processEnvironment();

// Unknown flags and invalid values are ConfigurationError. --help/--version set the
// corresponding flags and fill helpText instead of failing.
Result<CommandLineOptions> parseCommandLine(int argc, const char* const* argv);

// CLI over environment over defaults. Pure apart from the injected lookup.
Result<ServerConfig> resolveServerConfig(const CommandLineOptions& cli, const EnvLookup& env);

// MCP level vocabulary (trace, debug, info, notice, warning|warn, error, critical, alert,
// emergency). Unknown names are ConfigurationError.
Result<spdlog::level::level_enum> parseMcpLogLevel(const std::string& level);

std::vector<std::string> splitList(const std::string& value, char separator = ',');

} // namespace ctxbroker::config
