#include <ctxbroker/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <iostream>
#include <string>

#include <poll.h>
#include <unistd.h>

namespace ctxbroker::mcp {

namespace {

bool isWs(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Strips CR, surrounding whitespace, a UTF-8 BOM and record separators before the JSON.
void sanitizeLine(std::string& line) {
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
        static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
    }
    auto first = std::find_if(line.begin(), line.end(), [](unsigned char c) {
        return !(isWs(c) || c == 0x1e || c < 0x20);
    });
    line.erase(line.begin(), first);
    while (!line.empty() && isWs(static_cast<unsigned char>(line.back())))
        line.pop_back();
}

} // namespace

StdioTransport::StdioTransport() : in_(std::cin), out_(std::cout), pollStdin_(true) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);
    std::cout << std::unitbuf;
}

StdioTransport::StdioTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

void StdioTransport::send(const json& message) {
    if (state_.load() != TransportState::Connected)
        return;
    std::string payload;
    try {
        payload = message.dump();
    } catch (const json::exception& e) {
        spdlog::error("StdioTransport::send failed to serialize message: {}", e.what());
        return;
    }
    std::lock_guard<std::mutex> lock(outMutex_);
    // MCP stdio: newline-delimited JSON
    out_ << payload << "\n";
    out_.flush();
}

bool StdioTransport::isInputAvailable(int timeoutMs) const {
    if (in_.rdbuf()->in_avail() > 0)
        return true;
    struct pollfd fds;
    fds.fd = STDIN_FILENO;
    fds.events = POLLIN | POLLHUP;
    fds.revents = 0;
    int result = ::poll(&fds, 1, timeoutMs);
    if (result < 0)
        return false;
    // POLLHUP counts as readable so getline observes EOF
    return result > 0 && ((fds.revents & POLLIN) || (fds.revents & POLLHUP));
}

MessageResult StdioTransport::receive() {
    while (state_.load() == TransportState::Connected) {
        if (pollStdin_ && !isInputAvailable(recvTimeoutMs_)) {
            return Error{ErrorCode::Timeout, "No input available"};
        }

        std::string line;
        if (!std::getline(in_, line)) {
            if (in_.eof()) {
                spdlog::info("StdioTransport: EOF on input; treating as client disconnect");
                state_.store(TransportState::Disconnected);
                return Error{ErrorCode::NetworkError, "EOF on stdin"};
            }
            // Transient stream failure; clear and retry.
            in_.clear();
            continue;
        }

        sanitizeLine(line);
        if (line.empty())
            continue;

        spdlog::trace("StdioTransport: read line: '{}'", line);
        if (line.front() != '{' && line.front() != '[') {
            spdlog::error("StdioTransport: invalid message format (expected NDJSON): {}", line);
            return Error{ErrorCode::InvalidData, "Invalid message format - expected NDJSON"};
        }
        return json_utils::parse_json(line);
    }
    return Error{ErrorCode::NetworkError, "Transport closed during receive"};
}

} // namespace ctxbroker::mcp
