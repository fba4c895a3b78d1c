#pragma once

#include <ctxbroker/config/server_config.h>
#include <ctxbroker/core/process_state.h>
#include <ctxbroker/core/types.h>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ctxbroker::session {

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string statusText;
};

/**
 * Single JSON POST with a hard deadline. Implementations must abort the transfer at the
 * deadline and report ErrorCode::Timeout, distinct from any other network failure.
 */
class IHandshakeClient {
public:
    virtual ~IHandshakeClient() = default;
    virtual Result<HttpResponse> postJson(const std::string& url, const std::string& body,
                                          std::chrono::milliseconds timeout) = 0;
};

struct CurlHandshakeClientConfig {
    bool verifyTls = true;
    std::string userAgent = "ctxbroker-mcp";
};

class CurlHandshakeClient final : public IHandshakeClient {
public:
    explicit CurlHandshakeClient(CurlHandshakeClientConfig config = {});
    Result<HttpResponse> postJson(const std::string& url, const std::string& body,
                                  std::chrono::milliseconds timeout) override;

private:
    CurlHandshakeClientConfig config_;
};

/**
 * One-time remote access check.
 *
 * Concurrent first callers share one in-flight attempt; only a successful outcome is
 * memoized, in ProcessState::handshakeValidated.
 */
class HandshakeValidator {
public:
    HandshakeValidator(core::ProcessState& state, std::shared_ptr<IHandshakeClient> client);

    Result<void> validate(const config::HandshakeSettings& settings);

private:
    Result<void> performHandshake(const config::HandshakeSettings& settings);

    core::ProcessState& state_;
    std::shared_ptr<IHandshakeClient> client_;
    std::mutex mutex_;
    std::optional<std::shared_future<Result<void>>> inFlight_;
};

} // namespace ctxbroker::session
