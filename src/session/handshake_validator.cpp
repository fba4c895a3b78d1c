#include <ctxbroker/session/handshake_validator.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <exception>

namespace ctxbroker::session {

using json = nlohmann::json;

namespace {

bool isTruthy(const json& v) {
    if (v.is_boolean())
        return v.get<bool>();
    if (v.is_number_integer())
        return v.get<long long>() != 0;
    if (v.is_number_float())
        return v.get<double>() != 0.0;
    if (v.is_string())
        return !v.get_ref<const std::string&>().empty();
    return v.is_object() || v.is_array();
}

} // namespace

HandshakeValidator::HandshakeValidator(core::ProcessState& state,
                                       std::shared_ptr<IHandshakeClient> client)
    : state_(state), client_(std::move(client)) {}

Result<void> HandshakeValidator::validate(const config::HandshakeSettings& settings) {
    if (state_.handshakeValidated())
        return {};

    if (settings.bypass) {
        spdlog::warn("Handshake bypass is enabled; remote access validation skipped");
        state_.markHandshakeValidated();
        return {};
    }
    if (settings.loginUrl.empty()) {
        return Error{ErrorCode::ConfigurationError, "Internal error. Login endpoint not set"};
    }
    if (settings.password.empty()) {
        return Error{ErrorCode::ConfigurationError, "Invalid or missing value for $PASSWORD"};
    }

    std::promise<Result<void>> promise;
    std::shared_future<Result<void>> pending;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.handshakeValidated())
            return {};
        if (inFlight_) {
            pending = *inFlight_;
        } else {
            owner = true;
            pending = promise.get_future().share();
            inFlight_ = pending;
        }
    }

    if (!owner) {
        spdlog::debug("Handshake already in flight; waiting for its outcome");
        return pending.get();
    }

    // The latch is released on every path so a failed attempt never strands waiters.
    Result<void> outcome = [&]() -> Result<void> {
        try {
            return performHandshake(settings);
        } catch (const std::exception& e) {
            spdlog::error("Handshake aborted: {}", e.what());
            return Error{ErrorCode::InternalError, std::string("Handshake aborted: ") + e.what()};
        }
    }();
    if (outcome)
        state_.markHandshakeValidated();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_.reset();
    }
    promise.set_value(outcome);
    return outcome;
}

Result<void> HandshakeValidator::performHandshake(const config::HandshakeSettings& settings) {
    if (!client_) {
        return Error{ErrorCode::InternalError, "No handshake client configured"};
    }
    if (!settings.strictSsl) {
        spdlog::warn("TLS certificate verification is disabled for the handshake");
    }

    std::string body;
    try {
        body = json{{"password", settings.password}}.dump();
    } catch (const json::type_error& e) {
        spdlog::error("Handshake secret cannot be encoded: {}", e.what());
        return Error{ErrorCode::InvalidArgument,
                     "Invalid value for $PASSWORD: not valid UTF-8"};
    }
    spdlog::debug("Handshake POST {} (timeout {} ms)", settings.loginUrl,
                  settings.timeout.count());

    Result<HttpResponse> response = [&]() -> Result<HttpResponse> {
        try {
            return client_->postJson(settings.loginUrl, body, settings.timeout);
        } catch (const std::exception& e) {
            return Error{ErrorCode::NetworkError, e.what()};
        }
    }();

    if (!response) {
        const auto& err = response.error();
        if (err.code == ErrorCode::Timeout) {
            spdlog::error("Handshake request timed out after {} ms", settings.timeout.count());
            return Error{ErrorCode::Timeout, "Handshake request timed out."};
        }
        spdlog::error("Handshake request failed: {}", err.message);
        return Error{ErrorCode::NetworkError, "Handshake request failed: " + err.message};
    }

    const auto& http = response.value();
    json payload;
    if (!http.body.empty()) {
        try {
            payload = json::parse(http.body);
        } catch (const json::parse_error& e) {
            spdlog::warn("Handshake response is not valid JSON: {}", e.what());
            payload = nullptr;
        }
    }

    const bool okStatus = http.status >= 200 && http.status < 300;
    const bool success =
        okStatus && payload.is_object() && payload.contains("success") && isTruthy(payload["success"]);
    if (success) {
        spdlog::info("Handshake validated");
        return {};
    }

    std::string reason;
    if (payload.is_object() && payload.contains("message") && payload["message"].is_string() &&
        !payload["message"].get_ref<const std::string&>().empty()) {
        reason = payload["message"].get<std::string>();
    } else if (!okStatus) {
        reason = "HTTP " + std::to_string(http.status);
        if (!http.statusText.empty())
            reason += " " + http.statusText;
    } else {
        reason = "Handshake validation failed.";
    }
    spdlog::error("Handshake rejected (status {}): {}", http.status, reason);
    return Error{ErrorCode::HandshakeRejected, "Handshake rejected: " + reason};
}

} // namespace ctxbroker::session
