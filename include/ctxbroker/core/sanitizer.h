#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_set>

namespace ctxbroker::core {

using json = nlohmann::json;

using FieldSet = std::unordered_set<std::string>;

// accessToken, access_token, password, client_secret, clientSecret
const FieldSet& defaultSensitiveFields();

/**
 * Returns a deep copy of `input` with every object member whose key is in `fieldsToRedact`
 * replaced by a redaction marker. Non-empty strings become "[REDACTED - length: N]" (N in
 * code points); any other value becomes "[REDACTED]". Nested objects are sanitized
 * recursively, array elements only when they are objects. Scalars and null are returned
 * unchanged. The input is never modified.
 */
json sanitizeSensitiveData(const json& input, const FieldSet& fieldsToRedact = defaultSensitiveFields());

} // namespace ctxbroker::core
