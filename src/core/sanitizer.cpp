#include <ctxbroker/core/sanitizer.h>

#include <cstddef>
#include <string_view>

namespace ctxbroker::core {

namespace {

std::size_t codePointLength(std::string_view s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        // count every byte that is not a UTF-8 continuation byte
        if ((c & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

json redact(const json& value) {
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (!s.empty()) {
            return "[REDACTED - length: " + std::to_string(codePointLength(s)) + "]";
        }
    }
    return "[REDACTED]";
}

json sanitizeArray(const json& array, const FieldSet& fields);

json sanitizeObject(const json& object, const FieldSet& fields) {
    json out = json::object();
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (fields.count(it.key()) != 0) {
            out[it.key()] = redact(it.value());
        } else if (it.value().is_object()) {
            out[it.key()] = sanitizeObject(it.value(), fields);
        } else if (it.value().is_array()) {
            out[it.key()] = sanitizeArray(it.value(), fields);
        } else {
            out[it.key()] = it.value();
        }
    }
    return out;
}

json sanitizeArray(const json& array, const FieldSet& fields) {
    json out = json::array();
    for (const auto& element : array) {
        if (element.is_object()) {
            out.push_back(sanitizeObject(element, fields));
        } else {
            out.push_back(element);
        }
    }
    return out;
}

} // namespace

const FieldSet& defaultSensitiveFields() {
    static const FieldSet kFields = {"accessToken", "access_token", "password", "client_secret",
                                     "clientSecret"};
    return kFields;
}

json sanitizeSensitiveData(const json& input, const FieldSet& fieldsToRedact) {
    if (input.is_object()) {
        return sanitizeObject(input, fieldsToRedact);
    }
    if (input.is_array()) {
        return sanitizeArray(input, fieldsToRedact);
    }
    return input;
}

} // namespace ctxbroker::core
