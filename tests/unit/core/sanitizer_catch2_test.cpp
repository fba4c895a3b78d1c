#include <catch2/catch_test_macros.hpp>

#include <ctxbroker/core/sanitizer.h>

using ctxbroker::core::json;
using ctxbroker::core::sanitizeSensitiveData;

TEST_CASE("Sanitizer - Redacts top-level token and keeps other fields",
          "[core][sanitizer][catch2]") {
    const json input = {{"accessToken", "abcdef"}, {"user", "x"}};
    const json copy = input;

    const auto out = sanitizeSensitiveData(input);

    CHECK(out["accessToken"] == "[REDACTED - length: 6]");
    CHECK(out["user"] == "x");
    CHECK(input == copy);
}

TEST_CASE("Sanitizer - Redacts nested objects and objects inside arrays",
          "[core][sanitizer][catch2]") {
    const json input = {{"a", {{"password", "pw"}}},
                        {"list", json::array({json{{"client_secret", "s3"}}, 7, "plain"})}};

    const auto out = sanitizeSensitiveData(input);

    CHECK(out["a"]["password"] == "[REDACTED - length: 2]");
    CHECK(out["list"][0]["client_secret"] == "[REDACTED - length: 2]");
    CHECK(out["list"][1] == 7);
    CHECK(out["list"][2] == "plain");
}

TEST_CASE("Sanitizer - Non-string and empty values get the bare marker",
          "[core][sanitizer][catch2]") {
    const json input = {{"access_token", ""}, {"clientSecret", 42}, {"password", nullptr}};

    const auto out = sanitizeSensitiveData(input);

    CHECK(out["access_token"] == "[REDACTED]");
    CHECK(out["clientSecret"] == "[REDACTED]");
    CHECK(out["password"] == "[REDACTED]");
}

TEST_CASE("Sanitizer - Length counts code points", "[core][sanitizer][catch2]") {
    const json input = {{"password", "\xC3\xA9t\xC3\xA9"}};
    CHECK(sanitizeSensitiveData(input)["password"] == "[REDACTED - length: 3]");
}

TEST_CASE("Sanitizer - Scalars and null pass through", "[core][sanitizer][catch2]") {
    CHECK(sanitizeSensitiveData(json()).is_null());
    CHECK(sanitizeSensitiveData(json(5)) == 5);
    CHECK(sanitizeSensitiveData(json("password")) == "password");
}

TEST_CASE("Sanitizer - Custom field set", "[core][sanitizer][catch2]") {
    const json input = {{"apiKey", "k"}, {"password", "p"}};
    const auto out = sanitizeSensitiveData(input, {"apiKey"});
    CHECK(out["apiKey"] == "[REDACTED - length: 1]");
    CHECK(out["password"] == "p");
}
