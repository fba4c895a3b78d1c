// Shared helpers for the Catch2 unit tests

#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace ctxbroker::test {

/**
 * @brief Write data to a file, creating parent directories as needed.
 */
inline std::filesystem::path write_file(const std::filesystem::path& path, std::string_view data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream stream(path, std::ios::binary);
    stream.write(data.data(), static_cast<std::streamsize>(data.size()));
    stream.close();
    return path;
}

/**
 * @brief Sets (or unsets, with nullopt) a process environment variable for one scope.
 *
 * The previous value is put back on destruction. Not movable; keep it on the stack.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, std::optional<std::string> value)
        : key_(std::move(key)), previous_(read(key_)) {
        apply(key_, value);
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

    ~ScopedEnvVar() { apply(key_, previous_); }

private:
    static std::optional<std::string> read(const std::string& key) {
        if (const char* v = std::getenv(key.c_str()))
            return std::string(v);
        return std::nullopt;
    }

    static void apply(const std::string& key, const std::optional<std::string>& value) {
        if (value)
            ::setenv(key.c_str(), value->c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }

    std::string key_;
    std::optional<std::string> previous_;
};

/**
 * @brief In-memory environment for code that takes an injected lookup.
 */
class FakeEnvironment {
public:
    FakeEnvironment& set(std::string key, std::string value) {
        values_[std::move(key)] = std::move(value);
        return *this;
    }

    std::function<std::optional<std::string>(const std::string&)> lookup() const {
        return [values = values_](const std::string& key) -> std::optional<std::string> {
            if (auto it = values.find(key); it != values.end())
                return it->second;
            return std::nullopt;
        };
    }

private:
    std::map<std::string, std::string> values_;
};

} // namespace ctxbroker::test
