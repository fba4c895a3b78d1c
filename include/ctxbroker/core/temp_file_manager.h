#pragma once

#include <ctxbroker/core/types.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace ctxbroker::core {

using json = nlohmann::json;

// Upper bound for the retention window; larger values are clamped by cleanup.
inline constexpr int kMaxRetentionDays = 36500;

struct TempDirSettings {
    std::string baseSubdir = "tmp";
    int retentionDays = 7;
};

struct TempWriteOptions {
    // Extension without the leading dot; empty picks json for JSON content, txt otherwise.
    std::string extension;
    int jsonIndent = 3;
};

/**
 * Scratch directory under the resolved workspace.
 *
 * Filenames are `<hint>_<YYMMDDHHMMSSmmm>.<ext>`. Uniqueness is guaranteed at creation time
 * by an exclusive open; a `-<n>` suffix is added when the name is already taken, so
 * concurrent writers never need a shared lock.
 */
class TempFileManager {
public:
    explicit TempFileManager(TempDirSettings settings = {});

    const TempDirSettings& settings() const { return settings_; }

    // <workspace>/<baseSubdir>, created when missing. NotADirectory if it exists as a file.
    Result<std::filesystem::path> ensureBaseDir(const std::filesystem::path& workspace) const;

    Result<std::filesystem::path> write(const std::filesystem::path& workspace,
                                        std::string_view nameHint, std::string_view content,
                                        const TempWriteOptions& options = {}) const;

    Result<std::filesystem::path> writeJson(const std::filesystem::path& workspace,
                                            std::string_view nameHint, const json& content,
                                            const TempWriteOptions& options = {}) const;

    // Best-effort; returns the number of removed entries. Errors are logged and swallowed.
    // retentionDays is clamped to [0, kMaxRetentionDays].
    std::size_t cleanupObsolete(const std::filesystem::path& baseDir,
                                int retentionDays) const noexcept;

    static std::string compactTimestamp(TimePoint tp);
    static std::string sanitizeNameHint(std::string_view hint);

private:
    Result<std::filesystem::path> writeBytes(const std::filesystem::path& workspace,
                                             std::string_view nameHint, std::string_view bytes,
                                             const std::string& extension) const;

    TempDirSettings settings_;
};

} // namespace ctxbroker::core
