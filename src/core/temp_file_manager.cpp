#include <ctxbroker/core/temp_file_manager.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace ctxbroker::core {

namespace fs = std::filesystem;

namespace {

constexpr int kMaxNameAttempts = 1000;

// RAII file descriptor for exclusively created files
class UniqueFd {
public:
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() {
        if (fd_ >= 0)
            ::close(fd_);
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

bool writeAll(int fd, std::string_view bytes) {
    const char* p = bytes.data();
    std::size_t left = bytes.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    return true;
}

std::string normalizeExtension(std::string ext) {
    while (!ext.empty() && ext.front() == '.')
        ext.erase(ext.begin());
    return ext;
}

} // namespace

TempFileManager::TempFileManager(TempDirSettings settings) : settings_(std::move(settings)) {
    if (settings_.baseSubdir.empty())
        settings_.baseSubdir = "tmp";
}

Result<fs::path> TempFileManager::ensureBaseDir(const fs::path& workspace) const {
    if (workspace.empty()) {
        return Error{ErrorCode::InvalidState, "Workspace path is not resolved"};
    }
    const fs::path base = workspace / settings_.baseSubdir;
    std::error_code ec;
    auto status = fs::status(base, ec);
    if (fs::exists(status)) {
        if (!fs::is_directory(status)) {
            return Error{ErrorCode::NotADirectory,
                         "Temp path exists and is not a directory: " + base.string()};
        }
        return base;
    }
    fs::create_directories(base, ec);
    if (ec) {
        // Lost a creation race is fine as long as a directory is there now
        if (fs::is_directory(base))
            return base;
        return Error{ErrorCode::WriteError,
                     "Failed to create temp directory " + base.string() + ": " + ec.message()};
    }
    spdlog::debug("Created temp directory {}", base.string());
    return base;
}

std::string TempFileManager::compactTimestamp(TimePoint tp) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() %
        1000;
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%y%m%d%H%M%S") << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

std::string TempFileManager::sanitizeNameHint(std::string_view hint) {
    std::string out;
    out.reserve(hint.size());
    for (unsigned char c : hint) {
        if (c == '/' || c == '\\' || c < 0x20 || c == 0x7f) {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    // "." and ".." would escape or alias the base directory
    if (out.empty() || out == "." || out == "..")
        out = "file";
    return out;
}

Result<fs::path> TempFileManager::write(const fs::path& workspace, std::string_view nameHint,
                                        std::string_view content,
                                        const TempWriteOptions& options) const {
    auto ext = normalizeExtension(options.extension);
    return writeBytes(workspace, nameHint, content, ext.empty() ? "txt" : ext);
}

Result<fs::path> TempFileManager::writeJson(const fs::path& workspace, std::string_view nameHint,
                                            const json& content,
                                            const TempWriteOptions& options) const {
    std::string text;
    try {
        text = content.dump(options.jsonIndent);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Failed to serialize JSON: ") + e.what()};
    }
    auto ext = normalizeExtension(options.extension);
    return writeBytes(workspace, nameHint, text, ext.empty() ? "json" : ext);
}

Result<fs::path> TempFileManager::writeBytes(const fs::path& workspace, std::string_view nameHint,
                                             std::string_view bytes,
                                             const std::string& extension) const {
    auto baseRes = ensureBaseDir(workspace);
    if (!baseRes)
        return baseRes.error();
    const fs::path base = baseRes.value();

    cleanupObsolete(base, settings_.retentionDays);

    const std::string stem =
        sanitizeNameHint(nameHint) + "_" + compactTimestamp(std::chrono::system_clock::now());

    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
        std::string filename = stem;
        if (attempt > 0)
            filename += "-" + std::to_string(attempt);
        filename += "." + extension;
        const fs::path target = base / filename;

        UniqueFd fd(::open(target.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
        if (fd.get() < 0) {
            if (errno == EEXIST)
                continue;
            return Error{ErrorCode::WriteError,
                         "Failed to create " + target.string() + ": " + std::strerror(errno)};
        }
        if (!writeAll(fd.get(), bytes)) {
            const std::string reason = std::strerror(errno);
            ::close(fd.release());
            std::error_code ec;
            fs::remove(target, ec);
            return Error{ErrorCode::WriteError,
                         "Failed to write " + target.string() + ": " + reason};
        }
        if (::close(fd.release()) != 0) {
            return Error{ErrorCode::WriteError,
                         "Failed to close " + target.string() + ": " + std::strerror(errno)};
        }
        spdlog::debug("Wrote temp file {} ({} bytes)", target.string(), bytes.size());
        return target;
    }
    return Error{ErrorCode::WriteError, "No free temp filename for " + stem};
}

std::size_t TempFileManager::cleanupObsolete(const fs::path& baseDir,
                                             int retentionDays) const noexcept {
    std::size_t removed = 0;
    try {
        std::error_code ec;
        if (!fs::is_directory(baseDir, ec))
            return 0;
        const int days = std::clamp(retentionDays, 0, kMaxRetentionDays);
        const auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(24) * days;

        fs::directory_iterator it(baseDir, ec);
        if (ec) {
            spdlog::warn("Temp cleanup: cannot list {}: {}", baseDir.string(), ec.message());
            return 0;
        }
        for (const auto& entry : it) {
            std::error_code entryEc;
            auto mtime = entry.last_write_time(entryEc);
            if (entryEc) {
                spdlog::debug("Temp cleanup: skipping {}: {}", entry.path().string(),
                              entryEc.message());
                continue;
            }
            if (mtime >= cutoff)
                continue;
            fs::remove_all(entry.path(), entryEc);
            if (entryEc) {
                spdlog::warn("Temp cleanup: failed to remove {}: {}", entry.path().string(),
                             entryEc.message());
                continue;
            }
            ++removed;
        }
        if (removed > 0)
            spdlog::debug("Temp cleanup removed {} obsolete entries from {}", removed,
                          baseDir.string());
    } catch (const std::exception& e) {
        spdlog::warn("Temp cleanup of {} failed: {}", baseDir.string(), e.what());
    }
    return removed;
}

} // namespace ctxbroker::core
