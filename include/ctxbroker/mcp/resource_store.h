#pragma once

#include <ctxbroker/mcp/capability_negotiator.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace ctxbroker::mcp {

using json = nlohmann::json;

// file:// URI for a local path. Every byte outside the unreserved set and '/' is
// percent-encoded, so "/a b/100%" becomes "file:///a%20b/100%25".
std::string fileUriFromPath(const std::filesystem::path& path);

// Dynamic resources published by handlers at run time. Bounded; the oldest entry is evicted
// when capacity is exceeded. Republishing a URI replaces it and makes it the newest.
class ResourceStore {
public:
    using ChangeListener = std::function<void()>;

    explicit ResourceStore(std::size_t capacity = 30);

    // Called after every publish and after a clear that removed something, without the
    // store lock held. Pass nullptr to detach.
    void setChangeListener(ChangeListener listener);

    void publish(ResourceRef resource);
    std::optional<ResourceRef> read(const std::string& uri) const;
    bool contains(const std::string& uri) const;

    // resources/list entries, oldest first
    json list() const;

    void clear();
    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

private:
    void publishLocked(ResourceRef resource);
    void notifyChanged() const;

    mutable std::mutex mutex_;
    std::size_t capacity_;
    std::deque<ResourceRef> entries_;

    mutable std::mutex listenerMutex_;
    ChangeListener listener_;
};

} // namespace ctxbroker::mcp
