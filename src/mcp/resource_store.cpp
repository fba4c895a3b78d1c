#include <ctxbroker/mcp/resource_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace ctxbroker::mcp {

std::string fileUriFromPath(const std::filesystem::path& path) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    const std::string raw = path.generic_string();
    std::string out = "file://";
    out.reserve(out.size() + raw.size());
    for (unsigned char c : raw) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == '/') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

ResourceStore::ResourceStore(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

void ResourceStore::setChangeListener(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener_ = std::move(listener);
}

void ResourceStore::notifyChanged() const {
    ChangeListener listener;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listener = listener_;
    }
    if (listener)
        listener();
}

void ResourceStore::publish(ResourceRef resource) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        publishLocked(std::move(resource));
    }
    notifyChanged();
}

void ResourceStore::publishLocked(ResourceRef resource) {
    auto existing = std::find_if(entries_.begin(), entries_.end(),
                                 [&](const ResourceRef& r) { return r.uri == resource.uri; });
    if (existing != entries_.end())
        entries_.erase(existing);
    entries_.push_back(std::move(resource));
    while (entries_.size() > capacity_) {
        spdlog::debug("Resource store full, evicting {}", entries_.front().uri);
        entries_.pop_front();
    }
}

std::optional<ResourceRef> ResourceStore::read(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& r : entries_) {
        if (r.uri == uri)
            return r;
    }
    return std::nullopt;
}

bool ResourceStore::contains(const std::string& uri) const {
    return read(uri).has_value();
}

json ResourceStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json out = json::array();
    for (const auto& r : entries_) {
        out.push_back(json{{"uri", r.uri},
                           {"name", r.name},
                           {"description", r.description},
                           {"mimeType", r.mimeType}});
    }
    return out;
}

void ResourceStore::clear() {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = !entries_.empty();
        entries_.clear();
    }
    if (removed)
        notifyChanged();
}

std::size_t ResourceStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace ctxbroker::mcp
