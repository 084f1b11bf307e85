#include "dircache/PathCache.hpp"

#include <mutex>

using namespace rfs::dircache;

std::optional<std::string> PathCache::get(const std::string& path) const {
    std::shared_lock lock(mutex_);
    const auto it = pathToId_.find(path);
    if (it != pathToId_.end()) return it->second;
    return std::nullopt;
}

std::optional<std::string> PathCache::getInv(const std::string& id) const {
    std::shared_lock lock(mutex_);
    const auto it = idToPath_.find(id);
    if (it != idToPath_.end()) return it->second;
    return std::nullopt;
}

void PathCache::put(const std::string& path, const std::string& id) {
    std::unique_lock lock(mutex_);
    pathToId_[path] = id;
    idToPath_[id] = path;
}

size_t PathCache::size() const {
    std::shared_lock lock(mutex_);
    return pathToId_.size();
}
