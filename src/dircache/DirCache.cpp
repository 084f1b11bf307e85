#include "dircache/DirCache.hpp"
#include "errors/Errors.hpp"
#include "logging/LogRegistry.hpp"
#include "util/remotePath.hpp"

#include <fmt/format.h>
#include <exception>

using namespace rfs::dircache;
using namespace rfs::concurrency;
using namespace rfs::errors;
using namespace rfs::logging;
using namespace rfs::util;

namespace {

// Cancellation and internal errors pass through untouched, anything else
// the backend throws gets the path attached and is nested.
template <class Fn>
auto withPathContext(const char* action, const std::string& path, Fn&& fn) {
    try {
        return fn();
    } catch (const Cancelled&) {
        throw;
    } catch (const PreconditionFailed&) {
        throw;
    } catch (const std::exception& e) {
        std::throw_with_nested(BackendError(path, fmt::format("{} \"{}\": {}", action, path, e.what())));
    }
}

}

DirCache::DirCache(const std::string& root, std::string trueRootId, std::shared_ptr<DirCacher> backend)
    : backend_(std::move(backend)),
      root_(joinSegments(pathSegments(root))),
      trueRootId_(std::move(trueRootId)) {
    if (!backend_) throw std::invalid_argument("[DirCache] Backend is required");
    if (trueRootId_.empty()) throw std::invalid_argument("[DirCache] Root ID must not be empty");
}

std::string DirCache::findRoot(const Context& ctx) {
    if (foundRoot()) return rootId_;

    std::scoped_lock lock(rootMutex_);
    if (foundRoot()) return rootId_;

    auto id = resolveRoot(ctx);
    rootId_ = id;
    foundRoot_.store(true, std::memory_order_release);

    LogRegistry::dircache()->debug("[DirCache] Root \"{}\" resolved to {}", root_, id);
    return id;
}

std::string DirCache::resolveRoot(const Context& ctx) {
    if (root_.empty()) return trueRootId_;

    const auto segments = pathSegments(root_);

    // deepest prefix of the chain that is already known
    std::string parentId = trueRootId_;
    size_t depth = 0;
    for (; depth < segments.size(); ++depth) {
        const auto id = cache_.get(joinSegments(segments, depth + 1));
        if (!id) break;
        parentId = *id;
    }
    if (depth == segments.size()) return parentId;

    for (size_t i = depth; i < segments.size(); ++i) {
        const auto dirPath = joinSegments(segments, i + 1);
        if (cache_.get(dirPath)) continue;

        const auto parentPath = joinSegments(segments, i);
        const auto parent = i == 0 ? std::optional(trueRootId_) : cache_.get(parentPath);
        if (!parent)
            throw PreconditionFailed(fmt::format("internal error: couldn't find parent directory \"{}\"", parentPath));

        const auto id = withPathContext("failed to make directory", dirPath, [&] {
            return backend_->createDir(ctx, *parent, segments[i]);
        });
        cache_.put(dirPath, id);

        LogRegistry::dircache()->debug("[DirCache] Created directory \"{}\" as {} under {}", dirPath, id, *parent);
    }

    const auto id = cache_.get(root_);
    if (!id) throw PreconditionFailed(fmt::format("internal error: root \"{}\" missing from the cache", root_));
    return *id;
}

std::string DirCache::findDir(const Context& ctx, const std::string& path) {
    if (!foundRoot()) throw PreconditionFailed("internal error: findDir called before findRoot");

    const auto segments = pathSegments(path);
    if (segments.empty()) return rootId_;

    std::string parentId = rootId_;
    size_t depth = segments.size();
    for (; depth > 0; --depth) {
        if (const auto id = cache_.get(keyFor(joinSegments(segments, depth)))) {
            parentId = *id;
            break;
        }
    }

    if (depth == segments.size()) {
        LogRegistry::dircache()->trace("[DirCache] Cache hit for \"{}\"", path);
        return parentId;
    }

    for (size_t i = depth; i < segments.size(); ++i) {
        const auto relPath = joinSegments(segments, i + 1);
        const auto key = keyFor(relPath);

        // another caller may have filled it in meanwhile
        if (const auto cached = cache_.get(key)) {
            parentId = *cached;
            continue;
        }

        const auto id = withPathContext("failed to look up directory", relPath, [&] {
            return backend_->findLeaf(ctx, parentId, segments[i]);
        });
        if (!id) throw NotFound(fmt::format("couldn't find directory \"{}\"", joinSegments(segments)));

        cache_.put(key, *id);
        parentId = *id;
    }

    LogRegistry::dircache()->debug("[DirCache] Resolved \"{}\" to {}", path, parentId);
    return parentId;
}

std::string DirCache::findPath([[maybe_unused]] const Context& ctx, const std::string& id) const {
    if (id.empty()) throw NotFound("can't find path for empty ID");
    if (id == trueRootId_ || (foundRoot() && id == rootId_)) return root_;

    if (auto path = getInv(id)) return *path;
    throw NotFound(fmt::format("couldn't find path for ID \"{}\"", id));
}

std::pair<std::string, std::string> DirCache::findParent(const Context& ctx, const std::string& remote) {
    auto [dir, leaf] = splitPath(remote);
    if (leaf.empty()) throw std::invalid_argument("[DirCache] Path has no leaf: \"" + remote + "\"");
    return {leaf, findDir(ctx, dir)};
}

std::string DirCache::rootId() const {
    if (!foundRoot()) throw PreconditionFailed("internal error: root not resolved yet");
    return rootId_;
}

std::optional<std::string> DirCache::get(const std::string& path) const {
    return cache_.get(keyFor(path));
}

void DirCache::put(const std::string& path, const std::string& id) {
    cache_.put(keyFor(path), id);
}

std::optional<std::string> DirCache::getInv(const std::string& id) const {
    const auto key = cache_.getInv(id);
    if (!key) return std::nullopt;
    return relativeTo(*key);
}

std::string DirCache::keyFor(const std::string& relPath) const {
    return joinPath(root_, joinSegments(pathSegments(relPath)));
}

std::optional<std::string> DirCache::relativeTo(const std::string& key) const {
    if (root_.empty()) return key;
    if (key == root_) return std::string();
    if (key.size() > root_.size() && key.compare(0, root_.size(), root_) == 0 && key[root_.size()] == '/')
        return key.substr(root_.size() + 1);
    return std::nullopt;
}
