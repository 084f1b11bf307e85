#pragma once

#include "concurrency/Context.hpp"
#include "dircache/DirCacher.hpp"
#include "dircache/PathCache.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace rfs::dircache {

/// Resolves paths under a configured root to backend directory IDs,
/// caching every directory it discovers or creates.
///
/// findRoot() must succeed once before findDir() can be used: the root
/// chain is only known (and possibly created) at that point.
///
/// get/put/getInv take and return paths relative to the root, the same
/// paths findDir() accepts. Underneath, the PathCache is keyed by full
/// paths from the absolute root so the root chain ("a", "a/b" for root
/// "a/b") never collides with a directory of the same name below it.
class DirCache {
public:
    DirCache(const std::string& root, std::string trueRootId, std::shared_ptr<DirCacher> backend);

    [[nodiscard]] std::optional<std::string> get(const std::string& path) const;
    void put(const std::string& path, const std::string& id);

    /// Root-relative path of a cached ID. Empty for the root itself, nullopt
    /// for IDs outside the root (its ancestors on the chain).
    [[nodiscard]] std::optional<std::string> getInv(const std::string& id) const;

    // Keyed by absolute paths, e.g. for seeding the root chain.
    [[nodiscard]] PathCache& cache() { return cache_; }
    [[nodiscard]] const PathCache& cache() const { return cache_; }

    /// ID of the configured root, creating missing directories of the chain.
    /// Runs at most once per instance; later calls return the same ID
    /// without touching the backend. A failed run keeps whatever it created.
    std::string findRoot(const concurrency::Context& ctx);

    /// ID of an existing directory relative to the root. Never creates.
    /// Throws PreconditionFailed before findRoot() and NotFound for a
    /// missing segment.
    std::string findDir(const concurrency::Context& ctx, const std::string& path);

    /// Path of a known directory ID, answered from the cache alone. The
    /// configured root for the root IDs, otherwise the root-relative path
    /// findDir() resolves back to the same ID.
    [[nodiscard]] std::string findPath(const concurrency::Context& ctx, const std::string& id) const;

    /// {leaf, ID of the directory holding it} for an object path.
    std::pair<std::string, std::string> findParent(const concurrency::Context& ctx, const std::string& remote);

    [[nodiscard]] bool foundRoot() const { return foundRoot_.load(std::memory_order_acquire); }
    [[nodiscard]] std::string rootId() const;
    [[nodiscard]] const std::string& root() const { return root_; }
    [[nodiscard]] const std::string& trueRootId() const { return trueRootId_; }

private:
    std::string resolveRoot(const concurrency::Context& ctx);
    [[nodiscard]] std::string keyFor(const std::string& relPath) const;
    [[nodiscard]] std::optional<std::string> relativeTo(const std::string& key) const;

    PathCache cache_;
    std::shared_ptr<DirCacher> backend_;

    const std::string root_;
    const std::string trueRootId_;

    std::mutex rootMutex_;             // single-flight root resolution
    std::string rootId_;               // written once, before foundRoot_ is published
    std::atomic<bool> foundRoot_{false};
};

}
