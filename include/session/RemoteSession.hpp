#pragma once

#include "concurrency/Context.hpp"
#include "config/Config.hpp"
#include "dircache/DirCache.hpp"
#include "pacer/Pacer.hpp"
#include "pacer/retry.hpp"

#include <memory>
#include <string>
#include <utility>

namespace rfs::session {

/// Everything one client needs to talk paths to a remote: the pacer all
/// backend calls share and the directory cache built on top of it.
/// Each session owns its own cache; nothing is shared between sessions.
class RemoteSession {
public:
    RemoteSession(const config::Config& cfg, std::shared_ptr<dircache::DirCacher> backend);

    std::string findRoot(const concurrency::Context& ctx);

    // Paths are normalised with util::cleanPath first.
    std::string findDir(const concurrency::Context& ctx, const std::string& path);
    std::pair<std::string, std::string> findParent(const concurrency::Context& ctx, const std::string& remote);

    [[nodiscard]] std::string findPath(const concurrency::Context& ctx, const std::string& id) const;

    /// Routes an arbitrary backend call through the session's pacer.
    template <class Fn>
    void paced(const concurrency::Context& ctx, Fn&& fn) {
        pacer_->call(ctx, [&] { return rfs::pacer::attempt(fn); });
    }

    [[nodiscard]] const std::shared_ptr<rfs::pacer::Pacer>& pacer() const { return pacer_; }
    [[nodiscard]] dircache::DirCache& dirCache() { return *dirCache_; }

private:
    std::shared_ptr<rfs::pacer::Pacer> pacer_;
    std::shared_ptr<dircache::DirCacher> backend_;
    std::unique_ptr<dircache::DirCache> dirCache_;
};

}

