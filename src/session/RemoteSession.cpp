#include "session/RemoteSession.hpp"
#include "dircache/PacedDirCacher.hpp"
#include "logging/LogRegistry.hpp"
#include "pacer/Pacer.hpp"
#include "util/remotePath.hpp"

#include <nlohmann/json.hpp>

using namespace rfs::session;
using namespace rfs::concurrency;
using namespace rfs::dircache;
using namespace rfs::logging;

RemoteSession::RemoteSession(const config::Config& cfg, std::shared_ptr<DirCacher> backend)
    : pacer_(std::make_shared<rfs::pacer::Pacer>(cfg.pacer)),
      backend_(std::make_shared<PacedDirCacher>(std::move(backend), pacer_)),
      dirCache_(std::make_unique<DirCache>(util::cleanPath(cfg.dircache.root), cfg.dircache.root_id, backend_)) {
    LogRegistry::remotefs()->info("[RemoteSession] Opened at \"{}\" (root id {}), pacer {}",
                                  dirCache_->root(), dirCache_->trueRootId(), nlohmann::json(cfg.pacer).dump());
}

std::string RemoteSession::findRoot(const Context& ctx) {
    return dirCache_->findRoot(ctx);
}

std::string RemoteSession::findDir(const Context& ctx, const std::string& path) {
    return dirCache_->findDir(ctx, util::cleanPath(path));
}

std::pair<std::string, std::string> RemoteSession::findParent(const Context& ctx, const std::string& remote) {
    return dirCache_->findParent(ctx, util::cleanPath(remote));
}

std::string RemoteSession::findPath(const Context& ctx, const std::string& id) const {
    return dirCache_->findPath(ctx, id);
}
