#include "dircache/PacedDirCacher.hpp"
#include "errors/Errors.hpp"
#include "logging/LogRegistry.hpp"
#include "pacer/Pacer.hpp"
#include "pacer/retry.hpp"

using namespace rfs::dircache;
using namespace rfs::concurrency;
using namespace rfs::errors;
using namespace rfs::logging;

PacedDirCacher::PacedDirCacher(std::shared_ptr<DirCacher> backend, std::shared_ptr<pacer::Pacer> pacer)
    : backend_(std::move(backend)), pacer_(std::move(pacer)) {
    if (!backend_) throw std::invalid_argument("[PacedDirCacher] Backend is required");
    if (!pacer_) throw std::invalid_argument("[PacedDirCacher] Pacer is required");
}

std::optional<std::string> PacedDirCacher::findLeaf(const Context& ctx, const std::string& parentId,
                                                    const std::string& leaf) {
    if (parentId.empty()) throw PreconditionFailed("internal error: directory ID is blank");

    std::optional<std::string> found;
    pacer_->call(ctx, [&] {
        return pacer::attempt([&] { found = backend_->findLeaf(ctx, parentId, leaf); });
    });

    LogRegistry::backend()->trace("[PacedDirCacher] findLeaf({}, {}) -> {}", parentId, leaf, found.value_or("<none>"));
    return found;
}

std::string PacedDirCacher::createDir(const Context& ctx, const std::string& parentId, const std::string& leaf) {
    if (parentId.empty()) throw PreconditionFailed("internal error: directory ID is blank");

    std::string id;
    pacer_->call(ctx, [&] {
        return pacer::attempt([&] { id = backend_->createDir(ctx, parentId, leaf); });
    });

    LogRegistry::backend()->debug("[PacedDirCacher] createDir({}, {}) -> {}", parentId, leaf, id);
    return id;
}
