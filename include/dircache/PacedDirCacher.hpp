#pragma once

#include "dircache/DirCacher.hpp"

#include <memory>

namespace rfs::pacer {
class Pacer;
}

namespace rfs::dircache {

/// Routes every call of a raw backend through a shared Pacer, retrying
/// the failures pacer::shouldRetry considers transient.
class PacedDirCacher final : public DirCacher {
public:
    PacedDirCacher(std::shared_ptr<DirCacher> backend, std::shared_ptr<pacer::Pacer> pacer);

    [[nodiscard]] std::optional<std::string> findLeaf(const concurrency::Context& ctx,
                                                      const std::string& parentId,
                                                      const std::string& leaf) override;

    std::string createDir(const concurrency::Context& ctx,
                          const std::string& parentId,
                          const std::string& leaf) override;

private:
    std::shared_ptr<DirCacher> backend_;
    std::shared_ptr<pacer::Pacer> pacer_;
};

}
