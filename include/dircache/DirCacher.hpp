#pragma once

#include "concurrency/Context.hpp"

#include <optional>
#include <string>

namespace rfs::dircache {

/// The two directory operations a backend has to provide for path
/// resolution. Failures are reported by throwing.
class DirCacher {
public:
    virtual ~DirCacher() = default;

    /// ID of the directory called leaf inside parentId, or nullopt when
    /// there is none. Must never create anything.
    [[nodiscard]] virtual std::optional<std::string> findLeaf(const concurrency::Context& ctx,
                                                              const std::string& parentId,
                                                              const std::string& leaf) = 0;

    /// Creates leaf inside parentId and returns its ID. Not idempotent:
    /// callers must not ask twice for the same (parentId, leaf).
    virtual std::string createDir(const concurrency::Context& ctx,
                                  const std::string& parentId,
                                  const std::string& leaf) = 0;
};

}
