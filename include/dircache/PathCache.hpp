#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace rfs::dircache {

/// Bidirectional path <-> directory ID map. Entries are only ever
/// overwritten, never evicted.
class PathCache {
public:
    [[nodiscard]] std::optional<std::string> get(const std::string& path) const;
    [[nodiscard]] std::optional<std::string> getInv(const std::string& id) const;

    // Overwrites both directions. A previous inverse entry for a replaced ID is left in place.
    void put(const std::string& path, const std::string& id);

    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::string> pathToId_;
    std::unordered_map<std::string, std::string> idToPath_;
};

}
