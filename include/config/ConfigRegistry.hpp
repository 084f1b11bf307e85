#pragma once

#include "config/Config.hpp"
#include "config/paths.hpp"

#include <mutex>

namespace rfs::config {

/// Process-wide configuration, set once at startup.
class ConfigRegistry {
public:
    // Falls back to the built-in defaults when the file doesn't exist.
    static void init(const std::filesystem::path& path = paths::getConfigPath());
    static void init(const Config& config);
    static const Config& get();

private:
    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

}
