#include "config/paths.hpp"

#include <cstdlib>

namespace rfs::paths {

namespace {
std::filesystem::path logPathOverride;
}

std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("REMOTEFS_CONFIG"); env && *env) return env;
    return "/etc/remotefs/config.yaml";
}

std::filesystem::path getLogPath() {
    if (!logPathOverride.empty()) return logPathOverride;
    return "/var/log/remotefs";
}

void setLogPathForTesting() {
    logPathOverride = std::filesystem::temp_directory_path() / "remotefs_test_logs";
}

}
