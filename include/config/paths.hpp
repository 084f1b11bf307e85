#pragma once

#include <filesystem>

namespace rfs::paths {

/// $REMOTEFS_CONFIG if set, otherwise /etc/remotefs/config.yaml
std::filesystem::path getConfigPath();

std::filesystem::path getLogPath();

/// Redirects logs into a scratch directory under the system temp dir.
void setLogPathForTesting();

}
