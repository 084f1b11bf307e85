#include "config/ConfigRegistry.hpp"

#include <stdexcept>

using namespace rfs::config;

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&] {
        config_ = std::filesystem::exists(path) ? loadConfig(path) : Config{};
        initialized_ = true;
    });
}

void ConfigRegistry::init(const Config& config) {
    std::call_once(init_flag_, [&] {
        config_ = config;
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    if (!initialized_) throw std::runtime_error("[ConfigRegistry] remotefs config requested before init()");
    return config_;
}
