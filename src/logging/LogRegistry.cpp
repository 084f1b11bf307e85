#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <stdexcept>

using namespace rfs::logging;
using namespace rfs::config;

namespace {

spdlog::level::level_enum levelFor(const std::string_view name, const SubsystemLogLevelsConfig& levels) {
    if (name == "dircache") return levels.dircache;
    if (name == "pacer") return levels.pacer;
    if (name == "backend") return levels.backend;
    return levels.remotefs;
}

}

void LogRegistry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] remotefs logging already set up, keeping {}", log_file_.string());
        return;
    }

    std::filesystem::create_directories(logDir);
    log_file_ = logDir / "remotefs.log";

    const auto& levels = ConfigRegistry::get().logging.levels;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(levels.console_log_level);
    console->set_color_mode(spdlog::color_mode::automatic);

    auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file_.string(), MAX_LOG_BYTES, MAX_LOG_FILES);
    file->set_level(levels.file_log_level);

    sinks_ = {console, file};
    for (const auto& sink : sinks_) sink->set_pattern(LOG_FORMAT);

    for (const auto name : SUBSYSTEMS) {
        auto logger = std::make_shared<spdlog::logger>(std::string(name), sinks_.begin(), sinks_.end());
        logger->set_level(levelFor(name, levels.subsystem_levels));
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(std::move(logger));
    }

    initialized_ = true;
    remotefs()->info("[LogRegistry] Logging to {}", log_file_.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    if (auto logger = spdlog::get(name)) return logger;
    if (!initialized_) throw std::runtime_error("[LogRegistry] Logger \"" + name + "\" requested before init()");
    throw std::runtime_error("[LogRegistry] No remotefs logger named \"" + name + "\"");
}

bool LogRegistry::isInitialized() { return initialized_; }

std::filesystem::path LogRegistry::logFile() { return log_file_; }
