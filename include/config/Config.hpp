#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace rfs::config {

struct PacerConfig {
    unsigned int max_connections = 8;
    int retries = 10;
    std::chrono::milliseconds min_sleep{10};
    std::chrono::milliseconds max_sleep{2000};  // 0 disables the upper bound
    unsigned int decay_constant = 2;
};

struct DirCacheConfig {
    std::string root;               // sub-path of the remote to work under, "" for the whole remote
    std::string root_id = "root";   // backend ID of the remote's absolute root
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum remotefs = spdlog::level::info;   // session lifecycle
    spdlog::level::level_enum dircache = spdlog::level::warn;   // cache misses, directory creation
    spdlog::level::level_enum pacer    = spdlog::level::warn;   // retry scheduling, pool resizing
    spdlog::level::level_enum backend  = spdlog::level::warn;   // calls routed to the collaborator
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/remotefs";
    LogLevelsConfig levels;
};

struct Config {
    PacerConfig pacer;
    DirCacheConfig dircache;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const PacerConfig& c);
void from_json(const nlohmann::json& j, PacerConfig& c);
void to_json(nlohmann::json& j, const DirCacheConfig& c);
void from_json(const nlohmann::json& j, DirCacheConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace rfs::config
