#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace rfs::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<PacerConfig> {
    static Node encode(const PacerConfig& rhs) {
        Node node;
        node["max_connections"] = rhs.max_connections;
        node["retries"] = rhs.retries;
        node["min_sleep_ms"] = rhs.min_sleep.count();
        node["max_sleep_ms"] = rhs.max_sleep.count();
        node["decay_constant"] = rhs.decay_constant;
        return node;
    }

    static bool decode(const Node& node, PacerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_connections = node["max_connections"].as<unsigned int>(8);
        rhs.retries = node["retries"].as<int>(10);
        rhs.min_sleep = std::chrono::milliseconds(node["min_sleep_ms"].as<long>(10));
        rhs.max_sleep = std::chrono::milliseconds(node["max_sleep_ms"].as<long>(2000));
        rhs.decay_constant = node["decay_constant"].as<unsigned int>(2);
        return true;
    }
};

template<>
struct convert<DirCacheConfig> {
    static Node encode(const DirCacheConfig& rhs) {
        Node node;
        node["root"] = rhs.root;
        node["root_id"] = rhs.root_id;
        return node;
    }

    static bool decode(const Node& node, DirCacheConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("");
        rhs.root_id = node["root_id"].as<std::string>("root");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["remotefs"] = to_std_string(spdlog::level::to_string_view(rhs.remotefs));
        node["dircache"] = to_std_string(spdlog::level::to_string_view(rhs.dircache));
        node["pacer"]    = to_std_string(spdlog::level::to_string_view(rhs.pacer));
        node["backend"]  = to_std_string(spdlog::level::to_string_view(rhs.backend));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.remotefs = spdlog::level::from_str(node["remotefs"].as<std::string>("info"));
        rhs.dircache = spdlog::level::from_str(node["dircache"].as<std::string>("warn"));
        rhs.pacer = spdlog::level::from_str(node["pacer"].as<std::string>("warn"));
        rhs.backend = spdlog::level::from_str(node["backend"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(node["subsystem_levels"], rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/remotefs");
        if (node["levels"]) convert<LogLevelsConfig>::decode(node["levels"], rhs.levels);
        return true;
    }
};

} // namespace YAML
