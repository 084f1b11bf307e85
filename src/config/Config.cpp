#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace rfs::config {

namespace {

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;

    if (auto node = root["pacer"]) YAML::convert<PacerConfig>::decode(node, cfg.pacer);
    if (auto node = root["dircache"]) YAML::convert<DirCacheConfig>::decode(node, cfg.dircache);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

spdlog::level::level_enum levelFrom(const nlohmann::json& j, const char* key, const spdlog::level::level_enum def) {
    if (!j.contains(key)) return def;
    return spdlog::level::from_str(j.at(key).get<std::string>());
}

}

Config loadConfig(const std::filesystem::path& path) {
    return fromRoot(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"pacer", c.pacer},
        {"dircache", c.dircache},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("pacer")) j.at("pacer").get_to(c.pacer);
    if (j.contains("dircache")) j.at("dircache").get_to(c.dircache);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const PacerConfig& c) {
    j = {
        {"max_connections", c.max_connections},
        {"retries", c.retries},
        {"min_sleep_ms", c.min_sleep.count()},
        {"max_sleep_ms", c.max_sleep.count()},
        {"decay_constant", c.decay_constant}
    };
}

void from_json(const nlohmann::json& j, PacerConfig& c) {
    c.max_connections = j.value("max_connections", 8u);
    c.retries = j.value("retries", 10);
    c.min_sleep = std::chrono::milliseconds(j.value("min_sleep_ms", 10L));
    c.max_sleep = std::chrono::milliseconds(j.value("max_sleep_ms", 2000L));
    c.decay_constant = j.value("decay_constant", 2u);
}

void to_json(nlohmann::json& j, const DirCacheConfig& c) {
    j = {
        {"root", c.root},
        {"root_id", c.root_id}
    };
}

void from_json(const nlohmann::json& j, DirCacheConfig& c) {
    c.root = j.value("root", "");
    c.root_id = j.value("root_id", "root");
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"remotefs", levelName(c.remotefs)},
        {"dircache", levelName(c.dircache)},
        {"pacer", levelName(c.pacer)},
        {"backend", levelName(c.backend)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.remotefs = levelFrom(j, "remotefs", spdlog::level::info);
    c.dircache = levelFrom(j, "dircache", spdlog::level::warn);
    c.pacer = levelFrom(j, "pacer", spdlog::level::warn);
    c.backend = levelFrom(j, "backend", spdlog::level::warn);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = levelFrom(j, "console_log_level", spdlog::level::info);
    c.file_log_level = levelFrom(j, "file_log_level", spdlog::level::warn);
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", "/var/log/remotefs");
    if (j.contains("levels")) j.at("levels").get_to(c.levels);
}

} // namespace rfs::config
