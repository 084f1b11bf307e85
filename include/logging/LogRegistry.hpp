#pragma once

#include <array>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <spdlog/spdlog.h>

namespace rfs::logging {

/// Owns the remotefs subsystem loggers. All of them write to the console
/// and to a rotating remotefs.log under the configured log directory.
class LogRegistry {
public:
    static constexpr std::array<std::string_view, 4> SUBSYSTEMS{"remotefs", "dircache", "pacer", "backend"};

    // Levels come from ConfigRegistry, which must be initialised first.
    static void init(const std::filesystem::path& logDir);

    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    static std::shared_ptr<spdlog::logger> remotefs() { return get("remotefs"); }
    static std::shared_ptr<spdlog::logger> dircache() { return get("dircache"); }
    static std::shared_ptr<spdlog::logger> pacer()    { return get("pacer"); }
    static std::shared_ptr<spdlog::logger> backend()  { return get("backend"); }

    [[nodiscard]] static bool isInitialized();
    [[nodiscard]] static std::filesystem::path logFile();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr size_t MAX_LOG_BYTES = 10 * 1024 * 1024;
    static constexpr size_t MAX_LOG_FILES = 5;

    static inline bool initialized_ = false;
    static inline std::filesystem::path log_file_;
    static inline std::vector<spdlog::sink_ptr> sinks_;
};

}
