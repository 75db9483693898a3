#pragma once

#include <spdlog/spdlog.h>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <string>

namespace tubeq {

// Helper function to get boolean from environment
inline bool get_env_bool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0;
}

// Helper function to get int from environment
inline int get_env_int(const char* name, int default_value) {
    const char* value = std::getenv(name);
    return value ? std::atoi(value) : default_value;
}

// Helper function to get string from environment
inline std::string get_env_string(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

struct TubeConfig {
    std::size_t max_jobs = 0;              // 0 = unlimited
    std::size_t max_waiters = 10000;       // Blocked reserves per tube
    int default_ttr = 60;                  // Seconds, used when a put carries ttr <= 0
    bool allow_unreserved_delete = false;  // Permit delete of READY/DELAYED jobs

    static TubeConfig from_env() {
        TubeConfig config;
        int max_jobs = get_env_int("TUBE_MAX_JOBS", 0);
        config.max_jobs = max_jobs > 0 ? static_cast<std::size_t>(max_jobs) : 0;
        int max_waiters = get_env_int("TUBE_MAX_WAITERS", 10000);
        config.max_waiters = max_waiters > 0 ? static_cast<std::size_t>(max_waiters) : 10000;
        int default_ttr = get_env_int("TUBE_DEFAULT_TTR", 60);
        config.default_ttr = default_ttr > 0 ? default_ttr : 60;
        config.allow_unreserved_delete = get_env_bool("TUBE_ALLOW_UNRESERVED_DELETE", false);
        return config;
    }
};

struct SweeperConfig {
    bool enabled = true;
    int interval_ms = 1000;

    static SweeperConfig from_env() {
        SweeperConfig config;
        config.enabled = get_env_bool("SWEEP_ENABLED", true);
        config.interval_ms = get_env_int("SWEEP_INTERVAL_MS", 1000);
        return config;
    }
};

struct LoggingConfig {
    std::string log_level = "info";
    std::string log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.log_level = get_env_string("LOG_LEVEL", "info");
        config.log_pattern = get_env_string("LOG_PATTERN", "[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        return config;
    }
};

struct Config {
    TubeConfig tube;
    SweeperConfig sweeper;
    LoggingConfig logging;

    static Config load() {
        Config config;
        config.tube = TubeConfig::from_env();
        config.sweeper = SweeperConfig::from_env();
        config.logging = LoggingConfig::from_env();
        return config;
    }
};

/**
 * Apply logging settings to the default spdlog logger.
 * Unknown level names fall back to info.
 */
inline void configure_logging(const LoggingConfig& config) {
    auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
    spdlog::set_pattern(config.log_pattern);
}

} // namespace tubeq
