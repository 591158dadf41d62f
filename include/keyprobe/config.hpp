#ifndef KEYPROBE_CONFIG_HPP
#define KEYPROBE_CONFIG_HPP

#include <string>

namespace keyprobe {

constexpr const char* DEFAULT_SERVICE_URL = "https://100x-server-production.up.railway.app/submit/checksum";
constexpr const char* DEFAULT_FAILED_LOG = "failed.txt";

struct ServiceConfig {
    std::string url;
};

struct LoggingConfig {
    std::string level;
    std::string file;
};

struct Config {
    ServiceConfig service;
    LoggingConfig logging;
    // File name of the failure log, created beside the checksum report
    std::string failed_log;
};

Config default_config();

// Load configuration from a YAML file, then apply KEYPROBE_* environment
// overrides. A missing file yields defaults; an unreadable one yields
// defaults with a warning on stderr.
Config load_config(const std::string& config_file = "config.yaml");

// Overrides from KEYPROBE_SERVICE_URL, KEYPROBE_LOG_LEVEL, KEYPROBE_LOG_FILE
void apply_env_overrides(Config& config);

} // namespace keyprobe

#endif // KEYPROBE_CONFIG_HPP
