#include "keyprobe/config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace keyprobe {

namespace {

void set_if_env(std::string& target, const char* env_var) {
    const char* env_value = std::getenv(env_var);
    if (env_value && *env_value) {
        target = env_value;
    }
}

} // namespace

Config default_config() {
    Config config;
    config.service.url = DEFAULT_SERVICE_URL;
    config.logging.level = "info";
    config.logging.file = "keyprobe.log";
    config.failed_log = DEFAULT_FAILED_LOG;
    return config;
}

void apply_env_overrides(Config& config) {
    set_if_env(config.service.url, "KEYPROBE_SERVICE_URL");
    set_if_env(config.logging.level, "KEYPROBE_LOG_LEVEL");
    set_if_env(config.logging.file, "KEYPROBE_LOG_FILE");
}

Config load_config(const std::string& config_file) {
    Config config = default_config();

    if (!config_file.empty() && std::filesystem::exists(config_file)) {
        try {
            YAML::Node yaml = YAML::LoadFile(config_file);

            if (yaml["service"]) {
                const auto& service = yaml["service"];
                if (service["url"]) config.service.url = service["url"].as<std::string>();
            }

            if (yaml["logging"]) {
                const auto& log = yaml["logging"];
                if (log["level"]) config.logging.level = log["level"].as<std::string>();
                if (log["file"]) config.logging.file = log["file"].as<std::string>();
            }

            if (yaml["failed_log"]) config.failed_log = yaml["failed_log"].as<std::string>();
        } catch (const YAML::Exception& e) {
            std::cerr << "Error loading configuration from " << config_file << ": " << e.what()
                      << " (using defaults)" << std::endl;
            config = default_config();
        }
    }

    apply_env_overrides(config);
    return config;
}

} // namespace keyprobe
