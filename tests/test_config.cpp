#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include "keyprobe/config.hpp"

using namespace keyprobe;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear_env();
        temp_config_path_ = (std::filesystem::temp_directory_path() / "keyprobe_test_config.yaml").string();
    }

    void TearDown() override {
        clear_env();
        if (std::filesystem::exists(temp_config_path_)) {
            std::filesystem::remove(temp_config_path_);
        }
    }

    static void clear_env() {
        unsetenv("KEYPROBE_SERVICE_URL");
        unsetenv("KEYPROBE_LOG_LEVEL");
        unsetenv("KEYPROBE_LOG_FILE");
    }

    void write_config(const std::string& content) {
        std::ofstream config_file(temp_config_path_);
        config_file << content;
    }

    std::string temp_config_path_;
};

TEST_F(ConfigTest, LoadValidConfig) {
    write_config(R"(
service:
  url: "http://127.0.0.1:9090/submit/checksum"

failed_log: "retry.txt"

logging:
  level: "debug"
  file: "test.log"
)");

    Config config = load_config(temp_config_path_);

    EXPECT_EQ(config.service.url, "http://127.0.0.1:9090/submit/checksum");
    EXPECT_EQ(config.failed_log, "retry.txt");
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.file, "test.log");
}

TEST_F(ConfigTest, PartialConfigKeepsDefaults) {
    write_config("logging:\n  level: warn\n");

    Config config = load_config(temp_config_path_);

    EXPECT_EQ(config.logging.level, "warn");
    EXPECT_EQ(config.logging.file, "keyprobe.log");
    EXPECT_EQ(config.service.url, DEFAULT_SERVICE_URL);
    EXPECT_EQ(config.failed_log, DEFAULT_FAILED_LOG);
}

TEST_F(ConfigTest, LoadNonExistentConfig) {
    Config config = load_config("nonexistent.yaml");

    EXPECT_EQ(config.service.url, DEFAULT_SERVICE_URL);
    EXPECT_EQ(config.failed_log, "failed.txt");
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, LoadEmptyConfigPath) {
    Config config = load_config("");

    EXPECT_EQ(config.service.url, DEFAULT_SERVICE_URL);
}

TEST_F(ConfigTest, MalformedConfigFallsBackToDefaults) {
    write_config("service: [unclosed\n  url: :::\n");

    Config config = load_config(temp_config_path_);

    EXPECT_EQ(config.service.url, DEFAULT_SERVICE_URL);
    EXPECT_EQ(config.failed_log, DEFAULT_FAILED_LOG);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    write_config("service:\n  url: \"http://from-file/\"\nlogging:\n  level: debug\n");
    setenv("KEYPROBE_SERVICE_URL", "http://from-env/lookup", 1);
    setenv("KEYPROBE_LOG_FILE", "env.log", 1);

    Config config = load_config(temp_config_path_);

    EXPECT_EQ(config.service.url, "http://from-env/lookup");
    EXPECT_EQ(config.logging.file, "env.log");
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, EmptyEnvironmentValueIsIgnored) {
    setenv("KEYPROBE_LOG_LEVEL", "", 1);

    Config config = load_config("");

    EXPECT_EQ(config.logging.level, "info");
}
