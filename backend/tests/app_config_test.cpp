#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "config/app_config.h"

using json = nlohmann::json;
namespace fs = std::filesystem;

TEST(AppConfigTest, DefaultsWhenEmpty) {
    AppConfig config = config_from_json(json::object());
    EXPECT_EQ(config.bind_address, "0.0.0.0");
    EXPECT_EQ(config.port, 3001);
    EXPECT_EQ(config.threads, 1u);
    EXPECT_EQ(config.static_dir, "dist");
    EXPECT_EQ(config.max_body_bytes, 100u * 1024u);
    EXPECT_EQ(config.log_level, spdlog::level::info);
}

TEST(AppConfigTest, ReadsEveryKey) {
    auto root = json::parse(R"({
        "server": {
            "bind_address": "127.0.0.1",
            "port": 8080,
            "threads": 4,
            "static_dir": "public",
            "max_body_bytes": 2048
        },
        "log_level": "debug"
    })");
    AppConfig config = config_from_json(root);
    EXPECT_EQ(config.bind_address, "127.0.0.1");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.threads, 4u);
    EXPECT_EQ(config.static_dir, "public");
    EXPECT_EQ(config.max_body_bytes, 2048u);
    EXPECT_EQ(config.log_level, spdlog::level::debug);
}

TEST(AppConfigTest, RejectsBadValues) {
    EXPECT_THROW(config_from_json(json::array()), std::runtime_error);
    EXPECT_THROW(config_from_json(json::parse(R"({"server": 1})")), std::runtime_error);
    EXPECT_THROW(config_from_json(json::parse(R"({"server": {"port": "3001"}})")), std::runtime_error);
    EXPECT_THROW(config_from_json(json::parse(R"({"server": {"port": 70000}})")), std::runtime_error);
    EXPECT_THROW(config_from_json(json::parse(R"({"server": {"port": 0}})")), std::runtime_error);
    EXPECT_THROW(config_from_json(json::parse(R"({"server": {"threads": 0}})")), std::runtime_error);
    EXPECT_THROW(config_from_json(json::parse(R"({"server": {"static_dir": 5}})")), std::runtime_error);
    EXPECT_THROW(config_from_json(json::parse(R"({"log_level": "loud"})")), std::runtime_error);
}

TEST(AppConfigTest, LogLevelOffIsAccepted) {
    AppConfig config = config_from_json(json::parse(R"({"log_level": "off"})"));
    EXPECT_EQ(config.log_level, spdlog::level::off);
}

TEST(AppConfigTest, PortEnvironmentOverridesConfig) {
    AppConfig config;
    config.port = 8080;
    apply_env_overrides(config, "4000");
    EXPECT_EQ(config.port, 4000);
}

TEST(AppConfigTest, UnsetOrEmptyPortEnvironmentKeepsConfig) {
    AppConfig config;
    apply_env_overrides(config, nullptr);
    EXPECT_EQ(config.port, 3001);
    apply_env_overrides(config, "");
    EXPECT_EQ(config.port, 3001);
}

TEST(AppConfigTest, InvalidPortEnvironmentThrows) {
    AppConfig config;
    EXPECT_THROW(apply_env_overrides(config, "http"), std::runtime_error);
    EXPECT_THROW(apply_env_overrides(config, "65536"), std::runtime_error);
    EXPECT_THROW(apply_env_overrides(config, "0"), std::runtime_error);
    EXPECT_THROW(apply_env_overrides(config, "80 "), std::runtime_error);
}

class AppConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = fs::temp_directory_path() / ("phonebook-config-" + std::to_string(stamp));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    fs::path dir_;
};

TEST_F(AppConfigFileTest, LoadsFromFile) {
    auto path = write("config.json", R"({"server": {"port": 5000}})");
    EXPECT_EQ(load_config(path, true).port, 5000);
}

TEST_F(AppConfigFileTest, MissingOptionalFileGivesDefaults) {
    AppConfig config = load_config((dir_ / "absent.json").string(), false);
    EXPECT_EQ(config.port, 3001);
}

TEST_F(AppConfigFileTest, MissingRequiredFileThrows) {
    EXPECT_THROW(load_config((dir_ / "absent.json").string(), true), std::runtime_error);
}

TEST_F(AppConfigFileTest, InvalidJsonThrows) {
    auto path = write("broken.json", "{ not json");
    EXPECT_THROW(load_config(path, false), std::runtime_error);
}
