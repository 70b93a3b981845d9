#include <gtest/gtest.h>
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace streamscribe;
using utils::Config;
using utils::ConfigurationException;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::setLevel(utils::LogLevel::ERROR);
        configPath_ = (std::filesystem::temp_directory_path() / "streamscribe_config_test.json").string();
    }

    void TearDown() override {
        std::remove(configPath_.c_str());
    }

    void writeConfig(const std::string& contents) {
        std::ofstream file(configPath_);
        file << contents;
    }

    std::string configPath_;
};

TEST_F(ConfigTest, DefaultValues) {
    auto config = Config::load("nonexistent.json");
    EXPECT_EQ(config.getLogLevel(), utils::LogLevel::INFO);
    EXPECT_EQ(config.getModelArch(), stt::ModelArch::BASE);
    EXPECT_TRUE(config.getModelPath().empty());
    EXPECT_TRUE(config.getModelOptions().empty());
    EXPECT_DOUBLE_EQ(config.getUpdateInterval(), 0.5);
    EXPECT_EQ(config.getChunkDurationMs(), 100);
    EXPECT_EQ(config.getSampleRate(), 16000);
}

TEST_F(ConfigTest, LoadsAllSections) {
    writeConfig(R"({
        "logLevel": "debug",
        "model": {
            "path": "models/ggml-base.en.bin",
            "arch": "base-streaming",
            "options": { "n_threads": 4, "language": "en", "return_audio_data": true }
        },
        "streaming": { "updateInterval": 0.25, "chunkDurationMs": 50, "sampleRate": 48000 }
    })");

    auto config = Config::load(configPath_);

    EXPECT_EQ(config.getLogLevel(), utils::LogLevel::DEBUG);
    EXPECT_EQ(config.getModelPath(), "models/ggml-base.en.bin");
    EXPECT_EQ(config.getModelArch(), stt::ModelArch::BASE_STREAMING);
    EXPECT_DOUBLE_EQ(config.getUpdateInterval(), 0.25);
    EXPECT_EQ(config.getChunkDurationMs(), 50);
    EXPECT_EQ(config.getSampleRate(), 48000);

    ASSERT_EQ(config.getModelOptions().size(), 3u);
    // nlohmann::json objects iterate in key order.
    EXPECT_EQ(config.getModelOptions()[0].name, "language");
    EXPECT_EQ(config.getModelOptions()[0].value, "en");
    EXPECT_EQ(config.getModelOptions()[1].name, "n_threads");
    EXPECT_EQ(config.getModelOptions()[1].value, "4");
    EXPECT_EQ(config.getModelOptions()[2].value, "true");
}

TEST_F(ConfigTest, PartialDocumentKeepsDefaults) {
    auto config = Config::fromJson(R"({"streaming": {"updateInterval": 1.0}})");
    EXPECT_DOUBLE_EQ(config.getUpdateInterval(), 1.0);
    EXPECT_EQ(config.getChunkDurationMs(), 100);
    EXPECT_EQ(config.getLogLevel(), utils::LogLevel::INFO);
}

TEST_F(ConfigTest, MalformedJsonThrows) {
    writeConfig("{ \"logLevel\": ");
    EXPECT_THROW(Config::load(configPath_), ConfigurationException);
}

TEST_F(ConfigTest, InvalidValuesThrow) {
    EXPECT_THROW(Config::fromJson(R"([1, 2])"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({"logLevel": "loud"})"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({"logLevel": 3})"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({"model": {"arch": "huge"}})"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({"model": {"options": {"n_threads": [1]}}})"),
                 ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({"streaming": {"updateInterval": 0}})"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({"streaming": {"sampleRate": -1}})"), ConfigurationException);
}

TEST_F(ConfigTest, ErrorNamesTheSource) {
    try {
        Config::fromJson(R"({"logLevel": "loud"})", "settings.json");
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getErrorInfo().context, "settings.json");
        EXPECT_NE(std::string(e.what()).find("loud"), std::string::npos);
    }
}

TEST_F(ConfigTest, SetModelOptionReplacesExistingValue) {
    Config config;
    config.setModelOption("language", "en");
    config.setModelOption("language", "de");

    ASSERT_EQ(config.getModelOptions().size(), 1u);
    EXPECT_EQ(config.getModelOptions()[0].value, "de");
}

TEST_F(ConfigTest, ToJsonReadsBack) {
    Config config;
    config.setLogLevel(utils::LogLevel::WARN);
    config.setModelPath("model.bin");
    config.setModelArch(stt::ModelArch::TINY);
    config.setModelOption("n_threads", "2");
    config.setUpdateInterval(0.75);

    Config reloaded = Config::fromJson(config.toJson());

    EXPECT_EQ(reloaded.getLogLevel(), utils::LogLevel::WARN);
    EXPECT_EQ(reloaded.getModelPath(), "model.bin");
    EXPECT_EQ(reloaded.getModelArch(), stt::ModelArch::TINY);
    EXPECT_DOUBLE_EQ(reloaded.getUpdateInterval(), 0.75);
    ASSERT_EQ(reloaded.getModelOptions().size(), 1u);
    EXPECT_EQ(reloaded.getModelOptions()[0].value, "2");
}

TEST(ShippedConfigTest, UsesTheGatewayWindowDefault) {
    auto config = Config::load(std::string(STREAMSCRIBE_SOURCE_DIR) + "/config/streamscribe.json");

    bool found = false;
    for (const auto& option : config.getModelOptions()) {
        if (option.name == "max_window_duration") {
            found = true;
            EXPECT_DOUBLE_EQ(std::stod(option.value), 20.0);
        }
    }
    EXPECT_TRUE(found);
    EXPECT_DOUBLE_EQ(config.getUpdateInterval(), 0.5);
}
