#include "Config/AppConfig.hpp"
#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace chunkscribe;

TEST(AppConfigTest, Defaults) {
    AppConfig config;
    EXPECT_EQ(config.endpoint.url, "http://localhost:8000/apz/transcribe");
    EXPECT_EQ(config.endpoint.timeoutMs, 30000u);
    EXPECT_EQ(config.capture.sampleRate, 44100u);
    EXPECT_EQ(config.capture.channels, 1u);
    EXPECT_EQ(config.capture.segmentIntervalMs, 10000u);
    EXPECT_EQ(config.capture.segmentFormat, "wav");
    EXPECT_EQ(config.dispatch.debounceMs, 500u);
    EXPECT_NO_THROW(config.Validate());
}

TEST(AppConfigTest, ParsesAllSections) {
    const AppConfig config = AppConfig::Parse(R"({
        "endpoint": {"url": "http://10.0.0.5:9000/stt", "timeout_ms": 5000},
        "capture": {"device_id": 3, "sample_rate": 48000, "channels": 2,
                    "segment_interval_ms": 2500, "segment_format": "flac"},
        "dispatch": {"debounce_ms": 0}
    })");

    EXPECT_EQ(config.endpoint.url, "http://10.0.0.5:9000/stt");
    EXPECT_EQ(config.endpoint.timeoutMs, 5000u);
    EXPECT_EQ(config.capture.deviceId, 3u);
    EXPECT_EQ(config.capture.sampleRate, 48000u);
    EXPECT_EQ(config.capture.channels, 2u);
    EXPECT_EQ(config.capture.segmentIntervalMs, 2500u);
    EXPECT_EQ(config.capture.segmentFormat, "flac");
    EXPECT_EQ(config.dispatch.debounceMs, 0u);
}

TEST(AppConfigTest, MissingKeysKeepDefaults) {
    const AppConfig config = AppConfig::Parse(R"({"capture": {"segment_interval_ms": 4000}})");
    EXPECT_EQ(config.capture.segmentIntervalMs, 4000u);
    EXPECT_EQ(config.capture.sampleRate, 44100u);
    EXPECT_EQ(config.endpoint.url, "http://localhost:8000/apz/transcribe");

    EXPECT_NO_THROW(AppConfig::Parse("{}"));
}

TEST(AppConfigTest, RejectsWrongTypes) {
    EXPECT_THROW(AppConfig::Parse(R"({"capture": {"sample_rate": "fast"}})"), ConfigError);
    EXPECT_THROW(AppConfig::Parse(R"({"capture": {"channels": -1}})"), ConfigError);
    EXPECT_THROW(AppConfig::Parse(R"({"endpoint": {"url": 42}})"), ConfigError);
    EXPECT_THROW(AppConfig::Parse(R"({"dispatch": 500})"), ConfigError);
    EXPECT_THROW(AppConfig::Parse("[]"), ConfigError);
    EXPECT_THROW(AppConfig::Parse("{ not json"), ConfigError);
}

TEST(AppConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(AppConfig::Parse(R"({"endpoint": {"url": "https://secure/"}})"), ConfigError);
    EXPECT_THROW(AppConfig::Parse(R"({"endpoint": {"timeout_ms": 0}})"), ConfigError);
    EXPECT_THROW(AppConfig::Parse(R"({"capture": {"segment_format": "mp3"}})"), ConfigError);
    EXPECT_THROW(AppConfig::Parse(R"({"capture": {"segment_interval_ms": 0}})"), ConfigError);
    EXPECT_THROW(AppConfig::Parse(R"({"capture": {"sample_rate": 0}})"), ConfigError);
}

TEST(AppConfigTest, RejectsValuesAboveFieldRange) {
    // 2^32 + 1000 не должно превратиться в 1000
    EXPECT_THROW(AppConfig::Parse(R"({"capture": {"segment_interval_ms": 4294968296}})"), ConfigError);
    EXPECT_THROW(AppConfig::Parse(R"({"endpoint": {"timeout_ms": 18446744073709551615}})"), ConfigError);

    const AppConfig config = AppConfig::Parse(R"({"capture": {"segment_interval_ms": 4294967295}})");
    EXPECT_EQ(config.capture.segmentIntervalMs, 4294967295u);
}

TEST(AppConfigTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "chunkscribe_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"dispatch": {"debounce_ms": 250}})";
    }

    const AppConfig config = AppConfig::Load(path);
    EXPECT_EQ(config.dispatch.debounceMs, 250u);

    EXPECT_THROW(AppConfig::Load(path + ".missing"), ConfigError);
}

TEST(CommandLineTest, ParsesOptions) {
    const CommandLine commandLine = CommandLine::Parse(
        {"--config", "app.json", "--endpoint", "http://host:1234/x", "--file", "speech.flac"});

    EXPECT_EQ(commandLine.configPath, "app.json");
    EXPECT_EQ(commandLine.endpointUrl, "http://host:1234/x");
    EXPECT_EQ(commandLine.inputFile, "speech.flac");
    EXPECT_FALSE(commandLine.showHelp);
}

TEST(CommandLineTest, EmptyAndHelp) {
    EXPECT_TRUE(CommandLine::Parse({}).configPath.empty());
    EXPECT_TRUE(CommandLine::Parse({"--help"}).showHelp);
    EXPECT_TRUE(CommandLine::Parse({"-h"}).showHelp);
}

TEST(CommandLineTest, RejectsBadArguments) {
    EXPECT_THROW(CommandLine::Parse({"--verbose"}), ConfigError);
    EXPECT_THROW(CommandLine::Parse({"--endpoint"}), ConfigError);
}
