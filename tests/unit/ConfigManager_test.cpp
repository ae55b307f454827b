#include <gtest/gtest.h>

#include <cstdlib>

#include "TestUtils.hpp"
#include "application/config/ConfigManager.hpp"

using core::config::ConfigManager;

class ConfigManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("WATCH_DIRECTORY");
        unsetenv("STORE_PATH");
        unsetenv("WATCH_POLL_INTERVAL_MS");
    }

    test_utils::TempDir dir;
    ConfigManager config;
};

TEST_F(ConfigManagerTest, DefaultsAreValid) {
    auto watch = config.getWatchConfig();
    auto ingest = config.getIngestConfig();

    EXPECT_EQ(watch.extension, ".csv");
    EXPECT_EQ(watch.pollIntervalMs, 1000);
    EXPECT_FALSE(watch.processExisting);
    EXPECT_EQ(ingest.defaultPrinter, "Printer_1");
    EXPECT_EQ(ingest.outcomeColumn, "Outcome Message");
    EXPECT_EQ(ingest.legacyOutcomeColumn, "Failure Message");
    EXPECT_EQ(config.getStoreConfig().path, "printer_jobs.db");
    EXPECT_TRUE(config.validate().isValid);
}

TEST_F(ConfigManagerTest, LoadsNestedJsonFile) {
    const auto path = dir.file("config.json");
    test_utils::writeFile(path, R"({
        "watch": {"directory": "/data/exports", "pollIntervalMs": 250, "processExisting": true},
        "ingest": {"defaultPrinter": "Line_A"},
        "store": {"path": "/data/jobs.db"},
        "logging": {"level": "debug", "consoleEnabled": false}
    })");

    config.loadFromFile(path);

    auto watch = config.getWatchConfig();
    EXPECT_EQ(watch.directory, "/data/exports");
    EXPECT_EQ(watch.pollIntervalMs, 250);
    EXPECT_TRUE(watch.processExisting);
    EXPECT_EQ(config.getIngestConfig().defaultPrinter, "Line_A");
    EXPECT_EQ(config.getIngestConfig().passValue, "Pass (Label)");
    EXPECT_EQ(config.getStoreConfig().path, "/data/jobs.db");
    EXPECT_EQ(config.getLoggingConfig().level, "debug");
    EXPECT_FALSE(config.getLoggingConfig().consoleEnabled);
    EXPECT_EQ(config.getConfigPath(), path);
}

TEST_F(ConfigManagerTest, MissingFileKeepsDefaults) {
    config.loadFromFile(dir.file("absent.json"));

    EXPECT_EQ(config.getWatchConfig().pollIntervalMs, 1000);
    EXPECT_TRUE(config.validate().isValid);
}

TEST_F(ConfigManagerTest, MalformedFileFallsBackToDefaults) {
    const auto path = dir.file("config.json");
    test_utils::writeFile(path, R"({"watch": {"directory": "/x",)");

    config.loadFromFile(path);

    EXPECT_EQ(config.getWatchConfig().directory, ".");
}

TEST_F(ConfigManagerTest, NonObjectFileFallsBackToDefaults) {
    const auto path = dir.file("config.json");
    test_utils::writeFile(path, "[1, 2, 3]");

    config.loadFromFile(path);

    EXPECT_EQ(config.getStoreConfig().path, "printer_jobs.db");
}

TEST_F(ConfigManagerTest, EnvironmentOverridesFile) {
    const auto path = dir.file("config.json");
    test_utils::writeFile(path, R"({"watch": {"directory": "/from/file"}, "store": {"path": "file.db"}})");
    setenv("WATCH_DIRECTORY", "/from/env", 1);
    setenv("WATCH_POLL_INTERVAL_MS", "75", 1);

    config.loadFromFile(path);
    config.loadFromEnv();

    EXPECT_EQ(config.getWatchConfig().directory, "/from/env");
    EXPECT_EQ(config.getWatchConfig().pollIntervalMs, 75);
    EXPECT_EQ(config.getStoreConfig().path, "file.db");
}

TEST_F(ConfigManagerTest, ValidateReportsEveryProblem) {
    config.set("watch.pollIntervalMs", "10");
    config.set("watch.extension", "");
    config.set("ingest.defaultPrinter", "");
    config.set("store.path", "");
    config.set("monitor.reportIntervalSec", "0");

    auto validation = config.validate();

    EXPECT_FALSE(validation.isValid);
    EXPECT_EQ(validation.errors.size(), 5u);
}

TEST_F(ConfigManagerTest, BadNumberFallsBackToDefault) {
    config.set("watch.pollIntervalMs", "fast");

    EXPECT_EQ(config.getWatchConfig().pollIntervalMs, 1000);
    EXPECT_FALSE(config.validate().isValid);
}
