#include "podengine/core/Config.hpp"
#include "podengine/core/Utils.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace podengine::core;

namespace fs = std::filesystem;

TEST(ConfigTest, DefaultsFollowXdgDataHome) {
    ::setenv("XDG_DATA_HOME", "/tmp/podengine-xdg", 1);
    Config config = Config::defaults();
    ::unsetenv("XDG_DATA_HOME");

    EXPECT_EQ(config.downloadPath, fs::path("/tmp/podengine-xdg/podengine"));
    EXPECT_EQ(config.databasePath, fs::path("/tmp/podengine-xdg/podengine/podengine.json"));
    EXPECT_EQ(config.simultaneousDownloads, 3u);
    EXPECT_EQ(config.maxRetries, 3u);
    EXPECT_TRUE(config.markAsPlayedOnPlay);
    EXPECT_FALSE(config.enableSync);
}

TEST(ConfigTest, FromJsonOverridesGivenKeys) {
    auto j = nlohmann::json::parse(R"({
        "download_path": "/data/podcasts",
        "simultaneous_downloads": 5,
        "mark_as_played_on_play": false,
        "enable_sync": true,
        "sync_server": "https://gpodder.example",
        "sync_username": "alice",
        "sync_password": "secret",
        "sync_device": "desk",
        "sync_on_start": true
    })");
    Config config = Config::fromJson(j);

    EXPECT_EQ(config.downloadPath, fs::path("/data/podcasts"));
    EXPECT_EQ(config.databasePath, fs::path("/data/podcasts/podengine.json"));
    EXPECT_EQ(config.simultaneousDownloads, 5u);
    EXPECT_EQ(config.maxRetries, 3u);
    EXPECT_FALSE(config.markAsPlayedOnPlay);
    EXPECT_TRUE(config.enableSync);
    EXPECT_EQ(config.syncServer, "https://gpodder.example");
    EXPECT_EQ(config.syncUsername, "alice");
    EXPECT_EQ(config.syncPassword, "secret");
    EXPECT_EQ(config.syncDevice, "desk");
    EXPECT_TRUE(config.syncOnStart);
}

TEST(ConfigTest, ExplicitDatabasePathWins) {
    auto j = nlohmann::json::parse(R"({"download_path": "/data", "database_path": "/db/pods.json"})");
    Config config = Config::fromJson(j);
    EXPECT_EQ(config.databasePath, fs::path("/db/pods.json"));
}

TEST(ConfigTest, InvalidValuesKeepDefaults) {
    auto j = nlohmann::json::parse(R"({
        "simultaneous_downloads": 0,
        "max_retries": "lots",
        "enable_sync": "yes",
        "sync_device": 42
    })");
    Config config = Config::fromJson(j);
    EXPECT_EQ(config.simultaneousDownloads, 3u);
    EXPECT_EQ(config.maxRetries, 3u);
    EXPECT_FALSE(config.enableSync);
    EXPECT_EQ(config.syncDevice, "podengine");
}

TEST(ConfigTest, NonObjectYieldsDefaults) {
    Config config = Config::fromJson(nlohmann::json::array({1, 2}));
    EXPECT_EQ(config.simultaneousDownloads, 3u);
}

TEST(ConfigTest, LoadReadsFileAndToleratesBadOnes) {
    const fs::path dir = fs::temp_directory_path() /
                         ("podengine_config_" + std::to_string(utils::currentTimeMs()));
    fs::create_directories(dir);

    EXPECT_EQ(Config::load(dir / "missing.json").maxRetries, 3u);

    {
        std::ofstream out(dir / "good.json");
        out << R"({"max_retries": 7})";
    }
    EXPECT_EQ(Config::load(dir / "good.json").maxRetries, 7u);

    {
        std::ofstream out(dir / "bad.json");
        out << "{ max_retries: ";
    }
    EXPECT_EQ(Config::load(dir / "bad.json").maxRetries, 3u);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
