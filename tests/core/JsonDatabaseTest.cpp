#include "podengine/core/Errors.hpp"
#include "podengine/core/JsonDatabase.hpp"
#include "podengine/core/Utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace podengine::core;

namespace fs = std::filesystem;

namespace {

EpisodeData episodeData(const std::string& title, const std::string& guid, std::int64_t pubdate) {
    EpisodeData episode;
    episode.title = title;
    episode.url = "https://example.com/" + title + ".mp3";
    episode.guid = guid;
    episode.description = "About " + title;
    episode.pubdate = utils::fromUnixSeconds(pubdate);
    episode.duration = 600;
    return episode;
}

// Newest first, as feeds list them.
PodcastData podcastData(const std::string& title, const std::string& url) {
    PodcastData podcast;
    podcast.title = title;
    podcast.url = url;
    podcast.description = "A show";
    podcast.lastChecked = utils::fromUnixSeconds(1700000000);
    podcast.episodes = {episodeData("three", "g3", 3000), episodeData("two", "g2", 2000),
                        episodeData("one", "g1", 1000)};
    return podcast;
}

class JsonDatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("podengine_db_" + std::to_string(utils::currentTimeMs()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
        file_ = dir_ / "podengine.json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    fs::path file_;
};

} // namespace

TEST_F(JsonDatabaseTest, MissingFileStartsEmpty) {
    JsonDatabase db(file_);
    EXPECT_TRUE(db.getPodcasts().empty());
    EXPECT_TRUE(db.getQueue().empty());
    EXPECT_FALSE(db.getParam("last_sync").has_value());
    EXPECT_FALSE(fs::exists(file_));
}

TEST_F(JsonDatabaseTest, CorruptFileThrows) {
    {
        std::ofstream out(file_);
        out << "{ not json";
    }
    EXPECT_THROW(JsonDatabase db(file_), DatabaseError);
}

TEST_F(JsonDatabaseTest, InsertAssignsOldestEpisodesLowestIds) {
    JsonDatabase db(file_);
    SyncResult result = db.insertPodcast(podcastData("Show", "https://example.com/feed"));

    ASSERT_EQ(result.added.size(), 3u);
    EXPECT_EQ(result.added[0].title, "one");
    EXPECT_EQ(result.added[0].id, 1);
    EXPECT_EQ(result.added[2].title, "three");
    EXPECT_EQ(result.added[2].podTitle, "Show");
    EXPECT_TRUE(result.updated.empty());

    auto podcasts = db.getPodcasts();
    ASSERT_EQ(podcasts.size(), 1u);
    EXPECT_EQ(podcasts[0].episodes->map([](const Episode& e) { return e.title; }),
              (std::vector<std::string>{"three", "two", "one"}));
}

TEST_F(JsonDatabaseTest, DuplicateUrlIsRejected) {
    JsonDatabase db(file_);
    db.insertPodcast(podcastData("Show", "https://example.com/feed"));
    EXPECT_THROW(db.insertPodcast(podcastData("Again", "https://example.com/feed")), DatabaseError);
    EXPECT_EQ(db.getPodcasts().size(), 1u);
}

TEST_F(JsonDatabaseTest, PodcastsAreSortedByTitle) {
    JsonDatabase db(file_);
    db.insertPodcast(podcastData("Zebra", "https://z.example/feed"));
    db.insertPodcast(podcastData("Apple", "https://a.example/feed"));

    auto podcasts = db.getPodcasts();
    ASSERT_EQ(podcasts.size(), 2u);
    EXPECT_EQ(podcasts[0].title, "Apple");
    EXPECT_EQ(podcasts[1].title, "Zebra");
}

TEST_F(JsonDatabaseTest, StatePersistsAcrossInstances) {
    {
        JsonDatabase db(file_);
        db.insertPodcast(podcastData("Show", "https://example.com/feed"));
        db.setPlayedStatus(2, 120, 600, false);
        db.insertFile(1, dir_ / "one.mp3");
        db.setParam("last_sync", "12345");
        db.setQueue({3, 1});
    }

    JsonDatabase reopened(file_);
    auto podcasts = reopened.getPodcasts();
    ASSERT_EQ(podcasts.size(), 1u);
    EXPECT_EQ(podcasts[0].description, std::optional<std::string>("A show"));
    EXPECT_EQ(podcasts[0].episodes->mapSingle(2, [](const Episode& e) { return e.position; }), 120);
    auto path = podcasts[0].episodes->mapSingle(1, [](const Episode& e) { return e.path; });
    ASSERT_TRUE(path.has_value() && path->has_value());
    EXPECT_EQ((*path)->string(), (dir_ / "one.mp3").string());
    EXPECT_EQ(reopened.getParam("last_sync"), std::optional<std::string>("12345"));
    EXPECT_EQ(reopened.getQueue(), (std::vector<std::int64_t>{3, 1}));
    EXPECT_FALSE(fs::exists(fs::path(file_.string() + ".tmp")));
}

TEST_F(JsonDatabaseTest, UpdateMatchesByGuidAndAddsNewEpisodes) {
    JsonDatabase db(file_);
    db.insertPodcast(podcastData("Show", "https://example.com/feed"));
    db.setPlayedStatus(3, 0, 1800, true);

    PodcastData refreshed = podcastData("Show", "https://example.com/feed");
    refreshed.episodes[0].title = "three (fixed)";
    refreshed.episodes[0].duration = 999;
    refreshed.episodes.insert(refreshed.episodes.begin(), episodeData("four", "g4", 4000));

    SyncResult result = db.updatePodcast(1, refreshed);
    ASSERT_EQ(result.added.size(), 1u);
    EXPECT_EQ(result.added[0].title, "four");
    EXPECT_EQ(result.added[0].id, 4);
    EXPECT_EQ(result.updated, std::vector<std::int64_t>{3});

    auto podcasts = db.getPodcasts();
    auto three = podcasts[0].episodes->mapSingle(3, [](const Episode& e) { return e; });
    ASSERT_TRUE(three.has_value());
    EXPECT_EQ(three->title, "three (fixed)");
    EXPECT_EQ(three->duration, 1800);
    EXPECT_TRUE(three->played);
}

TEST_F(JsonDatabaseTest, UpdateWithoutGuidMatchesOnTwoOfThree) {
    PodcastData podcast = podcastData("Show", "https://example.com/feed");
    for (auto& episode : podcast.episodes) {
        episode.guid.clear();
    }
    JsonDatabase db(file_);
    db.insertPodcast(podcast);

    // Same title and pubdate, new url: same episode.
    podcast.episodes[2].url = "https://cdn.example.com/one.mp3";
    SyncResult result = db.updatePodcast(1, podcast);
    EXPECT_TRUE(result.added.empty());
    EXPECT_EQ(result.updated, std::vector<std::int64_t>{1});

    // Only the title agrees: a new episode.
    podcast.episodes[1].url = "https://cdn.example.com/two-b.mp3";
    podcast.episodes[1].pubdate = utils::fromUnixSeconds(2500);
    result = db.updatePodcast(1, podcast);
    EXPECT_EQ(result.added.size(), 1u);
}

TEST_F(JsonDatabaseTest, UnchangedFeedReportsNothing) {
    JsonDatabase db(file_);
    db.insertPodcast(podcastData("Show", "https://example.com/feed"));
    SyncResult result = db.updatePodcast(1, podcastData("Show", "https://example.com/feed"));
    EXPECT_TRUE(result.added.empty());
    EXPECT_TRUE(result.updated.empty());
}

TEST_F(JsonDatabaseTest, RemovePodcastPrunesQueue) {
    JsonDatabase db(file_);
    db.insertPodcast(podcastData("Show", "https://example.com/feed"));
    db.insertPodcast(podcastData("Other", "https://other.example/feed"));
    db.setQueue({2, 5, 1});

    db.removePodcast(1);
    EXPECT_EQ(db.getQueue(), std::vector<std::int64_t>{5});
    EXPECT_EQ(db.getPodcasts().size(), 1u);
    EXPECT_THROW(db.removePodcast(1), DatabaseError);
}

TEST_F(JsonDatabaseTest, BatchIsAllOrNothing) {
    JsonDatabase db(file_);
    db.insertPodcast(podcastData("Show", "https://example.com/feed"));

    std::vector<PlayedStatus> updates{{1, 600, 600, true}, {99, 0, std::nullopt, false}};
    EXPECT_THROW(db.setPlayedStatusBatch(updates), DatabaseError);
    auto podcasts = db.getPodcasts();
    EXPECT_EQ(podcasts[0].episodes->mapSingle(1, [](const Episode& e) { return e.played; }), false);

    db.setPlayedStatusBatch({{1, 600, 600, true}, {2, 0, 600, true}});
    podcasts = db.getPodcasts();
    EXPECT_EQ(podcasts[0].episodes->mapSingle(1, [](const Episode& e) { return e.played; }), true);
    EXPECT_EQ(podcasts[0].episodes->mapSingle(2, [](const Episode& e) { return e.played; }), true);
}

TEST_F(JsonDatabaseTest, FilesCanBeRemovedInBulk) {
    JsonDatabase db(file_);
    db.insertPodcast(podcastData("Show", "https://example.com/feed"));
    db.insertFile(1, dir_ / "one.mp3");
    db.insertFile(2, dir_ / "two.mp3");

    db.removeFiles({1, 2});
    auto podcasts = db.getPodcasts();
    EXPECT_EQ(podcasts[0].episodes->filterMap([](const Catalog<Episode>::Handle& h) {
        return h->read([](const Episode& e) { return e.path; });
    }).size(), 0u);
    EXPECT_THROW(db.removeFile(42), DatabaseError);
}

TEST_F(JsonDatabaseTest, QueueRejectsUnknownEpisodes) {
    JsonDatabase db(file_);
    db.insertPodcast(podcastData("Show", "https://example.com/feed"));
    EXPECT_THROW(db.setQueue({1, 77}), DatabaseError);
    EXPECT_TRUE(db.getQueue().empty());
}
