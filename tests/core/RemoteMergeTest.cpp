#include "podengine/core/RemoteMerge.hpp"

#include <gtest/gtest.h>

using namespace podengine::core;

namespace {

LocalPodcastIndex sampleIndex() {
    LocalPodcastIndex index;
    index.byUrl["https://a.example/feed"].podId = 1;
    index.byUrl["https://a.example/feed"].episodesByUrl = {
        {"https://a.example/1.mp3", 11}, {"https://a.example/2.mp3", 12}};
    index.byUrl["https://b.example/feed"].podId = 2;
    index.byUrl["https://b.example/feed"].episodesByUrl = {{"https://b.example/1.mp3", 21}};
    return index;
}

EpisodeAction play(const std::string& podcast, const std::string& episode,
                   std::int64_t timestamp, std::int64_t position, std::int64_t total) {
    EpisodeAction action;
    action.podcast = podcast;
    action.episode = episode;
    action.action = EpisodeAction::Action::Play;
    action.timestamp = timestamp;
    action.started = 0;
    action.position = position;
    action.total = total;
    return action;
}

} // namespace

TEST(RemoteMergeTest, NewUrlsAreDeduplicatedAndKnownOnesSkipped) {
    msg::RemoteSyncResult result;
    result.added = {"https://c.example/feed", "https://a.example/feed", "https://c.example/feed"};

    auto plan = planRemoteMerge(sampleIndex(), result);
    EXPECT_EQ(plan.newPodcastUrls, std::vector<std::string>{"https://c.example/feed"});
    EXPECT_TRUE(plan.removedPodcasts.empty());
}

TEST(RemoteMergeTest, RemovedUrlsMapToLocalIds) {
    msg::RemoteSyncResult result;
    result.removed = {"https://b.example/feed", "https://zzz.example/feed", "https://b.example/feed"};

    auto plan = planRemoteMerge(sampleIndex(), result);
    EXPECT_EQ(plan.removedPodcasts, std::vector<std::int64_t>{2});
}

TEST(RemoteMergeTest, LastReceivedPlayActionWins) {
    msg::RemoteSyncResult result;
    result.actions = {
        play("https://a.example/feed", "https://a.example/1.mp3", 1, 10, 100),
        play("https://a.example/feed", "https://a.example/1.mp3", 2, 50, 100),
    };

    auto plan = planRemoteMerge(sampleIndex(), result);
    ASSERT_EQ(plan.updates.size(), 1u);
    EXPECT_EQ(plan.updates[0].podId, 1);
    EXPECT_EQ(plan.updates[0].epId, 11);
    EXPECT_EQ(plan.updates[0].position, 50);
    EXPECT_EQ(plan.updates[0].total, 100);
}

TEST(RemoteMergeTest, OutOfOrderTimestampsStillKeepLastReceived) {
    msg::RemoteSyncResult result;
    result.actions = {
        play("https://a.example/feed", "https://a.example/2.mp3", 200, 10, 60),
        play("https://a.example/feed", "https://a.example/2.mp3", 100, 20, 60),
    };

    auto plan = planRemoteMerge(sampleIndex(), result);
    ASSERT_EQ(plan.updates.size(), 1u);
    EXPECT_EQ(plan.updates[0].position, 20);
}

TEST(RemoteMergeTest, UpdatesAreOrderedByPodcastThenEpisode) {
    msg::RemoteSyncResult result;
    result.actions = {
        play("https://b.example/feed", "https://b.example/1.mp3", 1, 5, 10),
        play("https://a.example/feed", "https://a.example/2.mp3", 1, 5, 10),
        play("https://a.example/feed", "https://a.example/1.mp3", 1, 5, 10),
    };

    auto plan = planRemoteMerge(sampleIndex(), result);
    ASSERT_EQ(plan.updates.size(), 3u);
    EXPECT_EQ(plan.updates[0].epId, 11);
    EXPECT_EQ(plan.updates[1].epId, 12);
    EXPECT_EQ(plan.updates[2].epId, 21);
}

TEST(RemoteMergeTest, NonPlayAndIncompleteActionsAreIgnored) {
    msg::RemoteSyncResult result;
    auto download = play("https://a.example/feed", "https://a.example/1.mp3", 1, 5, 10);
    download.action = EpisodeAction::Action::Download;
    auto noTotal = play("https://a.example/feed", "https://a.example/1.mp3", 1, 5, 10);
    noTotal.total.reset();
    result.actions = {download, noTotal};

    auto plan = planRemoteMerge(sampleIndex(), result);
    EXPECT_TRUE(plan.updates.empty());
    EXPECT_EQ(plan.unmapped, 0u);
}

TEST(RemoteMergeTest, UnknownPodcastOrEpisodeIsCounted) {
    msg::RemoteSyncResult result;
    result.actions = {
        play("https://nope.example/feed", "https://nope.example/1.mp3", 1, 5, 10),
        play("https://a.example/feed", "https://a.example/404.mp3", 1, 5, 10),
        play("https://a.example/feed", "https://a.example/1.mp3", 1, 5, 10),
    };

    auto plan = planRemoteMerge(sampleIndex(), result);
    EXPECT_EQ(plan.unmapped, 2u);
    EXPECT_EQ(plan.updates.size(), 1u);
}
