#include "podengine/core/Player.hpp"
#include "core/Fakes.hpp"

#include <gtest/gtest.h>

using namespace podengine::core;
using podengine::testing::FakeAudioBackend;
using podengine::testing::waitFor;

namespace {

Player::Options fastOptions() {
    Player::Options options;
    options.tick = std::chrono::milliseconds(5);
    options.sampleInterval = std::chrono::milliseconds(5);
    options.fadeSteps = 2;
    options.fadeStepDelay = std::chrono::milliseconds(1);
    return options;
}

class PlayerTest : public ::testing::Test {
protected:
    PlayerTest()
        : state_(std::make_shared<FakeAudioBackend::State>()),
          player_(std::make_unique<FakeAudioBackend>(state_), fastOptions()) {}

    void setLengthMs(std::int64_t length) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->lengthMs = length;
    }

    void setExhausted() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->exhausted = true;
    }

    std::vector<std::int64_t> seeks() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->seeks;
    }

    std::vector<std::string> opened() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->opened;
    }

    void startPlaying() {
        setLengthMs(100000);
        player_.commands()->send(player::PlayFile{"/tmp/episode.mp3", std::nullopt});
        ASSERT_TRUE(waitFor([this] { return player_.status() == PlayerStatus::Playing; }));
    }

    std::shared_ptr<FakeAudioBackend::State> state_;
    Player player_;
};

} // namespace

TEST_F(PlayerTest, InitialState) {
    EXPECT_EQ(player_.status(), PlayerStatus::Ready);
    EXPECT_EQ(player_.elapsed(), 0);
    EXPECT_FALSE(player_.duration().has_value());
}

TEST_F(PlayerTest, PlayFileUsesKnownDurationWhenBackendHasNone) {
    player_.commands()->send(player::PlayFile{"/tmp/episode.mp3", 321});
    ASSERT_TRUE(waitFor([this] { return player_.status() == PlayerStatus::Playing; }));
    EXPECT_EQ(player_.duration(), 321);
    EXPECT_EQ(opened(), std::vector<std::string>{"/tmp/episode.mp3"});
}

TEST_F(PlayerTest, PlayUrlWhilePlayingReplacesStream) {
    startPlaying();
    player_.commands()->send(player::PlayUrl{"https://example.com/next.mp3", std::nullopt});
    ASSERT_TRUE(waitFor([this] { return opened().size() == 2; }));
    EXPECT_EQ(opened().back(), "https://example.com/next.mp3");
    EXPECT_TRUE(waitFor([this] { return player_.status() == PlayerStatus::Playing; }));
}

TEST_F(PlayerTest, PlayPauseToggles) {
    startPlaying();
    player_.commands()->send(player::PlayPause{});
    ASSERT_TRUE(waitFor([this] { return player_.status() == PlayerStatus::Paused; }));
    player_.commands()->send(player::PlayPause{});
    EXPECT_TRUE(waitFor([this] { return player_.status() == PlayerStatus::Playing; }));
}

TEST_F(PlayerTest, PlayPauseIsIgnoredWhenReady) {
    player_.commands()->send(player::PlayPause{});
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(player_.status(), PlayerStatus::Ready);
}

TEST_F(PlayerTest, SeekClampsToStreamBounds) {
    startPlaying();
    player_.commands()->send(player::Seek{500, SeekDirection::Forward});
    ASSERT_TRUE(waitFor([this] { return seeks().size() == 1; }));
    EXPECT_EQ(seeks().front(), 100000);
    ASSERT_TRUE(waitFor([this] { return player_.elapsed() == 100; }));

    player_.commands()->send(player::Seek{1000, SeekDirection::Backward});
    ASSERT_TRUE(waitFor([this] { return seeks().size() == 2; }));
    EXPECT_EQ(seeks().back(), 0);
    EXPECT_TRUE(waitFor([this] { return player_.elapsed() == 0; }));
}

TEST_F(PlayerTest, SeekIsIgnoredWhenReady) {
    player_.commands()->send(player::Seek{10, SeekDirection::Forward});
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(seeks().empty());
    EXPECT_EQ(player_.elapsed(), 0);
}

TEST_F(PlayerTest, SeekWhilePlayingRestoresVolume) {
    startPlaying();
    player_.commands()->send(player::Seek{10, SeekDirection::Forward});
    ASSERT_TRUE(waitFor([this] { return seeks().size() == 1; }));
    EXPECT_TRUE(waitFor([this] {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->volume == 100 && state_->playing;
    }));
}

TEST_F(PlayerTest, EndOfStreamFinishesAtDuration) {
    startPlaying();
    setExhausted();
    ASSERT_TRUE(waitFor([this] { return player_.status() == PlayerStatus::Finished; }));
    EXPECT_EQ(player_.elapsed(), 100);

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(player_.status(), PlayerStatus::Finished);
}

TEST_F(PlayerTest, SeekBackFromFinishedResumesPlayback) {
    startPlaying();
    setExhausted();
    ASSERT_TRUE(waitFor([this] { return player_.status() == PlayerStatus::Finished; }));

    player_.commands()->send(player::Seek{30, SeekDirection::Backward});
    ASSERT_TRUE(waitFor([this] { return player_.status() == PlayerStatus::Playing; }));
    EXPECT_EQ(seeks().back(), 70000);
}

TEST_F(PlayerTest, FailedOpenLeavesPlayerReady) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->failOpen = true;
    }
    player_.commands()->send(player::PlayUrl{"https://example.com/broken.mp3", 60});
    ASSERT_TRUE(waitFor([this] { return opened().size() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(player_.status(), PlayerStatus::Ready);
}

TEST_F(PlayerTest, StopJoinsThread) {
    startPlaying();
    player_.stop();
    EXPECT_TRUE(player_.commands()->closed());
}
