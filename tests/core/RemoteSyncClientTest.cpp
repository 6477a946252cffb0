#include "podengine/core/Errors.hpp"
#include "podengine/core/RemoteSync.hpp"
#include "core/Fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace podengine::core;
using podengine::testing::FakeHttpClient;
using podengine::testing::errorResponse;
using podengine::testing::okResponse;
using podengine::testing::transportError;

namespace {

const std::string kServer = "https://sync.example";
const std::string kAuth = kServer + "/api/2/auth/alice.json";
const std::string kDevices = kServer + "/api/2/devices/alice.json";
const std::string kRegister = kServer + "/api/2/devices/alice/laptop.json";
const std::string kAllSubscriptions = kServer + "/subscriptions/alice.json";
const std::string kSubscriptionChanges = kServer + "/api/2/subscriptions/alice/laptop.json";
const std::string kEpisodes = kServer + "/api/2/episodes/alice.json";
const std::string kUploadActions = kServer + "/api/2/episodes/alice/laptop.json";

class RemoteSyncClientTest : public ::testing::Test {
protected:
    RemoteSyncClientTest() : http_(std::make_shared<FakeHttpClient>()) {
        http_->respond(kAuth, okResponse(""));
        http_->respond(kDevices,
                       okResponse(R"([{"id":"laptop","caption":"","type":"laptop","subscriptions":2}])"));
    }

    RemoteSyncClient makeClient(std::int64_t timestamp = 0) {
        RemoteSyncConfig config;
        config.server = kServer;
        config.username = "alice";
        config.password = "secret";
        config.device = "laptop";
        config.maxRetries = 2;
        return RemoteSyncClient(config, http_, timestamp);
    }

    std::shared_ptr<FakeHttpClient> http_;
};

} // namespace

TEST_F(RemoteSyncClientTest, FirstSyncFetchesFullListAndKeepsCursor) {
    http_->respond(kAllSubscriptions,
                   okResponse(R"(["https://a.example/feed", "https://b.example/feed"])"));
    auto client = makeClient();

    auto changes = client.getSubscriptionChanges();
    EXPECT_EQ(changes.first,
              (std::vector<std::string>{"https://a.example/feed", "https://b.example/feed"}));
    EXPECT_TRUE(changes.second.empty());
    EXPECT_EQ(client.subscriptionsCursor(), 0);
    EXPECT_TRUE(client.loggedIn());
    EXPECT_EQ(http_->count("GET", kSubscriptionChanges), 0u);
}

TEST_F(RemoteSyncClientTest, SecondPassAfterFullListRequestsDeltaSinceZero) {
    http_->respond(kAllSubscriptions, okResponse(R"(["https://a.example/feed"])"));
    http_->respond(kSubscriptionChanges,
                   okResponse(R"({"add":["https://a.example/feed"],"remove":[],"timestamp":300})"));
    http_->respond(kSubscriptionChanges,
                   okResponse(R"({"add":[],"remove":["https://a.example/feed"],"timestamp":400})"));
    auto client = makeClient();

    client.getSubscriptionChanges();
    EXPECT_EQ(client.subscriptionsCursor(), 0);

    auto changes = client.getSubscriptionChanges();
    EXPECT_EQ(changes.first, std::vector<std::string>{"https://a.example/feed"});
    EXPECT_EQ(http_->count("GET", kAllSubscriptions), 1u);
    ASSERT_EQ(http_->count("GET", kSubscriptionChanges), 1u);
    EXPECT_EQ(client.subscriptionsCursor(), 301);
    for (const auto& request : http_->requests()) {
        if (request.url == kSubscriptionChanges) {
            EXPECT_EQ(request.params.at("since"), "0");
        }
    }

    changes = client.getSubscriptionChanges();
    EXPECT_EQ(changes.second, std::vector<std::string>{"https://a.example/feed"});
    EXPECT_EQ(client.subscriptionsCursor(), 401);
}

TEST_F(RemoteSyncClientTest, LoginHappensOnceAndKnownDeviceIsNotRegistered) {
    http_->respond(kAllSubscriptions, okResponse("[]"));
    http_->respond(kSubscriptionChanges,
                   okResponse(R"({"add":[],"remove":[],"timestamp":10})"));
    auto client = makeClient();

    client.getSubscriptionChanges();
    client.getSubscriptionChanges();
    EXPECT_EQ(http_->count("POST", kAuth), 1u);
    EXPECT_EQ(http_->count("GET", kDevices), 1u);
    EXPECT_EQ(http_->count("POST", kRegister), 0u);
}

TEST_F(RemoteSyncClientTest, UnknownDeviceIsRegistered) {
    auto http = std::make_shared<FakeHttpClient>();
    http->respond(kAuth, okResponse(""));
    http->respond(kDevices, okResponse(R"([{"id":"phone"}])"));
    http->respond(kRegister, okResponse(""));
    http->respond(kAllSubscriptions, okResponse("[]"));
    http_ = http;

    auto client = makeClient();
    client.getSubscriptionChanges();
    ASSERT_EQ(http_->count("POST", kRegister), 1u);
    for (const auto& request : http_->requests()) {
        if (request.url == kRegister) {
            EXPECT_EQ(nlohmann::json::parse(request.body).at("type"), "laptop");
        }
    }
}

TEST_F(RemoteSyncClientTest, IncrementalChangesAdvanceCursorPastTimestamp) {
    http_->respond(kSubscriptionChanges,
                   okResponse(R"({"add":["https://c.example/feed"],"remove":["https://a.example/feed"],"timestamp":500})"));
    auto client = makeClient(100);

    auto changes = client.getSubscriptionChanges();
    EXPECT_EQ(changes.first, std::vector<std::string>{"https://c.example/feed"});
    EXPECT_EQ(changes.second, std::vector<std::string>{"https://a.example/feed"});
    EXPECT_EQ(client.subscriptionsCursor(), 501);
    EXPECT_EQ(client.actionsCursor(), 100);
    EXPECT_EQ(client.timestamp(), 100);

    auto requests = http_->requests();
    auto it = std::find_if(requests.begin(), requests.end(), [](const FakeHttpClient::Request& r) {
        return r.url == kSubscriptionChanges;
    });
    ASSERT_NE(it, requests.end());
    EXPECT_EQ(it->params.at("since"), "100");
}

TEST_F(RemoteSyncClientTest, EpisodeActionsAreParsed) {
    http_->respond(kEpisodes, okResponse(R"({
        "actions": [
            {"podcast":"https://a.example/feed","episode":"https://a.example/1.mp3",
             "action":"play","timestamp":"2024-01-05T10:20:30Z","started":0,"position":120,"total":600},
            {"podcast":"https://a.example/feed","episode":"https://a.example/2.mp3",
             "action":"DOWNLOAD","timestamp":"2024-01-05T10:20:30"},
            {"podcast":"https://a.example/feed","episode":"https://a.example/3.mp3",
             "action":"flag","timestamp":"2024-01-05T10:20:30Z"}
        ],
        "timestamp": 900
    })"));
    auto client = makeClient(10);

    auto actions = client.getEpisodeActionChanges();
    ASSERT_EQ(actions.size(), 2u);
    EXPECT_EQ(actions[0].action, EpisodeAction::Action::Play);
    EXPECT_EQ(actions[0].timestamp, 1704450030);
    EXPECT_EQ(actions[0].position, 120);
    EXPECT_EQ(actions[0].total, 600);
    EXPECT_EQ(actions[1].action, EpisodeAction::Action::Download);
    EXPECT_FALSE(actions[1].position.has_value());
    EXPECT_EQ(client.actionsCursor(), 901);
    EXPECT_EQ(client.subscriptionsCursor(), 10);
}

TEST_F(RemoteSyncClientTest, ActionsWithoutTimestampFail) {
    http_->respond(kEpisodes, okResponse(R"({"actions":[]})"));
    auto client = makeClient(10);
    EXPECT_THROW(client.getEpisodeActionChanges(), RemoteSyncError);
    EXPECT_EQ(client.actionsCursor(), 10);
}

TEST_F(RemoteSyncClientTest, FailedCallsRetryThenThrowWithoutMovingCursor) {
    http_->respond(kSubscriptionChanges, errorResponse(502));
    auto client = makeClient(100);

    EXPECT_THROW(client.getSubscriptionChanges(), RemoteSyncError);
    EXPECT_EQ(http_->count("GET", kSubscriptionChanges), 2u);
    EXPECT_EQ(client.subscriptionsCursor(), 100);
}

TEST_F(RemoteSyncClientTest, TransportErrorOnLoginThrows) {
    auto http = std::make_shared<FakeHttpClient>();
    http->respond(kAuth, transportError("connection refused"));
    http_ = http;

    auto client = makeClient();
    EXPECT_THROW(client.getSubscriptionChanges(), RemoteSyncError);
    EXPECT_FALSE(client.loggedIn());
}

TEST_F(RemoteSyncClientTest, UnparseableBodyThrows) {
    http_->respond(kAllSubscriptions, okResponse("<html>"));
    auto client = makeClient();
    EXPECT_THROW(client.getSubscriptionChanges(), RemoteSyncError);
}

TEST_F(RemoteSyncClientTest, AddPodcastUploadsChangeAndTakesTimestamp) {
    http_->respond(kSubscriptionChanges, okResponse(R"({"timestamp":77,"update_urls":[]})"));
    auto client = makeClient(5);

    client.addPodcast("https://new.example/feed");
    EXPECT_EQ(client.subscriptionsCursor(), 78);

    for (const auto& request : http_->requests()) {
        if (request.method == "POST" && request.url == kSubscriptionChanges) {
            auto body = nlohmann::json::parse(request.body);
            EXPECT_EQ(body.at("add"), nlohmann::json::array({"https://new.example/feed"}));
            EXPECT_TRUE(body.at("remove").empty());
        }
    }
}

TEST_F(RemoteSyncClientTest, MarkPlayedBatchPostsPlayActions) {
    http_->respond(kUploadActions, okResponse(R"({"timestamp":1})"));
    auto client = makeClient(5);

    client.markPlayedBatch({});
    EXPECT_EQ(http_->count("POST", kUploadActions), 0u);

    client.markPlayedBatch({PlayReport{"https://a.example/feed", "https://a.example/1.mp3", 600, 600},
                            PlayReport{"https://a.example/feed", "https://a.example/2.mp3", 0, 300}});
    ASSERT_EQ(http_->count("POST", kUploadActions), 1u);
    for (const auto& request : http_->requests()) {
        if (request.url == kUploadActions) {
            auto body = nlohmann::json::parse(request.body);
            ASSERT_EQ(body.size(), 2u);
            EXPECT_EQ(body[0].at("action"), "play");
            EXPECT_EQ(body[0].at("position"), 600);
            EXPECT_EQ(body[1].at("total"), 300);
            EXPECT_EQ(body[1].at("started"), 0);
        }
    }
}

TEST(EpisodeActionJsonTest, TimestampIsWrittenAsRfc3339) {
    EpisodeAction action;
    action.podcast = "p";
    action.episode = "e";
    action.action = EpisodeAction::Action::Delete;
    action.timestamp = 1704450030;

    nlohmann::json j = action;
    EXPECT_EQ(j.at("timestamp"), "2024-01-05T10:20:30Z");
    EXPECT_EQ(j.at("action"), "delete");
    EXPECT_TRUE(j.at("position").is_null());

    auto back = j.get<EpisodeAction>();
    EXPECT_EQ(back.timestamp, 1704450030);
    EXPECT_EQ(back.action, EpisodeAction::Action::Delete);
}
