#include "podengine/core/Errors.hpp"
#include "podengine/core/PodcastFeed.hpp"
#include "podengine/core/Utils.hpp"

#include <gtest/gtest.h>

using namespace podengine::core;

namespace {

const char* kFeed = R"(<?xml version="1.0" encoding="UTF-8"?>
<rss version="2.0" xmlns:itunes="http://www.itunes.com/dtds/podcast-1.0.dtd"
     xmlns:media="http://search.yahoo.com/mrss/">
  <channel>
    <title>  Test Show  </title>
    <description>All about tests</description>
    <itunes:author>Jo Tester</itunes:author>
    <itunes:explicit>clean</itunes:explicit>
    <item>
      <title>Third</title>
      <guid> ep-3 </guid>
      <pubDate>Wed, 02 Oct 2002 13:00:00 GMT</pubDate>
      <itunes:duration>1:38:42</itunes:duration>
      <enclosure url="https://example.com/3.mp3" type="audio/mpeg" length="1"/>
    </item>
    <item>
      <title>Second</title>
      <description>Has media content</description>
      <itunes:duration>08:42</itunes:duration>
      <media:content url="https://example.com/2.jpg" type="image/jpeg"/>
      <media:content url="https://example.com/2.ogg" type="audio/ogg"/>
    </item>
    <item>
      <title>First</title>
      <pubDate>not a date</pubDate>
      <itunes:duration>nan</itunes:duration>
      <enclosure url="ftp://example.com/1.mp3"/>
    </item>
  </channel>
</rss>)";

} // namespace

TEST(PodcastFeedTest, ParseDuration) {
    EXPECT_EQ(PodcastFeed::parseDuration("1:38:42"), 5922);
    EXPECT_EQ(PodcastFeed::parseDuration("08:42"), 522);
    EXPECT_EQ(PodcastFeed::parseDuration("142"), 142);
    EXPECT_EQ(PodcastFeed::parseDuration(" 42 "), 42);
    EXPECT_FALSE(PodcastFeed::parseDuration("nan").has_value());
    EXPECT_FALSE(PodcastFeed::parseDuration("").has_value());
    EXPECT_FALSE(PodcastFeed::parseDuration("1:2:3:4").has_value());
    EXPECT_FALSE(PodcastFeed::parseDuration("1::3").has_value());
    EXPECT_FALSE(PodcastFeed::parseDuration("12.5").has_value());
}

TEST(PodcastFeedTest, ParseDurationRejectsOverflow) {
    EXPECT_FALSE(PodcastFeed::parseDuration("9223372036854775807:59").has_value());
    EXPECT_FALSE(PodcastFeed::parseDuration("153722867280912931:0").has_value());
    EXPECT_FALSE(PodcastFeed::parseDuration("99999999999999999999").has_value());
    EXPECT_EQ(PodcastFeed::parseDuration("153722867280912930:7"), 9223372036854775807);
}

TEST(PodcastFeedTest, ParseExplicit) {
    EXPECT_EQ(PodcastFeed::parseExplicit("Yes"), true);
    EXPECT_EQ(PodcastFeed::parseExplicit("explicit"), true);
    EXPECT_EQ(PodcastFeed::parseExplicit("clean"), false);
    EXPECT_EQ(PodcastFeed::parseExplicit("no"), false);
    EXPECT_FALSE(PodcastFeed::parseExplicit("maybe").has_value());
}

TEST(PodcastFeedTest, ParsesChannelMetadata) {
    PodcastFeed feed("https://example.com/feed.xml");
    feed.parseFeed(kFeed);
    const auto& data = feed.getData();

    EXPECT_EQ(data.url, "https://example.com/feed.xml");
    EXPECT_EQ(data.title, "Test Show");
    EXPECT_EQ(data.description, std::optional<std::string>("All about tests"));
    EXPECT_EQ(data.author, std::optional<std::string>("Jo Tester"));
    EXPECT_EQ(data.explicitFlag, std::optional<bool>(false));
    ASSERT_EQ(data.episodes.size(), 3u);
}

TEST(PodcastFeedTest, ParsesItemsInDocumentOrder) {
    PodcastFeed feed("https://example.com/feed.xml");
    feed.parseFeed(kFeed);
    const auto& episodes = feed.getData().episodes;
    ASSERT_EQ(episodes.size(), 3u);

    EXPECT_EQ(episodes[0].title, "Third");
    EXPECT_EQ(episodes[0].guid, "ep-3");
    EXPECT_EQ(episodes[0].url, "https://example.com/3.mp3");
    EXPECT_EQ(episodes[0].duration, 5922);
    ASSERT_TRUE(episodes[0].pubdate.has_value());
    EXPECT_EQ(utils::toUnixSeconds(*episodes[0].pubdate), 1033563600);

    EXPECT_EQ(episodes[1].title, "Second");
    EXPECT_EQ(episodes[1].description, "Has media content");
    EXPECT_EQ(episodes[1].url, "https://example.com/2.ogg");
    EXPECT_EQ(episodes[1].duration, 522);
    EXPECT_FALSE(episodes[1].pubdate.has_value());

    EXPECT_EQ(episodes[2].title, "First");
    EXPECT_TRUE(episodes[2].url.empty());
    EXPECT_FALSE(episodes[2].pubdate.has_value());
    EXPECT_FALSE(episodes[2].duration.has_value());
}

TEST(PodcastFeedTest, MalformedXmlThrows) {
    PodcastFeed feed("https://example.com/feed.xml");
    EXPECT_THROW(feed.parseFeed("<rss><channel><title>oops</channel></rss>"), FeedError);
}

TEST(PodcastFeedTest, MissingChannelThrows) {
    PodcastFeed feed("https://example.com/feed.xml");
    EXPECT_THROW(feed.parseFeed("<html><body/></html>"), FeedError);
}

TEST(PodcastFeedTest, EmptyChannelHasNoEpisodes) {
    PodcastFeed feed("https://example.com/feed.xml");
    feed.parseFeed("<rss><channel><title>Empty</title></channel></rss>");
    EXPECT_EQ(feed.getData().title, "Empty");
    EXPECT_TRUE(feed.getData().episodes.empty());
    EXPECT_FALSE(feed.getData().author.has_value());
}
