#pragma once

#include "podengine/core/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>

#include <pugixml.hpp>

namespace podengine {
namespace core {

/// RSS parser for one podcast feed.
///
/// Field extraction is lenient: anything missing or malformed degrades to
/// an empty or unset value for that field only. The only hard failure is a
/// document that is not XML or has no <rss><channel>.
class PodcastFeed {
public:
    explicit PodcastFeed(std::string feedUrl);
    ~PodcastFeed() = default;

    // Throws FeedError.
    void parseFeed(const std::string& xml);

    const PodcastData& getData() const { return data_; }
    PodcastData takeData() { return std::move(data_); }

    // "HH:MM:SS", "MM:SS" or "SS"; empty for anything else.
    static std::optional<std::int64_t> parseDuration(const std::string& text);
    // itunes:explicit values; empty when unrecognised.
    static std::optional<bool> parseExplicit(const std::string& text);

private:
    EpisodeData parseItem(const pugi::xml_node& item) const;
    std::string extractAudioUrl(const pugi::xml_node& item) const;
    std::string cleanAndValidateUrl(const std::string& url) const;

    std::string feedUrl_;
    PodcastData data_;
    pugi::xml_document doc_;
};

} // namespace core
} // namespace podengine
