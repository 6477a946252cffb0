#include "podengine/core/PodcastFeed.hpp"
#include "podengine/core/Errors.hpp"
#include "podengine/core/Utils.hpp"

#include <charconv>
#include <chrono>
#include <iostream>
#include <limits>
#include <sstream>
#include <vector>

#include <ada.h>
#include <pugixml.hpp>

namespace podengine {
namespace core {

PodcastFeed::PodcastFeed(std::string feedUrl) : feedUrl_(std::move(feedUrl)) {}

std::string PodcastFeed::cleanAndValidateUrl(const std::string& url) const {
    std::string cleaned = utils::trim(url);
    if (cleaned.empty()) {
        return "";
    }

    // Use ada-url for proper URL parsing and validation
    auto parsed_url = ada::parse<ada::url>(cleaned);
    if (!parsed_url) {
        return "";
    }

    if (parsed_url->get_protocol() != "http:" && parsed_url->get_protocol() != "https:") {
        return "";
    }

    return parsed_url->get_href();
}

std::string PodcastFeed::extractAudioUrl(const pugi::xml_node& item) const {
    // First priority: the enclosure, whatever its declared type
    if (auto enclosure = item.child("enclosure")) {
        std::string audioUrl = cleanAndValidateUrl(enclosure.attribute("url").value());
        if (!audioUrl.empty()) {
            return audioUrl;
        }
    }

    // Second priority: media:content
    for (auto media_content : item.children("media:content")) {
        std::string type = media_content.attribute("type").value();
        if (!type.empty() && type.find("audio/") != 0 && type.find("video/") != 0 &&
            type.find("application/octet-stream") != 0) {
            continue;
        }
        std::string audioUrl = cleanAndValidateUrl(media_content.attribute("url").value());
        if (!audioUrl.empty()) {
            return audioUrl;
        }
    }

    return "";
}

std::optional<std::int64_t> PodcastFeed::parseDuration(const std::string& text) {
    std::vector<std::string> parts;
    std::stringstream ss(utils::trim(text));
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(part);
    }
    if (parts.empty() || parts.size() > 3) {
        return std::nullopt;
    }

    std::int64_t total = 0;
    for (const auto& piece : parts) {
        std::int64_t value = 0;
        const char* end = piece.data() + piece.size();
        auto result = std::from_chars(piece.data(), end, value);
        if (piece.empty() || result.ec != std::errc() || result.ptr != end || value < 0) {
            return std::nullopt;
        }
        if (total > (std::numeric_limits<std::int64_t>::max() - value) / 60) {
            return std::nullopt;
        }
        total = total * 60 + value;
    }
    return total;
}

std::optional<bool> PodcastFeed::parseExplicit(const std::string& text) {
    const std::string value = utils::toLower(utils::trim(text));
    if (value == "yes" || value == "explicit" || value == "true") {
        return true;
    }
    if (value == "no" || value == "clean" || value == "false") {
        return false;
    }
    return std::nullopt;
}

EpisodeData PodcastFeed::parseItem(const pugi::xml_node& item) const {
    EpisodeData episode;
    episode.title = item.child("title").text().get();
    episode.url = extractAudioUrl(item);
    episode.guid = utils::trim(item.child("guid").text().get());
    episode.description = item.child("description").text().get();

    if (auto pubDate = item.child("pubDate")) {
        episode.pubdate = utils::parseRfc2822(pubDate.text().get());
    }

    if (auto duration = item.child("itunes:duration")) {
        episode.duration = parseDuration(duration.text().get());
    }

    return episode;
}

void PodcastFeed::parseFeed(const std::string& xml) {
    pugi::xml_parse_result result = doc_.load_string(xml.c_str());
    if (!result) {
        throw FeedError("Failed to parse XML feed: " + std::string(result.description()));
    }

    data_ = PodcastData{};
    data_.url = feedUrl_;
    data_.lastChecked = std::chrono::system_clock::now();

    pugi::xml_node channel = doc_.child("rss").child("channel");
    if (!channel) {
        throw FeedError("Invalid podcast feed format: no channel element found");
    }

    data_.title = utils::trim(channel.child("title").text().get());
    data_.description = std::string(channel.child("description").text().get());

    if (auto author = channel.child("itunes:author")) {
        data_.author = std::string(author.text().get());
    }
    if (auto explicitNode = channel.child("itunes:explicit")) {
        data_.explicitFlag = parseExplicit(explicitNode.text().get());
    }

    for (auto item : channel.children("item")) {
        data_.episodes.push_back(parseItem(item));
    }

    int missingUrls = 0;
    for (const auto& episode : data_.episodes) {
        if (episode.url.empty()) {
            ++missingUrls;
        }
    }
    if (missingUrls > 0) {
        std::cout << "Feed " << feedUrl_ << ": " << missingUrls
                  << " item(s) without a usable media url" << std::endl;
    }
}

} // namespace core
} // namespace podengine
