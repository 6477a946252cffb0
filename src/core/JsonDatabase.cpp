#include "podengine/core/JsonDatabase.hpp"

#include "podengine/core/Errors.hpp"
#include "podengine/core/Utils.hpp"

#include <algorithm>
#include <fstream>
#include <unordered_set>

namespace podengine {
namespace core {

namespace {

using nlohmann::json;

json emptyDocument() {
    return json{
        {"next_podcast_id", 1},
        {"next_episode_id", 1},
        {"podcasts", json::array()},
        {"params", json::object()},
        {"queue", json::array()}
    };
}

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

std::optional<std::int64_t> unixPubdate(const std::optional<TimePoint>& pubdate) {
    if (!pubdate) {
        return std::nullopt;
    }
    return utils::toUnixSeconds(*pubdate);
}

json* findPodcast(json& doc, std::int64_t podId) {
    for (auto& podcast : doc["podcasts"]) {
        if (podcast["id"].get<std::int64_t>() == podId) {
            return &podcast;
        }
    }
    return nullptr;
}

json* findEpisode(json& doc, std::int64_t episodeId) {
    for (auto& podcast : doc["podcasts"]) {
        for (auto& episode : podcast["episodes"]) {
            if (episode["id"].get<std::int64_t>() == episodeId) {
                return &episode;
            }
        }
    }
    return nullptr;
}

json& requireEpisode(json& doc, std::int64_t episodeId) {
    json* episode = findEpisode(doc, episodeId);
    if (!episode) {
        throw DatabaseError("No episode with id " + std::to_string(episodeId));
    }
    return *episode;
}

void writePodcastMeta(json& target, const PodcastData& podcast) {
    target["title"] = podcast.title;
    target["url"] = podcast.url;
    target["description"] = optionalToJson(podcast.description);
    target["author"] = optionalToJson(podcast.author);
    target["explicit"] = optionalToJson(podcast.explicitFlag);
    target["last_checked"] = utils::toUnixSeconds(podcast.lastChecked);
}

json newEpisode(json& doc, const EpisodeData& data) {
    const std::int64_t id = doc["next_episode_id"].get<std::int64_t>();
    doc["next_episode_id"] = id + 1;
    return json{
        {"id", id},
        {"title", data.title},
        {"url", data.url},
        {"guid", data.guid},
        {"description", data.description},
        {"pubdate", optionalToJson(unixPubdate(data.pubdate))},
        {"duration", optionalToJson(data.duration)},
        {"position", 0},
        {"played", false},
        {"path", nullptr}
    };
}

// Same guid, or else at least two of title, url and pubdate agree.
bool isSameEpisode(const json& stored, const EpisodeData& data) {
    if (!data.guid.empty() && stored["guid"].get<std::string>() == data.guid) {
        return true;
    }
    int agreements = 0;
    if (stored["title"].get<std::string>() == data.title) {
        ++agreements;
    }
    if (stored["url"].get<std::string>() == data.url) {
        ++agreements;
    }
    if (optionalFromJson<std::int64_t>(stored, "pubdate") == unixPubdate(data.pubdate)) {
        ++agreements;
    }
    return agreements >= 2;
}

// Refreshes feed metadata; returns whether anything changed. The duration
// is left alone, a downloaded file's probed duration beats the feed's.
bool refreshEpisode(json& stored, const EpisodeData& data) {
    const auto pubdate = unixPubdate(data.pubdate);
    const bool changed = stored["title"].get<std::string>() != data.title ||
                         stored["url"].get<std::string>() != data.url ||
                         stored["guid"].get<std::string>() != data.guid ||
                         stored["description"].get<std::string>() != data.description ||
                         optionalFromJson<std::int64_t>(stored, "pubdate") != pubdate;
    if (changed) {
        stored["title"] = data.title;
        stored["url"] = data.url;
        stored["guid"] = data.guid;
        stored["description"] = data.description;
        stored["pubdate"] = optionalToJson(pubdate);
    }
    return changed;
}

Episode episodeFromJson(const json& j, std::int64_t podId) {
    Episode episode;
    episode.id = j.at("id").get<std::int64_t>();
    episode.podId = podId;
    episode.title = j.at("title").get<std::string>();
    episode.url = j.at("url").get<std::string>();
    episode.guid = j.at("guid").get<std::string>();
    episode.description = j.at("description").get<std::string>();
    if (auto pubdate = optionalFromJson<std::int64_t>(j, "pubdate")) {
        episode.pubdate = utils::fromUnixSeconds(*pubdate);
    }
    episode.duration = optionalFromJson<std::int64_t>(j, "duration");
    episode.position = j.at("position").get<std::int64_t>();
    episode.played = j.at("played").get<bool>();
    if (auto path = optionalFromJson<std::string>(j, "path")) {
        episode.path = std::filesystem::path(*path);
    }
    return episode;
}

} // namespace

JsonDatabase::JsonDatabase(std::filesystem::path file) : file_(std::move(file)) {
    load();
}

void JsonDatabase::load() {
    std::ifstream in(file_);
    if (!in.is_open()) {
        // File doesn't exist yet, start empty
        doc_ = emptyDocument();
        return;
    }

    try {
        in >> doc_;
    } catch (const json::exception& e) {
        throw DatabaseError("Could not parse database " + file_.string() + ": " + e.what());
    }

    const json defaults = emptyDocument();
    for (const auto& entry : defaults.items()) {
        if (!doc_.contains(entry.key())) {
            doc_[entry.key()] = entry.value();
        }
    }
}

void JsonDatabase::save(const json& doc) const {
    std::filesystem::path temp = file_;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out.is_open()) {
            throw DatabaseError("Could not open file for writing: " + temp.string());
        }
        out << doc.dump(4);
        if (!out) {
            throw DatabaseError("Could not write database: " + temp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, file_, ec);
    if (ec) {
        throw DatabaseError("Could not replace database " + file_.string() + ": " + ec.message());
    }
}

void JsonDatabase::commit(json doc) {
    save(doc);
    doc_ = std::move(doc);
}

std::vector<Podcast> JsonDatabase::getPodcasts() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Podcast> podcasts;
    try {
        for (const auto& stored : doc_["podcasts"]) {
            Podcast podcast;
            podcast.id = stored.at("id").get<std::int64_t>();
            podcast.title = stored.at("title").get<std::string>();
            podcast.url = stored.at("url").get<std::string>();
            podcast.description = optionalFromJson<std::string>(stored, "description");
            podcast.author = optionalFromJson<std::string>(stored, "author");
            podcast.explicitFlag = optionalFromJson<bool>(stored, "explicit");
            podcast.lastChecked = utils::fromUnixSeconds(stored.at("last_checked").get<std::int64_t>());

            std::vector<Episode> episodes;
            for (const auto& storedEpisode : stored.at("episodes")) {
                episodes.push_back(episodeFromJson(storedEpisode, podcast.id));
            }
            std::stable_sort(episodes.begin(), episodes.end(), [](const Episode& a, const Episode& b) {
                return a.pubdate.value_or(TimePoint{}) > b.pubdate.value_or(TimePoint{});
            });
            podcast.episodes = std::make_shared<Catalog<Episode>>(std::move(episodes));
            podcasts.push_back(std::move(podcast));
        }
    } catch (const json::exception& e) {
        throw DatabaseError(std::string("Malformed podcast record: ") + e.what());
    }

    std::stable_sort(podcasts.begin(), podcasts.end(), [](const Podcast& a, const Podcast& b) {
        return a.title < b.title;
    });
    return podcasts;
}

SyncResult JsonDatabase::insertPodcast(const PodcastData& podcast) {
    std::lock_guard<std::mutex> lock(mutex_);
    json doc = doc_;

    for (const auto& stored : doc["podcasts"]) {
        if (stored["url"].get<std::string>() == podcast.url) {
            throw DatabaseError("Podcast already exists: " + podcast.url);
        }
    }

    const std::int64_t podId = doc["next_podcast_id"].get<std::int64_t>();
    doc["next_podcast_id"] = podId + 1;

    json stored = json::object();
    stored["id"] = podId;
    writePodcastMeta(stored, podcast);
    stored["episodes"] = json::array();

    SyncResult result;
    // Feeds list newest first; oldest episodes get the lowest ids.
    for (auto it = podcast.episodes.rbegin(); it != podcast.episodes.rend(); ++it) {
        json episode = newEpisode(doc, *it);
        NewEpisode added;
        added.id = episode["id"].get<std::int64_t>();
        added.podId = podId;
        added.title = it->title;
        added.podTitle = podcast.title;
        result.added.push_back(std::move(added));
        stored["episodes"].push_back(std::move(episode));
    }
    doc["podcasts"].push_back(std::move(stored));

    commit(std::move(doc));
    return result;
}

SyncResult JsonDatabase::updatePodcast(std::int64_t podId, const PodcastData& podcast) {
    std::lock_guard<std::mutex> lock(mutex_);
    json doc = doc_;

    json* stored = findPodcast(doc, podId);
    if (!stored) {
        throw DatabaseError("No podcast with id " + std::to_string(podId));
    }
    writePodcastMeta(*stored, podcast);

    SyncResult result;
    json& episodes = (*stored)["episodes"];
    for (auto it = podcast.episodes.rbegin(); it != podcast.episodes.rend(); ++it) {
        auto existing = std::find_if(episodes.begin(), episodes.end(),
                                     [&](const json& e) { return isSameEpisode(e, *it); });
        if (existing != episodes.end()) {
            if (refreshEpisode(*existing, *it)) {
                result.updated.push_back((*existing)["id"].get<std::int64_t>());
            }
            continue;
        }

        json episode = newEpisode(doc, *it);
        NewEpisode added;
        added.id = episode["id"].get<std::int64_t>();
        added.podId = podId;
        added.title = it->title;
        added.podTitle = podcast.title;
        result.added.push_back(std::move(added));
        episodes.push_back(std::move(episode));
    }

    commit(std::move(doc));
    return result;
}

void JsonDatabase::removePodcast(std::int64_t podId) {
    std::lock_guard<std::mutex> lock(mutex_);
    json doc = doc_;

    auto& podcasts = doc["podcasts"];
    auto it = std::find_if(podcasts.begin(), podcasts.end(), [podId](const json& p) {
        return p["id"].get<std::int64_t>() == podId;
    });
    if (it == podcasts.end()) {
        throw DatabaseError("No podcast with id " + std::to_string(podId));
    }

    std::unordered_set<std::int64_t> removed;
    for (const auto& episode : (*it)["episodes"]) {
        removed.insert(episode["id"].get<std::int64_t>());
    }
    podcasts.erase(it);

    json queue = json::array();
    for (const auto& id : doc["queue"]) {
        if (removed.count(id.get<std::int64_t>()) == 0) {
            queue.push_back(id);
        }
    }
    doc["queue"] = std::move(queue);

    commit(std::move(doc));
}

void JsonDatabase::insertFile(std::int64_t episodeId, const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    json doc = doc_;
    requireEpisode(doc, episodeId)["path"] = path.string();
    commit(std::move(doc));
}

void JsonDatabase::removeFile(std::int64_t episodeId) {
    std::lock_guard<std::mutex> lock(mutex_);
    json doc = doc_;
    requireEpisode(doc, episodeId)["path"] = nullptr;
    commit(std::move(doc));
}

void JsonDatabase::removeFiles(const std::vector<std::int64_t>& episodeIds) {
    std::lock_guard<std::mutex> lock(mutex_);
    json doc = doc_;
    for (std::int64_t id : episodeIds) {
        requireEpisode(doc, id)["path"] = nullptr;
    }
    commit(std::move(doc));
}

void JsonDatabase::setPlayedStatus(std::int64_t episodeId, std::int64_t position,
                                   std::optional<std::int64_t> duration, bool played) {
    std::lock_guard<std::mutex> lock(mutex_);
    json doc = doc_;
    json& episode = requireEpisode(doc, episodeId);
    episode["position"] = position;
    episode["duration"] = optionalToJson(duration);
    episode["played"] = played;
    commit(std::move(doc));
}

void JsonDatabase::setPlayedStatusBatch(const std::vector<PlayedStatus>& updates) {
    std::lock_guard<std::mutex> lock(mutex_);
    json doc = doc_;
    for (const auto& update : updates) {
        json& episode = requireEpisode(doc, update.episodeId);
        episode["position"] = update.position;
        episode["duration"] = optionalToJson(update.duration);
        episode["played"] = update.played;
    }
    commit(std::move(doc));
}

std::optional<std::string> JsonDatabase::getParam(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return optionalFromJson<std::string>(doc_["params"], key.c_str());
}

void JsonDatabase::setParam(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    json doc = doc_;
    doc["params"][key] = value;
    commit(std::move(doc));
}

std::vector<std::int64_t> JsonDatabase::getQueue() {
    std::lock_guard<std::mutex> lock(mutex_);
    return doc_["queue"].get<std::vector<std::int64_t>>();
}

void JsonDatabase::setQueue(const std::vector<std::int64_t>& episodeIds) {
    std::lock_guard<std::mutex> lock(mutex_);
    json doc = doc_;
    for (std::int64_t id : episodeIds) {
        requireEpisode(doc, id);
    }
    doc["queue"] = episodeIds;
    commit(std::move(doc));
}

} // namespace core
} // namespace podengine
