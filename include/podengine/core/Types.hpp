#pragma once

#include "podengine/core/Catalog.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace podengine {
namespace core {

using TimePoint = std::chrono::system_clock::time_point;

// Display widths above which list rows get extra metadata.
constexpr std::size_t kPodcastUnplayedTotalsLength = 25;
constexpr std::size_t kEpisodeDurationLength = 45;

/// Anything that can be shown as a row in a list: podcasts, episodes and
/// the "new episodes" popup entries.
class Menuable {
public:
    virtual ~Menuable() = default;

    virtual std::int64_t getId() const = 0;
    // Row text fitted to `width` columns.
    virtual std::string displayTitle(std::size_t width) const = 0;
    virtual bool isPlayed() const = 0;
};

struct Episode : public Menuable {
    std::int64_t id = 0;
    std::int64_t podId = 0;
    std::string title;
    std::string url;
    std::string guid;
    std::string description;
    std::optional<TimePoint> pubdate;
    std::optional<std::int64_t> duration; // seconds
    std::int64_t position = 0;            // seconds
    std::optional<std::filesystem::path> path;
    bool played = false;

    std::int64_t getId() const override { return id; }
    std::string displayTitle(std::size_t width) const override;
    bool isPlayed() const override { return played; }
};

/// A subscribed feed. Copies share the same episode catalog.
struct Podcast : public Menuable {
    std::int64_t id = 0;
    std::string title;
    std::string url;
    std::optional<std::string> description;
    std::optional<std::string> author;
    std::optional<bool> explicitFlag;
    TimePoint lastChecked{};
    std::shared_ptr<Catalog<Episode>> episodes = std::make_shared<Catalog<Episode>>();

    std::size_t numUnplayed() const;

    std::int64_t getId() const override { return id; }
    std::string displayTitle(std::size_t width) const override;
    bool isPlayed() const override { return numUnplayed() == 0; }
};

// Episode freshly added by a sync, offered for download.
struct NewEpisode : public Menuable {
    std::int64_t id = 0;
    std::int64_t podId = 0;
    std::string title;
    std::string podTitle;
    bool selected = false;

    std::int64_t getId() const override { return id; }
    std::string displayTitle(std::size_t width) const override;
    bool isPlayed() const override { return true; }
};

// Parsed feed data, before the database has assigned ids.
struct EpisodeData {
    std::string title;
    std::string url;
    std::string guid;
    std::string description;
    std::optional<TimePoint> pubdate;
    std::optional<std::int64_t> duration;
};

struct PodcastData {
    std::string title;
    std::string url;
    std::optional<std::string> description;
    std::optional<std::string> author;
    std::optional<bool> explicitFlag;
    TimePoint lastChecked{};
    std::vector<EpisodeData> episodes;
};

struct SyncResult {
    std::vector<NewEpisode> added;
    std::vector<std::int64_t> updated;
};

// One row of a played-status batch update.
struct PlayedStatus {
    std::int64_t episodeId = 0;
    std::int64_t position = 0;
    std::optional<std::int64_t> duration;
    bool played = false;
};

enum class SeekDirection { Forward, Backward };

enum class FilterType { Played, Downloaded };

enum class FilterStatus { PositiveCases, NegativeCases, All };

struct Filters {
    FilterStatus played = FilterStatus::All;
    FilterStatus downloaded = FilterStatus::All;
};

/// A feed to fetch: no id for a first fetch, the podcast id for a refresh.
struct FeedRequest {
    std::optional<std::int64_t> id;
    std::string url;
    std::optional<std::string> title;
};

/// What a download job needs to know about one episode. filePath and
/// duration are filled in by the job on success.
struct EpisodeDownload {
    std::int64_t id = 0;
    std::int64_t podId = 0;
    std::string title;
    std::string url;
    std::optional<TimePoint> pubdate;
    std::optional<std::int64_t> duration;
    std::optional<std::filesystem::path> filePath;
};

/// gpodder episode action. timestamp is Unix seconds.
struct EpisodeAction {
    enum class Action { New, Download, Play, Delete };

    std::string podcast;
    std::string episode;
    Action action = Action::Play;
    std::int64_t timestamp = 0;
    std::optional<std::int64_t> started;
    std::optional<std::int64_t> position;
    std::optional<std::int64_t> total;
};

// Play position report queued for the remote: podcast url, episode url,
// position and total in seconds.
struct PlayReport {
    std::string podcastUrl;
    std::string episodeUrl;
    std::int64_t position = 0;
    std::int64_t total = 0;
};

} // namespace core
} // namespace podengine
