#include "podengine/core/Controller.hpp"

#include "podengine/core/DownloadWorker.hpp"
#include "podengine/core/Errors.hpp"
#include "podengine/core/FeedWorker.hpp"
#include "podengine/core/Utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <system_error>
#include <unordered_map>

namespace podengine {
namespace core {

namespace {

// Filters are only recomputed this often while feed data is streaming in.
constexpr std::int64_t kFilterThrottleMs = 200;

std::string plural(std::size_t count) {
    return count > 1 ? "s" : "";
}

} // namespace

Controller::Controller(Config config, Database& db, std::shared_ptr<HttpClient> http,
                       std::shared_ptr<MediaProbe> probe, ControllerChannels channels)
    : config_(std::move(config)),
      db_(db),
      http_(std::move(http)),
      probe_(std::move(probe)),
      channels_(std::move(channels)),
      podcasts_(std::make_shared<Catalog<Podcast>>()),
      unplayed_(std::make_shared<Catalog<Episode>>()),
      queue_(std::make_shared<Catalog<Episode>>()),
      pool_(config_.simultaneousDownloads) {
    reloadPodcasts();
    updateQueue(db_.getQueue());
    updateUnplayed(true);
    updateFilters(false);
}

void Controller::run() {
    if (config_.syncOnStart) {
        sync(std::nullopt);
    }

    while (auto message = channels_.inbox->receive()) {
        if (!handle(std::move(*message))) {
            break;
        }
    }
    channels_.toUi->send(ui::TearDown{});
}

bool Controller::handle(Message message) {
    if (std::holds_alternative<msg::Quit>(message)) {
        return false;
    }
    try {
        dispatch(message);
    } catch (const DatabaseError& e) {
        std::cerr << "Database error in controller loop: " << e.what() << std::endl;
        notify(std::string("Database error: ") + e.what(), true);
    } catch (const std::exception& e) {
        std::cerr << "Error in controller loop: " << e.what() << std::endl;
    }
    return true;
}

void Controller::dispatch(const Message& message) {
    if (auto add = std::get_if<msg::AddFeed>(&message)) {
        addPodcast(add->url);
    } else if (auto one = std::get_if<msg::Sync>(&message)) {
        sync(one->podId);
    } else if (std::holds_alternative<msg::SyncAll>(message)) {
        sync(std::nullopt);
    } else if (std::holds_alternative<msg::SyncRemote>(message)) {
        requestRemoteSync();
    } else if (auto playMsg = std::get_if<msg::Play>(&message)) {
        play(playMsg->podId, playMsg->epId);
    } else if (std::holds_alternative<msg::Pause>(message)) {
        if (channels_.toPlayer) {
            channels_.toPlayer->send(player::PlayPause{});
        }
    } else if (auto seek = std::get_if<msg::Seek>(&message)) {
        if (channels_.toPlayer) {
            channels_.toPlayer->send(player::Seek{seek->seconds, seek->direction});
        }
    } else if (auto marked = std::get_if<msg::MarkPlayed>(&message)) {
        markPlayed(marked->podId, marked->epId, marked->played);
    } else if (auto all = std::get_if<msg::MarkAllPlayed>(&message)) {
        markAllPlayed(all->podId, all->played);
    } else if (auto position = std::get_if<msg::UpdatePosition>(&message)) {
        updatePosition(position->podId, position->epId, position->position);
    } else if (auto dl = std::get_if<msg::Download>(&message)) {
        download(dl->podId, dl->epId);
    } else if (auto dlAll = std::get_if<msg::DownloadAll>(&message)) {
        download(dlAll->podId, std::nullopt);
    } else if (auto del = std::get_if<msg::Delete>(&message)) {
        deleteFile(del->podId, del->epId);
    } else if (auto delAll = std::get_if<msg::DeleteAll>(&message)) {
        deleteFiles(delAll->podId);
    } else if (auto remove = std::get_if<msg::RemovePodcast>(&message)) {
        removePodcast(remove->podId, remove->deleteFiles);
    } else if (auto filter = std::get_if<msg::FilterChange>(&message)) {
        changeFilter(filter->type);
    } else if (auto queued = std::get_if<msg::Enqueue>(&message)) {
        enqueue(queued->podId, queued->epId);
    } else if (std::holds_alternative<msg::QueueModified>(message)) {
        writeQueue();
    } else if (auto fresh = std::get_if<msg::FeedNewData>(&message)) {
        addOrSyncData(fresh->podcast, std::nullopt);
    } else if (auto synced = std::get_if<msg::FeedSyncData>(&message)) {
        addOrSyncData(synced->podcast, synced->podId);
    } else if (auto failed = std::get_if<msg::FeedError>(&message)) {
        feedError(failed->request);
    } else if (auto complete = std::get_if<msg::DownloadComplete>(&message)) {
        downloadComplete(complete->episode);
    } else if (auto response = std::get_if<msg::DownloadResponseError>(&message)) {
        downloadFailed(response->episode, "Error sending download request. " + response->episode.url);
    } else if (auto create = std::get_if<msg::DownloadFileCreateError>(&message)) {
        downloadFailed(create->episode, "Error creating file. " + create->episode.title);
    } else if (auto write = std::get_if<msg::DownloadFileWriteError>(&message)) {
        downloadFailed(write->episode, "Error downloading episode. " + write->episode.title);
    } else if (auto remote = std::get_if<msg::RemoteSyncResult>(&message)) {
        remoteSyncResult(*remote);
    } else if (auto remoteFailed = std::get_if<msg::RemoteSyncFailed>(&message)) {
        notify("Remote sync failed: " + remoteFailed->what, true);
    }
}

// --- Feeds -----------------------------------------------------------------

void Controller::addPodcast(const std::string& url) {
    checkFeed(FeedRequest{std::nullopt, url, std::nullopt}, config_.maxRetries, pool_, http_,
              channels_.inbox);
}

void Controller::sync(std::optional<std::int64_t> podId) {
    auto toRequest = [](const Podcast& podcast) {
        return FeedRequest{podcast.id, podcast.url, podcast.title};
    };

    std::vector<FeedRequest> requests;
    if (podId) {
        auto request = podcasts_->mapSingle(*podId, toRequest);
        if (!request) {
            std::cerr << "Podcast with id " << *podId << " not found" << std::endl;
        } else {
            requests.push_back(std::move(*request));
        }
    } else {
        requests = podcasts_->map(toRequest, false);
    }

    for (auto& request : requests) {
        ++syncCounter_;
        checkFeed(std::move(request), config_.maxRetries, pool_, http_, channels_.inbox);
    }
    updateTrackerNotification();
}

void Controller::addOrSyncData(const PodcastData& podcast, std::optional<std::int64_t> podId) {
    std::optional<SyncResult> result;
    try {
        result = podId ? db_.updatePodcast(*podId, podcast) : db_.insertPodcast(podcast);
    } catch (const std::exception& e) {
        std::cerr << "Database error for " << podcast.url << ": " << e.what() << std::endl;
        notify(podId ? "Error synchronizing " + podcast.title + "."
                     : "Error adding podcast " + podcast.title + " to database.",
               true);
    }

    if (result && (!podId || !result->added.empty() || !result->updated.empty())) {
        reloadPodcasts();
        updateUnplayed(true);
        updateQueue(queue_->order(false));
        updateFilters(true);
    }

    if (podId) {
        if (result) {
            syncTracker_.push_back(*result);
        }
        if (syncCounter_ > 0) {
            --syncCounter_;
        }
        updateTrackerNotification();
        if (syncCounter_ == 0) {
            finishSync();
        }
    } else if (result) {
        sendRemote(remote::AddPodcast{podcast.url});
        notify("Successfully added " + std::to_string(result->added.size()) + " episodes.", false);
    }
}

void Controller::feedError(const FeedRequest& request) {
    if (!request.title) {
        notify("Error retrieving RSS feed for (no_title)", true);
        return;
    }

    if (syncCounter_ > 0) {
        --syncCounter_;
    }
    updateTrackerNotification();
    if (syncCounter_ == 0) {
        finishSync();
    }
    notify("Error retrieving RSS feed for " + *request.title, true);
}

void Controller::finishSync() {
    std::size_t added = 0;
    std::size_t updated = 0;
    for (const auto& result : syncTracker_) {
        added += result.added.size();
        updated += result.updated.size();
    }
    if (added + updated > 0) {
        updateFilters(false);
    }
    syncTracker_.clear();

    notify("Sync complete: Added " + std::to_string(added) + ", updated " +
               std::to_string(updated) + " episodes.",
           false);
    requestRemoteSync();
}

// --- Playback state --------------------------------------------------------

void Controller::play(std::int64_t podId, std::int64_t epId) {
    auto handle = episodeHandle(podId, epId);
    Episode episode = handle->snapshot();

    if (episode.duration && episode.position == *episode.duration) {
        db_.setPlayedStatus(epId, 0, episode.duration, episode.played);
        handle->write([](Episode& ep) { ep.position = 0; });
        episode.position = 0;
    }

    if (channels_.toPlayer) {
        if (episode.path) {
            channels_.toPlayer->send(player::PlayFile{*episode.path, episode.duration});
        } else {
            channels_.toPlayer->send(player::PlayUrl{episode.url, episode.duration});
        }
        if (episode.position > 0) {
            channels_.toPlayer->send(player::Seek{episode.position, SeekDirection::Forward});
        }
    }
    channels_.toUi->send(ui::PlayEpisode{podId, epId});
}

void Controller::markPlayed(std::int64_t podId, std::int64_t epId, bool played) {
    auto handle = episodeHandle(podId, epId);
    const std::string podcastUrl = podcastHandle(podId)->read([](const Podcast& p) { return p.url; });
    Episode episode = handle->snapshot();

    const std::int64_t position = played ? episode.position : 0;
    db_.setPlayedStatus(epId, position, episode.duration, played);
    handle->write([&](Episode& ep) {
        ep.played = played;
        ep.position = position;
    });
    episode.played = played;
    episode.position = position;

    trackUnplayed(handle, played);
    updateFilters(false);
    reportPlayed(podcastUrl, episode);
}

void Controller::markAllPlayed(std::int64_t podId, bool played) {
    const std::string podcastUrl = podcastHandle(podId)->read([](const Podcast& p) { return p.url; });
    auto episodes = episodesOf(podId);
    auto handles = episodes->handles(false);

    std::vector<PlayedStatus> statuses;
    std::vector<Episode> snapshots;
    for (const auto& handle : handles) {
        Episode episode = handle->snapshot();
        statuses.push_back(PlayedStatus{episode.id, episode.position, episode.duration, played});
        episode.played = played;
        snapshots.push_back(std::move(episode));
    }

    db_.setPlayedStatusBatch(statuses);
    for (const auto& handle : handles) {
        handle->write([played](Episode& ep) { ep.played = played; });
    }

    updateUnplayed(true);
    updateFilters(false);

    if (config_.enableSync) {
        std::vector<PlayReport> reports;
        for (const auto& episode : snapshots) {
            const std::int64_t total = episode.duration.value_or(kMaxDuration);
            reports.push_back(PlayReport{podcastUrl, episode.url,
                                         played ? total : episode.position, total});
        }
        sendRemote(remote::MarkPlayedBatch{std::move(reports)});
    }
}

void Controller::updatePosition(std::int64_t podId, std::int64_t epId, std::int64_t position) {
    auto handle = episodeHandle(podId, epId);
    const std::string podcastUrl = podcastHandle(podId)->read([](const Podcast& p) { return p.url; });
    Episode episode = handle->snapshot();

    const bool reachedEnd = episode.duration && position == *episode.duration;
    const bool played = episode.played || reachedEnd;
    db_.setPlayedStatus(epId, position, episode.duration, played);
    handle->write([&](Episode& ep) {
        ep.position = position;
        ep.played = played;
    });

    if (played != episode.played) {
        trackUnplayed(handle, played);
        updateFilters(false);
    }

    if (config_.enableSync) {
        const std::int64_t total = episode.duration.value_or(kMaxDuration);
        sendRemote(remote::MarkPlayed{PlayReport{podcastUrl, episode.url, position, total}});
    }
}

void Controller::applyPositionUpdates(const std::vector<PositionUpdate>& updates) {
    std::map<std::int64_t, std::vector<PositionUpdate>> byPodcast;
    for (const auto& update : updates) {
        byPodcast[update.podId].push_back(update);
    }

    for (const auto& entry : byPodcast) {
        auto podcast = podcasts_->get(entry.first);
        if (!podcast) {
            std::cerr << "Failed to get pod_id: " << entry.first << std::endl;
            continue;
        }
        auto episodes = podcast->read([](const Podcast& p) { return p.episodes; });

        std::vector<std::pair<Catalog<Episode>::Handle, PlayedStatus>> batch;
        for (const auto& update : entry.second) {
            auto handle = episodes->get(update.epId);
            if (!handle) {
                std::cerr << "Failed to get ep_id: " << update.epId << std::endl;
                continue;
            }
            Episode episode = handle->snapshot();
            PlayedStatus status;
            status.episodeId = episode.id;
            status.position = update.position;
            status.duration = episode.duration ? episode.duration : update.total;
            status.played = std::llabs(*status.duration - update.position) <= 1;
            batch.emplace_back(handle, status);
        }

        std::vector<PlayedStatus> statuses;
        for (const auto& item : batch) {
            statuses.push_back(item.second);
        }
        try {
            db_.setPlayedStatusBatch(statuses);
        } catch (const std::exception& e) {
            std::cerr << "Error updating played status: " << e.what() << std::endl;
            notify("Could not update played status in database.", true);
            continue;
        }

        for (const auto& item : batch) {
            const PlayedStatus& status = item.second;
            item.first->write([&status](Episode& ep) {
                ep.position = status.position;
                ep.duration = status.duration;
                ep.played = status.played;
            });
        }
    }
}

// --- Files -----------------------------------------------------------------

void Controller::download(std::int64_t podId, std::optional<std::int64_t> epId) {
    auto podcast = podcastHandle(podId);
    auto info = podcast->read([](const Podcast& p) { return std::make_pair(p.title, p.episodes); });
    const std::string& podTitle = info.first;

    auto toDownload = [](const Episode& ep) {
        EpisodeDownload data;
        data.id = ep.id;
        data.podId = ep.podId;
        data.title = ep.title;
        data.url = ep.url;
        data.pubdate = ep.pubdate;
        data.duration = ep.duration;
        return data;
    };

    std::vector<EpisodeDownload> episodes;
    if (epId) {
        auto handle = info.second->get(*epId);
        if (!handle) {
            throw NotFoundError("ep_id: " + std::to_string(*epId) + " does not exist");
        }
        handle->read([&](const Episode& ep) {
            if (!ep.path) {
                episodes.push_back(toDownload(ep));
            }
        });
    } else {
        episodes = info.second->filterMap(
            [&](const Catalog<Episode>::Handle& handle) -> std::optional<EpisodeDownload> {
                return handle->read([&](const Episode& ep) -> std::optional<EpisodeDownload> {
                    if (ep.path) {
                        return std::nullopt;
                    }
                    return toDownload(ep);
                });
            });
    }

    // Skip episodes that are already being downloaded
    episodes.erase(std::remove_if(episodes.begin(), episodes.end(),
                                  [this](const EpisodeDownload& ep) {
                                      return downloadTracker_.count(ep.id) > 0;
                                  }),
                   episodes.end());
    if (episodes.empty()) {
        return;
    }

    const std::filesystem::path dir = config_.downloadPath / utils::sanitizeFilename(podTitle);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "Could not create " << dir << ": " << ec.message() << std::endl;
        notify("Could not create dir: " + podTitle, true);
        updateTrackerNotification();
        return;
    }

    for (const auto& episode : episodes) {
        downloadTracker_.insert(episode.id);
    }
    downloadList(std::move(episodes), dir, config_.maxRetries, pool_, http_, probe_,
                 channels_.inbox);
    updateTrackerNotification();
}

void Controller::downloadComplete(const EpisodeDownload& episode) {
    finishDownload(episode.id);
    if (!episode.filePath) {
        throw std::runtime_error("Download of episode " + std::to_string(episode.id) +
                                 " completed without a file path");
    }

    db_.insertFile(episode.id, *episode.filePath);
    auto handle = episodeHandle(episode.podId, episode.id);
    if (episode.duration) {
        const Episode current = handle->snapshot();
        db_.setPlayedStatus(episode.id, current.position, episode.duration, current.played);
    }
    handle->write([&episode](Episode& ep) {
        ep.path = episode.filePath;
        if (episode.duration) {
            ep.duration = episode.duration;
        }
    });
    updateFilters(false);
}

void Controller::downloadFailed(const EpisodeDownload& episode, const std::string& text) {
    finishDownload(episode.id);
    notify(text, true);
}

void Controller::finishDownload(std::int64_t episodeId) {
    if (downloadTracker_.erase(episodeId) == 0) {
        return;
    }
    updateTrackerNotification();
    if (downloadTracker_.empty()) {
        notify("Downloads complete.", false);
    }
}

void Controller::deleteFile(std::int64_t podId, std::int64_t epId) {
    auto handle = episodeHandle(podId, epId);
    auto info = handle->read([](const Episode& ep) { return std::make_pair(ep.path, ep.title); });
    if (!info.first) {
        throw std::runtime_error("Episode " + std::to_string(epId) + " has no file");
    }
    const std::string& title = info.second;

    std::error_code ec;
    std::filesystem::remove(*info.first, ec);
    if (ec) {
        std::cerr << "Could not delete " << *info.first << ": " << ec.message() << std::endl;
        notify("Error deleting \"" + title + "\"", true);
        return;
    }

    db_.removeFile(epId);
    handle->write([](Episode& ep) { ep.path.reset(); });
    updateFilters(false);
    notify("Deleted \"" + title + "\"", false);
}

void Controller::deleteFiles(std::int64_t podId) {
    auto episodes = episodesOf(podId);
    auto downloaded = episodes->filterMap(
        [](const Catalog<Episode>::Handle& handle)
            -> std::optional<std::pair<Catalog<Episode>::Handle, std::filesystem::path>> {
            auto path = handle->read([](const Episode& ep) { return ep.path; });
            if (!path) {
                return std::nullopt;
            }
            return std::make_pair(handle, *path);
        });

    bool success = true;
    std::vector<std::int64_t> ids;
    for (const auto& item : downloaded) {
        std::error_code ec;
        std::filesystem::remove(item.second, ec);
        if (ec) {
            std::cerr << "Could not delete " << item.second << ": " << ec.message() << std::endl;
            success = false;
        }
        ids.push_back(item.first->read([](const Episode& ep) { return ep.id; }));
    }

    try {
        db_.removeFiles(ids);
        for (const auto& item : downloaded) {
            item.first->write([](Episode& ep) { ep.path.reset(); });
        }
    } catch (const std::exception& e) {
        std::cerr << "Error removing files from database: " << e.what() << std::endl;
        success = false;
    }

    if (!success) {
        notify("Error while deleting files", true);
    } else if (ids.empty()) {
        notify("There are no downloads to delete", false);
    } else {
        updateFilters(false);
        notify("Files successfully deleted.", false);
    }
}

void Controller::removePodcast(std::int64_t podId, bool deleteFiles) {
    if (deleteFiles) {
        try {
            this->deleteFiles(podId);
        } catch (const std::exception& e) {
            std::cerr << "Error deleting files of podcast " << podId << ": " << e.what() << std::endl;
        }
    }

    const std::string url = podcastHandle(podId)->read([](const Podcast& p) { return p.url; });
    db_.removePodcast(podId);
    sendRemote(remote::RemovePodcast{url});

    reloadPodcasts();
    updateUnplayed(true);
    updateQueue(queue_->order(false));
    updateFilters(false);
}

// --- Remote sync -----------------------------------------------------------

void Controller::requestRemoteSync() {
    if (!config_.enableSync || !channels_.toRemote) {
        return;
    }
    channels_.toRemote->send(remote::GetChanges{});
}

void Controller::remoteSyncResult(const msg::RemoteSyncResult& result) {
    const MergePlan plan = planRemoteMerge(localIndex(), result);
    if (plan.unmapped > 0) {
        std::cout << "Remote sync: skipped " << plan.unmapped
                  << " play actions for episodes not known locally" << std::endl;
    }

    for (const auto& url : plan.newPodcastUrls) {
        addPodcast(url);
    }
    applyPositionUpdates(plan.updates);
    for (std::int64_t podId : plan.removedPodcasts) {
        removePodcast(podId, true);
    }

    try {
        db_.setParam("last_sync", std::to_string(result.timestamp));
    } catch (const std::exception& e) {
        std::cerr << "Could not store sync timestamp: " << e.what() << std::endl;
    }

    updateUnplayed(true);
    updateFilters(false);
    notify("Remote sync finished with " + std::to_string(plan.updates.size()) + " updates", false);
}

LocalPodcastIndex Controller::localIndex() const {
    LocalPodcastIndex index;
    for (const auto& handle : podcasts_->handles(false)) {
        handle->read([&index](const Podcast& podcast) {
            auto& entry = index.byUrl[podcast.url];
            entry.podId = podcast.id;
            auto urls = podcast.episodes->map(
                [](const Episode& ep) { return std::make_pair(ep.url, ep.id); }, false);
            entry.episodesByUrl.insert(urls.begin(), urls.end());
        });
    }
    return index;
}

void Controller::reportPlayed(const std::string& podcastUrl, const Episode& episode) {
    if (!config_.enableSync) {
        return;
    }
    if (!episode.duration) {
        std::cerr << "Setting duration to maximum for episode " << episode.url
                  << ", else it cannot be marked as played remotely" << std::endl;
    }
    const std::int64_t total = episode.duration.value_or(kMaxDuration);
    const std::int64_t position = episode.played ? total : episode.position;
    sendRemote(remote::MarkPlayed{PlayReport{podcastUrl, episode.url, position, total}});
}

void Controller::sendRemote(RemoteRequest request) {
    if (config_.enableSync && channels_.toRemote) {
        channels_.toRemote->send(std::move(request));
    }
}

// --- Views -----------------------------------------------------------------

void Controller::changeFilter(FilterType type) {
    std::string description;
    if (type == FilterType::Played) {
        switch (filters_.played) {
            case FilterStatus::All:
                filters_.played = FilterStatus::NegativeCases;
                description = "Unplayed only";
                break;
            case FilterStatus::NegativeCases:
                filters_.played = FilterStatus::PositiveCases;
                description = "Played only";
                break;
            case FilterStatus::PositiveCases:
                filters_.played = FilterStatus::All;
                description = "Played and unplayed";
                break;
        }
    } else {
        switch (filters_.downloaded) {
            case FilterStatus::All:
                filters_.downloaded = FilterStatus::PositiveCases;
                description = "Downloaded only";
                break;
            case FilterStatus::PositiveCases:
                filters_.downloaded = FilterStatus::NegativeCases;
                description = "Undownloaded only";
                break;
            case FilterStatus::NegativeCases:
                filters_.downloaded = FilterStatus::All;
                description = "Downloaded and undownloaded";
                break;
        }
    }
    notify("Filter: " + description, false);
    updateFilters(false);
}

void Controller::updateFilters(bool inLoop) {
    const std::int64_t now = utils::currentTimeMs();
    if (inLoop && now - lastFilterTimeMs_ < kFilterThrottleMs) {
        return;
    }
    lastFilterTimeMs_ = now;

    const Filters filters = filters_;
    auto hidden = [filters](const Episode& ep) {
        bool byPlayed = false;
        switch (filters.played) {
            case FilterStatus::PositiveCases: byPlayed = !ep.played; break;
            case FilterStatus::NegativeCases: byPlayed = ep.played; break;
            case FilterStatus::All: break;
        }
        bool byDownloaded = false;
        switch (filters.downloaded) {
            case FilterStatus::PositiveCases: byDownloaded = !ep.path; break;
            case FilterStatus::NegativeCases: byDownloaded = ep.path.has_value(); break;
            case FilterStatus::All: break;
        }
        return byPlayed || byDownloaded;
    };

    for (const auto& episodes : podcasts_->map([](const Podcast& p) { return p.episodes; }, false)) {
        auto visible = episodes->filterMap(
            [&hidden](const Catalog<Episode>::Handle& handle) -> std::optional<std::int64_t> {
                return handle->read([&hidden](const Episode& ep) -> std::optional<std::int64_t> {
                    if (hidden(ep)) {
                        return std::nullopt;
                    }
                    return ep.id;
                });
            });
        episodes->replaceFilteredOrder(std::move(visible));
    }
}

void Controller::updateUnplayed(bool full) {
    if (full) {
        std::vector<Catalog<Episode>::Handle> unplayed;
        for (const auto& episodes : podcasts_->map([](const Podcast& p) { return p.episodes; }, false)) {
            for (auto& handle : episodes->handles(false)) {
                if (!handle->read([](const Episode& ep) { return ep.played; })) {
                    unplayed.push_back(std::move(handle));
                }
            }
        }
        unplayed_->replaceAll(std::move(unplayed));
    }
    unplayed_->sortBy([](const Episode& ep) { return ep.pubdate.value_or(TimePoint{}); });
    unplayed_->reverse();
}

void Controller::trackUnplayed(const Catalog<Episode>::Handle& episode, bool played) {
    const std::int64_t id = episode->read([](const Episode& ep) { return ep.id; });
    if (played && unplayed_->contains(id)) {
        unplayed_->remove(id);
    } else if (!played && !unplayed_->contains(id)) {
        unplayed_->insert(episode);
        updateUnplayed(false);
    }
}

void Controller::updateQueue(std::vector<std::int64_t> ids) {
    std::unordered_map<std::int64_t, Catalog<Episode>::Handle> live;
    for (const auto& episodes : podcasts_->map([](const Podcast& p) { return p.episodes; }, false)) {
        for (auto& handle : episodes->handles(false)) {
            const std::int64_t id = handle->read([](const Episode& ep) { return ep.id; });
            live.emplace(id, std::move(handle));
        }
    }

    std::vector<Catalog<Episode>::Handle> queued;
    for (std::int64_t id : ids) {
        auto it = live.find(id);
        if (it != live.end()) {
            queued.push_back(it->second);
        }
    }
    queue_->replaceAll(std::move(queued));
}

void Controller::enqueue(std::int64_t podId, std::int64_t epId) {
    auto handle = episodeHandle(podId, epId);
    if (queue_->contains(epId)) {
        return;
    }
    std::vector<std::int64_t> order = queue_->order(false);
    order.push_back(epId);
    db_.setQueue(order);
    queue_->insert(handle);
}

void Controller::writeQueue() {
    db_.setQueue(queue_->order(false));
}

void Controller::reloadPodcasts() {
    podcasts_->replaceAll(db_.getPodcasts());
}

// --- Lookups ---------------------------------------------------------------

Catalog<Podcast>::Handle Controller::podcastHandle(std::int64_t podId) const {
    auto handle = podcasts_->get(podId);
    if (!handle) {
        throw NotFoundError("Failed to get pod_id: " + std::to_string(podId));
    }
    return handle;
}

std::shared_ptr<Catalog<Episode>> Controller::episodesOf(std::int64_t podId) const {
    return podcastHandle(podId)->read([](const Podcast& p) { return p.episodes; });
}

Catalog<Episode>::Handle Controller::episodeHandle(std::int64_t podId, std::int64_t epId) const {
    auto handle = episodesOf(podId)->get(epId);
    if (!handle) {
        throw NotFoundError("Failed to get ep_id: " + std::to_string(epId));
    }
    return handle;
}

// --- Notifications ---------------------------------------------------------

void Controller::notify(const std::string& text, bool error) {
    channels_.toUi->send(ui::Notification{text, kMessageTime, error});
}

void Controller::persistentNotify(const std::string& text, bool error) {
    channels_.toUi->send(ui::PersistentNotification{text, error});
}

void Controller::clearPersistentNotification() {
    channels_.toUi->send(ui::ClearPersistentNotification{});
}

void Controller::updateTrackerNotification() {
    const std::size_t syncs = syncCounter_;
    const std::size_t downloads = downloadTracker_.size();

    if (syncs > 0 && downloads > 0) {
        persistentNotify("Syncing " + std::to_string(syncs) + " podcast" + plural(syncs) +
                             ", downloading " + std::to_string(downloads) + " episode" +
                             plural(downloads) + "...",
                         false);
    } else if (syncs > 0) {
        persistentNotify("Syncing " + std::to_string(syncs) + " podcast" + plural(syncs) + "...",
                         false);
    } else if (downloads > 0) {
        persistentNotify("Downloading " + std::to_string(downloads) + " episode" +
                             plural(downloads) + "...",
                         false);
    } else {
        clearPersistentNotification();
    }
}

} // namespace core
} // namespace podengine
