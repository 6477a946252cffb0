#pragma once

#include "podengine/core/Catalog.hpp"
#include "podengine/core/Channel.hpp"
#include "podengine/core/Config.hpp"
#include "podengine/core/Database.hpp"
#include "podengine/core/HttpClient.hpp"
#include "podengine/core/MediaProbe.hpp"
#include "podengine/core/Messages.hpp"
#include "podengine/core/Player.hpp"
#include "podengine/core/RemoteMerge.hpp"
#include "podengine/core/RemoteSyncWorker.hpp"
#include "podengine/core/ThreadPool.hpp"
#include "podengine/core/Types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace podengine {
namespace core {

struct ControllerChannels {
    // Where workers post their results; the controller consumes it.
    Sender<Message> inbox;
    Sender<UiCommand> toUi;
    // Null when remote sync is disabled.
    Sender<RemoteRequest> toRemote;
    // Null when running without audio output.
    Sender<PlayerCommand> toPlayer;
};

/// Single-threaded dispatcher at the centre of the engine.
///
/// Consumes the inbox, is the only writer of catalog structure, and keeps
/// the in-memory catalog in step with the database: every change is
/// persisted first and only applied in memory once the database accepted
/// it. Network and disk work is handed to the pool; results come back
/// through the inbox as messages.
///
/// Ids carried by messages may be stale by the time they are handled. A
/// missing podcast or episode aborts that one message with NotFoundError,
/// which is logged; the loop carries on.
class Controller {
public:
    Controller(Config config, Database& db, std::shared_ptr<HttpClient> http,
               std::shared_ptr<MediaProbe> probe, ControllerChannels channels);

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    // Runs until Quit or until the inbox is closed, then tells the UI to
    // tear down.
    void run();

    // Handles one message on the calling thread. Returns false for Quit.
    bool handle(Message message);

    // Catalogs are shared with the front-end for reading. Episodes join the
    // queue through Enqueue; the front-end may only reorder it and then send
    // QueueModified.
    std::shared_ptr<Catalog<Podcast>> podcasts() const { return podcasts_; }
    std::shared_ptr<Catalog<Episode>> unplayed() const { return unplayed_; }
    std::shared_ptr<Catalog<Episode>> queue() const { return queue_; }

    // Controller thread only.
    Filters filters() const { return filters_; }
    std::size_t downloadsInFlight() const { return downloadTracker_.size(); }
    std::size_t syncsInFlight() const { return syncCounter_; }

private:
    void dispatch(const Message& message);

    // Feeds
    void addPodcast(const std::string& url);
    void sync(std::optional<std::int64_t> podId);
    void addOrSyncData(const PodcastData& podcast, std::optional<std::int64_t> podId);
    void feedError(const FeedRequest& request);
    void finishSync();

    // Playback state
    void play(std::int64_t podId, std::int64_t epId);
    void markPlayed(std::int64_t podId, std::int64_t epId, bool played);
    void markAllPlayed(std::int64_t podId, bool played);
    void updatePosition(std::int64_t podId, std::int64_t epId, std::int64_t position);
    void applyPositionUpdates(const std::vector<PositionUpdate>& updates);

    // Files
    void download(std::int64_t podId, std::optional<std::int64_t> epId);
    void downloadComplete(const EpisodeDownload& episode);
    void downloadFailed(const EpisodeDownload& episode, const std::string& text);
    void finishDownload(std::int64_t episodeId);
    void deleteFile(std::int64_t podId, std::int64_t epId);
    void deleteFiles(std::int64_t podId);
    void removePodcast(std::int64_t podId, bool deleteFiles);

    // Remote sync
    void requestRemoteSync();
    void remoteSyncResult(const msg::RemoteSyncResult& result);
    LocalPodcastIndex localIndex() const;
    void reportPlayed(const std::string& podcastUrl, const Episode& episode);
    void sendRemote(RemoteRequest request);

    // Views
    void changeFilter(FilterType type);
    void updateFilters(bool inLoop);
    void updateUnplayed(bool full);
    void trackUnplayed(const Catalog<Episode>::Handle& episode, bool played);
    void updateQueue(std::vector<std::int64_t> ids);
    void enqueue(std::int64_t podId, std::int64_t epId);
    void writeQueue();
    void reloadPodcasts();

    // Lookups; throw NotFoundError.
    Catalog<Podcast>::Handle podcastHandle(std::int64_t podId) const;
    std::shared_ptr<Catalog<Episode>> episodesOf(std::int64_t podId) const;
    Catalog<Episode>::Handle episodeHandle(std::int64_t podId, std::int64_t epId) const;

    // Notifications
    void notify(const std::string& text, bool error);
    void persistentNotify(const std::string& text, bool error);
    void clearPersistentNotification();
    void updateTrackerNotification();

    Config config_;
    Database& db_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<MediaProbe> probe_;
    ControllerChannels channels_;

    std::shared_ptr<Catalog<Podcast>> podcasts_;
    std::shared_ptr<Catalog<Episode>> unplayed_;
    std::shared_ptr<Catalog<Episode>> queue_;

    Filters filters_;
    std::int64_t lastFilterTimeMs_ = 0;
    std::size_t syncCounter_ = 0;
    std::vector<SyncResult> syncTracker_;
    std::set<std::int64_t> downloadTracker_;

    ThreadPool pool_;
};

} // namespace core
} // namespace podengine
