#pragma once

#include "podengine/core/Channel.hpp"
#include "podengine/core/Types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace podengine {
namespace core {

// Everything the controller receives, from the front-end and from workers.
namespace msg {

// Front-end requests.
struct AddFeed { std::string url; };
struct Sync { std::int64_t podId; };
struct SyncAll {};
struct SyncRemote {};
struct Play { std::int64_t podId; std::int64_t epId; };
struct Pause {};
struct Seek { std::int64_t seconds; SeekDirection direction; };
struct MarkPlayed { std::int64_t podId; std::int64_t epId; bool played; };
struct MarkAllPlayed { std::int64_t podId; bool played; };
struct UpdatePosition { std::int64_t podId; std::int64_t epId; std::int64_t position; };
struct Download { std::int64_t podId; std::int64_t epId; };
struct DownloadAll { std::int64_t podId; };
struct Delete { std::int64_t podId; std::int64_t epId; };
struct DeleteAll { std::int64_t podId; };
struct RemovePodcast { std::int64_t podId; bool deleteFiles; };
struct FilterChange { FilterType type; };
struct Enqueue { std::int64_t podId; std::int64_t epId; };
struct QueueModified {};
struct Quit {};

// Feed refresh results.
struct FeedNewData { PodcastData podcast; };
struct FeedSyncData { std::int64_t podId; PodcastData podcast; };
struct FeedError { FeedRequest request; };

// Download results.
struct DownloadComplete { EpisodeDownload episode; };
struct DownloadResponseError { EpisodeDownload episode; };
struct DownloadFileCreateError { EpisodeDownload episode; };
struct DownloadFileWriteError { EpisodeDownload episode; };

// Remote sync results. Urls are already redirect-resolved; timestamp is
// the lower of the two cursors after the pass.
struct RemoteSyncResult {
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<EpisodeAction> actions;
    std::int64_t timestamp = 0;
};
struct RemoteSyncFailed { std::string what; };

} // namespace msg

using Message = std::variant<
    msg::AddFeed, msg::Sync, msg::SyncAll, msg::SyncRemote, msg::Play, msg::Pause, msg::Seek,
    msg::MarkPlayed, msg::MarkAllPlayed, msg::UpdatePosition, msg::Download, msg::DownloadAll,
    msg::Delete, msg::DeleteAll, msg::RemovePodcast, msg::FilterChange, msg::Enqueue,
    msg::QueueModified, msg::Quit, msg::FeedNewData, msg::FeedSyncData, msg::FeedError, msg::DownloadComplete,
    msg::DownloadResponseError, msg::DownloadFileCreateError, msg::DownloadFileWriteError,
    msg::RemoteSyncResult, msg::RemoteSyncFailed>;

// Commands the controller sends to the front-end.
namespace ui {

struct Notification {
    std::string text;
    std::chrono::milliseconds duration;
    bool error = false;
};
struct PersistentNotification {
    std::string text;
    bool error = false;
};
struct ClearPersistentNotification {};
struct PlayEpisode { std::int64_t podId; std::int64_t epId; };
struct TearDown {};

} // namespace ui

using UiCommand = std::variant<ui::Notification, ui::PersistentNotification,
                               ui::ClearPersistentNotification, ui::PlayEpisode, ui::TearDown>;

} // namespace core
} // namespace podengine
