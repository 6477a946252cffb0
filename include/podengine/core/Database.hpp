#pragma once

#include "podengine/core/Types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace podengine {
namespace core {

/// Persistence collaborator used by the controller. Every call either
/// succeeds completely or throws DatabaseError leaving the stored state
/// unchanged. Implementations must be callable from any thread.
class Database {
public:
    virtual ~Database() = default;

    // Podcasts ordered by title, each with its episodes newest first.
    virtual std::vector<Podcast> getPodcasts() = 0;

    virtual SyncResult insertPodcast(const PodcastData& podcast) = 0;
    virtual SyncResult updatePodcast(std::int64_t podId, const PodcastData& podcast) = 0;
    virtual void removePodcast(std::int64_t podId) = 0;

    virtual void insertFile(std::int64_t episodeId, const std::filesystem::path& path) = 0;
    virtual void removeFile(std::int64_t episodeId) = 0;
    virtual void removeFiles(const std::vector<std::int64_t>& episodeIds) = 0;

    virtual void setPlayedStatus(std::int64_t episodeId, std::int64_t position,
                                 std::optional<std::int64_t> duration, bool played) = 0;
    virtual void setPlayedStatusBatch(const std::vector<PlayedStatus>& updates) = 0;

    virtual std::optional<std::string> getParam(const std::string& key) = 0;
    virtual void setParam(const std::string& key, const std::string& value) = 0;

    virtual std::vector<std::int64_t> getQueue() = 0;
    virtual void setQueue(const std::vector<std::int64_t>& episodeIds) = 0;
};

} // namespace core
} // namespace podengine
