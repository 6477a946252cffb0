#pragma once

#include "podengine/core/Database.hpp"

#include <filesystem>
#include <mutex>

#include <nlohmann/json.hpp>

namespace podengine {
namespace core {

/// Database stored as one JSON document.
///
/// The whole document is kept in memory. A mutating call edits a copy,
/// writes it to a temporary file next to the database and renames it over
/// the old one; only then does the in-memory document change.
class JsonDatabase : public Database {
public:
    // Loads `file` if it exists. Throws DatabaseError if it cannot be parsed.
    explicit JsonDatabase(std::filesystem::path file);

    std::vector<Podcast> getPodcasts() override;

    SyncResult insertPodcast(const PodcastData& podcast) override;
    SyncResult updatePodcast(std::int64_t podId, const PodcastData& podcast) override;
    void removePodcast(std::int64_t podId) override;

    void insertFile(std::int64_t episodeId, const std::filesystem::path& path) override;
    void removeFile(std::int64_t episodeId) override;
    void removeFiles(const std::vector<std::int64_t>& episodeIds) override;

    void setPlayedStatus(std::int64_t episodeId, std::int64_t position,
                         std::optional<std::int64_t> duration, bool played) override;
    void setPlayedStatusBatch(const std::vector<PlayedStatus>& updates) override;

    std::optional<std::string> getParam(const std::string& key) override;
    void setParam(const std::string& key, const std::string& value) override;

    std::vector<std::int64_t> getQueue() override;
    void setQueue(const std::vector<std::int64_t>& episodeIds) override;

private:
    void load();
    void save(const nlohmann::json& doc) const;
    void commit(nlohmann::json doc);

    std::filesystem::path file_;
    nlohmann::json doc_;
    std::mutex mutex_;
};

} // namespace core
} // namespace podengine
