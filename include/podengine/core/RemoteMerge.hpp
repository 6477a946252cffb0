#pragma once

#include "podengine/core/Messages.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace podengine {
namespace core {

// Local ids by url, as needed to map remote changes onto the catalog.
struct LocalPodcastIndex {
    struct Entry {
        std::int64_t podId = 0;
        std::unordered_map<std::string, std::int64_t> episodesByUrl;
    };
    std::unordered_map<std::string, Entry> byUrl;
};

struct PositionUpdate {
    std::int64_t podId = 0;
    std::int64_t epId = 0;
    std::int64_t position = 0;
    std::int64_t total = 0;
};

struct MergePlan {
    std::vector<std::string> newPodcastUrls;
    std::vector<std::int64_t> removedPodcasts;
    // At most one entry per (podId, epId), ordered by podId then epId.
    std::vector<PositionUpdate> updates;
    // Play actions whose podcast or episode is not known locally.
    std::size_t unmapped = 0;
};

/// Reconciles one remote sync result with the local catalog.
///
/// Added urls not present locally become new podcasts; removed urls that
/// map to a local podcast are scheduled for removal. Only play actions that
/// carry both position and total are used; for each episode the action
/// received last in the pass wins. Actions that cannot be mapped are
/// counted and dropped.
MergePlan planRemoteMerge(const LocalPodcastIndex& index, const msg::RemoteSyncResult& result);

} // namespace core
} // namespace podengine
