#include "podengine/core/RemoteMerge.hpp"

#include <map>
#include <unordered_set>
#include <utility>

namespace podengine {
namespace core {

MergePlan planRemoteMerge(const LocalPodcastIndex& index, const msg::RemoteSyncResult& result) {
    MergePlan plan;

    std::unordered_set<std::string> requested;
    for (const auto& url : result.added) {
        if (index.byUrl.count(url) == 0 && requested.insert(url).second) {
            plan.newPodcastUrls.push_back(url);
        }
    }

    std::unordered_set<std::int64_t> removing;
    for (const auto& url : result.removed) {
        auto it = index.byUrl.find(url);
        if (it != index.byUrl.end() && removing.insert(it->second.podId).second) {
            plan.removedPodcasts.push_back(it->second.podId);
        }
    }

    std::map<std::pair<std::int64_t, std::int64_t>, PositionUpdate> latest;

    for (const auto& action : result.actions) {
        if (action.action != EpisodeAction::Action::Play || !action.position || !action.total) {
            continue;
        }
        auto podcast = index.byUrl.find(action.podcast);
        if (podcast == index.byUrl.end()) {
            ++plan.unmapped;
            continue;
        }
        auto episode = podcast->second.episodesByUrl.find(action.episode);
        if (episode == podcast->second.episodesByUrl.end()) {
            ++plan.unmapped;
            continue;
        }

        // Actions arrive in server order; the last one for an episode wins.
        const auto key = std::make_pair(podcast->second.podId, episode->second);
        latest[key] = PositionUpdate{key.first, key.second, *action.position, *action.total};
    }

    plan.updates.reserve(latest.size());
    for (const auto& entry : latest) {
        plan.updates.push_back(entry.second);
    }
    return plan;
}

} // namespace core
} // namespace podengine
