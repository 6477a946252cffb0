#pragma once

#include "podengine/core/HttpClient.hpp"
#include "podengine/core/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace podengine {
namespace core {

struct RemoteSyncConfig {
    std::string server;
    std::string username;
    std::string password;
    std::string device;
    std::size_t maxRetries = 3;
};

struct RemoteDevice {
    std::string id;
    std::string caption;
    std::string type;
    std::int64_t subscriptions = 0;
};

// Wire format of one episode action; timestamps are RFC 3339 on the wire.
void to_json(nlohmann::json& j, const EpisodeAction& action);
void from_json(const nlohmann::json& j, EpisodeAction& action);

/// Client for a gpodder.net compatible sync server (Basic auth, JSON).
///
/// Keeps two independent cursors, one for subscription changes and one
/// for episode actions. A cursor only moves forward after a response has
/// been received and parsed, so a failed call can be repeated without
/// losing changes. Login is attempted lazily before the first call and
/// cached once it succeeds; on first login the device is registered if
/// the server does not know it yet.
///
/// Every call throws RemoteSyncError after `maxRetries` failed attempts or
/// on an unparseable response. Not thread-safe: owned by the remote sync
/// worker thread.
class RemoteSyncClient {
public:
    RemoteSyncClient(RemoteSyncConfig config, std::shared_ptr<HttpClient> client,
                     std::int64_t timestamp = 0);

    std::int64_t subscriptionsCursor() const { return subscriptionsCursor_; }
    std::int64_t actionsCursor() const { return actionsCursor_; }
    // The lower cursor; what gets persisted between runs.
    std::int64_t timestamp() const;
    void setCursors(std::int64_t subscriptions, std::int64_t actions);

    bool loggedIn() const { return loggedIn_; }

    /// (added, removed) feed urls since the subscriptions cursor. The first
    /// call with a zero cursor returns the full subscription list as "added";
    /// the calls after it ask for the delta since 0 and advance the cursor.
    std::pair<std::vector<std::string>, std::vector<std::string>> getSubscriptionChanges();
    std::vector<EpisodeAction> getEpisodeActionChanges();

    void uploadSubscriptionChanges(const std::vector<std::string>& added,
                                   const std::vector<std::string>& removed);
    void addPodcast(const std::string& url);
    void removePodcast(const std::string& url);

    void markPlayed(const PlayReport& report);
    void markPlayedBatch(const std::vector<PlayReport>& reports);

    std::vector<RemoteDevice> getDevices();
    void registerDevice();

private:
    void requireLogin();
    std::vector<std::string> getAllSubscriptions();
    void postActions(const std::vector<PlayReport>& reports);

    std::string get(const std::string& url, std::map<std::string, std::string> params = {});
    std::string post(const std::string& url, const std::string& body);
    RequestOptions requestOptions() const;
    std::string userUrl(const std::string& prefix) const;
    std::string deviceUrl(const std::string& prefix) const;

    RemoteSyncConfig config_;
    std::shared_ptr<HttpClient> client_;
    std::int64_t subscriptionsCursor_;
    std::int64_t actionsCursor_;
    bool loggedIn_ = false;
    bool fullListFetched_ = false;
};

} // namespace core
} // namespace podengine
