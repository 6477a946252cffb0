#include "podengine/core/RemoteSync.hpp"
#include "podengine/core/Errors.hpp"
#include "podengine/core/Retry.hpp"
#include "podengine/core/Utils.hpp"

#include <algorithm>
#include <iostream>

namespace podengine {
namespace core {

namespace {

const char* actionName(EpisodeAction::Action action) {
    switch (action) {
        case EpisodeAction::Action::New: return "new";
        case EpisodeAction::Action::Download: return "download";
        case EpisodeAction::Action::Play: return "play";
        case EpisodeAction::Action::Delete: return "delete";
    }
    return "play";
}

std::optional<std::int64_t> optionalInt(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::int64_t>();
}

nlohmann::json parseBody(const std::string& body, const std::string& what) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw RemoteSyncError("Error parsing " + what + ": " + e.what());
    }
}

} // namespace

void to_json(nlohmann::json& j, const EpisodeAction& action) {
    auto optional = [](const std::optional<std::int64_t>& value) {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    };
    j = nlohmann::json{
        {"podcast", action.podcast},
        {"episode", action.episode},
        {"action", actionName(action.action)},
        {"timestamp", utils::formatRfc3339(action.timestamp)},
        {"started", optional(action.started)},
        {"position", optional(action.position)},
        {"total", optional(action.total)}};
}

void from_json(const nlohmann::json& j, EpisodeAction& action) {
    action.podcast = j.at("podcast").get<std::string>();
    action.episode = j.at("episode").get<std::string>();

    const std::string name = utils::toLower(j.at("action").get<std::string>());
    if (name == "new") {
        action.action = EpisodeAction::Action::New;
    } else if (name == "download") {
        action.action = EpisodeAction::Action::Download;
    } else if (name == "play") {
        action.action = EpisodeAction::Action::Play;
    } else if (name == "delete") {
        action.action = EpisodeAction::Action::Delete;
    } else {
        throw RemoteSyncError("Unknown episode action: " + name);
    }

    const auto& timestamp = j.at("timestamp");
    if (timestamp.is_number_integer()) {
        action.timestamp = timestamp.get<std::int64_t>();
    } else {
        auto parsed = utils::parseRfc3339(timestamp.get<std::string>());
        if (!parsed) {
            throw RemoteSyncError("failed to parse date: " + timestamp.get<std::string>());
        }
        action.timestamp = *parsed;
    }

    action.started = optionalInt(j, "started");
    action.position = optionalInt(j, "position");
    action.total = optionalInt(j, "total");
}

RemoteSyncClient::RemoteSyncClient(RemoteSyncConfig config, std::shared_ptr<HttpClient> client,
                                   std::int64_t timestamp)
    : config_(std::move(config)),
      client_(std::move(client)),
      subscriptionsCursor_(timestamp),
      actionsCursor_(timestamp) {}

std::int64_t RemoteSyncClient::timestamp() const {
    return std::min(subscriptionsCursor_, actionsCursor_);
}

void RemoteSyncClient::setCursors(std::int64_t subscriptions, std::int64_t actions) {
    subscriptionsCursor_ = subscriptions;
    actionsCursor_ = actions;
}

RequestOptions RemoteSyncClient::requestOptions() const {
    RequestOptions options;
    options.connectTimeout = std::chrono::seconds(10);
    options.timeout = std::chrono::seconds(30);
    options.username = config_.username;
    options.password = config_.password;
    options.contentType = "application/json";
    return options;
}

std::string RemoteSyncClient::userUrl(const std::string& prefix) const {
    return config_.server + prefix + config_.username + ".json";
}

std::string RemoteSyncClient::deviceUrl(const std::string& prefix) const {
    return config_.server + prefix + config_.username + "/" + config_.device + ".json";
}

std::string RemoteSyncClient::get(const std::string& url,
                                  std::map<std::string, std::string> params) {
    RequestOptions options = requestOptions();
    options.params = std::move(params);

    HttpResponse response;
    AttemptResult outcome = retryWithBudget(config_.maxRetries, [&] {
        response = client_->get(url, options);
        return response.ok() ? AttemptResult::Success : AttemptResult::Retryable;
    });
    if (outcome != AttemptResult::Success) {
        throw RemoteSyncError(response.error.empty()
                                  ? "Error code: " + std::to_string(response.status)
                                  : "Max retries exceeded: " + response.error);
    }
    return response.body;
}

std::string RemoteSyncClient::post(const std::string& url, const std::string& body) {
    const RequestOptions options = requestOptions();

    HttpResponse response;
    AttemptResult outcome = retryWithBudget(config_.maxRetries, [&] {
        response = client_->post(url, body, options);
        return response.ok() ? AttemptResult::Success : AttemptResult::Retryable;
    });
    if (outcome != AttemptResult::Success) {
        throw RemoteSyncError(response.error.empty()
                                  ? "Error code: " + std::to_string(response.status)
                                  : "Max retries exceeded: " + response.error);
    }
    return response.body;
}

void RemoteSyncClient::requireLogin() {
    if (loggedIn_) {
        return;
    }
    post(userUrl("/api/2/auth/"), "");

    bool known = false;
    for (const auto& device : getDevices()) {
        if (device.id == config_.device) {
            std::cout << "Using device: id = " << device.id << ", type = " << device.type
                      << ", subscriptions = " << device.subscriptions
                      << ", caption = " << device.caption << std::endl;
            known = true;
            break;
        }
    }
    if (!known) {
        registerDevice();
    }
    loggedIn_ = true;
}

std::vector<RemoteDevice> RemoteSyncClient::getDevices() {
    const nlohmann::json devices = parseBody(get(userUrl("/api/2/devices/")), "devices");
    std::vector<RemoteDevice> result;
    try {
        for (const auto& entry : devices) {
            RemoteDevice device;
            device.id = entry.at("id").get<std::string>();
            device.caption = entry.value("caption", "");
            device.type = entry.value("type", "");
            device.subscriptions = entry.value("subscriptions", std::int64_t{0});
            result.push_back(std::move(device));
        }
    } catch (const nlohmann::json::exception& e) {
        throw RemoteSyncError(std::string("Error parsing devices: ") + e.what());
    }
    return result;
}

void RemoteSyncClient::registerDevice() {
    const nlohmann::json device = {{"caption", ""}, {"type", "laptop"}};
    post(deviceUrl("/api/2/devices/"), device.dump());
    std::cout << "Registered device " << config_.device << std::endl;
}

std::vector<std::string> RemoteSyncClient::getAllSubscriptions() {
    const nlohmann::json subscriptions =
        parseBody(get(userUrl("/subscriptions/")), "subscriptions");
    std::vector<std::string> feeds;
    try {
        for (const auto& entry : subscriptions) {
            feeds.push_back(entry.is_string() ? entry.get<std::string>()
                                              : entry.at("feed").get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw RemoteSyncError(std::string("Error parsing subscriptions: ") + e.what());
    }
    return feeds;
}

std::pair<std::vector<std::string>, std::vector<std::string>>
RemoteSyncClient::getSubscriptionChanges() {
    requireLogin();
    if (subscriptionsCursor_ == 0 && !fullListFetched_) {
        auto feeds = getAllSubscriptions();
        fullListFetched_ = true;
        return {feeds, {}};
    }

    const nlohmann::json changes =
        parseBody(get(deviceUrl("/api/2/subscriptions/"),
                      {{"since", std::to_string(subscriptionsCursor_)}}),
                  "subscription changes");
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::int64_t timestamp = 0;
    try {
        added = changes.at("add").get<std::vector<std::string>>();
        removed = changes.at("remove").get<std::vector<std::string>>();
        timestamp = changes.at("timestamp").get<std::int64_t>();
    } catch (const nlohmann::json::exception& e) {
        throw RemoteSyncError(std::string("Error parsing subscription changes: ") + e.what());
    }

    for (const auto& url : added) {
        std::cout << "Remote: podcast added " << url << std::endl;
    }
    for (const auto& url : removed) {
        std::cout << "Remote: podcast removed " << url << std::endl;
    }
    subscriptionsCursor_ = timestamp + 1;
    return {added, removed};
}

std::vector<EpisodeAction> RemoteSyncClient::getEpisodeActionChanges() {
    requireLogin();
    const nlohmann::json body = parseBody(
        get(userUrl("/api/2/episodes/"), {{"since", std::to_string(actionsCursor_)}}),
        "episode actions");

    auto timestamp = body.find("timestamp");
    if (timestamp == body.end() || !timestamp->is_number_integer()) {
        throw RemoteSyncError("Parsing timestamp failed");
    }
    auto entries = body.find("actions");
    if (entries == body.end() || !entries->is_array()) {
        throw RemoteSyncError("Parsing episode actions failed");
    }

    std::vector<EpisodeAction> actions;
    for (const auto& entry : *entries) {
        try {
            actions.push_back(entry.get<EpisodeAction>());
        } catch (const std::exception& e) {
            std::cerr << "Skipping malformed episode action: " << e.what() << std::endl;
        }
    }
    actionsCursor_ = timestamp->get<std::int64_t>() + 1;
    return actions;
}

void RemoteSyncClient::uploadSubscriptionChanges(const std::vector<std::string>& added,
                                                 const std::vector<std::string>& removed) {
    requireLogin();
    const nlohmann::json changes = {{"add", added}, {"remove", removed}};
    const nlohmann::json body =
        parseBody(post(deviceUrl("/api/2/subscriptions/"), changes.dump()), "upload response");

    std::int64_t timestamp = 0;
    try {
        for (const auto& pair : body.value("update_urls", nlohmann::json::array())) {
            if (pair.is_array() && pair.size() == 2) {
                std::cout << "Remote: url changed " << pair[0].get<std::string>() << " -> "
                          << pair[1].get<std::string>() << std::endl;
            }
        }
        timestamp = body.at("timestamp").get<std::int64_t>();
    } catch (const nlohmann::json::exception& e) {
        throw RemoteSyncError(std::string("Error parsing url subscription changes: ") + e.what());
    }
    subscriptionsCursor_ = timestamp + 1;
}

void RemoteSyncClient::addPodcast(const std::string& url) {
    uploadSubscriptionChanges({url}, {});
}

void RemoteSyncClient::removePodcast(const std::string& url) {
    uploadSubscriptionChanges({}, {url});
}

void RemoteSyncClient::postActions(const std::vector<PlayReport>& reports) {
    const std::int64_t now = utils::currentTimeSeconds();
    nlohmann::json actions = nlohmann::json::array();
    for (const auto& report : reports) {
        EpisodeAction action;
        action.podcast = report.podcastUrl;
        action.episode = report.episodeUrl;
        action.action = EpisodeAction::Action::Play;
        action.timestamp = now;
        action.started = 0;
        action.position = report.position;
        action.total = report.total;
        actions.push_back(action);
    }
    post(deviceUrl("/api/2/episodes/"), actions.dump());
}

void RemoteSyncClient::markPlayed(const PlayReport& report) {
    requireLogin();
    postActions({report});
    std::cout << "Marked position: " << report.position << " episode: " << report.episodeUrl
              << " podcast: " << report.podcastUrl << std::endl;
}

void RemoteSyncClient::markPlayedBatch(const std::vector<PlayReport>& reports) {
    if (reports.empty()) {
        return;
    }
    requireLogin();
    postActions(reports);
    std::cout << "Marked played: " << reports.size() << " actions" << std::endl;
}

} // namespace core
} // namespace podengine
