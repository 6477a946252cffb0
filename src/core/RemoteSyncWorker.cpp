#include "podengine/core/RemoteSyncWorker.hpp"

#include <iostream>

namespace podengine {
namespace core {

RemoteSyncWorker::RemoteSyncWorker(std::unique_ptr<RemoteSyncClient> client,
                                   std::shared_ptr<HttpClient> http, Sender<Message> inbox)
    : client_(std::move(client)),
      http_(std::move(http)),
      inbox_(std::move(inbox)),
      requests_(std::make_shared<Channel<RemoteRequest>>()) {}

RemoteSyncWorker::~RemoteSyncWorker() {
    stop();
}

void RemoteSyncWorker::start() {
    if (!thread_.joinable()) {
        thread_ = std::thread(&RemoteSyncWorker::run, this);
    }
}

void RemoteSyncWorker::stop() {
    requests_->send(remote::Quit{});
    requests_->close();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void RemoteSyncWorker::run() {
    while (auto request = requests_->receive()) {
        if (!handle(*request)) {
            break;
        }
    }
}

bool RemoteSyncWorker::handle(const RemoteRequest& request) {
    if (std::holds_alternative<remote::Quit>(request)) {
        return false;
    }

    try {
        if (std::holds_alternative<remote::GetChanges>(request)) {
            getChanges();
        } else if (auto add = std::get_if<remote::AddPodcast>(&request)) {
            client_->addPodcast(add->url);
        } else if (auto remove = std::get_if<remote::RemovePodcast>(&request)) {
            client_->removePodcast(remove->url);
        } else if (auto played = std::get_if<remote::MarkPlayed>(&request)) {
            client_->markPlayed(played->report);
        } else if (auto batch = std::get_if<remote::MarkPlayedBatch>(&request)) {
            client_->markPlayedBatch(batch->reports);
        }
    } catch (const std::exception& e) {
        std::cerr << "Remote sync request failed: " << e.what() << std::endl;
    }
    return true;
}

void RemoteSyncWorker::getChanges() {
    const std::int64_t subscriptions = client_->subscriptionsCursor();
    const std::int64_t actions = client_->actionsCursor();

    try {
        auto changes = client_->getSubscriptionChanges();
        auto episodeActions = client_->getEpisodeActionChanges();

        msg::RemoteSyncResult result;
        for (const auto& url : changes.first) {
            result.added.push_back(resolveRedirection(*http_, url));
        }
        for (const auto& url : changes.second) {
            result.removed.push_back(resolveRedirection(*http_, url));
        }
        result.actions = std::move(episodeActions);
        result.timestamp = client_->timestamp();
        inbox_->send(std::move(result));
    } catch (const std::exception& e) {
        client_->setCursors(subscriptions, actions);
        std::cerr << "Remote sync failed: " << e.what() << std::endl;
        inbox_->send(msg::RemoteSyncFailed{e.what()});
    }
}

} // namespace core
} // namespace podengine
