#include "podengine/core/FeedWorker.hpp"
#include "podengine/core/Errors.hpp"
#include "podengine/core/PodcastFeed.hpp"
#include "podengine/core/Retry.hpp"

#include <iostream>
#include <sstream>

namespace podengine {
namespace core {

PodcastData fetchFeed(HttpClient& client, const std::string& url, std::size_t maxRetries) {
    if (url.empty()) {
        throw FeedError("Empty URL provided");
    }

    RequestOptions options;
    options.connectTimeout = std::chrono::seconds(5);
    options.timeout = std::chrono::seconds(20);

    HttpResponse response;
    AttemptResult outcome = retryWithBudget(maxRetries, [&] {
        response = client.get(url, options);
        if (response.ok()) {
            return AttemptResult::Success;
        }
        std::cerr << "Fetching " << url << " failed: "
                  << (response.error.empty() ? "HTTP " + std::to_string(response.status)
                                             : response.error)
                  << std::endl;
        return AttemptResult::Retryable;
    });

    if (outcome != AttemptResult::Success) {
        std::stringstream err;
        err << "Failed to fetch podcast feed: ";
        if (!response.error.empty()) {
            err << response.error;
        } else {
            err << "HTTP " << response.status;
        }
        throw FeedError(err.str());
    }

    PodcastFeed feed(url);
    feed.parseFeed(response.body);
    return feed.takeData();
}

void checkFeed(FeedRequest request, std::size_t maxRetries, ThreadPool& pool,
               std::shared_ptr<HttpClient> client, Sender<Message> inbox) {
    pool.execute([request = std::move(request), maxRetries, client = std::move(client),
                  inbox = std::move(inbox)]() {
        try {
            PodcastData podcast = fetchFeed(*client, request.url, maxRetries);
            if (request.id) {
                inbox->send(msg::FeedSyncData{*request.id, std::move(podcast)});
            } else {
                inbox->send(msg::FeedNewData{std::move(podcast)});
            }
        } catch (const std::exception& e) {
            std::cerr << "Error fetching feed " << request.url << ": " << e.what() << std::endl;
            inbox->send(msg::FeedError{request});
        }
    });
}

} // namespace core
} // namespace podengine
