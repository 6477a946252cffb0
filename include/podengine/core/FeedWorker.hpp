#pragma once

#include "podengine/core/HttpClient.hpp"
#include "podengine/core/Messages.hpp"
#include "podengine/core/ThreadPool.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace podengine {
namespace core {

/// Fetches and parses one feed, retrying transport failures and non-2xx
/// responses up to `maxRetries` attempts. Throws FeedError.
PodcastData fetchFeed(HttpClient& client, const std::string& url, std::size_t maxRetries);

/// Queues one pool job that fetches `request` and posts exactly one of
/// FeedNewData (no id), FeedSyncData (refresh) or FeedError to `inbox`.
void checkFeed(FeedRequest request, std::size_t maxRetries, ThreadPool& pool,
               std::shared_ptr<HttpClient> client, Sender<Message> inbox);

} // namespace core
} // namespace podengine
