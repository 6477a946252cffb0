#pragma once

#include "podengine/core/Channel.hpp"
#include "podengine/core/HttpClient.hpp"
#include "podengine/core/Messages.hpp"
#include "podengine/core/RemoteSync.hpp"

#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace podengine {
namespace core {

namespace remote {

struct GetChanges {};
struct AddPodcast { std::string url; };
struct RemovePodcast { std::string url; };
struct MarkPlayed { PlayReport report; };
struct MarkPlayedBatch { std::vector<PlayReport> reports; };
struct Quit {};

} // namespace remote

using RemoteRequest = std::variant<remote::GetChanges, remote::AddPodcast, remote::RemovePodcast,
                                   remote::MarkPlayed, remote::MarkPlayedBatch, remote::Quit>;

/// Owns the RemoteSyncClient and serves requests from the controller on its
/// own thread, so no sync traffic (redirect resolution included) ever runs
/// on the controller thread.
///
/// GetChanges fetches subscription changes, then episode actions, resolves
/// the redirects of every subscription url and posts one RemoteSyncResult.
/// If either call fails both cursors are restored and RemoteSyncFailed is
/// posted instead. Failures of the upload requests are logged.
class RemoteSyncWorker {
public:
    RemoteSyncWorker(std::unique_ptr<RemoteSyncClient> client, std::shared_ptr<HttpClient> http,
                     Sender<Message> inbox);
    ~RemoteSyncWorker();

    RemoteSyncWorker(const RemoteSyncWorker&) = delete;
    RemoteSyncWorker& operator=(const RemoteSyncWorker&) = delete;

    Sender<RemoteRequest> requests() const { return requests_; }

    void start();
    // Sends Quit and joins; safe to call more than once.
    void stop();

    // Serves one request on the calling thread. Returns false for Quit.
    bool handle(const RemoteRequest& request);

    const RemoteSyncClient& client() const { return *client_; }

private:
    void run();
    void getChanges();

    std::unique_ptr<RemoteSyncClient> client_;
    std::shared_ptr<HttpClient> http_;
    Sender<Message> inbox_;
    Sender<RemoteRequest> requests_;
    std::thread thread_;
};

} // namespace core
} // namespace podengine
