#pragma once

#include "podengine/core/HttpClient.hpp"
#include "podengine/core/MediaProbe.hpp"
#include "podengine/core/Messages.hpp"
#include "podengine/core/ThreadPool.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace podengine {
namespace core {

/// Extension for a downloaded file: from the content type when it is a
/// known audio/video type, else the suffix of the url's last path segment,
/// else "mp3".
std::string fileExtension(const std::string& contentType, const std::string& url);

/// "<sanitized title>[_YYYYMMDD_HHMMSS].<ext>"
std::string downloadFileName(const EpisodeDownload& episode, const std::string& extension);

/// Downloads one episode into `dest` and returns the message describing the
/// outcome: DownloadComplete with filePath and probed duration set, or one
/// of the three failure messages.
Message downloadFile(EpisodeDownload episode, const std::filesystem::path& dest,
                     std::size_t maxRetries, HttpClient& client, MediaProbe* probe);

/// Queues one pool job per episode; every job posts exactly one message.
void downloadList(std::vector<EpisodeDownload> episodes, const std::filesystem::path& dest,
                  std::size_t maxRetries, ThreadPool& pool, std::shared_ptr<HttpClient> client,
                  std::shared_ptr<MediaProbe> probe, Sender<Message> inbox);

} // namespace core
} // namespace podengine
