#include "podengine/core/DownloadWorker.hpp"
#include "podengine/core/Retry.hpp"
#include "podengine/core/Utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <system_error>

namespace podengine {
namespace core {

namespace {

// https://www.iana.org/assignments/media-types/media-types.xhtml
const std::map<std::string, std::string>& extensionTable() {
    static const std::map<std::string, std::string> table = {
        {"audio/3gpp", "3gp"},       {"video/3gpp", "3gp"},
        {"audio/aac", "aac"},        {"audio/flac", "flac"},
        {"audio/x-m4a", "m4a"},      {"audio/matroska", "mka"},
        {"audio/midi", "mid"},       {"audio/x-midi", "mid"},
        {"audio/midi-clip", "midi2"}, {"audio/mp4", "mp4"},
        {"video/mp4", "mp4"},        {"audio/mpeg", "mp3"},
        {"audio/ogg", "oga"},        {"audio/vorbis", "oga"},
        {"audio/opus", "opus"},      {"audio/wav", "wav"},
        {"audio/webm", "weba"},      {"video/3gpp2", "3g2"},
        {"video/matroska", "mkv"},   {"video/matroska-3d", "mk3d"},
        {"video/quicktime", "mov"},  {"video/x-m4v", "m4v"},
    };
    return table;
}

void removeQuietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

} // namespace

std::string fileExtension(const std::string& contentType, const std::string& url) {
    const std::string mime = utils::toLower(utils::trim(contentType.substr(0, contentType.find(';'))));
    auto known = extensionTable().find(mime);
    if (known != extensionTable().end()) {
        return known->second;
    }

    std::string path = url.substr(0, url.find_first_of("?#"));
    const std::string segment = path.substr(path.rfind('/') == std::string::npos ? 0 : path.rfind('/') + 1);
    const auto dot = segment.rfind('.');
    if (dot != std::string::npos && dot + 1 < segment.size()) {
        std::string suffix = segment.substr(dot + 1);
        const bool clean = std::all_of(suffix.begin(), suffix.end(), [](unsigned char c) {
            return std::isalnum(c) != 0;
        });
        if (clean) {
            return suffix;
        }
    }
    return "mp3";
}

std::string downloadFileName(const EpisodeDownload& episode, const std::string& extension) {
    const std::string suffix = episode.pubdate ? utils::pubdateSuffix(*episode.pubdate) : "";
    const std::string tail = suffix + "." + extension;
    // The whole name, suffix and extension included, has to fit.
    const std::size_t budget =
        tail.size() < utils::kMaxFileNameBytes ? utils::kMaxFileNameBytes - tail.size() : 1;
    return utils::sanitizeFilename(episode.title, budget) + tail;
}

Message downloadFile(EpisodeDownload episode, const std::filesystem::path& dest,
                     std::size_t maxRetries, HttpClient& client, MediaProbe* probe) {
    const std::filesystem::path partPath = dest / ("." + std::to_string(episode.id) + ".part");

    RequestOptions options;
    options.connectTimeout = std::chrono::seconds(10);
    options.timeout = std::chrono::seconds(120);

    HttpResponse response;
    bool createFailed = false;
    bool writeFailed = false;
    AttemptResult outcome = retryWithBudget(maxRetries, [&] {
        std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            createFailed = true;
            return AttemptResult::Fatal;
        }
        response = client.download(episode.url, out, options);
        out.flush();
        if (!response.ok()) {
            std::cerr << "Download of " << episode.url << " failed: "
                      << (response.error.empty() ? "HTTP " + std::to_string(response.status)
                                                 : response.error)
                      << std::endl;
            return AttemptResult::Retryable;
        }
        if (!out) {
            writeFailed = true;
            return AttemptResult::Fatal;
        }
        return AttemptResult::Success;
    });

    if (createFailed) {
        return msg::DownloadFileCreateError{std::move(episode)};
    }
    if (outcome != AttemptResult::Success) {
        removeQuietly(partPath);
        if (writeFailed) {
            return msg::DownloadFileWriteError{std::move(episode)};
        }
        return msg::DownloadResponseError{std::move(episode)};
    }

    const std::filesystem::path finalPath =
        dest / downloadFileName(episode, fileExtension(response.contentType, episode.url));
    std::error_code ec;
    std::filesystem::rename(partPath, finalPath, ec);
    if (ec) {
        std::cerr << "Could not move download to " << finalPath << ": " << ec.message() << std::endl;
        removeQuietly(partPath);
        return msg::DownloadFileCreateError{std::move(episode)};
    }

    episode.filePath = finalPath;
    if (probe) {
        episode.duration = probe->durationSeconds(finalPath);
    }
    return msg::DownloadComplete{std::move(episode)};
}

void downloadList(std::vector<EpisodeDownload> episodes, const std::filesystem::path& dest,
                  std::size_t maxRetries, ThreadPool& pool, std::shared_ptr<HttpClient> client,
                  std::shared_ptr<MediaProbe> probe, Sender<Message> inbox) {
    for (auto& episode : episodes) {
        pool.execute([episode = std::move(episode), dest, maxRetries, client, probe, inbox]() {
            Message result = [&]() -> Message {
                try {
                    return downloadFile(episode, dest, maxRetries, *client, probe.get());
                } catch (const std::exception& e) {
                    std::cerr << "Download of " << episode.url << " failed: " << e.what()
                              << std::endl;
                    return msg::DownloadFileWriteError{episode};
                }
            }();
            inbox->send(std::move(result));
        });
    }
}

} // namespace core
} // namespace podengine
