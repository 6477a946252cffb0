#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace podengine {
namespace core {

// How long transient notifications stay up.
constexpr std::chrono::milliseconds kMessageTime{5000};

// Reported as the total when an episode's duration is unknown; the sync
// server cannot mark an episode played without one.
constexpr std::int64_t kMaxDuration = 2147483647;

struct Config {
    std::filesystem::path downloadPath;
    std::filesystem::path databasePath;
    std::size_t simultaneousDownloads = 3;
    std::size_t maxRetries = 3;
    bool markAsPlayedOnPlay = true;

    bool enableSync = false;
    std::string syncServer;
    std::string syncUsername;
    std::string syncPassword;
    std::string syncDevice = "podengine";
    bool syncOnStart = false;

    // Defaults with the download path under $XDG_DATA_HOME or ~/.local/share.
    static Config defaults();

    // Keys missing from `j` keep their defaults; values of the wrong type
    // are ignored with a warning.
    static Config fromJson(const nlohmann::json& j);

    // A missing file yields the defaults. An unreadable or malformed file
    // is reported and also yields the defaults.
    static Config load(const std::filesystem::path& file);
};

} // namespace core
} // namespace podengine
