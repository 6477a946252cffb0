#include "podengine/core/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace podengine {
namespace core {

namespace {

std::filesystem::path defaultDataDir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "podengine";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "podengine";
    }
    return std::filesystem::current_path() / "podengine";
}

template <typename T>
void readKey(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Warning: invalid value for config key '" << key
                  << "', using default: " << e.what() << std::endl;
    }
}

void readCount(const nlohmann::json& j, const char* key, std::size_t& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_integer() || it->get<std::int64_t>() < 1) {
        std::cerr << "Warning: config key '" << key
                  << "' must be a positive integer, using default" << std::endl;
        return;
    }
    target = it->get<std::size_t>();
}

} // namespace

Config Config::defaults() {
    Config config;
    config.downloadPath = defaultDataDir();
    config.databasePath = config.downloadPath / "podengine.json";
    return config;
}

Config Config::fromJson(const nlohmann::json& j) {
    Config config = defaults();
    if (!j.is_object()) {
        std::cerr << "Warning: config is not a JSON object, using defaults" << std::endl;
        return config;
    }

    std::string downloadPath;
    readKey(j, "download_path", downloadPath);
    if (!downloadPath.empty()) {
        config.downloadPath = downloadPath;
        config.databasePath = config.downloadPath / "podengine.json";
    }
    std::string databasePath;
    readKey(j, "database_path", databasePath);
    if (!databasePath.empty()) {
        config.databasePath = databasePath;
    }

    readCount(j, "simultaneous_downloads", config.simultaneousDownloads);
    readCount(j, "max_retries", config.maxRetries);
    readKey(j, "mark_as_played_on_play", config.markAsPlayedOnPlay);

    readKey(j, "enable_sync", config.enableSync);
    readKey(j, "sync_server", config.syncServer);
    readKey(j, "sync_username", config.syncUsername);
    readKey(j, "sync_password", config.syncPassword);
    readKey(j, "sync_device", config.syncDevice);
    readKey(j, "sync_on_start", config.syncOnStart);
    return config;
}

Config Config::load(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        std::cout << "No config at " << file << ", using defaults" << std::endl;
        return defaults();
    }

    try {
        nlohmann::json j;
        in >> j;
        return fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error reading config " << file << ": " << e.what() << std::endl;
        return defaults();
    }
}

} // namespace core
} // namespace podengine
