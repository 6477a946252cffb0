#include "podengine/core/VlcBackend.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace podengine {
namespace core {

VlcAudioBackend::VlcAudioBackend() : vlc_(nullptr), player_(nullptr) {
    // Set VLC plugin path for macOS
    #ifdef __APPLE__
    setenv("VLC_PLUGIN_PATH", "/Applications/VLC.app/Contents/MacOS/plugins", 1);
    #endif

    const char* args[] = {
        "--no-video",
        "--quiet",
        "--network-caching=3000"
    };

    vlc_ = libvlc_new(3, args);
    if (!vlc_) {
        throw std::runtime_error("Failed to initialize VLC");
    }

    player_ = libvlc_media_player_new(vlc_);
    if (!player_) {
        libvlc_release(vlc_);
        throw std::runtime_error("Failed to create VLC media player");
    }

    libvlc_audio_set_volume(player_, 100);
}

VlcAudioBackend::~VlcAudioBackend() {
    stop();
    if (player_) {
        libvlc_media_player_release(player_);
    }
    if (vlc_) {
        libvlc_release(vlc_);
    }
}

bool VlcAudioBackend::open(const std::string& location, bool isUrl) {
    stop();

    libvlc_media_t* media = isUrl ? libvlc_media_new_location(vlc_, location.c_str())
                                  : libvlc_media_new_path(vlc_, location.c_str());
    if (!media) {
        std::cerr << "Failed to create media from " << location << std::endl;
        return false;
    }

    if (isUrl) {
        libvlc_media_add_option(media, ":network-caching=5000");
        libvlc_media_add_option(media, ":http-reconnect=true");
        libvlc_media_add_option(media, ":network-timeout=30000");
    }

    libvlc_media_player_set_media(player_, media);
    // The player retains its own reference
    libvlc_media_release(media);

    if (libvlc_media_player_play(player_) < 0) {
        std::cerr << "Failed to start playback of " << location << std::endl;
        return false;
    }

    // Wait for the stream to start or fail
    const int max_retries = 10;
    for (int retry_count = 0; retry_count < max_retries; ++retry_count) {
        libvlc_state_t state = libvlc_media_player_get_state(player_);
        if (state == libvlc_Playing) {
            return true;
        }
        if (state == libvlc_Error) {
            std::cerr << "Playback failed: player reported error state" << std::endl;
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    std::cerr << "Playback did not start, final state: "
              << getStateString(libvlc_media_player_get_state(player_)) << std::endl;
    return libvlc_media_player_get_state(player_) != libvlc_Error;
}

void VlcAudioBackend::play() {
    libvlc_media_player_set_pause(player_, 0);
    if (libvlc_media_player_get_state(player_) != libvlc_Playing) {
        libvlc_media_player_play(player_);
    }
}

void VlcAudioBackend::pause() {
    libvlc_media_player_set_pause(player_, 1);
}

void VlcAudioBackend::stop() {
    if (player_) {
        libvlc_media_player_stop(player_);
    }
}

void VlcAudioBackend::setVolume(int percent) {
    libvlc_audio_set_volume(player_, percent);
}

int VlcAudioBackend::volume() const {
    const int current = libvlc_audio_get_volume(player_);
    return current < 0 ? 100 : current;
}

std::int64_t VlcAudioBackend::positionMs() const {
    const libvlc_time_t time = libvlc_media_player_get_time(player_);
    return time < 0 ? 0 : static_cast<std::int64_t>(time);
}

std::optional<std::int64_t> VlcAudioBackend::lengthMs() const {
    const libvlc_time_t length = libvlc_media_player_get_length(player_);
    if (length <= 0) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(length);
}

void VlcAudioBackend::seekMs(std::int64_t positionMs) {
    libvlc_media_player_set_time(player_, static_cast<libvlc_time_t>(positionMs));
}

bool VlcAudioBackend::exhausted() const {
    return libvlc_media_player_get_state(player_) == libvlc_Ended;
}

std::string VlcAudioBackend::getStateString(libvlc_state_t state) {
    switch (state) {
        case libvlc_NothingSpecial: return "Nothing Special";
        case libvlc_Opening: return "Opening";
        case libvlc_Buffering: return "Buffering";
        case libvlc_Playing: return "Playing";
        case libvlc_Paused: return "Paused";
        case libvlc_Stopped: return "Stopped";
        case libvlc_Ended: return "Ended";
        case libvlc_Error: return "Error";
        default: return "Unknown";
    }
}

VlcMediaProbe::VlcMediaProbe() : vlc_(nullptr) {
    const char* args[] = {"--no-video", "--quiet"};
    vlc_ = libvlc_new(2, args);
    if (!vlc_) {
        throw std::runtime_error("Failed to initialize VLC");
    }
}

VlcMediaProbe::~VlcMediaProbe() {
    if (vlc_) {
        libvlc_release(vlc_);
    }
}

std::optional<std::int64_t> VlcMediaProbe::durationSeconds(const std::filesystem::path& file) {
    std::lock_guard<std::mutex> lock(mutex_);

    libvlc_media_t* media = libvlc_media_new_path(vlc_, file.string().c_str());
    if (!media) {
        return std::nullopt;
    }

    std::optional<std::int64_t> result;
    if (libvlc_media_parse_with_options(media, libvlc_media_parse_local, 5000) == 0) {
        // Parsing is asynchronous; poll until it settles.
        for (int i = 0; i < 60; ++i) {
            if (libvlc_media_get_parsed_status(media) != 0) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (libvlc_media_get_parsed_status(media) == libvlc_media_parsed_status_done) {
            const libvlc_time_t duration = libvlc_media_get_duration(media);
            if (duration > 0) {
                result = static_cast<std::int64_t>(duration / 1000);
            }
        }
    }

    libvlc_media_release(media);
    if (!result) {
        std::cerr << "Could not read duration of " << file << std::endl;
    }
    return result;
}

} // namespace core
} // namespace podengine
