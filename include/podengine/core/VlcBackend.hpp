#ifndef PODENGINE_CORE_VLC_BACKEND_HPP
#define PODENGINE_CORE_VLC_BACKEND_HPP

#include "podengine/core/MediaProbe.hpp"
#include "podengine/core/Player.hpp"

#include <mutex>
#include <string>

#include <vlc/vlc.h>

namespace podengine {
namespace core {

class VlcAudioBackend : public AudioBackend {
public:
    VlcAudioBackend();
    ~VlcAudioBackend() override;

    VlcAudioBackend(const VlcAudioBackend&) = delete;
    VlcAudioBackend& operator=(const VlcAudioBackend&) = delete;

    bool open(const std::string& location, bool isUrl) override;
    void play() override;
    void pause() override;
    void stop() override;
    void setVolume(int percent) override;
    int volume() const override;
    std::int64_t positionMs() const override;
    std::optional<std::int64_t> lengthMs() const override;
    void seekMs(std::int64_t positionMs) override;
    bool exhausted() const override;

private:
    static std::string getStateString(libvlc_state_t state);

    libvlc_instance_t* vlc_;
    libvlc_media_player_t* player_;
};

// Reads container durations with libvlc's local parser.
class VlcMediaProbe : public MediaProbe {
public:
    VlcMediaProbe();
    ~VlcMediaProbe() override;

    VlcMediaProbe(const VlcMediaProbe&) = delete;
    VlcMediaProbe& operator=(const VlcMediaProbe&) = delete;

    std::optional<std::int64_t> durationSeconds(const std::filesystem::path& file) override;

private:
    libvlc_instance_t* vlc_;
    std::mutex mutex_;
};

} // namespace core
} // namespace podengine

#endif // PODENGINE_CORE_VLC_BACKEND_HPP
