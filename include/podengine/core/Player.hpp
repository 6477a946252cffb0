#ifndef PODENGINE_CORE_PLAYER_HPP
#define PODENGINE_CORE_PLAYER_HPP

#include "podengine/core/Channel.hpp"
#include "podengine/core/Guarded.hpp"
#include "podengine/core/Types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>

namespace podengine {
namespace core {

/// Audio output seam. VlcAudioBackend is the real one; tests use a fake.
/// Only ever called from the player thread.
class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    // Replaces any current stream with `location` and starts it.
    virtual bool open(const std::string& location, bool isUrl) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;
    virtual void setVolume(int percent) = 0;
    virtual int volume() const = 0;
    virtual std::int64_t positionMs() const = 0;
    virtual std::optional<std::int64_t> lengthMs() const = 0;
    virtual void seekMs(std::int64_t positionMs) = 0;
    // True once the current stream has played to its end.
    virtual bool exhausted() const = 0;
};

enum class PlayerStatus { Ready, Playing, Paused, Finished };

namespace player {

struct PlayPause {};
struct PlayFile {
    std::filesystem::path path;
    std::optional<std::int64_t> duration;
};
struct PlayUrl {
    std::string url;
    std::optional<std::int64_t> duration;
};
struct Seek {
    std::int64_t seconds;
    SeekDirection direction;
};
struct Quit {};

} // namespace player

using PlayerCommand =
    std::variant<player::PlayPause, player::PlayFile, player::PlayUrl, player::Seek, player::Quit>;

/// Playback engine. Runs on its own thread and is driven only through the
/// command channel; state is published through lock-protected cells that
/// the controller and front-end poll.
///
/// Ready -> Playing on PlayFile/PlayUrl (any previous stream is dropped).
/// PlayPause toggles Playing and Paused. Seek is clamped to [0, duration]
/// and ignored in Ready. When the stream runs out while Playing the status
/// becomes Finished once and elapsed snaps to the duration.
class Player {
public:
    struct Options {
        std::chrono::milliseconds tick{100};
        std::chrono::milliseconds sampleInterval{1000};
        int fadeSteps = 5;
        std::chrono::milliseconds fadeStepDelay{20};
    };

    explicit Player(std::unique_ptr<AudioBackend> backend);
    Player(std::unique_ptr<AudioBackend> backend, Options options);
    ~Player();

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    Sender<PlayerCommand> commands() const { return commands_; }

    PlayerStatus status() const { return status_.get(); }
    // Seconds into the current stream, sampled about once per second.
    std::int64_t elapsed() const { return elapsed_.get(); }
    std::optional<std::int64_t> duration() const { return duration_.get(); }

    // Sends Quit and joins the player thread.
    void stop();

private:
    void run();
    void handle(const PlayerCommand& command);
    void startStream(const std::string& location, bool isUrl,
                     std::optional<std::int64_t> knownDuration);
    void togglePause();
    void seek(const player::Seek& command);
    void fadeTo(int target);
    void sample();

    std::unique_ptr<AudioBackend> backend_;
    Options options_;
    Sender<PlayerCommand> commands_;
    SharedCell<PlayerStatus> status_{PlayerStatus::Ready};
    SharedCell<std::int64_t> elapsed_{0};
    SharedCell<std::optional<std::int64_t>> duration_{std::nullopt};
    std::chrono::steady_clock::time_point lastSample_;
    std::thread thread_;
};

} // namespace core
} // namespace podengine

#endif // PODENGINE_CORE_PLAYER_HPP
