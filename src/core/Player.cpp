#include "podengine/core/Player.hpp"

#include <algorithm>
#include <iostream>

namespace podengine {
namespace core {

Player::Player(std::unique_ptr<AudioBackend> backend) : Player(std::move(backend), Options{}) {}

Player::Player(std::unique_ptr<AudioBackend> backend, Options options)
    : backend_(std::move(backend)),
      options_(options),
      commands_(std::make_shared<Channel<PlayerCommand>>()),
      lastSample_(std::chrono::steady_clock::now()) {
    thread_ = std::thread(&Player::run, this);
}

Player::~Player() {
    stop();
}

void Player::stop() {
    commands_->send(player::Quit{});
    commands_->close();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Player::run() {
    while (true) {
        auto command = commands_->receiveFor(options_.tick);
        if (command) {
            if (std::holds_alternative<player::Quit>(*command)) {
                break;
            }
            try {
                handle(*command);
            } catch (const std::exception& e) {
                std::cerr << "Player error: " << e.what() << std::endl;
            }
        } else if (commands_->closed()) {
            break;
        }

        if (status_.get() == PlayerStatus::Playing) {
            sample();
        }
    }
    backend_->stop();
}

void Player::handle(const PlayerCommand& command) {
    if (std::holds_alternative<player::PlayPause>(command)) {
        togglePause();
    } else if (auto file = std::get_if<player::PlayFile>(&command)) {
        startStream(file->path.string(), false, file->duration);
    } else if (auto url = std::get_if<player::PlayUrl>(&command)) {
        startStream(url->url, true, url->duration);
    } else if (auto seekCommand = std::get_if<player::Seek>(&command)) {
        seek(*seekCommand);
    }
}

void Player::startStream(const std::string& location, bool isUrl,
                         std::optional<std::int64_t> knownDuration) {
    std::cout << "Playing: " << location << std::endl;
    if (!backend_->open(location, isUrl)) {
        std::cerr << "Could not open " << location << std::endl;
        status_.set(PlayerStatus::Ready);
        elapsed_.set(0);
        duration_.set(std::nullopt);
        return;
    }

    std::optional<std::int64_t> duration = knownDuration;
    if (auto length = backend_->lengthMs()) {
        duration = *length / 1000;
    }
    elapsed_.set(0);
    duration_.set(duration);
    status_.set(PlayerStatus::Playing);
    lastSample_ = std::chrono::steady_clock::now();
}

void Player::togglePause() {
    switch (status_.get()) {
        case PlayerStatus::Playing:
            backend_->pause();
            status_.set(PlayerStatus::Paused);
            break;
        case PlayerStatus::Paused:
            backend_->play();
            status_.set(PlayerStatus::Playing);
            lastSample_ = std::chrono::steady_clock::now();
            break;
        default:
            break;
    }
}

void Player::seek(const player::Seek& command) {
    const PlayerStatus current = status_.get();
    if (current == PlayerStatus::Ready) {
        return;
    }

    std::int64_t target = elapsed_.get();
    if (command.direction == SeekDirection::Forward) {
        target += command.seconds;
    } else {
        target -= command.seconds;
    }
    target = std::max<std::int64_t>(target, 0);
    const auto duration = duration_.get();
    if (duration) {
        target = std::min(target, *duration);
    }

    switch (current) {
        case PlayerStatus::Playing: {
            const int volume = backend_->volume();
            backend_->pause();
            fadeTo(0);
            backend_->seekMs(target * 1000);
            backend_->play();
            fadeTo(volume);
            break;
        }
        case PlayerStatus::Paused:
            backend_->seekMs(target * 1000);
            break;
        case PlayerStatus::Finished:
            if (duration && target < *duration) {
                backend_->stop();
                backend_->play();
                backend_->seekMs(target * 1000);
                status_.set(PlayerStatus::Playing);
                lastSample_ = std::chrono::steady_clock::now();
            }
            break;
        default:
            break;
    }
    elapsed_.set(target);
}

void Player::fadeTo(int target) {
    const int start = backend_->volume();
    const int steps = std::max(options_.fadeSteps, 1);
    for (int i = 1; i <= steps; ++i) {
        backend_->setVolume(start + (target - start) * i / steps);
        std::this_thread::sleep_for(options_.fadeStepDelay);
    }
}

void Player::sample() {
    if (backend_->exhausted()) {
        status_.set(PlayerStatus::Finished);
        if (auto duration = duration_.get()) {
            elapsed_.set(*duration);
        }
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now - lastSample_ < options_.sampleInterval) {
        return;
    }
    lastSample_ = now;

    elapsed_.set(backend_->positionMs() / 1000);
    if (!duration_.get()) {
        if (auto length = backend_->lengthMs()) {
            duration_.set(*length / 1000);
        }
    }
}

} // namespace core
} // namespace podengine
