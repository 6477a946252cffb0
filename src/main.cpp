#include "podengine/core/Config.hpp"
#include "podengine/core/Controller.hpp"
#include "podengine/core/HttpClient.hpp"
#include "podengine/core/JsonDatabase.hpp"
#include "podengine/core/Player.hpp"
#include "podengine/core/RemoteSyncWorker.hpp"
#include "podengine/core/VlcBackend.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace podengine::core;

namespace {

std::atomic<bool> g_running{true};

// Episode the player was last asked to play, as (podcast id, episode id).
std::atomic<std::int64_t> g_currentPod{-1};
std::atomic<std::int64_t> g_currentEp{-1};

void printHelp() {
    std::cout << "\npodengine commands:\n"
              << "Podcasts:\n"
              << "  add <url>                    - Subscribe to a feed\n"
              << "  remove <pod> [--delete]      - Unsubscribe, optionally deleting files\n"
              << "  list                         - List podcasts\n"
              << "  episodes <pod>               - List episodes (current filters apply)\n"
              << "  unplayed                     - List unplayed episodes, newest first\n"
              << "  sync [pod]                   - Refresh one or all feeds\n"
              << "  syncremote                   - Synchronize with the sync server\n"
              << "  filter played|downloaded     - Cycle an episode filter\n\n"
              << "Episodes:\n"
              << "  play <pod> <ep>              - Play an episode\n"
              << "  pause                        - Toggle pause\n"
              << "  seek <+secs|-secs>           - Seek forward or backward\n"
              << "  status                       - Show playback status\n"
              << "  mark <pod> <ep> played|unplayed\n"
              << "  markall <pod> played|unplayed\n"
              << "  download <pod> [ep]          - Download one or all episodes\n"
              << "  delete <pod> [ep]            - Delete one or all downloaded files\n\n"
              << "Queue:\n"
              << "  queue                        - Show the queue\n"
              << "  enqueue <pod> <ep>           - Append an episode to the queue\n\n"
              << "General:\n"
              << "  help                         - Show this help\n"
              << "  quit                         - Exit program\n\n"
              << "Options:\n"
              << "  --config <file>              - Config file (default ~/.config/podengine/config.json)\n"
              << "\n";
}

std::vector<std::string> parseArguments(const std::string& input) {
    std::vector<std::string> args;
    std::stringstream ss(input);
    std::string arg;

    while (ss >> arg) {
        args.push_back(arg);
    }

    return args;
}

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

std::filesystem::path defaultConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "podengine" / "config.json";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "podengine" / "config.json";
    }
    return "config.json";
}

std::int64_t toId(const std::string& value) {
    return std::stoll(value);
}

std::string statusName(PlayerStatus status) {
    switch (status) {
        case PlayerStatus::Ready: return "Ready";
        case PlayerStatus::Playing: return "Playing";
        case PlayerStatus::Paused: return "Paused";
        case PlayerStatus::Finished: return "Finished";
    }
    return "Unknown";
}

// Prints what the controller sends to the front-end until TearDown.
void uiLoop(Sender<UiCommand> toUi, Sender<Message> inbox, bool markOnPlay) {
    while (auto command = toUi->receive()) {
        if (auto note = std::get_if<ui::Notification>(&*command)) {
            (note->error ? std::cerr : std::cout) << "[" << (note->error ? "error" : "info") << "] "
                                                  << note->text << std::endl;
        } else if (auto persistent = std::get_if<ui::PersistentNotification>(&*command)) {
            std::cout << "[status] " << persistent->text << std::endl;
        } else if (auto play = std::get_if<ui::PlayEpisode>(&*command)) {
            g_currentPod = play->podId;
            g_currentEp = play->epId;
            if (markOnPlay) {
                inbox->send(msg::MarkPlayed{play->podId, play->epId, true});
            }
        } else if (std::holds_alternative<ui::TearDown>(*command)) {
            break;
        }
    }
}

// Reports the playback position back to the controller once per change.
void positionLoop(const Player* player, Sender<Message> inbox) {
    std::int64_t lastReported = -1;
    std::int64_t lastEpisode = -1;
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        if (!player || player->status() == PlayerStatus::Ready) {
            continue;
        }
        const std::int64_t epId = g_currentEp;
        const std::int64_t elapsed = player->elapsed();
        if (epId < 0 || (epId == lastEpisode && elapsed == lastReported)) {
            continue;
        }
        lastEpisode = epId;
        lastReported = elapsed;
        inbox->send(msg::UpdatePosition{g_currentPod, epId, elapsed});
    }
}

void listPodcasts(const Controller& controller) {
    auto rows = controller.podcasts()->map(
        [](const Podcast& p) { return std::to_string(p.id) + " |" + p.displayTitle(70); }, false);
    if (rows.empty()) {
        std::cout << "No podcasts subscribed.\n";
        return;
    }
    std::cout << "\nSubscribed Podcasts:\n" << std::string(74, '-') << "\n";
    for (const auto& row : rows) {
        std::cout << row << "\n";
    }
    std::cout << std::string(74, '-') << "\n";
}

void listEpisodes(const Catalog<Episode>& episodes, bool filtered) {
    auto rows = episodes.map(
        [](const Episode& e) {
            return std::to_string(e.podId) + "/" + std::to_string(e.id) + " |" + e.displayTitle(70);
        },
        filtered);
    if (rows.empty()) {
        std::cout << "No episodes.\n";
        return;
    }
    for (const auto& row : rows) {
        std::cout << row << "\n";
    }
}

void handleCommand(Controller& controller, const Player* player, Sender<Message> inbox,
                   const std::string& command, const std::vector<std::string>& args) {
    if (command == "help") {
        printHelp();
    } else if (command == "add" && args.size() == 1) {
        inbox->send(msg::AddFeed{args[0]});
    } else if (command == "remove" && !args.empty()) {
        inbox->send(msg::RemovePodcast{toId(args[0]), args.size() > 1 && args[1] == "--delete"});
    } else if (command == "list") {
        listPodcasts(controller);
    } else if (command == "episodes" && args.size() == 1) {
        auto podcast = controller.podcasts()->get(toId(args[0]));
        if (!podcast) {
            std::cout << "No podcast with id " << args[0] << "\n";
            return;
        }
        listEpisodes(*podcast->read([](const Podcast& p) { return p.episodes; }), true);
    } else if (command == "unplayed") {
        listEpisodes(*controller.unplayed(), false);
    } else if (command == "queue") {
        listEpisodes(*controller.queue(), false);
    } else if (command == "enqueue" && args.size() == 2) {
        auto podcast = controller.podcasts()->get(toId(args[0]));
        auto episode = podcast ? podcast->read([](const Podcast& p) { return p.episodes; })->get(toId(args[1]))
                               : nullptr;
        if (!episode) {
            std::cout << "No such episode\n";
            return;
        }
        inbox->send(msg::Enqueue{toId(args[0]), toId(args[1])});
    } else if (command == "sync") {
        if (args.empty()) {
            inbox->send(msg::SyncAll{});
        } else {
            inbox->send(msg::Sync{toId(args[0])});
        }
    } else if (command == "syncremote") {
        inbox->send(msg::SyncRemote{});
    } else if (command == "filter" && args.size() == 1) {
        if (args[0] == "played") {
            inbox->send(msg::FilterChange{FilterType::Played});
        } else if (args[0] == "downloaded") {
            inbox->send(msg::FilterChange{FilterType::Downloaded});
        } else {
            std::cout << "Usage: filter played|downloaded\n";
        }
    } else if (command == "play" && args.size() == 2) {
        inbox->send(msg::Play{toId(args[0]), toId(args[1])});
    } else if (command == "pause") {
        inbox->send(msg::Pause{});
    } else if (command == "seek" && args.size() == 1) {
        const std::int64_t shift = toId(args[0]);
        inbox->send(msg::Seek{shift < 0 ? -shift : shift,
                              shift < 0 ? SeekDirection::Backward : SeekDirection::Forward});
    } else if (command == "status") {
        if (!player) {
            std::cout << "Audio output not available\n";
            return;
        }
        std::cout << "Status: " << statusName(player->status()) << "\n"
                  << "Position: " << player->elapsed() << "s";
        if (auto duration = player->duration()) {
            std::cout << " / " << *duration << "s";
        }
        std::cout << "\n";
    } else if (command == "mark" && args.size() == 3) {
        inbox->send(msg::MarkPlayed{toId(args[0]), toId(args[1]), args[2] == "played"});
    } else if (command == "markall" && args.size() == 2) {
        inbox->send(msg::MarkAllPlayed{toId(args[0]), args[1] == "played"});
    } else if (command == "download" && !args.empty()) {
        if (args.size() == 1) {
            inbox->send(msg::DownloadAll{toId(args[0])});
        } else {
            inbox->send(msg::Download{toId(args[0]), toId(args[1])});
        }
    } else if (command == "delete" && !args.empty()) {
        if (args.size() == 1) {
            inbox->send(msg::DeleteAll{toId(args[0])});
        } else {
            inbox->send(msg::Delete{toId(args[0]), toId(args[1])});
        }
    } else {
        std::cout << "Unknown command or wrong arguments: " << command << " (try 'help')\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // Set up signal handlers
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    try {
        std::filesystem::path configPath = defaultConfigPath();
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                return 1;
            }
        }

        Config config = Config::load(configPath);
        std::filesystem::create_directories(config.downloadPath);
        if (config.databasePath.has_parent_path()) {
            std::filesystem::create_directories(config.databasePath.parent_path());
        }

        JsonDatabase db(config.databasePath);
        auto http = std::make_shared<CprHttpClient>(kUserAgent);

        std::shared_ptr<MediaProbe> probe;
        std::unique_ptr<Player> player;
        try {
            probe = std::make_shared<VlcMediaProbe>();
            player = std::make_unique<Player>(std::make_unique<VlcAudioBackend>());
        } catch (const std::exception& e) {
            std::cerr << "Audio output disabled: " << e.what() << std::endl;
        }

        auto inbox = std::make_shared<Channel<Message>>();
        auto toUi = std::make_shared<Channel<UiCommand>>();

        std::unique_ptr<RemoteSyncWorker> remoteWorker;
        if (config.enableSync) {
            std::int64_t lastSync = 0;
            if (auto stored = db.getParam("last_sync")) {
                try {
                    lastSync = std::stoll(*stored);
                } catch (const std::exception&) {
                    std::cerr << "Ignoring invalid last_sync value: " << *stored << std::endl;
                }
            }
            RemoteSyncConfig remoteConfig{config.syncServer, config.syncUsername,
                                          config.syncPassword, config.syncDevice,
                                          config.maxRetries};
            remoteWorker = std::make_unique<RemoteSyncWorker>(
                std::make_unique<RemoteSyncClient>(remoteConfig, http, lastSync), http, inbox);
            remoteWorker->start();
        }

        ControllerChannels channels;
        channels.inbox = inbox;
        channels.toUi = toUi;
        channels.toRemote = remoteWorker ? remoteWorker->requests() : nullptr;
        channels.toPlayer = player ? player->commands() : nullptr;

        Controller controller(config, db, http, probe, channels);
        std::thread controllerThread(&Controller::run, &controller);
        std::thread uiThread(uiLoop, toUi, inbox, config.markAsPlayedOnPlay);
        std::thread positionThread(positionLoop, player.get(), inbox);

        std::cout << "Welcome to podengine!\n";
        printHelp();

        std::string input;
        while (g_running) {
            std::cout << "\nEnter command: ";
            if (!std::getline(std::cin, input)) {
                break;
            }

            try {
                auto parsedArgs = parseArguments(input);
                if (parsedArgs.empty()) {
                    continue;
                }
                if (parsedArgs[0] == "quit") {
                    break;
                }
                std::vector<std::string> args(parsedArgs.begin() + 1, parsedArgs.end());
                handleCommand(controller, player.get(), inbox, parsedArgs[0], args);
            }
            catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << "\n";
            }
        }

        // Clean shutdown
        g_running = false;
        inbox->send(msg::Quit{});
        controllerThread.join();
        uiThread.join();
        positionThread.join();
        if (remoteWorker) {
            remoteWorker->stop();
        }
        if (player) {
            player->stop();
        }
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
