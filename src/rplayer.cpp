#include "auth_token_manager.hpp"
#include "button_input.hpp"
#include "config.hpp"
#include "console_presenter.hpp"
#include "errors.hpp"
#include "ffmpeg_backend.hpp"
#include "http_client.hpp"
#include "logging.hpp"
#include "metadata_poller.hpp"
#include "mpd_backend.hpp"
#include "session_controller.hpp"
#include "state_store.hpp"
#include "station.hpp"
#include "station_registry.hpp"
#include "stream_resolver.hpp"
#include "task_runner.hpp"
#include "tui_presenter.hpp"
#include "ui_event_router.hpp"
#include "world_directory.hpp"

#ifdef RPLAYER_ENABLE_INTERNAL_PLAYER
#include "internal_player.hpp"
#endif

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <thread>
#include <unistd.h>

#include <spdlog/spdlog.h>

using namespace rplayer;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

bool terminal_available() {
    const char* term = std::getenv("TERM");
    return isatty(STDIN_FILENO) && isatty(STDOUT_FILENO) && term && std::string(term) != "dumb";
}

std::vector<StationDescriptor> area_station_list(AuthTokenManager& auth, StreamResolver& resolver) {
    AuthToken token = auth.getValidToken();
    if (token.area_id.empty()) {
        throw StationUnresolvable("the service did not report an area");
    }
    return resolver.areaStations(token.area_id);
}

int export_station_list(const Config& cfg, AuthTokenManager& auth, StreamResolver& resolver) {
    std::vector<StationDescriptor> stations;
    try {
        stations = area_station_list(auth, resolver);
    } catch (const Error& e) {
        spdlog::error("stations: cannot fetch the area station list: {}", e.what());
        return 1;
    }
    if (stations.empty()) {
        spdlog::error("stations: the area station list is empty");
        return 1;
    }
    std::sort(stations.begin(), stations.end(),
              [](const StationDescriptor& a, const StationDescriptor& b) { return a.id < b.id; });
    if (!save_station_list(cfg.stations_path, stations)) {
        return 1;
    }
    std::cout << "Wrote " << stations.size() << " stations to " << cfg.stations_path << std::endl;
    return 0;
}

// Name curated entries that only carry an id, from the area station list
void hydrate_names(std::vector<StationDescriptor>& stations, AuthTokenManager& auth, StreamResolver& resolver) {
    bool needed = std::any_of(stations.begin(), stations.end(), [](const StationDescriptor& s) {
        return s.name.empty() && !s.has_fixed_url();
    });
    if (!needed) return;

    std::map<std::string, std::string> names;
    try {
        for (const auto& station : area_station_list(auth, resolver)) {
            names[station.id] = station.name;
        }
    } catch (const Error& e) {
        spdlog::warn("stations: cannot name stations: {}", e.what());
        return;
    }
    for (auto& station : stations) {
        if (station.name.empty() && names.count(station.id)) {
            station.name = names[station.id];
        }
    }
}

std::unique_ptr<PlaybackBackend> make_backend(const Config& cfg, bool quiet) {
    const auto& audio = cfg.audio;

#ifdef RPLAYER_ENABLE_INTERNAL_PLAYER
    if (audio.player == AudioConfig::Player::Internal) {
        spdlog::info("playback: internal player");
        return std::make_unique<InternalPlayerBackend>();
    }
#endif

    auto ffmpeg = std::make_unique<FfmpegProcessBackend>(audio.ffmpeg, audio.alsa_device, cfg.debug, quiet);
    if (audio.player == AudioConfig::Player::Ffmpeg) {
        spdlog::info("playback: ffmpeg on {}", audio.alsa_device);
        return ffmpeg;
    }

    auto mpd = std::make_unique<MpdBackend>(audio.mpd_host, audio.mpd_port);
    if (audio.player == AudioConfig::Player::Auto && !mpd->available()) {
        spdlog::info("playback: no MPD at {}:{}, using ffmpeg for everything", audio.mpd_host, audio.mpd_port);
        return ffmpeg;
    }
    spdlog::info("playback: MPD at {}:{} for plain streams, ffmpeg for authenticated ones",
                 audio.mpd_host, audio.mpd_port);
    return std::make_unique<RoutingBackend>(std::move(ffmpeg), std::move(mpd));
}

} // namespace

int main(int argc, char* argv[]) {
    Config cfg;
    try {
        cfg = load_config(argc, argv, read_environment());
    } catch (const ConfigError& e) {
        std::cerr << "rplayer: " << e.what() << "\n" << usage(argv[0]);
        return 1;
    }
    if (cfg.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    bool use_tui = !cfg.list_stations &&
        (cfg.display.ui == DisplayConfig::Ui::Tui ||
         (cfg.display.ui == DisplayConfig::Ui::Auto && terminal_available()));
    init_logging(cfg.debug, use_tui ? cfg.log_file : "");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    CurlHttpClient http;
    AuthTokenManager auth(http, cfg.auth);
    StreamResolver resolver(http, auth, cfg.endpoints);

    if (cfg.list_stations) {
        return export_station_list(cfg, auth, resolver);
    }

    std::vector<StationDescriptor> stations = load_stations(cfg.stations_path);
    if (stations.empty()) {
        spdlog::error("No stations loaded from {}", cfg.stations_path);
        std::cerr << "rplayer: no stations loaded from " << cfg.stations_path << std::endl;
        return 1;
    }
    hydrate_names(stations, auth, resolver);

    RadioBrowserDirectory directory(http, cfg.endpoints.world_api, cfg.endpoints.world_limit);
    StationRegistry registry(stations, &directory);

    std::unique_ptr<TuiPresenter> tui;
    std::unique_ptr<ConsolePresenter> console;
    DisplayPresenter* presenter = nullptr;
    if (use_tui) {
        tui = std::make_unique<TuiPresenter>(cfg.display);
        if (tui->init()) {
            tui->set_stations(stations);
            presenter = tui.get();
        } else {
            spdlog::warn("display: falling back to console output");
            tui.reset();
        }
    }
    if (!presenter) {
        console = std::make_unique<ConsolePresenter>(cfg.display);
        presenter = console.get();
    }

    std::unique_ptr<PlaybackBackend> backend = make_backend(cfg, tui != nullptr);

    std::vector<ButtonSource*> sources;
    std::unique_ptr<SysfsGpioButtonSource> gpio;
    if (cfg.buttons.gpio_enabled) {
        gpio = std::make_unique<SysfsGpioButtonSource>(cfg.buttons);
        if (gpio->available()) sources.push_back(gpio.get());
    } else {
        spdlog::info("gpio: disabled");
    }
    if (tui) sources.push_back(tui.get());
    ClickDetector clicks(cfg.buttons.double_click);

    JsonStateStore store(cfg.state_path);
    MetadataPoller poller(http, cfg.endpoints, cfg.poll);
    poller.set_title_source([&backend] { return backend->stream_title(); });

    auto tasks = std::make_unique<AsyncTaskRunner>();
    SessionOptions options;
    options.refresh = cfg.poll.refresh;
    options.shutdown_confirm = cfg.buttons.shutdown_confirm;
    options.shutdown_command = cfg.shutdown_command;

    SessionController controller(registry, resolver, *backend, *presenter, *tasks, options);
    controller.attach_poller(&poller);
    controller.attach_store(&store);
    controller.attach_auth(&auth);

    bool needs_auth = std::any_of(stations.begin(), stations.end(),
                                  [](const StationDescriptor& s) { return !s.has_fixed_url(); });
    if (needs_auth) {
        auth.startBackgroundRenewal();
    }
    poller.start();
    controller.start();
    std::thread loop([&controller] { controller.run(); });

    // The main thread owns the terminal and the button devices
    bool stop_requested = false;
    while (!controller.finished()) {
        if (!stop_requested && (!g_running || (tui && tui->quit_requested()))) {
            spdlog::info("Stopping");
            controller.request_shutdown(false);
            stop_requested = true;
        }
        for (ButtonSource* source : sources) {
            for (const auto& edge : source->poll()) {
                if (auto event = clicks.feed(edge.button, edge.pressed, edge.timestamp)) {
                    controller.submit(*event);
                }
            }
        }
        if (tui) tui->pump();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    loop.join();
    tasks.reset();
    poller.stop();
    auth.stop();
    if (tui) {
        tui->pump();
        tui->cleanup();
    }
    spdlog::info("Bye");
    return 0;
}
