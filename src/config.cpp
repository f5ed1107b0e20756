#include "config.hpp"
#include "errors.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <set>

extern char** environ;

namespace rplayer {

namespace {

const std::set<std::string>& known_variables() {
    static const std::set<std::string> names = {
        "RPLAYER_STATIONS", "RPLAYER_STATE", "RPLAYER_DEBUG", "RPLAYER_LOG_FILE",
        "RPLAYER_LIST_STATIONS", "RPLAYER_SHUTDOWN_COMMAND",
        "RPLAYER_BUTTON_A", "RPLAYER_BUTTON_B", "RPLAYER_BUTTON_X", "RPLAYER_BUTTON_Y",
        "RPLAYER_DISABLE_GPIO", "RPLAYER_DOUBLE_CLICK_MS", "RPLAYER_SHUTDOWN_CONFIRM_MS",
        "RPLAYER_UI", "RPLAYER_DISPLAY_ROTATION", "RPLAYER_DISPLAY_WIDTH", "RPLAYER_DISPLAY_HEIGHT",
        "RPLAYER_PLAYER", "RPLAYER_ALSA_DEVICE", "RPLAYER_FFMPEG", "RPLAYER_MPD_HOST", "RPLAYER_MPD_PORT",
        "RPLAYER_METADATA_SEC", "RPLAYER_PROGRAM_REFRESH_SEC", "RPLAYER_STALE_MULTIPLIER",
        "RPLAYER_REFRESH_MS",
        "RPLAYER_RADIKO_AUTHKEY", "RPLAYER_RADIKO_APP", "RPLAYER_RADIKO_APP_VER",
        "RPLAYER_RADIKO_DEVICE", "RPLAYER_RADIKO_USER", "RPLAYER_RADIKO_COOKIE",
        "RPLAYER_RADIKO_TOKEN", "RPLAYER_RADIKO_AUTH1_URLS", "RPLAYER_RADIKO_AUTH2_URLS",
        "RPLAYER_TOKEN_TTL_SEC", "RPLAYER_TOKEN_MARGIN_SEC", "RPLAYER_AUTH_ATTEMPTS",
        "RPLAYER_AUTH_BACKOFF_MS",
        "RPLAYER_STREAM_XML_URLS", "RPLAYER_PROGRAM_URL", "RPLAYER_STATION_LIST_URL",
        "RPLAYER_WORLD_API", "RPLAYER_WORLD_LIMIT",
    };
    return names;
}

// Reads typed values out of the environment map, failing loudly
class EnvReader {
public:
    explicit EnvReader(const Environment& env) : env_(env) {}

    bool has(const std::string& name) const {
        return env_.find(name) != env_.end();
    }

    std::string str(const std::string& name, const std::string& fallback) const {
        auto it = env_.find(name);
        return it == env_.end() ? fallback : trim(it->second);
    }

    std::string non_empty(const std::string& name, const std::string& fallback) const {
        std::string value = str(name, fallback);
        if (value.empty()) {
            throw ConfigError(name + " must not be empty");
        }
        return value;
    }

    long integer(const std::string& name, long fallback, long min, long max) const {
        auto it = env_.find(name);
        if (it == env_.end()) {
            return fallback;
        }
        std::string raw = trim(it->second);
        long value = 0;
        try {
            size_t used = 0;
            value = std::stol(raw, &used);
            if (used != raw.size()) {
                throw ConfigError(name + ": trailing characters in '" + raw + "'");
            }
        } catch (const std::logic_error&) {
            throw ConfigError(name + ": '" + raw + "' is not an integer");
        }
        if (value < min || value > max) {
            throw ConfigError(name + ": " + std::to_string(value) + " outside [" +
                              std::to_string(min) + ", " + std::to_string(max) + "]");
        }
        return value;
    }

    bool flag(const std::string& name, bool fallback) const {
        auto it = env_.find(name);
        if (it == env_.end()) {
            return fallback;
        }
        std::string raw = trim(it->second);
        if (raw == "1") return true;
        if (raw == "0" || raw.empty()) return false;
        throw ConfigError(name + ": expected 0 or 1, got '" + raw + "'");
    }

    std::vector<std::string> urls(const std::string& name, const std::vector<std::string>& fallback) const {
        if (!has(name)) {
            return fallback;
        }
        auto list = split_list(str(name, ""));
        if (list.empty()) {
            throw ConfigError(name + " must list at least one URL");
        }
        for (const auto& url : list) {
            check_url(name, url);
        }
        return list;
    }

    std::string url(const std::string& name, const std::string& fallback) const {
        std::string value = non_empty(name, fallback);
        check_url(name, value);
        return value;
    }

private:
    static void check_url(const std::string& name, const std::string& url) {
        if (!starts_with(url, "http://") && !starts_with(url, "https://")) {
            throw ConfigError(name + ": '" + url + "' is not an http(s) URL");
        }
    }

    const Environment& env_;
};

DisplayConfig::Ui parse_ui(const std::string& value) {
    if (value == "auto") return DisplayConfig::Ui::Auto;
    if (value == "tui") return DisplayConfig::Ui::Tui;
    if (value == "console") return DisplayConfig::Ui::Console;
    throw ConfigError("RPLAYER_UI: expected auto, tui or console, got '" + value + "'");
}

AudioConfig::Player parse_player(const std::string& value) {
    if (value == "auto") return AudioConfig::Player::Auto;
    if (value == "ffmpeg") return AudioConfig::Player::Ffmpeg;
    if (value == "mpd") return AudioConfig::Player::Mpd;
    if (value == "internal") {
#ifdef RPLAYER_ENABLE_INTERNAL_PLAYER
        return AudioConfig::Player::Internal;
#else
        throw ConfigError("RPLAYER_PLAYER: internal player not compiled in");
#endif
    }
    throw ConfigError("RPLAYER_PLAYER: expected auto, ffmpeg, mpd or internal, got '" + value + "'");
}

} // namespace

Environment read_environment() {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string pair = *entry;
        size_t eq = pair.find('=');
        if (eq == std::string::npos) continue;
        std::string key = pair.substr(0, eq);
        if (starts_with(key, "RPLAYER_")) {
            env[key] = pair.substr(eq + 1);
        }
    }
    return env;
}

Config load_config(int argc, const char* const* argv, const Environment& env) {
    for (const auto& [key, value] : env) {
        if (starts_with(key, "RPLAYER_") && known_variables().count(key) == 0) {
            throw ConfigError("unknown variable " + key);
        }
    }

    EnvReader reader(env);
    Config cfg;

    cfg.stations_path = reader.non_empty("RPLAYER_STATIONS", cfg.stations_path);
    cfg.state_path = reader.non_empty("RPLAYER_STATE", cfg.state_path);
    cfg.log_file = reader.non_empty("RPLAYER_LOG_FILE", cfg.log_file);
    cfg.shutdown_command = reader.str("RPLAYER_SHUTDOWN_COMMAND", cfg.shutdown_command);
    cfg.debug = reader.flag("RPLAYER_DEBUG", false);
    cfg.list_stations = reader.flag("RPLAYER_LIST_STATIONS", false);

    auto& buttons = cfg.buttons;
    buttons.pin_a = static_cast<int>(reader.integer("RPLAYER_BUTTON_A", buttons.pin_a, 0, 63));
    buttons.pin_b = static_cast<int>(reader.integer("RPLAYER_BUTTON_B", buttons.pin_b, 0, 63));
    buttons.pin_x = static_cast<int>(reader.integer("RPLAYER_BUTTON_X", buttons.pin_x, 0, 63));
    buttons.pin_y = static_cast<int>(reader.integer("RPLAYER_BUTTON_Y", buttons.pin_y, 0, 63));
    buttons.gpio_enabled = !reader.flag("RPLAYER_DISABLE_GPIO", false);
    buttons.double_click = std::chrono::milliseconds(
        reader.integer("RPLAYER_DOUBLE_CLICK_MS", buttons.double_click.count(), 50, 5000));
    buttons.shutdown_confirm = std::chrono::milliseconds(
        reader.integer("RPLAYER_SHUTDOWN_CONFIRM_MS", buttons.shutdown_confirm.count(), 1000, 600000));
    std::vector<int> pins = {buttons.pin_a, buttons.pin_b, buttons.pin_x, buttons.pin_y};
    std::sort(pins.begin(), pins.end());
    if (std::adjacent_find(pins.begin(), pins.end()) != pins.end()) {
        throw ConfigError("RPLAYER_BUTTON_*: two buttons share a pin");
    }

    auto& display = cfg.display;
    display.ui = parse_ui(reader.str("RPLAYER_UI", "auto"));
    display.rotation = static_cast<int>(reader.integer("RPLAYER_DISPLAY_ROTATION", display.rotation, 0, 270));
    if (display.rotation % 90 != 0) {
        throw ConfigError("RPLAYER_DISPLAY_ROTATION: must be 0, 90, 180 or 270");
    }
    display.width = static_cast<int>(reader.integer("RPLAYER_DISPLAY_WIDTH", display.width, 16, 4096));
    display.height = static_cast<int>(reader.integer("RPLAYER_DISPLAY_HEIGHT", display.height, 16, 4096));

    auto& audio = cfg.audio;
    audio.player = parse_player(reader.str("RPLAYER_PLAYER", "auto"));
    audio.alsa_device = reader.non_empty("RPLAYER_ALSA_DEVICE", audio.alsa_device);
    audio.ffmpeg = reader.non_empty("RPLAYER_FFMPEG", audio.ffmpeg);
    audio.mpd_host = reader.non_empty("RPLAYER_MPD_HOST", audio.mpd_host);
    audio.mpd_port = static_cast<int>(reader.integer("RPLAYER_MPD_PORT", audio.mpd_port, 1, 65535));

    auto& poll = cfg.poll;
    poll.now_playing = std::chrono::seconds(reader.integer("RPLAYER_METADATA_SEC", poll.now_playing.count(), 1, 3600));
    poll.program = std::chrono::seconds(reader.integer("RPLAYER_PROGRAM_REFRESH_SEC", poll.program.count(), 10, 86400));
    poll.stale_multiplier = static_cast<int>(reader.integer("RPLAYER_STALE_MULTIPLIER", poll.stale_multiplier, 1, 100));
    poll.refresh = std::chrono::milliseconds(reader.integer("RPLAYER_REFRESH_MS", poll.refresh.count(), 50, 10000));

    auto& auth = cfg.auth;
    auth.authkey = reader.non_empty("RPLAYER_RADIKO_AUTHKEY", auth.authkey);
    auth.app = reader.non_empty("RPLAYER_RADIKO_APP", auth.app);
    auth.app_version = reader.non_empty("RPLAYER_RADIKO_APP_VER", auth.app_version);
    auth.device = reader.non_empty("RPLAYER_RADIKO_DEVICE", auth.device);
    auth.user = reader.non_empty("RPLAYER_RADIKO_USER", auth.user);
    auth.cookie = reader.str("RPLAYER_RADIKO_COOKIE", "");
    auth.token_override = reader.str("RPLAYER_RADIKO_TOKEN", "");
    auth.auth1_urls = reader.urls("RPLAYER_RADIKO_AUTH1_URLS", auth.auth1_urls);
    auth.auth2_urls = reader.urls("RPLAYER_RADIKO_AUTH2_URLS", auth.auth2_urls);
    auth.token_ttl = std::chrono::seconds(reader.integer("RPLAYER_TOKEN_TTL_SEC", auth.token_ttl.count(), 60, 86400));
    auth.safety_margin = std::chrono::seconds(reader.integer("RPLAYER_TOKEN_MARGIN_SEC", auth.safety_margin.count(), 0, 3600));
    auth.max_attempts = static_cast<int>(reader.integer("RPLAYER_AUTH_ATTEMPTS", auth.max_attempts, 1, 10));
    auth.backoff = std::chrono::milliseconds(reader.integer("RPLAYER_AUTH_BACKOFF_MS", auth.backoff.count(), 0, 60000));
    if (auth.safety_margin >= auth.token_ttl) {
        throw ConfigError("RPLAYER_TOKEN_MARGIN_SEC must be smaller than RPLAYER_TOKEN_TTL_SEC");
    }

    auto& endpoints = cfg.endpoints;
    endpoints.stream_xml_urls = reader.urls("RPLAYER_STREAM_XML_URLS", endpoints.stream_xml_urls);
    endpoints.program_url = reader.url("RPLAYER_PROGRAM_URL", endpoints.program_url);
    endpoints.station_list_url = reader.url("RPLAYER_STATION_LIST_URL", endpoints.station_list_url);
    endpoints.world_api = reader.url("RPLAYER_WORLD_API", endpoints.world_api);
    endpoints.world_limit = static_cast<int>(reader.integer("RPLAYER_WORLD_LIMIT", endpoints.world_limit, 1, 10000));

    bool have_positional = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list-stations") {
            cfg.list_stations = true;
        } else if (arg == "--debug") {
            cfg.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            cfg.show_help = true;
        } else if (starts_with(arg, "-")) {
            throw ConfigError("unknown option " + arg);
        } else if (!have_positional) {
            cfg.stations_path = arg;
            have_positional = true;
        } else {
            throw ConfigError("unexpected argument " + arg);
        }
    }

    return cfg;
}

std::string usage(const std::string& program) {
    return "usage: " + program + " [--list-stations] [--debug] [stations.json]\n"
           "Settings are read from RPLAYER_* environment variables.\n";
}

std::string expand_template(const std::string& pattern, const std::map<std::string, std::string>& values) {
    std::string out = pattern;
    for (const auto& [key, value] : values) {
        const std::string token = "{" + key + "}";
        size_t pos = 0;
        while ((pos = out.find(token, pos)) != std::string::npos) {
            out.replace(pos, token.size(), value);
            pos += value.size();
        }
    }
    return out;
}

} // namespace rplayer
