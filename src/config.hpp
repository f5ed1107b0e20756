#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace rplayer {

struct ButtonConfig {
    int pin_a = 5;
    int pin_b = 6;
    int pin_x = 16;
    int pin_y = 24;
    bool gpio_enabled = true;
    std::chrono::milliseconds double_click{500};
    std::chrono::milliseconds shutdown_confirm{10000};
};

struct DisplayConfig {
    enum class Ui { Auto, Tui, Console };

    Ui ui = Ui::Auto;
    int rotation = 90;
    int width = 240;
    int height = 240;
};

struct AudioConfig {
    enum class Player { Auto, Ffmpeg, Mpd, Internal };

    Player player = Player::Auto;
    std::string alsa_device = "hw:1,0";
    std::string ffmpeg = "ffmpeg";
    std::string mpd_host = "localhost";
    int mpd_port = 6600;
};

struct PollConfig {
    std::chrono::seconds now_playing{10};
    std::chrono::seconds program{3600};
    int stale_multiplier = 3;
    std::chrono::milliseconds refresh{1000};
};

struct AuthConfig {
    std::string authkey = "bcd151073c03b352e1ef2fd66c32209da9ca0afa";
    std::string app = "pc_html5";
    std::string app_version = "0.0.1";
    std::string device = "pc";
    std::string user = "dummy_user";
    std::string cookie;
    std::string token_override;
    std::vector<std::string> auth1_urls = {
        "https://radiko.jp/v2/api/auth1",
        "https://radiko.jp/v2/api/auth1_fms",
        "http://radiko.jp/v2/api/auth1",
        "http://radiko.jp/v2/api/auth1_fms",
    };
    std::vector<std::string> auth2_urls = {
        "https://radiko.jp/v2/api/auth2",
        "https://radiko.jp/v2/api/auth2_fms",
        "http://radiko.jp/v2/api/auth2",
        "http://radiko.jp/v2/api/auth2_fms",
    };
    std::chrono::seconds token_ttl{4200};
    std::chrono::seconds safety_margin{60};
    int max_attempts = 3;
    std::chrono::milliseconds backoff{500};
};

// URL templates use {station}, {date} and {area} placeholders
struct EndpointConfig {
    std::vector<std::string> stream_xml_urls = {
        "https://radiko.jp/v3/station/stream/pc_html5/{station}.xml",
        "https://radiko.jp/v3/station/stream/pc/{station}.xml",
        "http://radiko.jp/v3/station/stream/pc_html5/{station}.xml",
        "http://radiko.jp/v3/station/stream/pc/{station}.xml",
    };
    std::string program_url = "https://radiko.jp/v3/program/station/date/{date}/{station}.xml";
    std::string station_list_url = "https://radiko.jp/v3/station/list/{area}.xml";
    std::string world_api = "https://all.api.radio-browser.info/json";
    int world_limit = 200;
};

struct Config {
    std::string stations_path = "stations.json";
    std::string state_path = "state.json";
    std::string log_file = "rplayer.log";
    std::string shutdown_command = "sudo shutdown -h now";
    bool debug = false;
    bool list_stations = false;
    bool show_help = false;

    ButtonConfig buttons;
    DisplayConfig display;
    AudioConfig audio;
    PollConfig poll;
    AuthConfig auth;
    EndpointConfig endpoints;
};

using Environment = std::map<std::string, std::string>;

// Snapshot of the RPLAYER_* variables of the running process
Environment read_environment();

// Resolve the configuration once. Throws ConfigError naming the offending
// variable or argument for invalid values and unknown RPLAYER_* names.
Config load_config(int argc, const char* const* argv, const Environment& env);

std::string usage(const std::string& program);

// Substitute {key} placeholders in a URL template
std::string expand_template(const std::string& pattern, const std::map<std::string, std::string>& values);

} // namespace rplayer

#endif // CONFIG_HPP
