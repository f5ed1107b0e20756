#include "station.hpp"
#include "text_util.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace rplayer {

namespace {

std::string string_field(const json& item, const char* key) {
    if (!item.contains(key) || !item[key].is_string()) {
        return "";
    }
    return trim(item[key].get<std::string>());
}

} // namespace

const char* mode_name(Mode mode) {
    return mode == Mode::World ? "world" : "curated";
}

std::optional<Mode> parse_mode(const std::string& name) {
    if (name == "curated" || name == "radiko") return Mode::Curated;
    if (name == "world") return Mode::World;
    return std::nullopt;
}

std::vector<StationDescriptor> load_stations(const std::string& filename) {
    std::vector<StationDescriptor> stations;
    std::ifstream file(filename);

    if (!file.is_open()) {
        spdlog::error("stations: cannot open {}", filename);
        return stations;
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        spdlog::error("stations: {} is not valid JSON: {}", filename, e.what());
        return stations;
    }

    if (j.is_object()) {
        for (auto& [name, url] : j.items()) {
            if (!url.is_string() || trim(url.get<std::string>()).empty()) {
                spdlog::warn("stations: skipping '{}' without a stream URL", name);
                continue;
            }
            stations.push_back({name, name, trim(url.get<std::string>()), "", Mode::Curated});
        }
    } else if (j.is_array()) {
        for (const auto& item : j) {
            if (!item.is_object()) {
                continue;
            }
            StationDescriptor station;
            station.id = string_field(item, "id");
            station.name = string_field(item, "name");
            station.stream_url = string_field(item, "stream_url");
            station.image_url = string_field(item, "image_url");
            if (station.id.empty()) {
                if (station.stream_url.empty()) {
                    spdlog::warn("stations: skipping entry without id and stream_url");
                    continue;
                }
                station.id = station.name.empty() ? station.stream_url : station.name;
            }
            stations.push_back(std::move(station));
        }
    }

    spdlog::info("stations: loaded {} from {}", stations.size(), filename);
    return stations;
}

bool save_station_list(const std::string& filename, const std::vector<StationDescriptor>& stations) {
    json j = json::array();
    for (const auto& station : stations) {
        j.push_back({{"id", station.id}, {"name", station.name}});
    }
    std::ofstream file(filename);
    if (!file.is_open()) {
        spdlog::error("stations: cannot write {}", filename);
        return false;
    }
    try {
        file << j.dump(2, ' ', false) << '\n';
    } catch (const json::exception& e) {
        spdlog::error("stations: cannot serialise list: {}", e.what());
        return false;
    }
    return file.good();
}

} // namespace rplayer
