#include "world_directory.hpp"
#include "text_util.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rplayer {

namespace {

std::string json_string(const nlohmann::json& item, const char* key) {
    if (!item.contains(key) || !item[key].is_string()) {
        return "";
    }
    return trim(item[key].get<std::string>());
}

} // namespace

RadioBrowserDirectory::RadioBrowserDirectory(HttpClient& http, std::string base_url, int limit)
    : http_(http), base_url_(std::move(base_url)), limit_(limit) {}

std::vector<StationDescriptor> RadioBrowserDirectory::lookup() {
    std::string url = with_query(base_url_ + "/stations/search",
                                 {{"limit", std::to_string(limit_)}, {"hidebroken", "true"}});

    HttpResponse res = http_.get(url, {}, std::chrono::seconds(10));
    std::vector<StationDescriptor> stations;
    if (res.ok()) {
        stations = parseResponse(res.body);
    } else {
        spdlog::warn("world: directory status {} ({}) {}", res.status, url, res.error);
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (!stations.empty()) {
        cache_ = stations;
        spdlog::debug("world: directory returned {} stations", stations.size());
    }
    return cache_;
}

std::vector<StationDescriptor> RadioBrowserDirectory::parseResponse(const std::string& body) {
    std::vector<StationDescriptor> stations;
    try {
        auto json = nlohmann::json::parse(body);
        if (!json.is_array()) {
            return stations;
        }
        for (const auto& item : json) {
            if (!item.is_object()) continue;
            std::string name = json_string(item, "name");
            std::string stream = json_string(item, "url_resolved");
            if (stream.empty()) {
                stream = json_string(item, "url");
            }
            if (name.empty() || stream.empty()) {
                continue;
            }
            std::string id = json_string(item, "stationuuid");
            stations.push_back({id.empty() ? name : id, name, stream, json_string(item, "favicon"), Mode::World});
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("world: unparsable directory response: {}", e.what());
    }
    return stations;
}

} // namespace rplayer
