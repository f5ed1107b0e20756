#include "stream_resolver.hpp"
#include "errors.hpp"
#include "text_util.hpp"
#include "xml_scan.hpp"

#include <algorithm>
#include <regex>
#include <spdlog/spdlog.h>
#include <sstream>

namespace rplayer {

namespace {

const std::regex& m3u8_regex() {
    static const std::regex re(R"(https?://[^\s<>"]+\.m3u8[^\s<>"]*)");
    return re;
}

// A bare playlist.m3u8 without station_id only works with a session cookie
bool usable_hls(const std::string& url) {
    return url.find("playlist.m3u8") == std::string::npos || url.find("station_id=") != std::string::npos;
}

} // namespace

StreamResolver::StreamResolver(HttpClient& http, AuthTokenManager& auth, EndpointConfig endpoints)
    : http_(http), auth_(auth), endpoints_(std::move(endpoints)) {}

StreamRef StreamResolver::resolve(const StationDescriptor& station) {
    if (station.has_fixed_url()) {
        spdlog::debug("resolver: {} uses fixed url {}", station.id, station.stream_url);
        return {station.id, station.stream_url, {}};
    }

    AuthToken token = auth_.getValidToken();

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = url_cache_.find(station.id);
        if (it != url_cache_.end()) {
            return {station.id, it->second, auth_.streamHeaders(token)};
        }
    }

    if (!token.area_id.empty()) {
        auto available = areaStations(token.area_id);
        bool listed = std::any_of(available.begin(), available.end(),
                                  [&](const StationDescriptor& s) { return s.id == station.id; });
        if (!available.empty() && !listed) {
            throw StationNotFound(station.label() + " is not available in area " + token.area_id);
        }
    }

    HeaderList headers = auth_.appHeaders();
    headers.emplace_back("X-Radiko-AuthToken", token.value);

    int not_found = 0;
    std::string last_failure = "no stream descriptor";
    for (const auto& pattern : endpoints_.stream_xml_urls) {
        std::string url = expand_template(pattern, {{"station", url_encode(station.id)}});
        HttpResponse res = http_.get(url, headers);
        spdlog::debug("resolver: stream xml status {} for {} ({})", res.status, station.id, url);
        if (res.status == 401 || res.status == 403) {
            auth_.invalidate(token.value);
            throw StationUnresolvable(station.label() + ": token rejected (" + std::to_string(res.status) + ")");
        }
        if (res.status == 404) {
            ++not_found;
            continue;
        }
        if (!res.ok()) {
            last_failure = res.status == 0 ? res.error : "status " + std::to_string(res.status);
            continue;
        }
        if (auto stream = streamFromDescriptor(station.id, res.body, headers)) {
            if (stream->find("medialist") == std::string::npos) {
                std::lock_guard<std::mutex> lock(cache_mutex_);
                url_cache_[station.id] = *stream;
            }
            spdlog::info("resolver: {} -> {}", station.id, *stream);
            return {station.id, *stream, auth_.streamHeaders(token)};
        }
        last_failure = "descriptor without playlist";
        spdlog::debug("resolver: stream xml body {}", res.body.substr(0, 200));
    }

    if (not_found > 0 && not_found == static_cast<int>(endpoints_.stream_xml_urls.size())) {
        throw StationNotFound(station.label() + " is unknown to the service");
    }
    throw StationUnresolvable(station.label() + ": " + last_failure);
}

std::optional<std::string> StreamResolver::streamFromDescriptor(const std::string& station_id,
                                                                const std::string& xml,
                                                                const HeaderList& headers) {
    std::string lsid = random_hex(16);
    const std::vector<std::map<std::string, std::string>> variants = {
        {{"station_id", station_id}, {"l", "15"}, {"lsid", lsid}, {"type", "b"}},
        {{"station_id", station_id}, {"l", "15"}, {"lsid", lsid}},
        {{"station_id", station_id}, {"lsid", lsid}},
        {{"station_id", station_id}},
    };

    for (const auto& create_url : parsePlaylistUrls(xml)) {
        for (const auto& params : variants) {
            if (auto playlist = fetchPlaylist(create_url, params, headers)) {
                return playlist;
            }
        }
    }

    // Descriptor without a usable playlist_create_url: any direct HLS URL
    std::string text = xml_decode(xml);
    for (auto it = std::sregex_iterator(text.begin(), text.end(), m3u8_regex()); it != std::sregex_iterator(); ++it) {
        std::string candidate = it->str(0);
        if (usable_hls(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::string> StreamResolver::fetchPlaylist(const std::string& create_url,
                                                         const std::map<std::string, std::string>& params,
                                                         const HeaderList& headers) {
    HeaderList post_headers = headers;
    post_headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");

    HttpResponse res = http_.post(create_url, form_encode(params), post_headers);
    if (!res.ok()) {
        spdlog::debug("resolver: playlist POST status {} for {}", res.status, create_url);
        res = http_.get(with_query(create_url, params), headers);
        if (!res.ok()) {
            spdlog::debug("resolver: playlist GET status {} for {}", res.status, create_url);
            return std::nullopt;
        }
    }

    auto playlist = extractPlaylist(res.body, res.effective_url.empty() ? create_url : res.effective_url);
    if (!playlist) {
        spdlog::debug("resolver: playlist reply without m3u8 from {}", create_url);
    }
    return playlist;
}

std::optional<std::string> StreamResolver::extractPlaylist(const std::string& body, const std::string& base_url) {
    std::smatch match;
    if (std::regex_search(body, match, m3u8_regex())) {
        return match.str(0);
    }
    if (body.find("#EXTM3U") != std::string::npos) {
        std::istringstream lines(body);
        std::string line;
        while (std::getline(lines, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;
            return resolve_url(base_url, line);
        }
    }
    return std::nullopt;
}

std::vector<std::string> StreamResolver::parsePlaylistUrls(const std::string& xml) {
    std::vector<std::string> live;
    std::vector<std::string> other;
    for (const auto& node : xml_find_all(xml, "url")) {
        std::string create_url = node.child_text("playlist_create_url");
        if (create_url.empty()) {
            continue;
        }
        if (node.attribute("areafree") == "0" && node.attribute("timefree") == "0") {
            live.push_back(create_url);
        } else {
            other.push_back(create_url);
        }
    }
    live.insert(live.end(), other.begin(), other.end());
    return live;
}

std::vector<StationDescriptor> StreamResolver::areaStations(const std::string& area_id) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = area_cache_.find(area_id);
        if (it != area_cache_.end()) {
            return it->second;
        }
    }

    std::string url = expand_template(endpoints_.station_list_url, {{"area", area_id}});
    HttpResponse res = http_.get(url);
    if (!res.ok()) {
        spdlog::warn("resolver: station list status {} for {} {}", res.status, area_id, res.error);
        return {};
    }
    auto stations = parseStationList(res.body);
    if (!stations.empty()) {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        area_cache_[area_id] = stations;
    }
    return stations;
}

std::vector<StationDescriptor> StreamResolver::parseStationList(const std::string& xml) {
    std::vector<StationDescriptor> stations;
    for (const auto& node : xml_find_all(xml, "station")) {
        StationDescriptor station;
        station.id = node.child_text("id");
        station.name = node.child_text("name");
        station.image_url = node.child_text("logo");
        if (!station.id.empty()) {
            stations.push_back(std::move(station));
        }
    }
    return stations;
}

} // namespace rplayer
