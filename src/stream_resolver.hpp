#ifndef STREAM_RESOLVER_HPP
#define STREAM_RESOLVER_HPP

#include "auth_token_manager.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "station.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rplayer {

// A playable stream: URL plus the request headers the player must send
struct StreamRef {
    std::string station_id;
    std::string url;
    HeaderList headers;

    bool needs_headers() const { return !headers.empty(); }

    bool operator==(const StreamRef& other) const {
        return station_id == other.station_id && url == other.url && headers == other.headers;
    }
    bool operator!=(const StreamRef& other) const { return !(*this == other); }
};

// Turns a station into a StreamRef. Fixed-URL stations are returned as-is;
// everything else goes through the token and the upstream stream
// descriptors. No retries beyond what AuthTokenManager does.
class StreamResolver {
public:
    StreamResolver(HttpClient& http, AuthTokenManager& auth, EndpointConfig endpoints);

    // Throws StationNotFound, StationUnresolvable or AuthUnavailable
    StreamRef resolve(const StationDescriptor& station);

    // Stations the service offers in an area; empty when unavailable
    std::vector<StationDescriptor> areaStations(const std::string& area_id);

    // Parse a /v3/station/list/{area}.xml document
    static std::vector<StationDescriptor> parseStationList(const std::string& xml);

    // Playlist-create URLs from a stream descriptor, live entries first
    static std::vector<std::string> parsePlaylistUrls(const std::string& xml);

    // First HLS URL in a playlist-create reply, resolved against base_url
    static std::optional<std::string> extractPlaylist(const std::string& body, const std::string& base_url);

private:
    std::optional<std::string> fetchPlaylist(const std::string& create_url,
                                             const std::map<std::string, std::string>& params,
                                             const HeaderList& headers);
    std::optional<std::string> streamFromDescriptor(const std::string& station_id, const std::string& xml,
                                                    const HeaderList& headers);

    HttpClient& http_;
    AuthTokenManager& auth_;
    EndpointConfig endpoints_;

    std::mutex cache_mutex_;
    std::map<std::string, std::string> url_cache_;
    std::map<std::string, std::vector<StationDescriptor>> area_cache_;
};

} // namespace rplayer

#endif // STREAM_RESOLVER_HPP
