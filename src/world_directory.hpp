#ifndef WORLD_DIRECTORY_HPP
#define WORLD_DIRECTORY_HPP

#include "http_client.hpp"
#include "station.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace rplayer {

// Source of ad-hoc world-radio stations
class StationDirectory {
public:
    virtual ~StationDirectory() = default;

    // Blocking lookup; empty when nothing is available
    virtual std::vector<StationDescriptor> lookup() = 0;
};

// radio-browser.info style directory. Every lookup goes to the network;
// when it fails the last successful set is returned instead.
class RadioBrowserDirectory : public StationDirectory {
public:
    RadioBrowserDirectory(HttpClient& http, std::string base_url, int limit);

    std::vector<StationDescriptor> lookup() override;

    // Parse a /stations/search response body
    static std::vector<StationDescriptor> parseResponse(const std::string& body);

private:
    HttpClient& http_;
    std::string base_url_;
    int limit_;

    std::mutex cache_mutex_;
    std::vector<StationDescriptor> cache_;
};

} // namespace rplayer

#endif // WORLD_DIRECTORY_HPP
