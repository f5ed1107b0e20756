#ifndef METADATA_POLLER_HPP
#define METADATA_POLLER_HPP

#include "config.hpp"
#include "http_client.hpp"
#include "station.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rplayer {

// Snapshot of what the current station is playing. Replaced wholesale.
struct NowPlaying {
    std::string station_id;
    std::string title;
    std::string artwork_url;
    std::string artwork;  // image bytes, empty until fetched
    std::chrono::system_clock::time_point fetched_at;
    uint64_t epoch = 0;
};

// One entry of the program schedule
struct ProgramEntry {
    std::chrono::system_clock::time_point start;
    std::chrono::system_clock::time_point end;
    std::string title;
    std::string image_url;
};

// Polls now-playing and program data for whatever station the controller
// last reported. Two threads: a short now-playing tick and a long program
// schedule refresh. Results go to the sink tagged with station id and
// epoch; a station change bumps the epoch, drops in-flight results and
// polls at once.
class MetadataPoller {
public:
    using Sink = std::function<void(NowPlaying)>;
    using TitleSource = std::function<std::string()>;
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    MetadataPoller(HttpClient& http, EndpointConfig endpoints, PollConfig poll,
                   Clock clock = [] { return std::chrono::system_clock::now(); });
    ~MetadataPoller();

    MetadataPoller(const MetadataPoller&) = delete;
    MetadataPoller& operator=(const MetadataPoller&) = delete;

    void set_sink(Sink sink);

    // Stream title from the playback backend, used when no program matches
    void set_title_source(TitleSource source);

    void start();
    void stop();

    // Target a new station. Returns the new epoch.
    uint64_t station_changed(const StationDescriptor& station);

    uint64_t epoch() const { return epoch_; }

    // One now-playing poll for the current station. nullopt when there is
    // no station, the poll failed, or the station changed meanwhile.
    std::optional<NowPlaying> poll_once();

    // Refetch today's schedule for the current station
    void refresh_program();

    // Older than the now-playing interval times the stale multiplier
    bool is_stale(const NowPlaying& now_playing, std::chrono::system_clock::time_point now) const;
    bool is_stale(const NowPlaying& now_playing) const { return is_stale(now_playing, clock_()); }

    // Program airing at the given time, from the cached schedule (fetched
    // when missing). Throws MetadataUnavailable if it cannot be fetched.
    std::optional<ProgramEntry> current_program(const std::string& station_id,
                                                std::chrono::system_clock::time_point now);

    static std::vector<ProgramEntry> parseSchedule(const std::string& xml);

    // yyyymmdd of the given instant in Japan Standard Time
    static std::string jstDate(std::chrono::system_clock::time_point when);

    // yyyymmddHHMMSS in JST; nullopt if malformed
    static std::optional<std::chrono::system_clock::time_point> parseJst(const std::string& text);

private:
    struct ScheduleCacheEntry {
        std::string date;
        std::chrono::system_clock::time_point fetched_at;
        std::vector<ProgramEntry> programs;
    };

    std::vector<ProgramEntry> fetchSchedule(const std::string& station_id, const std::string& date);
    std::vector<ProgramEntry> schedule(const std::string& station_id,
                                       std::chrono::system_clock::time_point now, bool force);
    std::string fetchArtwork(const std::string& url);
    void deliver(NowPlaying now_playing);
    void nowPlayingThread();
    void programThread();

    HttpClient& http_;
    EndpointConfig endpoints_;
    PollConfig poll_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<StationDescriptor> station_;
    std::atomic<uint64_t> epoch_{0};
    bool kick_ = false;
    Sink sink_;
    TitleSource title_source_;

    std::mutex cache_mutex_;
    std::map<std::string, ScheduleCacheEntry> schedules_;
    std::string artwork_url_;
    std::string artwork_;

    std::atomic<bool> running_{false};
    std::thread now_playing_worker_;
    std::thread program_worker_;

    static constexpr auto REQUEST_TIMEOUT = std::chrono::milliseconds(5000);
};

} // namespace rplayer

#endif // METADATA_POLLER_HPP
