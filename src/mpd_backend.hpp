#ifndef MPD_BACKEND_HPP
#define MPD_BACKEND_HPP

#include "playback_backend.hpp"

#include <map>
#include <string>
#include <vector>

namespace rplayer {

// Media-server session over the MPD text protocol. Cannot carry HTTP
// headers, so it only plays fixed-URL streams.
class MpdBackend : public PlaybackBackend {
public:
    MpdBackend(std::string host, int port);

    void start(const StreamRef& stream) override;
    void stop() override;
    BackendStatus status() override;
    std::string stream_title() override;
    bool supports_headers() const override { return false; }
    const char* name() const override { return "mpd"; }

    // True when a server answers the greeting
    bool available();

    // Quote an argument for the MPD protocol
    static std::string quote(const std::string& arg);

    // "key: value" lines of a successful reply
    static std::map<std::string, std::string> parse_pairs(const std::string& reply);

private:
    // Send commands on a fresh connection; throws PlaybackBackendError on
    // connection failure or an ACK reply. Returns the concatenated replies.
    std::string run(const std::vector<std::string>& commands);

    std::string host_;
    int port_;

    static constexpr int IO_TIMEOUT_MS = 3000;
};

} // namespace rplayer

#endif // MPD_BACKEND_HPP
