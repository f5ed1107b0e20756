#ifndef FFMPEG_BACKEND_HPP
#define FFMPEG_BACKEND_HPP

#include "playback_backend.hpp"

#include <string>
#include <sys/types.h>
#include <vector>

namespace rplayer {

// Runs the ffmpeg binary as a child process writing to ALSA. The only
// backend that can attach custom HTTP headers to the stream request.
class FfmpegProcessBackend : public PlaybackBackend {
public:
    FfmpegProcessBackend(std::string ffmpeg, std::string alsa_device, bool verbose, bool quiet_output);
    ~FfmpegProcessBackend() override;

    FfmpegProcessBackend(const FfmpegProcessBackend&) = delete;
    FfmpegProcessBackend& operator=(const FfmpegProcessBackend&) = delete;

    void start(const StreamRef& stream) override;
    void stop() override;
    BackendStatus status() override;
    bool supports_headers() const override { return true; }
    const char* name() const override { return "ffmpeg"; }

    // Command line for a stream (exposed for logging and tests)
    std::vector<std::string> command_line(const StreamRef& stream) const;

private:
    std::string ffmpeg_;
    std::string alsa_device_;
    bool verbose_;
    bool quiet_output_;
    pid_t pid_ = -1;

    static constexpr int STOP_TIMEOUT_MS = 2000;
};

} // namespace rplayer

#endif // FFMPEG_BACKEND_HPP
