#ifndef INTERNAL_PLAYER_HPP
#define INTERNAL_PLAYER_HPP

#ifdef RPLAYER_ENABLE_INTERNAL_PLAYER

#include "pcm_ringbuffer.hpp"
#include "playback_backend.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <thread>

struct AVFormatContext;

namespace rplayer {

// In-process player: libavformat/libavcodec decode, libswresample to
// S16 stereo, miniaudio to the default output device.
class InternalPlayerBackend : public PlaybackBackend {
public:
    InternalPlayerBackend();
    ~InternalPlayerBackend() override;

    InternalPlayerBackend(const InternalPlayerBackend&) = delete;
    InternalPlayerBackend& operator=(const InternalPlayerBackend&) = delete;

    void start(const StreamRef& stream) override;
    void stop() override;
    BackendStatus status() override;
    std::string stream_title() override;
    bool supports_headers() const override { return true; }
    const char* name() const override { return "internal"; }

private:
    void play_stream(StreamRef stream, std::promise<void> opened);
    void update_title(AVFormatContext* fmt_ctx, int audio_stream_idx);
    bool push_pcm(const uint8_t* data, size_t size);

    std::thread playback_thread_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};
    PcmRingBuffer audio_buffer_;

    std::mutex title_mutex_;
    std::string title_;

    static constexpr int SAMPLE_RATE = 48000;
    static constexpr size_t BYTES_PER_FRAME = 4;
    static constexpr size_t PREBUFFER_TARGET = 65536;
};

} // namespace rplayer

#endif // RPLAYER_ENABLE_INTERNAL_PLAYER

#endif // INTERNAL_PLAYER_HPP
