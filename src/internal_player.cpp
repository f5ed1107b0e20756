#ifdef RPLAYER_ENABLE_INTERNAL_PLAYER

#include "internal_player.hpp"

#include "errors.hpp"

#include <chrono>
#include <cstring>

#include <spdlog/spdlog.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

namespace rplayer {

namespace {

void data_callback(ma_device* pDevice, void* pOutput, const void* pInput, ma_uint32 frameCount) {
    (void)pInput;

    auto* buffer = static_cast<PcmRingBuffer*>(pDevice->pUserData);
    if (!buffer) return;

    uint8_t* output = static_cast<uint8_t*>(pOutput);
    size_t bytesToWrite = static_cast<size_t>(frameCount) * 4;
    size_t bytesRead = buffer->read(output, bytesToWrite);

    if (bytesRead < bytesToWrite) {
        std::memset(output + bytesRead, 0, bytesToWrite - bytesRead);
    }
}

std::string av_error(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

// Releases everything play_stream() acquired, in reverse order
struct DecodeContext {
    AVFormatContext* fmt_ctx = nullptr;
    AVCodecContext* codec_ctx = nullptr;
    SwrContext* swr_ctx = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;
    ma_device device;
    bool device_ready = false;

    ~DecodeContext() {
        if (device_ready) {
            ma_device_stop(&device);
            ma_device_uninit(&device);
        }
        av_packet_free(&packet);
        av_frame_free(&frame);
        swr_free(&swr_ctx);
        avcodec_free_context(&codec_ctx);
        avformat_close_input(&fmt_ctx);
    }
};

} // namespace

InternalPlayerBackend::InternalPlayerBackend() {
    av_log_set_level(AV_LOG_QUIET);
}

InternalPlayerBackend::~InternalPlayerBackend() {
    stop();
}

void InternalPlayerBackend::start(const StreamRef& stream) {
    stop();
    stop_requested_ = false;
    running_ = true;
    {
        std::lock_guard<std::mutex> lock(title_mutex_);
        title_.clear();
    }

    std::promise<void> opened;
    std::future<void> ready = opened.get_future();
    playback_thread_ = std::thread([this, stream, p = std::move(opened)]() mutable {
        play_stream(stream, std::move(p));
    });

    try {
        ready.get();
    } catch (const PlaybackBackendError&) {
        playback_thread_.join();
        throw;
    }
}

void InternalPlayerBackend::stop() {
    stop_requested_ = true;
    if (playback_thread_.joinable()) {
        playback_thread_.join();
    }
    running_ = false;
}

BackendStatus InternalPlayerBackend::status() {
    return running_ ? BackendStatus::Running : BackendStatus::Stopped;
}

std::string InternalPlayerBackend::stream_title() {
    std::lock_guard<std::mutex> lock(title_mutex_);
    return title_;
}

void InternalPlayerBackend::update_title(AVFormatContext* fmt_ctx, int audio_stream_idx) {
    auto lookup = [&](const char* key) -> AVDictionaryEntry* {
        AVDictionaryEntry* t = nullptr;
        if (audio_stream_idx >= 0 && fmt_ctx->streams[audio_stream_idx]) {
            t = av_dict_get(fmt_ctx->streams[audio_stream_idx]->metadata, key, nullptr, 0);
        }
        if (!t) {
            t = av_dict_get(fmt_ctx->metadata, key, nullptr, 0);
        }
        return t;
    };

    std::string title;
    AVDictionaryEntry* tag = lookup("StreamTitle");
    if (tag && tag->value) {
        title = tag->value;
        if (title.length() > 2 && title.front() == '\'' && title.back() == '\'') {
            title = title.substr(1, title.length() - 2);
        }
    }
    if (title.empty()) {
        AVDictionaryEntry* artist = lookup("artist");
        AVDictionaryEntry* name = lookup("title");
        if (artist && name && artist->value[0] && name->value[0]) {
            title = std::string(artist->value) + " - " + name->value;
        } else if (name && name->value[0]) {
            title = name->value;
        }
    }
    if (title.empty()) return;

    std::lock_guard<std::mutex> lock(title_mutex_);
    if (title != title_) {
        spdlog::debug("internal player: stream title '{}'", title);
        title_ = title;
    }
}

bool InternalPlayerBackend::push_pcm(const uint8_t* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        if (stop_requested_) return false;
        size_t n = audio_buffer_.write(data + written, size - written);
        if (n == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        } else {
            written += n;
        }
    }
    return true;
}

void InternalPlayerBackend::play_stream(StreamRef stream, std::promise<void> opened) {
    DecodeContext ctx;
    bool open_reported = false;

    auto fail = [&](const std::string& what) {
        spdlog::warn("internal player: {}", what);
        running_ = false;
        if (!open_reported) {
            open_reported = true;
            opened.set_exception(std::make_exception_ptr(PlaybackBackendError(what)));
        }
    };

    AVDictionary* opts = nullptr;
    av_dict_set(&opts, "icy", "1", 0);
    if (stream.needs_headers()) {
        std::string headers;
        for (const auto& [key, value] : stream.headers) {
            headers += key + ": " + value + "\r\n";
        }
        av_dict_set(&opts, "headers", headers.c_str(), 0);
    }

    int ret = avformat_open_input(&ctx.fmt_ctx, stream.url.c_str(), nullptr, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        fail("cannot open " + stream.url + ": " + av_error(ret));
        return;
    }

    ret = avformat_find_stream_info(ctx.fmt_ctx, nullptr);
    if (ret < 0) {
        fail("no stream info: " + av_error(ret));
        return;
    }

    int audio_stream_idx = -1;
    const AVCodec* codec = nullptr;
    for (unsigned int i = 0; i < ctx.fmt_ctx->nb_streams; i++) {
        AVStream* s = ctx.fmt_ctx->streams[i];
        if (s->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
            audio_stream_idx = static_cast<int>(i);
            codec = avcodec_find_decoder(s->codecpar->codec_id);
            break;
        }
    }
    if (audio_stream_idx == -1 || !codec) {
        fail("no decodable audio stream");
        return;
    }

    ctx.codec_ctx = avcodec_alloc_context3(codec);
    if (!ctx.codec_ctx ||
        avcodec_parameters_to_context(ctx.codec_ctx, ctx.fmt_ctx->streams[audio_stream_idx]->codecpar) < 0 ||
        avcodec_open2(ctx.codec_ctx, codec, nullptr) < 0) {
        fail(std::string("cannot open decoder ") + codec->name);
        return;
    }

    AVChannelLayout out_ch_layout;
    av_channel_layout_default(&out_ch_layout, 2);
    ret = swr_alloc_set_opts2(&ctx.swr_ctx,
        &out_ch_layout, AV_SAMPLE_FMT_S16, SAMPLE_RATE,
        &ctx.codec_ctx->ch_layout, ctx.codec_ctx->sample_fmt, ctx.codec_ctx->sample_rate,
        0, nullptr);
    if (ret < 0 || swr_init(ctx.swr_ctx) < 0) {
        fail("cannot set up resampler");
        return;
    }

    ma_device_config deviceConfig = ma_device_config_init(ma_device_type_playback);
    deviceConfig.playback.format = ma_format_s16;
    deviceConfig.playback.channels = 2;
    deviceConfig.sampleRate = SAMPLE_RATE;
    deviceConfig.dataCallback = data_callback;
    deviceConfig.pUserData = &audio_buffer_;
    if (ma_device_init(nullptr, &deviceConfig, &ctx.device) != MA_SUCCESS) {
        fail("cannot open audio device");
        return;
    }
    ctx.device_ready = true;

    ctx.packet = av_packet_alloc();
    ctx.frame = av_frame_alloc();
    if (!ctx.packet || !ctx.frame) {
        fail("out of memory");
        return;
    }

    spdlog::info("internal player: {} {} Hz -> {} Hz", codec->name, ctx.codec_ctx->sample_rate, SAMPLE_RATE);
    open_reported = true;
    opened.set_value();

    audio_buffer_.clear();
    bool device_started = false;
    int packet_counter = 0;
    alignas(16) uint8_t temp_buffer[32768];

    while (!stop_requested_) {
        ret = av_read_frame(ctx.fmt_ctx, ctx.packet);
        if (ret < 0) {
            spdlog::warn("internal player: stream ended: {}", av_error(ret));
            break;
        }

        if (++packet_counter % 5 == 0) {
            update_title(ctx.fmt_ctx, audio_stream_idx);
        }

        if (ctx.packet->stream_index == audio_stream_idx &&
            avcodec_send_packet(ctx.codec_ctx, ctx.packet) >= 0) {
            while (avcodec_receive_frame(ctx.codec_ctx, ctx.frame) >= 0) {
                uint8_t* out_buf = temp_buffer;
                int max_samples = static_cast<int>(sizeof(temp_buffer) / BYTES_PER_FRAME);
                int converted = swr_convert(ctx.swr_ctx, &out_buf, max_samples,
                    const_cast<const uint8_t**>(ctx.frame->data), ctx.frame->nb_samples);
                if (converted > 0 &&
                    !push_pcm(temp_buffer, static_cast<size_t>(converted) * BYTES_PER_FRAME)) {
                    break;
                }
            }
        }
        av_packet_unref(ctx.packet);

        // Start the device once enough audio is queued
        if (!device_started && audio_buffer_.readAvailable() >= PREBUFFER_TARGET) {
            if (ma_device_start(&ctx.device) != MA_SUCCESS) {
                spdlog::warn("internal player: cannot start audio device");
                break;
            }
            device_started = true;
        }
    }

    running_ = false;
}

} // namespace rplayer

#endif // RPLAYER_ENABLE_INTERNAL_PLAYER
