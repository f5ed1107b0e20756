#include "playback_backend.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>

namespace rplayer {

RoutingBackend::RoutingBackend(std::unique_ptr<PlaybackBackend> header_capable,
                               std::unique_ptr<PlaybackBackend> plain)
    : header_capable_(std::move(header_capable)), plain_(std::move(plain)) {
    if (!header_capable_ || !header_capable_->supports_headers()) {
        throw PlaybackBackendError("routing backend needs a header-capable player");
    }
}

void RoutingBackend::start(const StreamRef& stream) {
    PlaybackBackend* target = (stream.needs_headers() || !plain_) ? header_capable_.get() : plain_.get();
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        active_->stop();
        active_ = nullptr;
    }
    spdlog::debug("playback: {} via {}", stream.url, target->name());
    target->start(stream);
    active_ = target;
}

void RoutingBackend::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        active_->stop();
        active_ = nullptr;
    }
}

BackendStatus RoutingBackend::status() {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ ? active_->status() : BackendStatus::Stopped;
}

std::string RoutingBackend::stream_title() {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ ? active_->stream_title() : std::string();
}

const char* RoutingBackend::name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ ? active_->name() : "idle";
}

} // namespace rplayer
