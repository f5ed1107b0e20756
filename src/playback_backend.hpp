#ifndef PLAYBACK_BACKEND_HPP
#define PLAYBACK_BACKEND_HPP

#include "stream_resolver.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace rplayer {

enum class BackendStatus {
    Stopped,
    Running,
};

// Something that turns a StreamRef into sound. start() replaces whatever
// was playing; implementations throw PlaybackBackendError on failure.
class PlaybackBackend {
public:
    virtual ~PlaybackBackend() = default;

    virtual void start(const StreamRef& stream) = 0;
    virtual void stop() = 0;
    virtual BackendStatus status() = 0;

    // Title reported by the stream itself (ICY, MPD tags), empty if unknown.
    // Called from the metadata thread.
    virtual std::string stream_title() { return ""; }

    // Whether start() honours StreamRef::headers
    virtual bool supports_headers() const = 0;

    virtual const char* name() const = 0;
};

// Sends header-carrying streams to one backend and plain streams to
// another, keeping at most one of them active.
class RoutingBackend : public PlaybackBackend {
public:
    // plain may be null, in which case everything goes to header_capable
    RoutingBackend(std::unique_ptr<PlaybackBackend> header_capable,
                   std::unique_ptr<PlaybackBackend> plain);

    void start(const StreamRef& stream) override;
    void stop() override;
    BackendStatus status() override;
    std::string stream_title() override;
    bool supports_headers() const override { return true; }
    const char* name() const override;

private:
    std::unique_ptr<PlaybackBackend> header_capable_;
    std::unique_ptr<PlaybackBackend> plain_;

    mutable std::mutex mutex_;
    PlaybackBackend* active_ = nullptr;
};

} // namespace rplayer

#endif // PLAYBACK_BACKEND_HPP
