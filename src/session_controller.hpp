#ifndef SESSION_CONTROLLER_HPP
#define SESSION_CONTROLLER_HPP

#include "auth_token_manager.hpp"
#include "display_presenter.hpp"
#include "metadata_poller.hpp"
#include "playback_backend.hpp"
#include "state_store.hpp"
#include "station_registry.hpp"
#include "stream_resolver.hpp"
#include "task_runner.hpp"
#include "ui_event_router.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rplayer {

enum class PlaybackStatus {
    Idle,
    Resolving,
    Playing,
    Error,
};

const char* status_name(PlaybackStatus status);

struct SessionState {
    Mode mode = Mode::Curated;
    std::string station_id;
    std::string station_name;
    std::optional<StreamRef> stream;  // absent while resolving
    PlaybackStatus status = PlaybackStatus::Idle;
    std::string status_line;
    std::string last_error;
};

struct SessionOptions {
    std::chrono::milliseconds refresh{1000};
    std::chrono::milliseconds shutdown_confirm{10000};
    std::chrono::milliseconds shutdown_grace{5000};
    std::string shutdown_command;
};

// Owns the session. Every mutation happens on the loop thread; other
// threads talk to it through post(). Resolves run on the task runner and
// report back tagged with the switch epoch, so a late result for a
// superseded selection is dropped. Backend calls can block, so they run
// on the task runner too, one at a time.
class SessionController {
public:
    SessionController(StationRegistry& registry, StreamResolver& resolver, PlaybackBackend& backend,
                      DisplayPresenter& presenter, TaskRunner& tasks, SessionOptions options);

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Optional collaborators; attach before start()
    void attach_poller(MetadataPoller* poller);
    void attach_store(StateStore* store);
    void attach_auth(AuthTokenManager* auth);

    // Queue work for the loop (any thread)
    void post(std::function<void()> fn);

    // Restore the persisted session and begin playing (queued)
    void start();

    // Button event from an input source (any thread)
    void submit(const ButtonEvent& event);

    // Metadata result from the poller (any thread)
    void deliver_now_playing(NowPlaying now_playing);

    // Shut down; run_command also runs the configured shutdown command
    void request_shutdown(bool run_command);

    // Process messages and periodic checks until shutdown completes
    void run();

    // Process queued messages on the calling thread; returns how many ran
    size_t drain();

    // Periodic work: prompt timeout, playback watchdog, display refresh
    void tick(UiClock::time_point now);

    // Runs a command on the loop thread
    void execute(Command command);

    SessionState snapshot() const;
    bool finished() const;

    // Whether the shutdown command was requested
    bool power_off_requested() const;

private:
    void restore();
    void select(Command command);
    void toggle_mode();
    void begin_switch(const StationDescriptor& target, bool automatic);
    void begin_world_lookup();
    void on_resolved(uint64_t epoch, const StationDescriptor& target, const StreamRef& stream, bool automatic);
    void on_started(uint64_t epoch, const StationDescriptor& target, const StreamRef& stream);
    void on_start_failed(uint64_t epoch, const StationDescriptor& target, const std::string& error,
                         bool automatic);
    void on_failed(uint64_t epoch, const StationDescriptor& target, const std::string& status_line,
                   const std::string& error, bool automatic);
    void on_now_playing(NowPlaying now_playing);
    void check_playback(UiClock::time_point now);
    void on_backend_status(uint64_t epoch, BackendStatus status, UiClock::time_point now);
    void remember_pre_switch();
    void persist();
    void shutdown(bool run_command);
    void commit();
    DisplayFrame compose_frame() const;

    StationRegistry& registry_;
    StreamResolver& resolver_;
    PlaybackBackend& backend_;
    DisplayPresenter& presenter_;
    TaskRunner& tasks_;
    SessionOptions options_;

    MetadataPoller* poller_ = nullptr;
    StateStore* store_ = nullptr;
    AuthTokenManager* auth_ = nullptr;

    UIEventRouter router_;

    // Loop-thread state
    SessionState state_;
    StationDescriptor station_;
    std::atomic<uint64_t> epoch_{0};  // read by backend tasks
    // What was playing before the switch in flight; put back if it fails
    SessionState pre_switch_;
    StationDescriptor pre_switch_station_;
    std::optional<NowPlaying> pre_switch_now_playing_;
    std::optional<NowPlaying> now_playing_;
    bool status_check_pending_ = false;
    bool prompt_visible_ = false;
    bool stale_warned_ = false;
    bool retried_ = false;
    UiClock::time_point playing_since_;
    bool shutting_down_ = false;
    bool persistence_enabled_ = true;

    // Serializes backend calls made from tasks
    std::mutex backend_mutex_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::function<void()>> queue_;
    bool finished_ = false;
    bool power_off_ = false;

    mutable std::mutex snapshot_mutex_;
    SessionState snapshot_;

    static constexpr auto RETRY_RESET = std::chrono::seconds(60);
};

} // namespace rplayer

#endif // SESSION_CONTROLLER_HPP
