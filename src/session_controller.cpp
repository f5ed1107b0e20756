#include "session_controller.hpp"

#include "errors.hpp"

#include <cstdlib>
#include <spdlog/spdlog.h>

namespace rplayer {

namespace {

const char* fallback_title(Mode mode) {
    return mode == Mode::World ? "World Radio" : "Now Playing";
}

} // namespace

const char* status_name(PlaybackStatus status) {
    switch (status) {
        case PlaybackStatus::Idle: return "idle";
        case PlaybackStatus::Resolving: return "resolving";
        case PlaybackStatus::Playing: return "playing";
        case PlaybackStatus::Error: return "error";
    }
    return "?";
}

SessionController::SessionController(StationRegistry& registry, StreamResolver& resolver, PlaybackBackend& backend,
                                     DisplayPresenter& presenter, TaskRunner& tasks, SessionOptions options)
    : registry_(registry),
      resolver_(resolver),
      backend_(backend),
      presenter_(presenter),
      tasks_(tasks),
      options_(std::move(options)),
      router_(options_.shutdown_confirm) {}

void SessionController::attach_poller(MetadataPoller* poller) {
    poller_ = poller;
    if (poller_) {
        poller_->set_sink([this](NowPlaying now_playing) { deliver_now_playing(std::move(now_playing)); });
    }
}

void SessionController::attach_store(StateStore* store) {
    store_ = store;
}

void SessionController::attach_auth(AuthTokenManager* auth) {
    auth_ = auth;
}

void SessionController::post(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(fn));
    }
    queue_cv_.notify_one();
}

void SessionController::start() {
    post([this] { restore(); });
}

void SessionController::submit(const ButtonEvent& event) {
    post([this, event] {
        if (shutting_down_) return;
        if (auto command = router_.handle(event)) {
            execute(*command);
        }
    });
}

void SessionController::deliver_now_playing(NowPlaying now_playing) {
    post([this, now_playing = std::move(now_playing)]() mutable { on_now_playing(std::move(now_playing)); });
}

void SessionController::request_shutdown(bool run_command) {
    post([this, run_command] { shutdown(run_command); });
}

size_t SessionController::drain() {
    size_t count = 0;
    for (;;) {
        std::function<void()> fn;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty()) break;
            fn = std::move(queue_.front());
            queue_.pop_front();
        }
        fn();
        ++count;
    }
    return count;
}

void SessionController::run() {
    auto next_tick = UiClock::now();
    for (;;) {
        std::function<void()> fn;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_until(lock, next_tick, [this] { return finished_ || !queue_.empty(); });
            if (finished_) break;
            if (!queue_.empty()) {
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
        }
        if (fn) {
            fn();
        }
        auto now = UiClock::now();
        if (now >= next_tick) {
            tick(now);
            next_tick = now + options_.refresh;
        }
    }
    spdlog::debug("session: loop finished");
}

SessionState SessionController::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

bool SessionController::finished() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return finished_;
}

bool SessionController::power_off_requested() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return power_off_;
}

void SessionController::restore() {
    std::optional<PersistedSession> saved;
    if (store_) {
        try {
            saved = store_->load();
        } catch (const PersistenceError& e) {
            spdlog::warn("session: cannot restore last session, starting fresh: {}", e.what());
        }
    }

    if (saved && saved->mode == Mode::World && registry_.directory()) {
        registry_.set_mode(Mode::World);
        if (saved->world_station) {
            registry_.select_world(*saved->world_station);
            spdlog::info("session: resuming world station {}", saved->world_station->label());
            begin_switch(*saved->world_station, false);
        } else {
            begin_world_lookup();
        }
        return;
    }

    registry_.set_mode(Mode::Curated);
    if (saved && !saved->station_id.empty()) {
        if (registry_.select_curated(saved->station_id)) {
            spdlog::info("session: resuming {}", saved->station_id);
        } else {
            spdlog::info("session: saved station {} is gone, starting with the first entry", saved->station_id);
        }
    }
    const StationDescriptor* current = registry_.current();
    if (!current) {
        state_.status = PlaybackStatus::Error;
        state_.status_line = "No stations";
        commit();
        return;
    }
    begin_switch(*current, false);
}

void SessionController::execute(Command command) {
    if (shutting_down_) return;

    switch (command) {
    case Command::SelectPrevious:
    case Command::SelectNext:
        select(command);
        break;
    case Command::ToggleMode:
        toggle_mode();
        break;
    case Command::ShowShutdownPrompt:
        prompt_visible_ = true;
        commit();
        break;
    case Command::DismissShutdownPrompt:
        prompt_visible_ = false;
        commit();
        break;
    case Command::ConfirmShutdown:
        shutdown(true);
        break;
    }
}

void SessionController::select(Command command) {
    if (registry_.mode() == Mode::World) {
        begin_world_lookup();
        return;
    }
    if (registry_.curated().size() == 1) {
        state_.status_line = "Only one station";
        commit();
        return;
    }
    const StationDescriptor* target =
        command == Command::SelectNext ? registry_.next() : registry_.previous();
    if (target) {
        begin_switch(*target, false);
    }
}

void SessionController::toggle_mode() {
    Mode next = registry_.mode() == Mode::Curated ? Mode::World : Mode::Curated;
    if (next == Mode::World && !registry_.directory()) {
        spdlog::warn("session: world radio is not configured");
        return;
    }
    registry_.set_mode(next);
    spdlog::info("session: mode -> {}", mode_name(next));

    if (next == Mode::World) {
        begin_world_lookup();
    } else if (const StationDescriptor* current = registry_.current()) {
        begin_switch(*current, false);
    }
}

void SessionController::remember_pre_switch() {
    if (state_.status == PlaybackStatus::Resolving) {
        return;  // keep the snapshot from the first switch of a burst
    }
    pre_switch_ = state_;
    pre_switch_station_ = station_;
    pre_switch_now_playing_ = now_playing_;
}

void SessionController::begin_world_lookup() {
    StationDirectory* directory = registry_.directory();
    if (!directory) return;

    remember_pre_switch();
    uint64_t epoch = ++epoch_;
    state_.mode = Mode::World;
    state_.status = PlaybackStatus::Resolving;
    state_.stream.reset();
    state_.status_line = "Searching...";
    commit();

    tasks_.run([this, epoch, directory] {
        std::vector<StationDescriptor> found;
        try {
            found = directory->lookup();
        } catch (const std::exception& e) {
            spdlog::warn("session: world lookup failed: {}", e.what());
        }
        post([this, epoch, found = std::move(found)]() mutable {
            if (epoch != epoch_ || shutting_down_) {
                spdlog::debug("session: dropping superseded world lookup");
                return;
            }
            const StationDescriptor* pick = registry_.adopt_world_set(std::move(found));
            if (pick) {
                begin_switch(*pick, false);
            } else {
                StationDescriptor none;
                none.source = Mode::World;
                on_failed(epoch, none, "No world stations", "world directory returned nothing", false);
            }
        });
    });
}

void SessionController::begin_switch(const StationDescriptor& target, bool automatic) {
    remember_pre_switch();
    uint64_t epoch = ++epoch_;
    if (!automatic) {
        retried_ = false;
    }

    station_ = target;
    state_.mode = registry_.mode();
    state_.station_id = target.id;
    state_.station_name = target.label();
    state_.status = PlaybackStatus::Resolving;
    state_.stream.reset();
    state_.status_line.clear();
    now_playing_.reset();
    commit();

    if (poller_) {
        poller_->station_changed(target);
    }
    spdlog::info("session: tuning to {} ({})", target.label(), automatic ? "retry" : mode_name(state_.mode));

    tasks_.run([this, epoch, target, automatic] {
        try {
            StreamRef stream = resolver_.resolve(target);
            post([this, epoch, target, stream, automatic] { on_resolved(epoch, target, stream, automatic); });
        } catch (const StationNotFound& e) {
            std::string error = e.what();
            post([this, epoch, target, error, automatic] {
                on_failed(epoch, target, "Station not found", error, automatic);
            });
        } catch (const AuthUnavailable& e) {
            std::string error = e.what();
            post([this, epoch, target, error, automatic] {
                on_failed(epoch, target, "Login failed", error, automatic);
            });
        } catch (const std::exception& e) {
            std::string error = e.what();
            post([this, epoch, target, error, automatic] {
                on_failed(epoch, target, "Stream unavailable", error, automatic);
            });
        }
    });
}

void SessionController::on_resolved(uint64_t epoch, const StationDescriptor& target, const StreamRef& stream,
                                    bool automatic) {
    if (epoch != epoch_ || shutting_down_) {
        spdlog::debug("session: dropping superseded stream for {}", target.id);
        return;
    }

    tasks_.run([this, epoch, target, stream, automatic] {
        bool started = true;
        std::string error;
        {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            if (epoch != epoch_) {
                return;  // a newer switch or shutdown owns the backend now
            }
            try {
                backend_.stop();
                backend_.start(stream);
            } catch (const PlaybackBackendError& e) {
                started = false;
                error = e.what();
            }
        }
        if (started) {
            post([this, epoch, target, stream] { on_started(epoch, target, stream); });
        } else {
            post([this, epoch, target, error, automatic] { on_start_failed(epoch, target, error, automatic); });
        }
    });
}

void SessionController::on_started(uint64_t epoch, const StationDescriptor& target, const StreamRef& stream) {
    if (shutting_down_) {
        return;
    }
    if (epoch != epoch_) {
        // The backend plays this stream until the newer switch lands, so
        // that is what a failed newer switch falls back to
        if (state_.status == PlaybackStatus::Resolving) {
            pre_switch_.mode = target.source;
            pre_switch_.station_id = target.id;
            pre_switch_.station_name = target.label();
            pre_switch_.status = PlaybackStatus::Playing;
            pre_switch_.stream = stream;
            pre_switch_station_ = target;
            pre_switch_now_playing_.reset();
        }
        return;
    }

    state_.stream = stream;
    state_.status = PlaybackStatus::Playing;
    state_.status_line.clear();
    state_.last_error.clear();
    playing_since_ = UiClock::now();
    commit();
    spdlog::info("session: playing {} via {}", target.label(), backend_.name());
    persist();
}

void SessionController::on_start_failed(uint64_t epoch, const StationDescriptor& target, const std::string& error,
                                        bool automatic) {
    if (shutting_down_) {
        return;
    }
    // The previous stream was stopped before the start, nothing to fall back to
    pre_switch_.stream.reset();
    pre_switch_.status = PlaybackStatus::Idle;
    if (epoch != epoch_) {
        return;
    }

    spdlog::warn("session: {} failed to start {}: {}", backend_.name(), target.id, error);
    if (!retried_) {
        retried_ = true;
        begin_switch(target, true);
        return;
    }
    on_failed(epoch, target, "Playback failed", error, automatic);
}

void SessionController::on_failed(uint64_t epoch, const StationDescriptor& target, const std::string& status_line,
                                  const std::string& error, bool automatic) {
    if (epoch != epoch_ || shutting_down_) {
        spdlog::debug("session: dropping superseded failure for {}", target.id);
        return;
    }
    spdlog::warn("session: cannot play {}: {}", target.id.empty() ? "world station" : target.id, error);

    if (!automatic && pre_switch_.stream) {
        // The old stream is still playing; point the session back at it
        state_.mode = pre_switch_.mode;
        state_.station_id = pre_switch_.station_id;
        state_.station_name = pre_switch_.station_name;
        state_.status = pre_switch_.status;
        state_.stream = pre_switch_.stream;
        station_ = pre_switch_station_;
        now_playing_ = pre_switch_now_playing_;
        if (state_.mode == Mode::World) {
            registry_.set_mode(Mode::World);
            registry_.select_world(station_);
        } else if (registry_.mode() != Mode::Curated) {
            // Entering curated mode failed; keep the cursor on what plays
            registry_.set_mode(Mode::Curated);
            registry_.select_curated(state_.station_id);
        }
        if (poller_) {
            poller_->station_changed(station_);
        }
    } else {
        state_.status = PlaybackStatus::Error;
        state_.stream.reset();
    }
    state_.status_line = status_line;
    state_.last_error = error;
    commit();
}

void SessionController::on_now_playing(NowPlaying now_playing) {
    if (now_playing.station_id != state_.station_id || (poller_ && now_playing.epoch != poller_->epoch())) {
        spdlog::debug("session: ignoring metadata for {}", now_playing.station_id);
        return;
    }
    now_playing_ = std::move(now_playing);
    commit();
}

void SessionController::tick(UiClock::time_point now) {
    if (shutting_down_) return;

    if (auto command = router_.tick(now)) {
        execute(*command);
    }
    check_playback(now);

    bool stale = now_playing_ && poller_ && poller_->is_stale(*now_playing_);
    if (stale && !stale_warned_) {
        spdlog::warn("session: metadata for {} is stale, showing station name only", state_.station_id);
    }
    stale_warned_ = stale;
    commit();
}

void SessionController::check_playback(UiClock::time_point now) {
    if (state_.status != PlaybackStatus::Playing || status_check_pending_) {
        return;
    }
    status_check_pending_ = true;
    uint64_t epoch = epoch_;
    tasks_.run([this, epoch, now] {
        BackendStatus status;
        {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            status = backend_.status();
        }
        post([this, epoch, status, now] { on_backend_status(epoch, status, now); });
    });
}

void SessionController::on_backend_status(uint64_t epoch, BackendStatus status, UiClock::time_point now) {
    status_check_pending_ = false;
    if (epoch != epoch_ || shutting_down_ || state_.status != PlaybackStatus::Playing) {
        return;
    }
    if (status == BackendStatus::Running) {
        if (retried_ && now - playing_since_ >= RETRY_RESET) {
            retried_ = false;
        }
        return;
    }

    spdlog::warn("session: {} stopped playing {}", backend_.name(), state_.station_id);
    if (!retried_) {
        retried_ = true;
        begin_switch(station_, true);
        return;
    }
    state_.status = PlaybackStatus::Error;
    state_.stream.reset();
    state_.status_line = "Playback stopped";
    state_.last_error = "player exited";
    commit();
}

void SessionController::persist() {
    if (!store_ || !persistence_enabled_) {
        return;
    }
    PersistedSession session;
    session.mode = state_.mode;
    session.station_id = state_.station_id;
    if (const StationDescriptor* world = registry_.world_current()) {
        session.world_station = *world;
    }
    try {
        store_->save(session);
    } catch (const PersistenceError& e) {
        spdlog::warn("session: persistence disabled: {}", e.what());
        persistence_enabled_ = false;
    }
}

void SessionController::shutdown(bool run_command) {
    if (shutting_down_) return;
    shutting_down_ = true;
    ++epoch_;
    spdlog::info("session: shutting down");

    prompt_visible_ = false;
    state_.status_line = run_command ? "Shutting down..." : "Stopping...";
    commit();

    {
        std::lock_guard<std::mutex> lock(backend_mutex_);
        backend_.stop();
    }
    if (state_.status == PlaybackStatus::Playing) {
        persist();
    }
    state_.status = PlaybackStatus::Idle;
    state_.stream.reset();

    if (poller_) poller_->stop();
    if (auth_) auth_->stop();
    tasks_.wait_all(options_.shutdown_grace);

    if (run_command && !options_.shutdown_command.empty()) {
        spdlog::info("session: running '{}'", options_.shutdown_command);
        int rc = std::system(options_.shutdown_command.c_str());
        if (rc != 0) {
            spdlog::error("session: shutdown command exited with {}", rc);
        }
    }

    commit();
    std::lock_guard<std::mutex> lock(queue_mutex_);
    finished_ = true;
    power_off_ = run_command;
    queue_cv_.notify_all();
}

DisplayFrame SessionController::compose_frame() const {
    DisplayFrame frame;
    frame.mode = state_.mode;
    frame.station_id = state_.station_id;
    frame.status_line = state_.status_line;

    if (prompt_visible_) {
        frame.station = "Shutdown?";
        frame.title = "Press X to confirm";
        return frame;
    }

    frame.station = state_.station_name.empty() ? fallback_title(state_.mode) : state_.station_name;
    if (state_.status == PlaybackStatus::Resolving) {
        frame.title = "Loading...";
        return frame;
    }

    bool fresh = now_playing_ && now_playing_->station_id == state_.station_id &&
                 !(poller_ && poller_->is_stale(*now_playing_));
    if (fresh) {
        frame.title = now_playing_->title;
        frame.artwork = now_playing_->artwork;
    }
    if (frame.title.empty()) {
        frame.title = fallback_title(state_.mode);
    }
    return frame;
}

void SessionController::commit() {
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot_ = state_;
    }
    presenter_.publish(compose_frame());
}

} // namespace rplayer
