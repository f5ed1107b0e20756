#include "session_controller.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>
#include <thread>

namespace rplayer {
namespace {

using std::chrono::milliseconds;
using std::chrono::seconds;
using test::FakeBackend;
using test::FakeDirectory;
using test::FakeHttpClient;
using test::FakePresenter;
using test::fixed_station;
using test::InlineTaskRunner;
using test::ManualClock;
using test::ManualTaskRunner;
using test::MemoryStateStore;
using test::upstream_station;
using test::world_station;

constexpr const char* AUTH1 = "https://auth.test/auth1";
constexpr const char* AUTH2 = "https://auth.test/auth2";

class SessionControllerTest : public ::testing::Test {
protected:
    SessionControllerTest() {
        AuthConfig auth;
        auth.auth1_urls = {AUTH1};
        auth.auth2_urls = {AUTH2};
        auth.max_attempts = 1;
        auth_ = std::make_unique<AuthTokenManager>(http_, auth, clock_.fn(), [](milliseconds) {});

        EndpointConfig endpoints;
        endpoints.stream_xml_urls = {"https://api.test/stream/{station}.xml"};
        endpoints.station_list_url = "https://api.test/list/{area}.xml";
        resolver_ = std::make_unique<StreamResolver>(http_, *auth_, endpoints);

        options_.shutdown_command.clear();
    }

    void make(std::vector<StationDescriptor> stations, TaskRunner& tasks, StationDirectory* directory = nullptr) {
        registry_ = std::make_unique<StationRegistry>(std::move(stations), directory, 7);
        controller_ = std::make_unique<SessionController>(*registry_, *resolver_, backend_, presenter_, tasks,
                                                          options_);
        controller_->attach_store(&store_);
        controller_->attach_auth(auth_.get());
    }

    void make(TaskRunner& tasks, StationDirectory* directory = nullptr) {
        make({fixed_station("a", "http://a.test/live"), fixed_station("b", "http://b.test/live")}, tasks,
             directory);
    }

    void boot() {
        controller_->start();
        controller_->drain();
    }

    void press(Button button, Click click = Click::Single) {
        controller_->submit({button, click, UiClock::now()});
        controller_->drain();
    }

    void script_auth() {
        http_.respond(AUTH1, 200, "", {{"X-Radiko-AuthToken", "tok-1"},
                                       {"X-Radiko-KeyLength", "4"},
                                       {"X-Radiko-KeyOffset", "2"}});
        http_.respond(AUTH2, 200, "JP13,tokyo Japan");
    }

    // Run released tasks and the messages they post until nothing is left
    void settle(ManualTaskRunner& tasks) {
        controller_->drain();
        while (tasks.pending() > 0) {
            tasks.run_all();
            controller_->drain();
        }
    }

    NowPlaying now_playing(const std::string& station_id, const std::string& title, uint64_t epoch) {
        NowPlaying result;
        result.station_id = station_id;
        result.title = title;
        result.epoch = epoch;
        result.fetched_at = clock_.now();
        return result;
    }

    SessionState state() const { return controller_->snapshot(); }

    std::string playing_url() const {
        auto s = state();
        return s.stream ? s.stream->url : "";
    }

    FakeHttpClient http_;
    ManualClock clock_;
    std::unique_ptr<AuthTokenManager> auth_;
    std::unique_ptr<StreamResolver> resolver_;
    FakeBackend backend_;
    FakePresenter presenter_;
    MemoryStateStore store_;
    InlineTaskRunner inline_;
    SessionOptions options_;
    std::unique_ptr<StationRegistry> registry_;
    std::unique_ptr<SessionController> controller_;
};

TEST_F(SessionControllerTest, StartsWithFirstStation) {
    make(inline_);
    boot();
    EXPECT_EQ(state().status, PlaybackStatus::Playing);
    EXPECT_EQ(state().station_id, "a");
    EXPECT_EQ(playing_url(), "http://a.test/live");
    EXPECT_EQ(presenter_.last().station, "a FM");
    EXPECT_EQ(presenter_.last().title, "Now Playing");
}

TEST_F(SessionControllerTest, FixedUrlStationStartsOnceWithoutNetwork) {
    make(inline_);
    boot();
    ASSERT_EQ(backend_.started().size(), 1u);
    EXPECT_FALSE(backend_.started()[0].needs_headers());
    EXPECT_EQ(http_.total(), 0u);
    EXPECT_EQ(auth_->handshakeCount(), 0);
}

TEST_F(SessionControllerTest, RestoresSavedStation) {
    store_.saved = PersistedSession{Mode::Curated, "b", std::nullopt};
    make(inline_);
    boot();
    EXPECT_EQ(state().station_id, "b");
    EXPECT_EQ(playing_url(), "http://b.test/live");
}

TEST_F(SessionControllerTest, MissingSavedStationFallsBackToFirst) {
    store_.saved = PersistedSession{Mode::Curated, "gone", std::nullopt};
    make(inline_);
    boot();
    EXPECT_EQ(state().station_id, "a");
}

TEST_F(SessionControllerTest, CorruptStateStartsFresh) {
    store_.corrupt = true;
    make(inline_);
    boot();
    EXPECT_EQ(state().station_id, "a");
    EXPECT_EQ(state().status, PlaybackStatus::Playing);
}

TEST_F(SessionControllerTest, NoStationsIsAnError) {
    make(std::vector<StationDescriptor>{}, inline_);
    boot();
    EXPECT_EQ(state().status, PlaybackStatus::Error);
    EXPECT_EQ(presenter_.last().status_line, "No stations");
    EXPECT_TRUE(backend_.started().empty());
}

TEST_F(SessionControllerTest, NextAndPreviousWrap) {
    make(inline_);
    boot();
    press(Button::B);
    EXPECT_EQ(state().station_id, "b");
    press(Button::B);
    EXPECT_EQ(state().station_id, "a");
    press(Button::A);
    EXPECT_EQ(state().station_id, "b");
    EXPECT_EQ(backend_.started().size(), 4u);
    EXPECT_EQ(backend_.started().back().url, "http://b.test/live");
}

TEST_F(SessionControllerTest, FailedSwitchKeepsCurrentStream) {
    make({fixed_station("a", "http://a.test/live"), upstream_station("c", "Station C")}, inline_);
    boot();
    press(Button::B);

    SessionState s = state();
    EXPECT_EQ(s.status, PlaybackStatus::Playing);
    EXPECT_EQ(playing_url(), "http://a.test/live");
    EXPECT_EQ(s.station_id, "a");
    EXPECT_EQ(s.station_name, "a FM");
    EXPECT_EQ(s.status_line, "Login failed");
    EXPECT_FALSE(s.last_error.empty());
    EXPECT_EQ(backend_.started().size(), 1u);
    EXPECT_EQ(presenter_.last().station, "a FM");
    EXPECT_EQ(presenter_.last().status_line, "Login failed");
}

TEST_F(SessionControllerTest, DeadPlayerAfterFailedSwitchRestartsPlayingStation) {
    make({fixed_station("a", "http://a.test/live"), upstream_station("c", "Station C")}, inline_);
    boot();
    press(Button::B);
    ASSERT_EQ(state().station_id, "a");

    backend_.crash();
    controller_->tick(UiClock::now());
    controller_->drain();

    auto started = backend_.started();
    ASSERT_EQ(started.size(), 2u);
    EXPECT_EQ(started[1].url, "http://a.test/live");
    EXPECT_EQ(state().status, PlaybackStatus::Playing);
    EXPECT_EQ(state().station_id, "a");
}

TEST_F(SessionControllerTest, SingleStationIgnoresNextAndPrevious) {
    make({fixed_station("a", "http://a.test/live")}, inline_);
    boot();
    press(Button::B);
    press(Button::A);
    EXPECT_EQ(backend_.started().size(), 1u);
    EXPECT_EQ(backend_.stops(), 1);
    EXPECT_EQ(state().status, PlaybackStatus::Playing);
    EXPECT_EQ(presenter_.last().status_line, "Only one station");
}

TEST_F(SessionControllerTest, FailedFirstTuneIsAnError) {
    make({upstream_station("c")}, inline_);
    boot();
    EXPECT_EQ(state().status, PlaybackStatus::Error);
    EXPECT_FALSE(state().stream.has_value());
    EXPECT_EQ(state().status_line, "Login failed");
}

TEST_F(SessionControllerTest, UnknownStationReportsNotFound) {
    script_auth();
    make({upstream_station("XYZ")}, inline_);
    boot();
    EXPECT_EQ(state().status, PlaybackStatus::Error);
    EXPECT_EQ(state().status_line, "Station not found");
}

TEST_F(SessionControllerTest, AuthOutageDoesNotStopFixedStation) {
    make({fixed_station("a", "http://a.test/live"), upstream_station("c")}, inline_);
    boot();
    press(Button::B);
    press(Button::B);
    EXPECT_EQ(state().station_id, "a");
    EXPECT_EQ(state().status, PlaybackStatus::Playing);
    EXPECT_TRUE(state().status_line.empty());
}

TEST_F(SessionControllerTest, LoadingWhileResolving) {
    ManualTaskRunner tasks;
    make(tasks);
    boot();
    EXPECT_EQ(state().status, PlaybackStatus::Resolving);
    EXPECT_EQ(presenter_.last().station, "a FM");
    EXPECT_EQ(presenter_.last().title, "Loading...");
    EXPECT_EQ(tasks.pending(), 1u);

    settle(tasks);
    EXPECT_EQ(state().status, PlaybackStatus::Playing);
}

TEST_F(SessionControllerTest, BackendCallsRunOffTheLoop) {
    ManualTaskRunner tasks;
    make(tasks);
    boot();
    tasks.run_next();
    controller_->drain();
    // Resolved, but the start itself waits on the task runner
    EXPECT_EQ(state().status, PlaybackStatus::Resolving);
    EXPECT_TRUE(backend_.started().empty());
    ASSERT_EQ(tasks.pending(), 1u);

    settle(tasks);
    EXPECT_EQ(backend_.started().size(), 1u);

    controller_->tick(UiClock::now());
    EXPECT_EQ(tasks.pending(), 1u);
    // Only one status check at a time
    controller_->tick(UiClock::now());
    EXPECT_EQ(tasks.pending(), 1u);
    settle(tasks);
    EXPECT_EQ(state().status, PlaybackStatus::Playing);
}

TEST_F(SessionControllerTest, SupersededStartNeverReachesBackend) {
    ManualTaskRunner tasks;
    make({fixed_station("a", "http://a.test/live"), fixed_station("b", "http://b.test/live"),
          fixed_station("d", "http://d.test/live")},
         tasks);
    boot();
    settle(tasks);

    press(Button::B);
    tasks.run_next();
    controller_->drain();
    ASSERT_EQ(tasks.pending(), 1u);  // start of b

    press(Button::B);
    settle(tasks);

    auto started = backend_.started();
    ASSERT_EQ(started.size(), 2u);
    EXPECT_EQ(started[1].url, "http://d.test/live");
    EXPECT_EQ(state().station_id, "d");
}

TEST_F(SessionControllerTest, LatestSelectionWins) {
    ManualTaskRunner tasks;
    make({fixed_station("a", "http://a.test/live"), fixed_station("b", "http://b.test/live"),
          fixed_station("d", "http://d.test/live")},
         tasks);
    boot();
    settle(tasks);

    press(Button::B);
    press(Button::B);
    ASSERT_EQ(tasks.pending(), 2u);
    // Finish the newer resolve first, then the superseded one
    tasks.run_last();
    tasks.run_next();
    settle(tasks);

    auto started = backend_.started();
    ASSERT_EQ(started.size(), 2u);
    EXPECT_EQ(started[1].url, "http://d.test/live");
    EXPECT_EQ(state().station_id, "d");
    EXPECT_EQ(playing_url(), "http://d.test/live");
}

TEST_F(SessionControllerTest, BackendFailureRetriesOnce) {
    backend_.fail_next(1);
    make(inline_);
    boot();
    EXPECT_EQ(backend_.failed_starts(), 1);
    EXPECT_EQ(state().status, PlaybackStatus::Playing);
    EXPECT_EQ(playing_url(), "http://a.test/live");
}

TEST_F(SessionControllerTest, BackendFailureTwiceIsAnError) {
    make(inline_);
    boot();
    backend_.fail_next(2);
    press(Button::B);
    EXPECT_EQ(backend_.failed_starts(), 2);
    EXPECT_EQ(state().status, PlaybackStatus::Error);
    EXPECT_EQ(state().status_line, "Playback failed");
    EXPECT_FALSE(state().stream.has_value());
}

TEST_F(SessionControllerTest, WatchdogRestartsDeadPlayerOnce) {
    make(inline_);
    boot();

    backend_.crash();
    controller_->tick(UiClock::now());
    controller_->drain();
    EXPECT_EQ(backend_.started().size(), 2u);
    EXPECT_EQ(state().status, PlaybackStatus::Playing);

    backend_.crash();
    controller_->tick(UiClock::now());
    controller_->drain();
    EXPECT_EQ(backend_.started().size(), 2u);
    EXPECT_EQ(state().status, PlaybackStatus::Error);
    EXPECT_EQ(presenter_.last().status_line, "Playback stopped");
}

TEST_F(SessionControllerTest, ToggleIntoWorldAndBack) {
    FakeDirectory directory({world_station("w1", "http://w1.test/live")});
    make(inline_, &directory);
    boot();

    press(Button::X);
    EXPECT_EQ(state().mode, Mode::World);
    EXPECT_EQ(state().station_id, "w1");
    EXPECT_EQ(playing_url(), "http://w1.test/live");
    EXPECT_EQ(directory.lookups, 1);

    press(Button::B);
    EXPECT_EQ(directory.lookups, 2);

    press(Button::X);
    EXPECT_EQ(state().mode, Mode::Curated);
    EXPECT_EQ(state().station_id, "a");

    // Coming back to world radio looks the directory up again
    directory.set({world_station("w2", "http://w2.test/live")});
    press(Button::X);
    EXPECT_EQ(directory.lookups, 3);
    EXPECT_EQ(state().mode, Mode::World);
    EXPECT_EQ(playing_url(), "http://w2.test/live");
}

TEST_F(SessionControllerTest, EmptyWorldLookupReportsFailure) {
    FakeDirectory directory;
    make(inline_, &directory);
    boot();
    press(Button::X);
    EXPECT_EQ(state().status_line, "No world stations");
    // The curated stream keeps playing and the session stays with it
    EXPECT_EQ(playing_url(), "http://a.test/live");
    EXPECT_EQ(state().mode, Mode::Curated);
    EXPECT_EQ(registry_->mode(), Mode::Curated);
    EXPECT_EQ(registry_->cursor(), 0u);
}

TEST_F(SessionControllerTest, ToggleWithoutDirectoryIsIgnored) {
    make(inline_);
    boot();
    press(Button::X);
    EXPECT_EQ(state().mode, Mode::Curated);
    EXPECT_EQ(backend_.started().size(), 1u);
}

TEST_F(SessionControllerTest, RestoresWorldPickWithoutLookup) {
    FakeDirectory directory({world_station("w1", "http://w1.test/live")});
    store_.saved = PersistedSession{Mode::World, "w9", world_station("w9", "http://w9.test/live")};
    make(inline_, &directory);
    boot();
    EXPECT_EQ(state().mode, Mode::World);
    EXPECT_EQ(playing_url(), "http://w9.test/live");
    EXPECT_EQ(directory.lookups, 0);
}

TEST_F(SessionControllerTest, PersistsAfterEachSuccessfulTune) {
    FakeDirectory directory({world_station("w1", "http://w1.test/live")});
    make(inline_, &directory);
    boot();
    press(Button::B);
    ASSERT_TRUE(store_.saved.has_value());
    EXPECT_EQ(store_.saved->mode, Mode::Curated);
    EXPECT_EQ(store_.saved->station_id, "b");

    press(Button::X);
    EXPECT_EQ(store_.saved->mode, Mode::World);
    EXPECT_EQ(store_.saved->station_id, "w1");
    ASSERT_TRUE(store_.saved->world_station.has_value());
    EXPECT_EQ(store_.saved->world_station->stream_url, "http://w1.test/live");
}

TEST_F(SessionControllerTest, FailedTuneIsNotPersisted) {
    make({fixed_station("a", "http://a.test/live"), upstream_station("c")}, inline_);
    boot();
    press(Button::B);
    EXPECT_EQ(store_.saved->station_id, "a");
}

TEST_F(SessionControllerTest, SaveFailureDisablesPersistence) {
    store_.read_only = true;
    make(inline_);
    boot();
    EXPECT_EQ(store_.saves, 1);
    press(Button::B);
    EXPECT_EQ(store_.saves, 1);
    EXPECT_EQ(state().status, PlaybackStatus::Playing);
}

TEST_F(SessionControllerTest, ShutdownPromptAndDismiss) {
    make(inline_);
    boot();
    press(Button::Y);
    EXPECT_EQ(presenter_.last().station, "a FM");
    press(Button::Y, Click::Double);
    EXPECT_EQ(presenter_.last().station, "Shutdown?");
    EXPECT_EQ(presenter_.last().title, "Press X to confirm");

    press(Button::B);
    EXPECT_EQ(presenter_.last().station, "a FM");
    EXPECT_EQ(state().station_id, "a");
    EXPECT_EQ(backend_.started().size(), 1u);
}

TEST_F(SessionControllerTest, ShutdownPromptTimesOut) {
    make(inline_);
    boot();
    press(Button::Y, Click::Double);
    controller_->tick(UiClock::now() + milliseconds(options_.shutdown_confirm.count() + 1000));
    EXPECT_EQ(presenter_.last().station, "a FM");
    press(Button::X);
    EXPECT_FALSE(controller_->finished());
}

TEST_F(SessionControllerTest, ConfirmedShutdownStopsEverything) {
    make(inline_);
    boot();
    press(Button::Y, Click::Double);
    press(Button::X);

    EXPECT_TRUE(controller_->finished());
    EXPECT_TRUE(controller_->power_off_requested());
    EXPECT_EQ(backend_.status(), BackendStatus::Stopped);
    EXPECT_EQ(state().status, PlaybackStatus::Idle);
    EXPECT_EQ(presenter_.last().status_line, "Shutting down...");

    press(Button::B);
    EXPECT_EQ(backend_.started().size(), 1u);
}

TEST_F(SessionControllerTest, SignalShutdownSavesSession) {
    make(inline_);
    boot();
    press(Button::B);
    store_.saved.reset();
    controller_->request_shutdown(false);
    controller_->drain();

    EXPECT_TRUE(controller_->finished());
    EXPECT_FALSE(controller_->power_off_requested());
    ASSERT_TRUE(store_.saved.has_value());
    EXPECT_EQ(store_.saved->station_id, "b");
}

TEST_F(SessionControllerTest, LateResultAfterShutdownIsIgnored) {
    ManualTaskRunner tasks;
    make(tasks);
    boot();
    controller_->request_shutdown(false);
    controller_->drain();
    tasks.run_all();
    controller_->drain();
    EXPECT_TRUE(backend_.started().empty());
}

TEST_F(SessionControllerTest, IgnoresNowPlayingForOtherStationOrEpoch) {
    MetadataPoller poller(http_, EndpointConfig{}, PollConfig{}, clock_.fn());
    make(inline_);
    controller_->attach_poller(&poller);
    boot();
    uint64_t epoch = poller.epoch();

    controller_->deliver_now_playing(now_playing("a", "Song A", epoch));
    controller_->drain();
    ASSERT_EQ(presenter_.last().title, "Song A");

    controller_->deliver_now_playing(now_playing("b", "Song B", epoch));
    controller_->deliver_now_playing(now_playing("a", "Older poll", epoch - 1));
    controller_->drain();
    EXPECT_EQ(presenter_.last().title, "Song A");

    press(Button::B);
    // Polled for a before the switch, arriving after it
    controller_->deliver_now_playing(now_playing("a", "Late", epoch));
    controller_->drain();
    EXPECT_EQ(presenter_.last().station, "b FM");
    EXPECT_EQ(presenter_.last().title, "Now Playing");
}

TEST_F(SessionControllerTest, ShowsNowPlayingUntilStale) {
    PollConfig poll;
    poll.now_playing = seconds(10);
    poll.stale_multiplier = 3;
    MetadataPoller poller(http_, EndpointConfig{}, poll, clock_.fn());
    poller.set_title_source([this] { return backend_.stream_title(); });
    backend_.set_title("Artist - Song");

    make(inline_);
    controller_->attach_poller(&poller);
    poller.start();
    boot();

    bool shown = false;
    for (int i = 0; i < 250 && !shown; ++i) {
        controller_->drain();
        shown = presenter_.last().title == "Artist - Song";
        if (!shown) std::this_thread::sleep_for(milliseconds(20));
    }
    poller.stop();
    ASSERT_TRUE(shown);

    clock_.advance(seconds(31));
    controller_->tick(UiClock::now());
    EXPECT_EQ(presenter_.last().title, "Now Playing");
}

TEST_F(SessionControllerTest, RunLoopExitsAfterShutdown) {
    make(inline_);
    std::thread loop([this] { controller_->run(); });
    controller_->start();

    bool playing = false;
    for (int i = 0; i < 250 && !playing; ++i) {
        playing = state().status == PlaybackStatus::Playing;
        if (!playing) std::this_thread::sleep_for(milliseconds(20));
    }
    controller_->request_shutdown(false);
    loop.join();

    EXPECT_TRUE(playing);
    EXPECT_TRUE(controller_->finished());
    EXPECT_EQ(backend_.started().size(), 1u);
    EXPECT_EQ(backend_.status(), BackendStatus::Stopped);
}

} // namespace
} // namespace rplayer
