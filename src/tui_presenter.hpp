#ifndef TUI_PRESENTER_HPP
#define TUI_PRESENTER_HPP

#include "button_input.hpp"
#include "config.hpp"
#include "display_presenter.hpp"
#include "station.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <ncurses.h>
#include <optional>
#include <string>
#include <vector>

namespace rplayer {

struct TitleHistoryEntry {
    std::string title;
    std::string station;
    std::chrono::system_clock::time_point played_at;
};

// ncurses front panel. publish() only queues the frame; pump() must be
// called from the thread that owns the terminal to draw it. Doubles as a
// keyboard button source (a/b/x/y, arrows, space).
class TuiPresenter : public DisplayPresenter, public ButtonSource {
public:
    explicit TuiPresenter(const DisplayConfig& config);
    ~TuiPresenter() override;

    TuiPresenter(const TuiPresenter&) = delete;
    TuiPresenter& operator=(const TuiPresenter&) = delete;

    // False when the terminal cannot host the panel
    bool init();
    void cleanup();

    void set_stations(const std::vector<StationDescriptor>& stations);

    void publish(const DisplayFrame& frame) override;

    // Draw a queued frame, if any (main thread)
    void pump();

    // Keys read since the last call, as button edges (main thread)
    std::vector<ButtonEdge> poll() override;

    // 'q' was pressed
    bool quit_requested() const { return quit_requested_; }

private:
    void setup_colors();
    void create_windows();
    void destroy_windows();
    void draw_all();
    void draw_header();
    void draw_stations();
    void draw_main();
    void draw_controls();
    void add_to_history(const std::string& title, const std::string& station);

    static std::string format_time_clock(const std::chrono::system_clock::time_point& tp);

    DisplayConfig config_;
    bool active_ = false;

    WINDOW* header_win_ = nullptr;
    WINDOW* station_win_ = nullptr;
    WINDOW* main_win_ = nullptr;
    WINDOW* controls_win_ = nullptr;

    int max_y_ = 0;
    int max_x_ = 0;
    int station_width_ = 28;

    std::vector<StationDescriptor> stations_;
    DisplayFrame frame_;
    std::vector<TitleHistoryEntry> history_;

    std::mutex pending_mutex_;
    std::optional<DisplayFrame> pending_frame_;

    std::atomic<bool> quit_requested_{false};

    int color_header_ = 1;
    int color_selected_ = 2;
    int color_border_ = 3;
    int color_title_ = 4;
    int color_dim_ = 5;
    int color_controls_ = 6;
    int color_station_ = 7;
    int color_error_ = 8;

    static constexpr size_t HISTORY_SIZE = 10;
};

} // namespace rplayer

#endif // TUI_PRESENTER_HPP
