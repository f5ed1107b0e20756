#include "tui_presenter.hpp"

#include "text_util.hpp"

#include <algorithm>
#include <clocale>
#include <ctime>
#include <spdlog/spdlog.h>

namespace rplayer {

TuiPresenter::TuiPresenter(const DisplayConfig& config)
    : config_(config) {}

TuiPresenter::~TuiPresenter() {
    cleanup();
}

bool TuiPresenter::init() {
    setlocale(LC_ALL, "");

    if (!initscr()) {
        spdlog::warn("display: cannot initialise ncurses");
        return false;
    }

    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    set_escdelay(25);

    if (has_colors()) {
        start_color();
        use_default_colors();
        setup_colors();
    }

    getmaxyx(stdscr, max_y_, max_x_);
    if (max_x_ < 50 || max_y_ < 12) {
        endwin();
        spdlog::warn("display: terminal too small ({}x{}, need 50x12)", max_x_, max_y_);
        return false;
    }
    station_width_ = max_x_ >= 100 ? 35 : (max_x_ >= 80 ? 28 : 22);

    active_ = true;
    create_windows();
    draw_all();
    return true;
}

void TuiPresenter::cleanup() {
    if (!active_) return;
    destroy_windows();
    endwin();
    active_ = false;
}

void TuiPresenter::setup_colors() {
    init_pair(color_header_, COLOR_BLACK, COLOR_CYAN);
    init_pair(color_selected_, COLOR_BLACK, COLOR_GREEN);
    init_pair(color_border_, COLOR_BLUE, -1);
    init_pair(color_title_, COLOR_YELLOW, -1);
    init_pair(color_dim_, COLOR_WHITE, -1);
    init_pair(color_controls_, COLOR_CYAN, -1);
    init_pair(color_station_, COLOR_GREEN, -1);
    init_pair(color_error_, COLOR_RED, -1);
}

void TuiPresenter::create_windows() {
    getmaxyx(stdscr, max_y_, max_x_);
    header_win_ = newwin(1, max_x_, 0, 0);
    controls_win_ = newwin(1, max_x_, max_y_ - 1, 0);

    int content_height = max_y_ - 2;
    station_win_ = newwin(content_height, station_width_, 1, 0);
    main_win_ = newwin(content_height, max_x_ - station_width_, 1, station_width_);
}

void TuiPresenter::destroy_windows() {
    if (header_win_) delwin(header_win_);
    if (station_win_) delwin(station_win_);
    if (main_win_) delwin(main_win_);
    if (controls_win_) delwin(controls_win_);
    header_win_ = station_win_ = main_win_ = controls_win_ = nullptr;
}

void TuiPresenter::set_stations(const std::vector<StationDescriptor>& stations) {
    stations_ = stations;
    if (active_) draw_stations();
}

void TuiPresenter::publish(const DisplayFrame& frame) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_frame_ = frame;
}

void TuiPresenter::pump() {
    std::optional<DisplayFrame> frame;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        frame.swap(pending_frame_);
    }
    if (!frame || !active_ || *frame == frame_) {
        return;
    }
    if (!frame->title.empty() && frame->title != frame_.title && frame->station_id == frame_.station_id) {
        add_to_history(frame->title, frame->station);
    }
    frame_ = std::move(*frame);
    draw_all();
}

void TuiPresenter::add_to_history(const std::string& title, const std::string& station) {
    history_.push_back({title, station, std::chrono::system_clock::now()});
    if (history_.size() > HISTORY_SIZE) {
        history_.erase(history_.begin());
    }
}

void TuiPresenter::draw_all() {
    draw_header();
    draw_stations();
    draw_main();
    draw_controls();
}

void TuiPresenter::draw_header() {
    if (!header_win_) return;

    werase(header_win_);
    if (has_colors()) {
        wbkgd(header_win_, COLOR_PAIR(color_header_) | ' ');
    }
    std::string title = "rplayer";
    std::string mode = frame_.mode == Mode::World ? "[World Radio]" : "[Curated]";

    wattron(header_win_, A_BOLD);
    mvwaddstr(header_win_, 0, 2, title.c_str());
    wattroff(header_win_, A_BOLD);
    mvwaddstr(header_win_, 0, max_x_ - static_cast<int>(mode.length()) - 2, mode.c_str());
    wrefresh(header_win_);
}

void TuiPresenter::draw_stations() {
    if (!station_win_) return;

    werase(station_win_);
    wattron(station_win_, COLOR_PAIR(color_border_));
    box(station_win_, 0, 0);
    wattroff(station_win_, COLOR_PAIR(color_border_));

    std::string heading = frame_.mode == Mode::World ? " WORLD " : " STATIONS ";
    mvwaddstr(station_win_, 0, (station_width_ - static_cast<int>(heading.length())) / 2, heading.c_str());

    int y = 2;
    int max_rows = getmaxy(station_win_) - y - 1;
    size_t name_len = static_cast<size_t>(std::max(station_width_ - 9, 4));

    if (frame_.mode == Mode::World) {
        if (has_colors()) wattron(station_win_, COLOR_PAIR(color_title_) | A_BOLD);
        mvwaddstr(station_win_, y, 2, fit_text("> " + frame_.station, name_len + 4).c_str());
        if (has_colors()) wattroff(station_win_, COLOR_PAIR(color_title_) | A_BOLD);
        wrefresh(station_win_);
        return;
    }

    // Keep the current station in view
    size_t current = 0;
    for (size_t i = 0; i < stations_.size(); ++i) {
        if (stations_[i].id == frame_.station_id) current = i;
    }
    size_t first = current >= static_cast<size_t>(max_rows) ? current - max_rows + 1 : 0;

    for (size_t i = first; i < stations_.size() && y < max_rows + 2; ++i, ++y) {
        bool selected = stations_[i].id == frame_.station_id;
        int attr = selected ? (COLOR_PAIR(color_selected_) | A_BOLD) : COLOR_PAIR(color_dim_);
        if (has_colors()) wattron(station_win_, attr);
        std::string line = (selected ? "> " : "  ") + std::to_string(i + 1) + ". " +
                           fit_text(stations_[i].label(), name_len);
        mvwaddstr(station_win_, y, 2, line.c_str());
        if (has_colors()) wattroff(station_win_, attr);
    }
    wrefresh(station_win_);
}

void TuiPresenter::draw_main() {
    if (!main_win_) return;

    werase(main_win_);
    wattron(main_win_, COLOR_PAIR(color_border_));
    box(main_win_, 0, 0);
    wattroff(main_win_, COLOR_PAIR(color_border_));

    int max_x = getmaxx(main_win_);
    size_t width = static_cast<size_t>(std::max(max_x - 6, 8));
    int y = 2;

    std::string heading = " NOW PLAYING ";
    mvwaddstr(main_win_, y, (max_x - static_cast<int>(heading.length())) / 2, heading.c_str());
    y += 2;

    if (has_colors()) wattron(main_win_, COLOR_PAIR(color_station_) | A_BOLD);
    mvwaddstr(main_win_, y, 3, fit_text(frame_.station, width).c_str());
    if (has_colors()) wattroff(main_win_, COLOR_PAIR(color_station_) | A_BOLD);
    y += 1;

    if (has_colors()) wattron(main_win_, COLOR_PAIR(color_title_));
    mvwaddstr(main_win_, y, 3, fit_text(frame_.title, width).c_str());
    if (has_colors()) wattroff(main_win_, COLOR_PAIR(color_title_));
    y += 2;

    if (!frame_.artwork.empty()) {
        if (has_colors()) wattron(main_win_, COLOR_PAIR(color_dim_));
        std::string art = "Artwork: " + std::to_string((frame_.artwork.size() + 1023) / 1024) + " KiB";
        mvwaddstr(main_win_, y, 3, art.c_str());
        if (has_colors()) wattroff(main_win_, COLOR_PAIR(color_dim_));
        y += 1;
    }

    if (!frame_.status_line.empty()) {
        if (has_colors()) wattron(main_win_, COLOR_PAIR(color_error_) | A_BOLD);
        mvwaddstr(main_win_, y, 3, fit_text(frame_.status_line, width).c_str());
        if (has_colors()) wattroff(main_win_, COLOR_PAIR(color_error_) | A_BOLD);
    }
    y += 2;

    wattron(main_win_, COLOR_PAIR(color_border_));
    mvwhline(main_win_, y, 3, ACS_HLINE, max_x - 6);
    wattroff(main_win_, COLOR_PAIR(color_border_));
    y += 2;

    int bottom = getmaxy(main_win_) - 1;
    if (history_.empty()) {
        mvwaddstr(main_win_, y, 3, "No titles yet.");
    }
    for (auto it = history_.rbegin(); it != history_.rend() && y < bottom; ++it, ++y) {
        std::string clock_str = "[" + format_time_clock(it->played_at) + "] ";
        if (has_colors()) wattron(main_win_, COLOR_PAIR(color_controls_) | A_BOLD);
        mvwaddstr(main_win_, y, 3, clock_str.c_str());
        if (has_colors()) wattroff(main_win_, COLOR_PAIR(color_controls_) | A_BOLD);
        size_t room = width > clock_str.size() ? width - clock_str.size() : 0;
        mvwaddstr(main_win_, y, 3 + static_cast<int>(clock_str.size()),
                  fit_text(it->title + " on " + it->station, room).c_str());
    }
    wrefresh(main_win_);
}

void TuiPresenter::draw_controls() {
    if (!controls_win_) return;

    werase(controls_win_);
    struct ControlSection {
        const char* category;
        const char* keys;
    };
    const ControlSection sections[] = {
        {"Prev", "[a/↑]"},
        {"Next", "[b/↓]"},
        {"Mode", "[x]"},
        {"Shutdown", "[y y]"},
        {"Quit", "[q]"},
    };
    wmove(controls_win_, 0, 2);
    for (const auto& section : sections) {
        if (has_colors()) wattron(controls_win_, COLOR_PAIR(color_dim_));
        waddstr(controls_win_, section.category);
        waddstr(controls_win_, ":");
        if (has_colors()) {
            wattroff(controls_win_, COLOR_PAIR(color_dim_));
            wattron(controls_win_, COLOR_PAIR(color_controls_) | A_BOLD);
        }
        waddstr(controls_win_, section.keys);
        if (has_colors()) wattroff(controls_win_, COLOR_PAIR(color_controls_) | A_BOLD);
        waddstr(controls_win_, "  ");
    }
    wrefresh(controls_win_);
}

std::vector<ButtonEdge> TuiPresenter::poll() {
    std::vector<ButtonEdge> edges;
    if (!active_) return edges;

    int ch;
    while ((ch = getch()) != ERR) {
        std::optional<Button> button;
        switch (ch) {
            case 'a': case 'A': case KEY_UP: case KEY_LEFT:
                button = Button::A;
                break;
            case 'b': case 'B': case KEY_DOWN: case KEY_RIGHT:
                button = Button::B;
                break;
            case 'x': case 'X': case '\n': case KEY_ENTER:
                button = Button::X;
                break;
            case 'y': case 'Y':
                button = Button::Y;
                break;
            case 'q': case 'Q':
                quit_requested_ = true;
                break;
            case KEY_RESIZE:
                endwin();
                refresh();
                destroy_windows();
                create_windows();
                draw_all();
                break;
        }
        if (button) {
            auto now = UiClock::now();
            edges.push_back({*button, true, now});
            edges.push_back({*button, false, now});
        }
    }
    return edges;
}

std::string TuiPresenter::format_time_clock(const std::chrono::system_clock::time_point& tp) {
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm local_tm{};
    localtime_r(&time, &local_tm);
    char buf[6];
    std::strftime(buf, sizeof(buf), "%H:%M", &local_tm);
    return buf;
}

} // namespace rplayer
