#ifndef DISPLAY_PRESENTER_HPP
#define DISPLAY_PRESENTER_HPP

#include "station.hpp"

#include <string>

namespace rplayer {

// Everything visible at once. Each publish replaces the whole frame.
struct DisplayFrame {
    std::string station;      // first line
    std::string title;        // second line
    std::string artwork;      // image bytes, empty for none
    std::string status_line;
    std::string station_id;
    Mode mode = Mode::Curated;

    bool operator==(const DisplayFrame& other) const {
        return station == other.station && title == other.title && artwork == other.artwork &&
               status_line == other.status_line && station_id == other.station_id && mode == other.mode;
    }
    bool operator!=(const DisplayFrame& other) const { return !(*this == other); }
};

// Renders frames. publish() may be called from the controller thread; the
// presenter owns truncation and scrolling.
class DisplayPresenter {
public:
    virtual ~DisplayPresenter() = default;

    virtual void publish(const DisplayFrame& frame) = 0;
};

} // namespace rplayer

#endif // DISPLAY_PRESENTER_HPP
