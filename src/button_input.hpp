#ifndef BUTTON_INPUT_HPP
#define BUTTON_INPUT_HPP

#include "config.hpp"
#include "ui_event_router.hpp"

#include <string>
#include <vector>

namespace rplayer {

// Raw press/release edge from an input device
struct ButtonEdge {
    Button button;
    bool pressed;
    UiClock::time_point timestamp;
};

class ButtonSource {
public:
    virtual ~ButtonSource() = default;

    // Edges since the last call; never blocks
    virtual std::vector<ButtonEdge> poll() = 0;
};

// Buttons wired to GPIO lines with pull-ups, read through the sysfs GPIO
// interface (active-low). A line that cannot be exported or read is
// skipped with a warning.
class SysfsGpioButtonSource : public ButtonSource {
public:
    explicit SysfsGpioButtonSource(const ButtonConfig& config, std::string sysfs_root = "/sys/class/gpio");

    std::vector<ButtonEdge> poll() override;

    // True when at least one line is readable
    bool available() const { return !lines_.empty(); }

private:
    struct Line {
        Button button;
        int pin;
        std::string value_path;
        bool pressed = false;
    };

    bool setup(int pin);
    int read_value(const Line& line) const;

    std::string root_;
    std::vector<Line> lines_;
};

} // namespace rplayer

#endif // BUTTON_INPUT_HPP
