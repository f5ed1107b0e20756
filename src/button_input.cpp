#include "button_input.hpp"

#include <chrono>
#include <fstream>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <thread>

namespace rplayer {

namespace {

bool write_file(const std::string& path, const std::string& value) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << value;
    file.flush();
    return file.good();
}

bool exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

} // namespace

SysfsGpioButtonSource::SysfsGpioButtonSource(const ButtonConfig& config, std::string sysfs_root)
    : root_(std::move(sysfs_root)) {
    const std::pair<Button, int> wiring[] = {
        {Button::A, config.pin_a},
        {Button::B, config.pin_b},
        {Button::X, config.pin_x},
        {Button::Y, config.pin_y},
    };
    for (const auto& [button, pin] : wiring) {
        if (!setup(pin)) {
            spdlog::warn("gpio: button {} on GPIO{} unavailable", button_name(button), pin);
            continue;
        }
        Line line{button, pin, root_ + "/gpio" + std::to_string(pin) + "/value"};
        line.pressed = read_value(line) == 0;
        lines_.push_back(line);
    }
    if (lines_.empty()) {
        spdlog::warn("gpio: no button lines readable under {}, button input disabled", root_);
    } else {
        spdlog::info("gpio: A=GPIO{} B=GPIO{} X=GPIO{} Y=GPIO{} ({} lines active)",
                     config.pin_a, config.pin_b, config.pin_x, config.pin_y, lines_.size());
    }
}

bool SysfsGpioButtonSource::setup(int pin) {
    std::string dir = root_ + "/gpio" + std::to_string(pin);
    if (!exists(dir)) {
        if (!write_file(root_ + "/export", std::to_string(pin))) {
            return false;
        }
        // udev needs a moment to fix up permissions on the new node
        for (int i = 0; i < 10 && !exists(dir + "/direction"); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
    if (!write_file(dir + "/direction", "in")) {
        spdlog::debug("gpio: cannot set GPIO{} direction, assuming input", pin);
    }
    return exists(dir + "/value");
}

int SysfsGpioButtonSource::read_value(const Line& line) const {
    std::ifstream file(line.value_path);
    char c = 0;
    if (!file.is_open() || !file.get(c)) {
        return -1;
    }
    return c == '0' ? 0 : 1;
}

std::vector<ButtonEdge> SysfsGpioButtonSource::poll() {
    std::vector<ButtonEdge> edges;
    auto now = UiClock::now();
    for (auto& line : lines_) {
        int value = read_value(line);
        if (value < 0) continue;
        bool pressed = value == 0;
        if (pressed != line.pressed) {
            line.pressed = pressed;
            edges.push_back({line.button, pressed, now});
        }
    }
    return edges;
}

} // namespace rplayer
