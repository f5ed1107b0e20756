#include "console_presenter.hpp"

#include "text_util.hpp"

#include <spdlog/spdlog.h>

namespace rplayer {

ConsolePresenter::ConsolePresenter(const DisplayConfig& config)
    : columns_(static_cast<size_t>(config.width)) {
    spdlog::info("display: console output, {}x{} rotation {}", config.width, config.height, config.rotation);
}

std::string ConsolePresenter::format(const DisplayFrame& frame) const {
    std::string line = frame.station + " | " + frame.title;
    if (!frame.artwork.empty()) {
        line += " (artwork " + std::to_string(frame.artwork.size() / 1024) + " KiB)";
    }
    if (!frame.status_line.empty()) {
        line += " [" + frame.status_line + "]";
    }
    return fit_text(line, columns_);
}

void ConsolePresenter::publish(const DisplayFrame& frame) {
    std::string line = format(frame);
    std::lock_guard<std::mutex> lock(mutex_);
    if (line == last_line_) {
        return;
    }
    last_line_ = line;
    spdlog::info("display: {}", line);
}

} // namespace rplayer
