#ifndef CONSOLE_PRESENTER_HPP
#define CONSOLE_PRESENTER_HPP

#include "config.hpp"
#include "display_presenter.hpp"

#include <mutex>
#include <string>

namespace rplayer {

// Fallback when there is no display: one log line per visible change
class ConsolePresenter : public DisplayPresenter {
public:
    explicit ConsolePresenter(const DisplayConfig& config);

    void publish(const DisplayFrame& frame) override;

    // The line publish() would log for a frame
    std::string format(const DisplayFrame& frame) const;

private:
    size_t columns_;
    std::mutex mutex_;
    std::string last_line_;
};

} // namespace rplayer

#endif // CONSOLE_PRESENTER_HPP
