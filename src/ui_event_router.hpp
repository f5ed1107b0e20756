#ifndef UI_EVENT_ROUTER_HPP
#define UI_EVENT_ROUTER_HPP

#include <chrono>
#include <optional>

namespace rplayer {

using UiClock = std::chrono::steady_clock;

enum class Button { A, B, X, Y };

enum class Click { Single, Double };

struct ButtonEvent {
    Button button;
    Click click = Click::Single;
    UiClock::time_point timestamp;
};

enum class Command {
    SelectPrevious,
    SelectNext,
    ToggleMode,
    ShowShutdownPrompt,
    ConfirmShutdown,
    DismissShutdownPrompt,
};

const char* button_name(Button button);
const char* command_name(Command command);

// Tags raw press edges. A, B and X report every press as a single press.
// Y reports a single press, or a double click when the press follows the
// previous Y press within the window.
class ClickDetector {
public:
    explicit ClickDetector(std::chrono::milliseconds double_click_window);

    // Feed one edge; releases produce nothing
    std::optional<ButtonEvent> feed(Button button, bool pressed, UiClock::time_point timestamp);

private:
    std::chrono::milliseconds window_;
    std::optional<UiClock::time_point> last_y_press_;
};

// Idle / ShutdownConfirm state machine turning button events into
// controller commands. Once shutdown is confirmed it goes quiet.
class UIEventRouter {
public:
    enum class State { Idle, ShutdownConfirm, Terminated };

    explicit UIEventRouter(std::chrono::milliseconds confirm_timeout);

    std::optional<Command> handle(const ButtonEvent& event);

    // Dismisses an unanswered shutdown prompt once the timeout has passed
    std::optional<Command> tick(UiClock::time_point now);

    State state() const { return state_; }

private:
    std::chrono::milliseconds confirm_timeout_;
    State state_ = State::Idle;
    UiClock::time_point prompt_since_;
};

} // namespace rplayer

#endif // UI_EVENT_ROUTER_HPP
