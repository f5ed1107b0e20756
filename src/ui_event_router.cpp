#include "ui_event_router.hpp"

#include <spdlog/spdlog.h>

namespace rplayer {

const char* button_name(Button button) {
    switch (button) {
        case Button::A: return "A";
        case Button::B: return "B";
        case Button::X: return "X";
        case Button::Y: return "Y";
    }
    return "?";
}

const char* command_name(Command command) {
    switch (command) {
        case Command::SelectPrevious: return "SelectPrevious";
        case Command::SelectNext: return "SelectNext";
        case Command::ToggleMode: return "ToggleMode";
        case Command::ShowShutdownPrompt: return "ShowShutdownPrompt";
        case Command::ConfirmShutdown: return "ConfirmShutdown";
        case Command::DismissShutdownPrompt: return "DismissShutdownPrompt";
    }
    return "?";
}

ClickDetector::ClickDetector(std::chrono::milliseconds double_click_window)
    : window_(double_click_window) {}

std::optional<ButtonEvent> ClickDetector::feed(Button button, bool pressed, UiClock::time_point timestamp) {
    if (!pressed) {
        return std::nullopt;
    }
    if (button != Button::Y) {
        return ButtonEvent{button, Click::Single, timestamp};
    }

    if (last_y_press_ && timestamp - *last_y_press_ <= window_) {
        last_y_press_.reset();
        return ButtonEvent{button, Click::Double, timestamp};
    }
    last_y_press_ = timestamp;
    return ButtonEvent{button, Click::Single, timestamp};
}

UIEventRouter::UIEventRouter(std::chrono::milliseconds confirm_timeout)
    : confirm_timeout_(confirm_timeout) {}

std::optional<Command> UIEventRouter::handle(const ButtonEvent& event) {
    std::optional<Command> command;

    switch (state_) {
    case State::Idle:
        if (event.button == Button::A) {
            command = Command::SelectPrevious;
        } else if (event.button == Button::B) {
            command = Command::SelectNext;
        } else if (event.button == Button::X && event.click == Click::Single) {
            command = Command::ToggleMode;
        } else if (event.button == Button::Y && event.click == Click::Double) {
            command = Command::ShowShutdownPrompt;
            state_ = State::ShutdownConfirm;
            prompt_since_ = event.timestamp;
        }
        break;

    case State::ShutdownConfirm:
        if (event.button == Button::X && event.click == Click::Single) {
            command = Command::ConfirmShutdown;
            state_ = State::Terminated;
        } else {
            command = Command::DismissShutdownPrompt;
            state_ = State::Idle;
        }
        break;

    case State::Terminated:
        break;
    }

    if (command) {
        spdlog::debug("ui: {}{} -> {}", button_name(event.button),
                      event.click == Click::Double ? " (double)" : "", command_name(*command));
    }
    return command;
}

std::optional<Command> UIEventRouter::tick(UiClock::time_point now) {
    if (state_ == State::ShutdownConfirm && now - prompt_since_ >= confirm_timeout_) {
        state_ = State::Idle;
        spdlog::debug("ui: shutdown prompt timed out");
        return Command::DismissShutdownPrompt;
    }
    return std::nullopt;
}

} // namespace rplayer
