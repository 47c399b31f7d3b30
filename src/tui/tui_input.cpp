#include "tui_app.hpp"
#include "../utf8.hpp"

namespace plx {

std::string TuiApp::key_name(int ch) {
    switch (ch) {
        case KEY_UP:        return "up";
        case KEY_DOWN:      return "down";
        case KEY_LEFT:      return "left";
        case KEY_RIGHT:     return "right";
        case KEY_PPAGE:     return "pgup";
        case KEY_NPAGE:     return "pgdown";
        case KEY_HOME:      return "home";
        case KEY_END:       return "end";
        case KEY_DC:        return "delete";
        case KEY_BTAB:      return "shift+tab";
        case KEY_ENTER:
        case '\n':
        case '\r':          return "enter";
        case '\t':          return "tab";
        case 27:            return "esc";
        case KEY_BACKSPACE:
        case 127:
        case 8:             return "backspace";
        case ' ':           return " ";
    }

    // Remaining control characters: 1 -> ctrl+a ... 26 -> ctrl+z
    if (ch >= 1 && ch <= 26) {
        return std::string("ctrl+") + static_cast<char>('a' + ch - 1);
    }

    if (ch > 32 && ch < 127) {
        return std::string(1, static_cast<char>(ch));
    }

    return {};
}

void TuiApp::handle_input(int ch) {
    if (ch == KEY_MOUSE) {
        handle_mouse_event();
        return;
    }

    if (ch == KEY_RESIZE) {
        // SIGWINCH already flagged the resize
        return;
    }

    const std::string key = key_name(ch);
    if (key.empty()) return;

    running_ = dashboard_->handle_key(key);
}

void TuiApp::handle_char(wint_t wch) {
    if (wch < 0x80) {
        handle_input(static_cast<int>(wch));
        return;
    }

    // Non-ASCII text reaches the dashboard as one UTF-8 encoded character
    const std::string key = utf8::encode(static_cast<char32_t>(wch));
    if (key.empty()) return;

    running_ = dashboard_->handle_key(key);
}

void TuiApp::handle_mouse_event() {
    MEVENT event;
    if (getmouse(&event) != OK) {
        return;
    }

    if (event.bstate & BUTTON4_PRESSED) {
        // Scroll up (wheel up)
        dashboard_->handle_wheel(-kWheelStep);
    }
    if (event.bstate & BUTTON5_PRESSED) {
        // Scroll down (wheel down)
        dashboard_->handle_wheel(kWheelStep);
    }
}

} // namespace plx
