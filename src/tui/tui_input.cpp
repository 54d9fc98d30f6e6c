#include "tui_app.hpp"

namespace tmxu {

KeyEvent TuiApp::translate_key(int ch) {
    switch (ch) {
        case KEY_UP:
            return KeyEvent::special(KeyCode::Up);
        case KEY_DOWN:
            return KeyEvent::special(KeyCode::Down);
        case KEY_LEFT:
            return KeyEvent::special(KeyCode::Left);
        case KEY_RIGHT:
            return KeyEvent::special(KeyCode::Right);

        case '\n':
        case '\r':
        case KEY_ENTER:
            return KeyEvent::special(KeyCode::Enter);

        case 27:  // Escape
            return KeyEvent::special(KeyCode::Esc);

        case KEY_BACKSPACE:
        case 127:
        case '\b':
            return KeyEvent::special(KeyCode::Backspace);

        default:
            break;
    }

    // Printable ASCII
    if (ch >= 32 && ch < 127) {
        return KeyEvent::character(static_cast<char>(ch));
    }

    // Ctrl+letter arrives as 1..26 in raw mode
    if (ch >= 1 && ch <= 26) {
        return KeyEvent::control(static_cast<char>('a' + ch - 1));
    }

    return KeyEvent::special(KeyCode::Other);
}

} // namespace tmxu
