#pragma once

namespace tmxu {

// Terminal-independent key press. The TUI layer translates its raw key
// codes into these before handing them to the controller.
enum class KeyCode {
    Char,
    Enter,
    Esc,
    Backspace,
    Up,
    Down,
    Left,
    Right,
    Other
};

struct KeyEvent {
    KeyCode code = KeyCode::Other;
    char ch = 0;        // Valid when code == KeyCode::Char
    bool ctrl = false;

    static constexpr KeyEvent character(char c) { return {KeyCode::Char, c, false}; }
    static constexpr KeyEvent control(char c) { return {KeyCode::Char, c, true}; }
    static constexpr KeyEvent special(KeyCode code) { return {code, 0, false}; }

    [[nodiscard]] constexpr bool is_char(char c) const {
        return code == KeyCode::Char && !ctrl && ch == c;
    }
};

} // namespace tmxu
