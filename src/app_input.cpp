#include "app_controller.hpp"
#include "string_utils.hpp"
#include <format>

namespace tmxu {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

Action AppController::handle_key(const KeyEvent& key) {
    return std::visit(Overloaded{
        [&](NormalMode&) { return handle_normal_key(key); },
        [&](CreateSessionMode& mode) { return handle_create_session_key(mode, key); },
        [&](RenameSessionMode& mode) { return handle_rename_session_key(mode, key); },
        [&](ConfirmKillMode& mode) { return handle_confirm_kill_key(mode, key); },
    }, view_model_.mode);
}

Action AppController::handle_normal_key(const KeyEvent& key) {
    auto& tree = view_model_.tree;
    const auto& sessions = view_model_.sessions();

    switch (key.code) {
        case KeyCode::Esc:
            return Action::quit();

        case KeyCode::Down:
            tree.move_down(sessions);
            return Action::none();

        case KeyCode::Up:
            tree.move_up(sessions);
            return Action::none();

        case KeyCode::Right:
            tree.expand(sessions);
            return Action::none();

        case KeyCode::Left:
            tree.collapse();
            return Action::none();

        case KeyCode::Enter:
            return action_attach();

        case KeyCode::Char:
            break;

        default:
            return Action::none();
    }

    if (key.ctrl) {
        if (key.ch == 'c' || key.ch == 'C') {
            return Action::quit();
        }
        return Action::none();
    }

    const char ch = key.ch;
    switch (ch) {
        case 'q':
            return Action::quit();

        // Navigation
        case 'j':
            tree.move_down(sessions);
            return Action::none();
        case 'k':
            tree.move_up(sessions);
            return Action::none();
        case 'g':
            tree.jump_first(sessions);
            return Action::none();
        case 'G':
            tree.jump_last(sessions);
            return Action::none();
        case ' ':
        case 'l':
            tree.expand(sessions);
            return Action::none();
        case 'h':
            tree.collapse();
            return Action::none();

        // Session management
        case 'n':
            view_model_.mode = CreateSessionMode{};
            return Action::none();
        case 'd':
            action_start_kill();
            return Action::none();
        case 'r':
            action_start_rename();
            return Action::none();
        case 'R':
            return Action::refresh();

        default:
            break;
    }

    // Shift+letter: select the labelled session and attach right away
    if (ch >= 'A' && ch <= 'Z') {
        jump_to_session(ch);
        return action_attach();
    }

    // Lowercase letter: select the labelled session
    if (ch >= 'a' && ch <= 'z') {
        jump_to_session(ch);
        return Action::none();
    }

    // Window by position within the selected session
    if (ch >= '1' && ch <= '9') {
        jump_to_window(ch);
        return Action::none();
    }

    return Action::none();
}

void AppController::edit_input(std::string& input, const KeyEvent& key) {
    if (key.code == KeyCode::Backspace) {
        if (!input.empty()) {
            input.pop_back();
        }
        return;
    }

    if (key.code == KeyCode::Char && !key.ctrl && key.ch >= 32 && key.ch < 127) {
        input += key.ch;
    }
}

Action AppController::handle_create_session_key(CreateSessionMode& mode, const KeyEvent& key) {
    switch (key.code) {
        case KeyCode::Esc:
            view_model_.mode = NormalMode{};
            return Action::none();

        case KeyCode::Enter: {
            std::string name = trim_copy(mode.input);
            // mode is gone after this assignment
            view_model_.mode = NormalMode{};
            if (name.empty()) {
                return Action::none();
            }

            auto result = controller_->create_session(name);
            if (!result.success) {
                report_failure(result.error_message);
                return Action::none();
            }
            set_flash(std::format("Created session '{}'", name));
            return Action::refresh();
        }

        default:
            edit_input(mode.input, key);
            return Action::none();
    }
}

Action AppController::handle_rename_session_key(RenameSessionMode& mode, const KeyEvent& key) {
    switch (key.code) {
        case KeyCode::Esc:
            view_model_.mode = NormalMode{};
            return Action::none();

        case KeyCode::Enter: {
            std::string old_name = mode.target;
            std::string new_name = trim_copy(mode.input);
            view_model_.mode = NormalMode{};
            if (new_name.empty() || new_name == old_name) {
                return Action::none();
            }

            auto result = controller_->rename_session(old_name, new_name);
            if (!result.success) {
                report_failure(result.error_message);
                return Action::none();
            }
            set_flash(std::format("Renamed '{}' -> '{}'", old_name, new_name));
            return Action::refresh();
        }

        default:
            edit_input(mode.input, key);
            return Action::none();
    }
}

Action AppController::handle_confirm_kill_key(ConfirmKillMode& mode, const KeyEvent& key) {
    std::string target = mode.target;
    view_model_.mode = NormalMode{};

    // Anything but y/Y cancels
    if (!key.is_char('y') && !key.is_char('Y')) {
        return Action::none();
    }

    auto result = controller_->kill_session(target);
    if (!result.success) {
        report_failure(result.error_message);
        return Action::none();
    }
    set_flash(std::format("Killed session '{}'", target));
    return Action::refresh();
}

} // namespace tmxu
