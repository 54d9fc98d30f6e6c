#include "app_controller.hpp"
#include <format>
#include <stdexcept>

namespace tmxu {

AppController::AppController(SessionStore* store, ISessionController* controller, TimeSource now)
    : store_(store)
    , controller_(controller)
    , now_(std::move(now))
    , clock_(now_())
{
    if (!store_ || !controller_) {
        throw std::invalid_argument("AppController requires a session store and controller");
    }
    view_model_.data = store_->get_snapshot();
}

void AppController::start() {
    reload();

    const auto& sessions = view_model_.sessions();
    if (!sessions.empty()) {
        view_model_.tree.open_and_select(sessions, sessions.front().name);
    }
}

void AppController::reload() {
    clock_.mark_refreshed(now_());

    auto result = store_->refresh();
    if (result.success) {
        view_model_.data = store_->get_snapshot();
        view_model_.tree.prune(view_model_.sessions());
    } else {
        set_flash(std::format("Refresh failed: {}", result.error_message));
    }
}

void AppController::tick() {
    if (clock_.tick(now_(), view_model_.flash)) {
        reload();
    }
}

void AppController::set_flash(std::string text) {
    view_model_.flash = FlashMessage{std::move(text), now_()};
}

void AppController::report_failure(const std::string& message) {
    store_->record_error(message);
    set_flash(std::format("Error: {}", message));
}

Action AppController::action_attach() const {
    const auto& selected = view_model_.tree.current_selection();
    if (selected.empty()) {
        return Action::none();
    }

    if (selected.size() == 1) {
        return Action::attach(selected[0]);
    }
    // Pane rows attach to their window
    return Action::attach(std::format("{}:{}", selected[0], selected[1]));
}

void AppController::action_start_kill() {
    const auto& selected = view_model_.tree.current_selection();
    if (selected.empty()) return;

    view_model_.mode = ConfirmKillMode{selected[0]};
}

void AppController::action_start_rename() {
    const auto& selected = view_model_.tree.current_selection();
    if (selected.empty()) return;

    view_model_.mode = RenameSessionMode{selected[0], selected[0]};
}

void AppController::jump_to_session(char letter) {
    const auto& sessions = view_model_.sessions();
    int position = session_position_for_label(letter);
    if (position < 0 || static_cast<size_t>(position) >= sessions.size()) return;

    view_model_.tree.open_and_select(sessions, sessions[position].name);
}

void AppController::jump_to_window(char digit) {
    const auto& selected = view_model_.tree.current_selection();
    if (selected.empty()) return;

    // Copy: select_window replaces the selection it would otherwise alias
    std::string session_name = selected[0];
    view_model_.tree.select_window(view_model_.sessions(), session_name,
                                   static_cast<size_t>(digit - '0'));
}

} // namespace tmxu
