#pragma once

#include "interfaces/i_session_controller.hpp"
#include "key_event.hpp"
#include "session_clock.hpp"
#include "session_store.hpp"
#include "viewmodels/app_view_model.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace tmxu {

enum class ActionType {
    None,
    Quit,
    Attach,
    Refresh
};

// What the run loop has to do after a key press
struct Action {
    ActionType type = ActionType::None;
    std::string target;     // Attach target: "session" or "session:window"

    static Action none() { return {}; }
    static Action quit() { return {ActionType::Quit, {}}; }
    static Action refresh() { return {ActionType::Refresh, {}}; }
    static Action attach(std::string target) { return {ActionType::Attach, std::move(target)}; }
};

// Application core: owns the view model and turns key presses into tree
// navigation, session commands and outward actions. Never attaches by
// itself; Attach is reported back to the caller.
class AppController {
public:
    using TimeSource = std::function<std::chrono::steady_clock::time_point()>;

    // Non-owning: store and controller must outlive the AppController
    AppController(SessionStore* store, ISessionController* controller,
                  TimeSource now = [] { return std::chrono::steady_clock::now(); });

    // Initial load; focuses the first session's first window
    void start();

    [[nodiscard]] Action handle_key(const KeyEvent& key);

    // Reload sessions now. Failure only sets a flash message.
    void reload();

    // Expire the flash message and auto-refresh when due
    void tick();

    void set_flash(std::string text);

    [[nodiscard]] const AppViewModel& view_model() const { return view_model_; }
    [[nodiscard]] const SessionStore& store() const { return *store_; }

private:
    // Per-mode key handling (app_input.cpp)
    Action handle_normal_key(const KeyEvent& key);
    Action handle_create_session_key(CreateSessionMode& mode, const KeyEvent& key);
    Action handle_rename_session_key(RenameSessionMode& mode, const KeyEvent& key);
    Action handle_confirm_kill_key(ConfirmKillMode& mode, const KeyEvent& key);

    // Backspace/printable editing shared by the input modes
    static void edit_input(std::string& input, const KeyEvent& key);

    // Actions
    [[nodiscard]] Action action_attach() const;
    void action_start_kill();
    void action_start_rename();
    void jump_to_session(char letter);
    void jump_to_window(char digit);

    // Report a failed command to the user and the error list
    void report_failure(const std::string& message);

    // Non-owned
    SessionStore* store_ = nullptr;
    ISessionController* controller_ = nullptr;

    TimeSource now_;
    SessionClock clock_;
    AppViewModel view_model_;
};

} // namespace tmxu
