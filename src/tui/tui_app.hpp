#pragma once

#include "../app_config.hpp"
#include "../app_controller.hpp"
#include "../key_event.hpp"
#include "../tree_state.hpp"
#include <algorithm>
#include <atomic>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Standard headers first: ncurses defines move(), clear() and erase() macros
#include <ncurses.h>

namespace tmxu {

class TuiApp {
public:
    // Non-owning: controller must be non-null and outlive the TuiApp
    TuiApp(AppController* controller, const AppConfig& config);
    ~TuiApp();

    // Runs until the user quits or picks an attach target. The terminal is
    // restored before returning.
    std::optional<std::string> run();

    // ncurses key code to a terminal-independent key
    [[nodiscard]] static KeyEvent translate_key(int ch);

private:
    // Rendering
    void render();
    void render_header();
    void render_session_tree();
    void render_empty_state();
    void render_tree_row(const VisibleNode& node, int row, bool is_selected);
    void render_status_bar();
    void render_input_dialog(const std::string& title, const std::string& input);
    void render_kill_dialog(const std::string& target);

    // Input handling
    void handle_input(int ch);
    void execute_action(const Action& action);

    // Navigation helpers
    void scroll_to_selection(const std::vector<VisibleNode>& visible);

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();
    [[nodiscard]] int header_height() const;

    // Utility
    static std::string read_hostname();
    static void print_clipped(WINDOW* win, int y, int& x, int max_x, const std::string& text, attr_t attrs);
    static WINDOW* create_dialog(int height, int color_pair, const std::string& title);

    // Non-owned
    AppController* controller_ = nullptr;

    AppConfig config_;
    std::string hostname_;

    // ncurses windows
    WINDOW* header_win_ = nullptr;
    WINDOW* tree_win_ = nullptr;
    WINDOW* status_win_ = nullptr;

    // UI state
    std::atomic<bool> running_{false};
    std::optional<std::string> attach_target_;

    // Scroll position
    int tree_scroll_offset_ = 0;
    int visible_tree_rows_ = 0;

    // Layout constants
    static constexpr int kBannerHeight = 2;     // Hostname line + rule
    static constexpr int kStatusBarHeight = 3;  // Rule + flash line + key hints
    static constexpr int kDialogHeight = 5;
    static constexpr int kDialogWidthPercent = 50;
    static constexpr int kInputPollTimeoutMs = 250;
};

} // namespace tmxu
