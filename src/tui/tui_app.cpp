#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <csignal>
#include <cstdio>
#include <stdexcept>
#include <unistd.h>

namespace tmxu {

// Signal handler for terminal resize
static std::atomic<bool> g_resize_requested{false};

static void handle_resize([[maybe_unused]] int sig) {
    g_resize_requested.store(true);
}

TuiApp::TuiApp(AppController* controller, const AppConfig& config)
    : controller_(controller)
    , config_(config)
    , hostname_(read_hostname())
{
    if (!controller_) {
        throw std::invalid_argument("TuiApp requires an app controller");
    }
}

TuiApp::~TuiApp() {
    cleanup_windows();
}

std::optional<std::string> TuiApp::run() {
    // Initialize ncurses
    initscr();
    raw();  // Deliver Ctrl-C as a key instead of SIGINT
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    set_escdelay(25);  // Bare Esc should not wait for a sequence
    timeout(kInputPollTimeoutMs);

    // Initialize colors
    init_colors();

    // Set terminal title
    std::string title = "tmxu: " + hostname_;
    printf("\033]0;%s\007", title.c_str());
    fflush(stdout);

    // Set up resize handler
    signal(SIGWINCH, handle_resize);

    // Create windows
    create_windows();

    running_ = true;
    attach_target_.reset();

    while (running_) {
        // Handle terminal resize
        if (g_resize_requested.exchange(false)) {
            endwin();
            refresh();
            resize_windows();
        }

        render();

        // Blocks for at most kInputPollTimeoutMs so the clock keeps ticking
        int ch = getch();
        if (ch != ERR) {
            handle_input(ch);
        }

        if (running_) {
            controller_->tick();
        }
    }

    // Cleanup
    cleanup_windows();
    endwin();

    // Reset terminal title
    printf("\033]0;\007");
    fflush(stdout);

    return attach_target_;
}

void TuiApp::handle_input(int ch) {
    if (ch == KEY_RESIZE) {
        resize_windows();
        return;
    }

    execute_action(controller_->handle_key(translate_key(ch)));
}

void TuiApp::execute_action(const Action& action) {
    switch (action.type) {
        case ActionType::Quit:
            running_ = false;
            break;

        case ActionType::Attach:
            attach_target_ = action.target;
            running_ = false;
            break;

        case ActionType::Refresh:
            controller_->reload();
            break;

        case ActionType::None:
            break;
    }
}

int TuiApp::header_height() const {
    return config_.show_logo ? kBannerHeight : 0;
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    // Calculate panel heights
    int top = header_height();
    int tree_height = std::max(3, max_y - top - kStatusBarHeight);

    int y = 0;
    if (top > 0) {
        header_win_ = newwin(top, max_x, y, 0);
        y += top;
    }

    tree_win_ = newwin(tree_height, max_x, y, 0);
    y += tree_height;
    visible_tree_rows_ = tree_height;

    status_win_ = newwin(kStatusBarHeight, max_x, y, 0);
}

void TuiApp::resize_windows() {
    cleanup_windows();
    create_windows();
}

void TuiApp::cleanup_windows() {
    if (header_win_) {
        delwin(header_win_);
        header_win_ = nullptr;
    }
    if (tree_win_) {
        delwin(tree_win_);
        tree_win_ = nullptr;
    }
    if (status_win_) {
        delwin(status_win_);
        status_win_ = nullptr;
    }
}

void TuiApp::render() {
    // Clear all windows
    if (header_win_) werase(header_win_);
    if (tree_win_) werase(tree_win_);
    if (status_win_) werase(status_win_);

    render_header();
    render_session_tree();
    render_status_bar();

    if (header_win_) wnoutrefresh(header_win_);
    if (tree_win_) wnoutrefresh(tree_win_);
    if (status_win_) wnoutrefresh(status_win_);
    doupdate();

    // Render overlays after the panels so they stay on top
    const auto& mode = controller_->view_model().mode;
    if (const auto* create = std::get_if<CreateSessionMode>(&mode)) {
        render_input_dialog("New Session", create->input);
    } else if (const auto* rename = std::get_if<RenameSessionMode>(&mode)) {
        render_input_dialog("Rename '" + rename->target + "'", rename->input);
    } else if (const auto* kill = std::get_if<ConfirmKillMode>(&mode)) {
        render_kill_dialog(kill->target);
    }
}

void TuiApp::render_header() {
    if (!header_win_) return;

    int max_x = getmaxx(header_win_);

    wattron(header_win_, COLOR_PAIR(COLOR_PAIR_BANNER) | A_BOLD);
    mvwprintw(header_win_, 0, 2, "%s", hostname_.c_str());
    wattroff(header_win_, COLOR_PAIR(COLOR_PAIR_BANNER) | A_BOLD);

    wattron(header_win_, COLOR_PAIR(COLOR_PAIR_DIM) | A_DIM);
    mvwhline(header_win_, 1, 0, ACS_HLINE, max_x);
    wattroff(header_win_, COLOR_PAIR(COLOR_PAIR_DIM) | A_DIM);
}

void TuiApp::scroll_to_selection(const std::vector<VisibleNode>& visible) {
    const auto& selected = controller_->view_model().tree.current_selection();

    int selected_idx = -1;
    for (size_t i = 0; i < visible.size(); ++i) {
        if (visible[i].path == selected) {
            selected_idx = static_cast<int>(i);
            break;
        }
    }

    // Keep the offset valid when rows disappear after a refresh
    int max_offset = std::max(0, static_cast<int>(visible.size()) - visible_tree_rows_);
    tree_scroll_offset_ = std::clamp(tree_scroll_offset_, 0, max_offset);

    if (selected_idx < 0) return;

    // Adjust scroll offset
    if (selected_idx < tree_scroll_offset_) {
        tree_scroll_offset_ = selected_idx;
    } else if (selected_idx >= tree_scroll_offset_ + visible_tree_rows_) {
        tree_scroll_offset_ = selected_idx - visible_tree_rows_ + 1;
    }
}

std::string TuiApp::read_hostname() {
    char buf[256] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "tmxu";
    }
    // Short form, like `hostname -s`
    std::string name(buf);
    if (auto dot = name.find('.'); dot != std::string::npos) {
        name.resize(dot);
    }
    return name;
}

void TuiApp::print_clipped(WINDOW* win, int y, int& x, int max_x, const std::string& text, attr_t attrs) {
    if (x >= max_x) return;

    std::string clipped = text;
    int room = max_x - x;
    if (static_cast<int>(clipped.length()) > room) {
        clipped = room > 3 ? clipped.substr(0, room - 3) + "..." : clipped.substr(0, room);
    }

    wattron(win, attrs);
    mvwprintw(win, y, x, "%s", clipped.c_str());
    wattroff(win, attrs);
    x += static_cast<int>(clipped.length());
}

} // namespace tmxu
