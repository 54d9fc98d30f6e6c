#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <format>
#include <utility>

namespace tmxu {

WINDOW* TuiApp::create_dialog(int height, int color_pair, const std::string& title) {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    // Dialog dimensions
    int dialog_width = std::clamp(max_x * kDialogWidthPercent / 100, std::min(30, max_x), max_x);
    int dialog_x = (max_x - dialog_width) / 2;
    int dialog_y = std::max(0, (max_y - height) / 2);

    WINDOW* dialog_win = newwin(height, dialog_width, dialog_y, dialog_x);
    if (!dialog_win) return nullptr;

    werase(dialog_win);
    wattron(dialog_win, COLOR_PAIR(color_pair));
    box(dialog_win, 0, 0);
    wattroff(dialog_win, COLOR_PAIR(color_pair));

    std::string padded = " " + title + " ";
    int title_x = std::max(1, (dialog_width - static_cast<int>(padded.length())) / 2);
    wattron(dialog_win, COLOR_PAIR(color_pair) | A_BOLD);
    mvwprintw(dialog_win, 0, title_x, "%s", padded.c_str());
    wattroff(dialog_win, COLOR_PAIR(color_pair) | A_BOLD);

    return dialog_win;
}

void TuiApp::render_input_dialog(const std::string& title, const std::string& input) {
    WINDOW* dialog_win = create_dialog(kDialogHeight, COLOR_PAIR_DIALOG_INPUT, title);
    if (!dialog_win) return;

    int max_x = getmaxx(dialog_win) - 2;

    // Show the tail of long input so the cursor stays visible
    int room = std::max(0, max_x - 6);
    std::string shown = input;
    if (static_cast<int>(shown.length()) > room) {
        shown = shown.substr(shown.length() - room);
    }

    int col = 2;
    print_clipped(dialog_win, 2, col, max_x, "> ", COLOR_PAIR(COLOR_PAIR_TITLE));
    print_clipped(dialog_win, 2, col, max_x, shown, COLOR_PAIR(COLOR_PAIR_WINDOW_NAME));
    print_clipped(dialog_win, 2, col, max_x + 1, " ", COLOR_PAIR(COLOR_PAIR_TITLE) | A_REVERSE);  // cursor

    wrefresh(dialog_win);

    // Delete temporary window (but leave content on screen until next render)
    delwin(dialog_win);
}

void TuiApp::render_kill_dialog(const std::string& target) {
    WINDOW* dialog_win = create_dialog(kDialogHeight, COLOR_PAIR_DIALOG_CONFIRM, "Confirm Kill");
    if (!dialog_win) return;

    int max_x = getmaxx(dialog_win) - 2;

    int col = 2;
    print_clipped(dialog_win, 2, col, max_x, "Kill session ", COLOR_PAIR(COLOR_PAIR_WINDOW_NAME));
    print_clipped(dialog_win, 2, col, max_x, "'" + target + "'", COLOR_PAIR(COLOR_PAIR_LABEL) | A_BOLD);
    print_clipped(dialog_win, 2, col, max_x, "? ", COLOR_PAIR(COLOR_PAIR_WINDOW_NAME));
    print_clipped(dialog_win, 2, col, max_x, "[y/N]", COLOR_PAIR(COLOR_PAIR_TITLE));

    wrefresh(dialog_win);
    delwin(dialog_win);
}

void TuiApp::render_status_bar() {
    if (!status_win_) return;

    int max_x = getmaxx(status_win_);
    const auto& vm = controller_->view_model();

    wattron(status_win_, COLOR_PAIR(COLOR_PAIR_DIM) | A_DIM);
    mvwhline(status_win_, 0, 0, ACS_HLINE, max_x);
    wattroff(status_win_, COLOR_PAIR(COLOR_PAIR_DIM) | A_DIM);

    // Flash line
    if (vm.flash) {
        int col = 2;
        print_clipped(status_win_, 1, col, max_x - 1, vm.flash->text, COLOR_PAIR(COLOR_PAIR_FLASH));
    }

    // Right side: recent error count
    auto errors = controller_->store().get_recent_errors();
    if (!errors.empty()) {
        std::string indicator = std::format("{} error{}", errors.size(), errors.size() == 1 ? "" : "s");
        int error_x = max_x - static_cast<int>(indicator.length()) - 2;
        if (error_x > 0) {
            wattron(status_win_, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
            mvwprintw(status_win_, 1, error_x, "%s", indicator.c_str());
            wattroff(status_win_, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        }
    }

    // Key hints
    static constexpr std::pair<const char*, const char*> kHints[] = {
        {"a-z", ":select  "},
        {"A-Z", ":open  "},
        {"1-9", ":window  "},
        {"Enter", ":attach  "},
        {"n", ":new  "},
        {"r", ":rename  "},
        {"d", ":kill  "},
        {"R", ":refresh  "},
        {"q", ":quit"},
    };

    int col = 2;
    for (const auto& [key, desc] : kHints) {
        print_clipped(status_win_, 2, col, max_x - 1, key, COLOR_PAIR(COLOR_PAIR_STATUS_KEY));
        print_clipped(status_win_, 2, col, max_x - 1, desc, COLOR_PAIR(COLOR_PAIR_DIM) | A_DIM);
    }
}

} // namespace tmxu
