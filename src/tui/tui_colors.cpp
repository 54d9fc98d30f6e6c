#include "tui_colors.hpp"

namespace tmxu {

void init_colors() {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    // Basic colors
    init_pair(COLOR_PAIR_DEFAULT, -1, -1);  // Default terminal colors
    init_pair(COLOR_PAIR_TITLE, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_SELECTED, COLOR_WHITE, COLOR_BLACK);

    // Tree rows
    init_pair(COLOR_PAIR_LABEL, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_SESSION_NAME, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_WINDOW_NAME, COLOR_WHITE, -1);
    init_pair(COLOR_PAIR_DIM, COLOR_WHITE, -1);     // Drawn with A_DIM
    init_pair(COLOR_PAIR_ATTACHED, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_TREE_MARKER, COLOR_BLUE, -1);

    // Status area
    init_pair(COLOR_PAIR_STATUS_KEY, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_FLASH, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_ERROR, COLOR_RED, -1);

    // Header
    init_pair(COLOR_PAIR_BANNER, COLOR_MAGENTA, -1);

    // Dialogs
    init_pair(COLOR_PAIR_DIALOG_INPUT, COLOR_MAGENTA, -1);
    init_pair(COLOR_PAIR_DIALOG_CONFIRM, COLOR_RED, -1);
}

} // namespace tmxu
