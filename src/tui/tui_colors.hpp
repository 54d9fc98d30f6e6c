#pragma once

#include <ncurses.h>

namespace tmxu {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_TITLE,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_LABEL,
    COLOR_PAIR_SESSION_NAME,
    COLOR_PAIR_WINDOW_NAME,
    COLOR_PAIR_DIM,
    COLOR_PAIR_ATTACHED,
    COLOR_PAIR_STATUS_KEY,
    COLOR_PAIR_FLASH,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_BANNER,
    COLOR_PAIR_DIALOG_INPUT,
    COLOR_PAIR_DIALOG_CONFIRM,
    COLOR_PAIR_TREE_MARKER,
};

// Initialize ncurses color pairs
void init_colors();

} // namespace tmxu
