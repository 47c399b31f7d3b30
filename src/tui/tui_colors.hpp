#pragma once

#include <ncurses.h>

namespace plx {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_TITLE,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_HEADER,
    COLOR_PAIR_BORDER,
    COLOR_PAIR_CATEGORY,
    COLOR_PAIR_STATUS_OK,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_HELP_KEY,
    COLOR_PAIR_EDIT,
};

// Initialize ncurses color pairs
void init_colors();

} // namespace plx
