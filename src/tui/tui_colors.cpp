#include "tui_colors.hpp"

namespace plx {

void init_colors() {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    init_pair(COLOR_PAIR_DEFAULT, -1, -1);  // Default terminal colors
    init_pair(COLOR_PAIR_TITLE, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_SELECTED, COLOR_BLACK, COLOR_CYAN);
    init_pair(COLOR_PAIR_HEADER, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_BORDER, COLOR_BLUE, -1);
    init_pair(COLOR_PAIR_CATEGORY, COLOR_MAGENTA, -1);

    // Status bar
    init_pair(COLOR_PAIR_STATUS_OK, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_ERROR, COLOR_RED, -1);

    init_pair(COLOR_PAIR_HELP_KEY, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_EDIT, COLOR_BLACK, COLOR_WHITE);
}

} // namespace plx
