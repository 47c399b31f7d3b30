#pragma once

#include "../display_model.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace plx {

struct ProjectTableViewModel {
    // Copied from the DisplayModel projection
    std::vector<VisibleColumn> columns;
    std::vector<ProjectionRow> rows;

    // Selection state
    int cursor = 0;

    // Rows per page for pgup/pgdown
    int height = ColumnLayout::kMinTableHeight;

    // Horizontal scroll hints
    bool can_scroll_left = false;
    bool can_scroll_right = false;
    bool all_columns_visible = true;

    void set_rows(std::vector<ProjectionRow> new_rows) {
        rows = std::move(new_rows);
        clamp_cursor();
    }

    void move_cursor(int delta) {
        cursor += delta;
        clamp_cursor();
    }

    void goto_top() { cursor = 0; }
    void goto_bottom() { cursor = std::max(0, static_cast<int>(rows.size()) - 1); }

    void clamp_cursor() {
        cursor = std::clamp(cursor, 0, std::max(0, static_cast<int>(rows.size()) - 1));
    }
};

} // namespace plx
