#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../utf8.hpp"
#include <algorithm>
#include <format>
#include <string>

namespace plx {

namespace {

// Cell text clipped to its column, leaving one space as a gutter
std::string fit_cell(const std::string& text, int width) {
    const size_t room = static_cast<size_t>(std::max(0, width - 1));
    if (utf8::length(text) <= room) {
        return text;
    }
    if (room <= 1) {
        return utf8::prefix(text, room);
    }
    return utf8::prefix(text, room - 1) + "~";
}

} // namespace

void TuiApp::scroll_to_cursor() {
    const int cursor = dashboard_->view_model().project_table.cursor;
    const int rows = std::max(1, visible_table_rows_);

    if (cursor < row_scroll_offset_) {
        row_scroll_offset_ = cursor;
    } else if (cursor >= row_scroll_offset_ + rows) {
        row_scroll_offset_ = cursor - rows + 1;
    }

    const int total = static_cast<int>(dashboard_->view_model().project_table.rows.size());
    row_scroll_offset_ = std::clamp(row_scroll_offset_, 0, std::max(0, total - rows));
}

void TuiApp::render_project_table() {
    const auto& table = dashboard_->view_model().project_table;

    int max_y, max_x;
    getmaxyx(table_win_, max_y, max_x);

    draw_box_title(table_win_, "Projects");

    // Horizontal scroll markers on the border
    if (table.can_scroll_left) {
        mvwaddch(table_win_, 1, 0, '<' | A_BOLD);
    }
    if (table.can_scroll_right) {
        mvwaddch(table_win_, 1, max_x - 1, '>' | A_BOLD);
    }

    const int right_edge = max_x - 1;

    // Column headers
    wattron(table_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);
    int x = kTableLeft;
    for (const auto& column : table.columns) {
        if (x >= right_edge) break;
        const std::string title = fit_cell(std::string(column.title), column.width);
        put_text(table_win_, 1, x, title, right_edge - x);
        x += column.width;
    }
    wattroff(table_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);

    visible_table_rows_ = std::max(0, max_y - 3);
    scroll_to_cursor();

    const int last = std::min(static_cast<int>(table.rows.size()), row_scroll_offset_ + visible_table_rows_);
    for (int i = row_scroll_offset_; i < last; ++i) {
        const auto& row = table.rows[static_cast<size_t>(i)];
        const int y = 2 + (i - row_scroll_offset_);
        const bool selected = i == table.cursor;

        const attr_t attrs = selected ? (COLOR_PAIR(COLOR_PAIR_SELECTED) | A_BOLD)
                           : row.is_header ? (COLOR_PAIR(COLOR_PAIR_CATEGORY) | A_BOLD)
                           : A_NORMAL;
        wattron(table_win_, attrs);

        if (selected) {
            mvwhline(table_win_, y, 1, ' ', max_x - 2);
        }

        if (row.is_header) {
            // Category label spans the whole row
            const std::string label = "[" + row.category + "]";
            put_text(table_win_, y, kTableLeft, label, right_edge - kTableLeft);
        } else {
            x = kTableLeft;
            for (size_t c = 0; c < table.columns.size() && c < row.cells.size(); ++c) {
                if (x >= right_edge) break;
                const std::string cell = fit_cell(row.cells[c], table.columns[c].width);
                put_text(table_win_, y, x, cell, right_edge - x);
                x += table.columns[c].width;
            }
        }

        wattroff(table_win_, attrs);
    }
}

void TuiApp::render_footer() {
    int max_x = getmaxx(footer_win_);

    if (dashboard_->editing()) {
        render_edit_line(0, max_x);
    } else {
        render_help_line(0, max_x);
    }
    render_status_line(1, max_x);
}

void TuiApp::render_help_line(int y, int max_x) {
    const auto& vm = dashboard_->view_model();

    std::string help;
    if (!vm.has_projects) {
        help = "n: new project | r: refresh | q: quit";
    } else {
        help = "up/down: navigate | space/enter: launch | e: edit | n: new | d: delete | o: open link | r: refresh | q: quit";
        if (!vm.project_table.all_columns_visible) {
            help += " | <-/->: scroll columns";
        }
    }

    wattron(footer_win_, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
    put_text(footer_win_, y, 1, help, max_x - 2);
    wattroff(footer_win_, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
}

void TuiApp::render_edit_line(int y, int max_x) {
    const auto& session = dashboard_->edit_session();
    const std::string line = std::format("Editing {}: {} | tab: next field, enter: save, esc: cancel",
                                         field_name(session.field()), session.input().value());

    wattron(footer_win_, COLOR_PAIR(COLOR_PAIR_EDIT));
    mvwhline(footer_win_, y, 0, ' ', max_x);
    put_text(footer_win_, y, 1, line, max_x - 2);
    wattroff(footer_win_, COLOR_PAIR(COLOR_PAIR_EDIT));
}

void TuiApp::render_status_line(int y, int max_x) {
    const auto& status = dashboard_->view_model().status_bar;
    if (!status.visible(Dashboard::Clock::now())) return;

    const int pair = status.is_error ? COLOR_PAIR_ERROR : COLOR_PAIR_STATUS_OK;
    wattron(footer_win_, COLOR_PAIR(pair) | A_BOLD);
    put_text(footer_win_, y, 1, status.message, max_x - 2);
    wattroff(footer_win_, COLOR_PAIR(pair) | A_BOLD);
}

} // namespace plx
