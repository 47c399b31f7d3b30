#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../utf8.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cassert>
#include <csignal>
#include <cstdio>
#include <format>

namespace plx {

// Signal handler for terminal resize
static std::atomic<bool> g_resize_requested{false};

static void handle_resize([[maybe_unused]] int sig) {
    g_resize_requested.store(true);
}

TuiApp::TuiApp(Dashboard* dashboard)
    : dashboard_(dashboard)
{
    assert(dashboard_ != nullptr);
}

TuiApp::~TuiApp() {
    cleanup_windows();
    if (curses_active_) {
        endwin();
    }
}

void TuiApp::run() {
    // Initialize ncurses
    initscr();
    curses_active_ = true;
    raw();  // ctrl+c arrives as a key, not SIGINT
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    set_escdelay(25);
    timeout(kInputTimeoutMs);
    mouseinterval(0);  // Disable mouse click delay

    // Wheel events only
    mousemask(BUTTON4_PRESSED | BUTTON5_PRESSED, nullptr);

    init_colors();

    printf("\033]0;%s\007", "Project Launcher");
    fflush(stdout);

    // Set up resize handler
    signal(SIGWINCH, handle_resize);

    create_windows();
    dashboard_->start();
    dashboard_->handle_resize(COLS, LINES);

    running_ = true;
    spdlog::debug("TUI started at {}x{}", COLS, LINES);

    while (running_) {
        // Handle terminal resize
        if (g_resize_requested.exchange(false)) {
            endwin();
            refresh();
            resize_windows();
            dashboard_->handle_resize(COLS, LINES);
        }

        render();

        wint_t wch = 0;
        const int rc = get_wch(&wch);
        if (rc == KEY_CODE_YES) {
            handle_input(static_cast<int>(wch));  // Function key
        } else if (rc == OK) {
            handle_char(wch);
        }
    }

    cleanup_windows();
    endwin();
    curses_active_ = false;

    // Reset terminal title
    printf("\033]0;\007");
    fflush(stdout);
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    const int table_height = std::max(3, max_y - kTitleHeight - kFooterHeight);

    int y = 0;
    title_win_ = newwin(kTitleHeight, max_x, y, 0);
    y += kTitleHeight;

    table_win_ = newwin(table_height, max_x, y, 0);
    y += table_height;
    visible_table_rows_ = std::max(0, table_height - 3);  // Border and column header

    footer_win_ = newwin(kFooterHeight, max_x, y, 0);
}

void TuiApp::resize_windows() {
    cleanup_windows();
    create_windows();
}

void TuiApp::cleanup_windows() {
    if (title_win_) {
        delwin(title_win_);
        title_win_ = nullptr;
    }
    if (table_win_) {
        delwin(table_win_);
        table_win_ = nullptr;
    }
    if (footer_win_) {
        delwin(footer_win_);
        footer_win_ = nullptr;
    }
}

void TuiApp::render() {
    if (!title_win_ || !table_win_ || !footer_win_) return;

    werase(title_win_);
    werase(table_win_);
    werase(footer_win_);

    render_title();
    if (dashboard_->view_model().has_projects) {
        render_project_table();
    } else {
        render_empty_catalog();
    }
    render_footer();

    wnoutrefresh(title_win_);
    wnoutrefresh(table_win_);
    place_cursor();
    wnoutrefresh(footer_win_);  // Last, so the hardware cursor lands in the footer
    doupdate();
}

void TuiApp::render_title() {
    wattron(title_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    mvwprintw(title_win_, 0, 1, "Project Launcher");
    wattroff(title_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
}

void TuiApp::render_empty_catalog() {
    int max_y, max_x;
    getmaxyx(table_win_, max_y, max_x);

    draw_box_title(table_win_, "Projects");
    const std::string message = "No projects configured yet. Press 'n' to add your first project!";
    const int y = std::max(1, max_y / 2);
    const int x = std::max(kTableLeft, (max_x - static_cast<int>(message.size())) / 2);
    put_text(table_win_, y, x, message, max_x - x - 1);
}

void TuiApp::put_text(WINDOW* win, int y, int x, const std::string& text, int max_chars) {
    if (max_chars <= 0) return;
    // Clip on character boundaries; ncursesw decodes the UTF-8 itself
    const std::string clipped = utf8::prefix(text, static_cast<size_t>(max_chars));
    mvwaddstr(win, y, x, clipped.c_str());
}

void TuiApp::draw_box_title(WINDOW* win, const std::string& title) {
    wattron(win, COLOR_PAIR(COLOR_PAIR_BORDER));
    box(win, 0, 0);
    wattroff(win, COLOR_PAIR(COLOR_PAIR_BORDER));
    if (!title.empty()) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
        mvwprintw(win, 0, 2, " %s ", title.c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    }
}

void TuiApp::place_cursor() {
    // Terminal cursor is shown only while a field is being edited
    if (!dashboard_->editing()) {
        curs_set(0);
        return;
    }

    const auto& session = dashboard_->edit_session();
    const std::string prefix = std::format("Editing {}: ", field_name(session.field()));
    const int x = 1 + static_cast<int>(prefix.size() + session.input().cursor());
    if (x < getmaxx(footer_win_)) {
        curs_set(1);
        wmove(footer_win_, 0, x);
    } else {
        curs_set(0);
    }
}

} // namespace plx
