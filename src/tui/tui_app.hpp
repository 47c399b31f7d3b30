#pragma once

#include "../dashboard.hpp"
#include <string>
#include <ncurses.h>

namespace plx {

class TuiApp {
public:
    // Non-owning constructor: TuiApp drives but does not own the dashboard.
    // The pointer must be non-null and must outlive the TuiApp instance.
    explicit TuiApp(Dashboard* dashboard);
    ~TuiApp();

    TuiApp(const TuiApp&) = delete;
    TuiApp& operator=(const TuiApp&) = delete;

    // Blocks until the user quits
    void run();

    // ncurses key code or ASCII character to the dashboard's canonical key name ("" if unmapped)
    static std::string key_name(int ch);

private:
    // Rendering
    void render();
    void render_title();
    void render_project_table();
    void render_empty_catalog();
    void render_footer();
    void render_help_line(int y, int max_x);
    void render_edit_line(int y, int max_x);
    void render_status_line(int y, int max_x);
    void place_cursor();

    // Input handling
    void handle_input(int ch);
    void handle_char(wint_t wch);
    void handle_mouse_event();

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();
    void draw_box_title(WINDOW* win, const std::string& title);
    static void put_text(WINDOW* win, int y, int x, const std::string& text, int max_chars);
    void scroll_to_cursor();

    Dashboard* dashboard_ = nullptr;

    WINDOW* title_win_ = nullptr;
    WINDOW* table_win_ = nullptr;
    WINDOW* footer_win_ = nullptr;

    bool running_ = false;
    bool curses_active_ = false;

    // Vertical scroll state of the table
    int row_scroll_offset_ = 0;
    int visible_table_rows_ = 0;

    static constexpr int kTitleHeight = 1;
    static constexpr int kFooterHeight = 2;
    static constexpr int kTableLeft = 2;
    static constexpr int kWheelStep = 3;
    static constexpr int kInputTimeoutMs = 250;  // Lets expired status messages clear
};

} // namespace plx
