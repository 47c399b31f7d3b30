#pragma once

#include "display_model.hpp"
#include "edit_session.hpp"
#include "launcher.hpp"
#include "text_input.hpp"
#include "viewmodels/app_view_model.hpp"
#include <chrono>
#include <string>

namespace plx {

// UI-agnostic controller. Front ends feed it canonical key names
// ("up", "ctrl+c", "shift+tab", "a", ...) and resize events, then paint
// from view_model() and edit_session().
class Dashboard {
public:
    using Clock = std::chrono::steady_clock;

    // Non-owning: model and launcher must outlive the dashboard
    Dashboard(DisplayModel* model, Launcher* launcher,
              std::chrono::milliseconds status_duration = std::chrono::milliseconds(3000));

    // Load the catalog and build the first view
    void start();

    // Returns false once the user has asked to quit
    bool handle_key(const std::string& key);
    void handle_resize(int width, int height);
    void handle_wheel(int delta);

    [[nodiscard]] bool running() const { return running_; }
    [[nodiscard]] bool editing() const { return edit_session_.active(); }

    [[nodiscard]] const AppViewModel& view_model() const { return view_model_; }
    [[nodiscard]] const EditSession& edit_session() const { return edit_session_; }
    [[nodiscard]] const DisplayModel& model() const { return *model_; }

private:
    void handle_normal_key(const std::string& key);
    void handle_edit_key(const std::string& key);
    bool handle_navigation_key(const std::string& key);

    void launch_selected();
    void open_selected_link();
    void start_edit();
    void add_project();
    void delete_selected();
    void reload();

    void refresh_view();
    void select_original_index(int original_index);
    void show_status(std::string message, bool is_error = false);
    void report_store_errors();

    DisplayModel* model_ = nullptr;
    Launcher* launcher_ = nullptr;

    TextInput text_input_;
    EditSession edit_session_;
    AppViewModel view_model_;

    std::chrono::milliseconds status_duration_;
    bool running_ = true;
};

} // namespace plx
