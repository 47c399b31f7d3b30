#include "dashboard.hpp"
#include <algorithm>
#include <cassert>
#include <format>
#include <utility>

namespace plx {

namespace {

Project new_project_template() {
    Project project;
    project.name = "New Project";
    project.path = "/path/to/project";
    project.command = "command";
    return project;
}

} // namespace

Dashboard::Dashboard(DisplayModel* model, Launcher* launcher, std::chrono::milliseconds status_duration)
    : model_(model)
    , launcher_(launcher)
    , edit_session_(model, &text_input_)
    , status_duration_(status_duration)
{
    assert(model_ != nullptr);
    assert(launcher_ != nullptr);
}

void Dashboard::start() {
    model_->reload();
    refresh_view();
}

bool Dashboard::handle_key(const std::string& key) {
    if (edit_session_.active()) {
        handle_edit_key(key);
    } else {
        handle_normal_key(key);
    }
    return running_;
}

void Dashboard::handle_resize(int width, int height) {
    model_->set_pane_size(width, height);
    refresh_view();
}

void Dashboard::handle_wheel(int delta) {
    if (edit_session_.active()) return;
    view_model_.project_table.move_cursor(delta);
}

void Dashboard::handle_normal_key(const std::string& key) {
    if (key == "q" || key == "ctrl+c") {
        running_ = false;
    } else if (key == " " || key == "space" || key == "enter") {
        launch_selected();
    } else if (key == "e") {
        start_edit();
    } else if (key == "n" || key == "a") {
        add_project();
    } else if (key == "d" || key == "delete") {
        delete_selected();
    } else if (key == "r") {
        reload();
    } else if (key == "o") {
        open_selected_link();
    } else if (key == "left") {
        model_->scroll_left();
        refresh_view();
    } else if (key == "right") {
        model_->scroll_right();
        refresh_view();
    } else {
        handle_navigation_key(key);
    }
}

bool Dashboard::handle_navigation_key(const std::string& key) {
    auto& table = view_model_.project_table;
    const int page = std::max(1, table.height);
    const int half_page = std::max(1, page / 2);

    if (key == "up" || key == "k") {
        table.move_cursor(-1);
    } else if (key == "down" || key == "j") {
        table.move_cursor(1);
    } else if (key == "pgup" || key == "b") {
        table.move_cursor(-page);
    } else if (key == "pgdown" || key == "f") {
        table.move_cursor(page);
    } else if (key == "ctrl+u" || key == "u") {
        table.move_cursor(-half_page);
    } else if (key == "ctrl+d") {
        table.move_cursor(half_page);
    } else if (key == "home" || key == "g") {
        table.goto_top();
    } else if (key == "end" || key == "G") {
        table.goto_bottom();
    } else {
        return false;
    }
    return true;
}

void Dashboard::handle_edit_key(const std::string& key) {
    if (key == "esc") {
        edit_session_.cancel();
        return;
    }

    if (key == "enter") {
        const int original_index = edit_session_.original_index();
        const bool stored = edit_session_.commit();
        refresh_view();
        if (stored) {
            select_original_index(original_index);
            show_status("Project updated");
        }
        report_store_errors();
        return;
    }

    const bool switching = key == "tab" || key == "shift+tab";
    edit_session_.handle_key(key == "space" ? " " : key);
    if (switching) {
        // The previous field was written back
        refresh_view();
        report_store_errors();
    }
}

void Dashboard::launch_selected() {
    const Project* record = model_->record_for_display_row(view_model_.project_table.cursor);
    if (!record) return;

    const Project project = *record;
    const LaunchOutcome outcome = launcher_->launch(project);
    show_status(outcome.message, outcome.status == LaunchStatus::Failed);
}

void Dashboard::open_selected_link() {
    const Project* record = model_->record_for_display_row(view_model_.project_table.cursor);
    if (!record) return;

    const Project project = *record;
    const LaunchOutcome outcome = launcher_->open_link(project);
    show_status(outcome.message, outcome.status == LaunchStatus::Failed);
}

void Dashboard::start_edit() {
    edit_session_.begin(view_model_.project_table.cursor);
}

void Dashboard::add_project() {
    model_->add_record(new_project_template());
    refresh_view();

    const int original_index = static_cast<int>(model_->projects().size()) - 1;
    select_original_index(original_index);
    edit_session_.begin_at(original_index);

    show_status("New project added");
    report_store_errors();
}

void Dashboard::delete_selected() {
    const int original_index = model_->original_index_for_display_row(view_model_.project_table.cursor);
    if (original_index == DisplayModel::kNotFound) return;

    const std::string name = model_->projects()[static_cast<size_t>(original_index)].name;
    if (!model_->delete_record(original_index)) return;

    refresh_view();
    show_status(std::format("Deleted {}", name));
    report_store_errors();
}

void Dashboard::reload() {
    model_->reload();
    refresh_view();
    show_status("Refreshed");
}

void Dashboard::refresh_view() {
    view_model_.update_from_model(*model_);
}

void Dashboard::select_original_index(int original_index) {
    const int row = model_->display_row_for_original_index(original_index);
    if (row != DisplayModel::kNotFound) {
        view_model_.project_table.cursor = row;
        view_model_.project_table.clamp_cursor();
    }
}

void Dashboard::show_status(std::string message, bool is_error) {
    view_model_.status_bar.show(std::move(message), is_error, Clock::now() + status_duration_);
}

void Dashboard::report_store_errors() {
    auto errors = model_->take_store_errors();
    if (errors.empty()) return;

    // The latest failure is the one worth showing
    show_status(std::format("Failed to save catalog: {}", errors.back().message), true);
}

} // namespace plx
