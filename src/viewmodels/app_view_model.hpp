#pragma once

#include "project_table_view_model.hpp"
#include "status_bar_view_model.hpp"

namespace plx {

// Root ViewModel containing all child ViewModels
struct AppViewModel {
    ProjectTableViewModel project_table;
    StatusBarViewModel status_bar;

    bool has_projects = false;

    // Update the table from the model's current projection
    void update_from_model(const DisplayModel& model) {
        const auto& projection = model.projection();
        project_table.columns = projection.columns;
        project_table.set_rows(projection.rows);
        project_table.height = model.table_height();
        project_table.can_scroll_left = model.can_scroll_left();
        project_table.can_scroll_right = model.can_scroll_right();
        project_table.all_columns_visible = model.all_columns_visible();
        has_projects = !model.empty();
    }
};

} // namespace plx
