#pragma once

#include "project.hpp"
#include "column_layout.hpp"
#include "errors.hpp"
#include "interfaces/i_project_store.hpp"
#include <string>
#include <vector>

namespace plx {

struct ProjectionRow {
    bool is_header = false;
    std::string category;            // Display category ("N/A" for empty)
    std::vector<std::string> cells;  // One per visible column; headers leave them empty
};

// Derived table contents, rebuilt wholesale on every change
struct Projection {
    std::vector<VisibleColumn> columns;
    std::vector<ProjectionRow> rows;
    // Per display row: position in the sorted copy, or kHeaderRow
    std::vector<int> index_map;
};

// Owns the project catalog and the sorted/grouped view of it.
// Display rows never address the catalog directly; everything goes
// through the index map and back to a catalog index.
class DisplayModel {
public:
    static constexpr int kHeaderRow = -1;
    static constexpr int kNotFound = -1;

    // Non-owning: store must outlive the model
    explicit DisplayModel(IProjectStore* store);

    // Replace the catalog with what is on disk
    void reload();

    [[nodiscard]] const std::vector<Project>& projects() const { return projects_; }
    [[nodiscard]] bool empty() const { return projects_.empty(); }
    [[nodiscard]] const Projection& projection() const { return projection_; }

    void rebuild_projection();

    // Row lookups: nullptr / kNotFound for header rows and out-of-range rows
    [[nodiscard]] const Project* record_for_display_row(int row) const;
    [[nodiscard]] int original_index_for_display_row(int row) const;
    [[nodiscard]] int display_row_for_original_index(int original_index) const;

    // Catalog mutations (each persists and rebuilds)
    void add_record(Project project);
    bool delete_record(int original_index);
    bool set_field(int original_index, ProjectField field, const std::string& value);

    // Viewport
    void set_pane_size(int width, int height);
    void scroll_left();
    void scroll_right();
    [[nodiscard]] bool can_scroll_left() const { return scroll_offset_ > 0; }
    [[nodiscard]] bool can_scroll_right() const;
    [[nodiscard]] bool all_columns_visible() const;
    [[nodiscard]] int scroll_offset() const { return scroll_offset_; }
    [[nodiscard]] int table_height() const { return table_height_; }

    // Save failures since the last call
    [[nodiscard]] std::vector<StoreError> take_store_errors();

    // Catalog indices in display order (category, then name; stable)
    [[nodiscard]] static std::vector<int> sorted_order(const std::vector<Project>& projects);
    [[nodiscard]] static std::vector<Project> sorted_copy(const std::vector<Project>& projects);

private:
    void persist();
    void relayout();
    [[nodiscard]] int sorted_position_for_display_row(int row) const;
    [[nodiscard]] bool is_valid_index(int original_index) const;

    IProjectStore* store_ = nullptr;

    std::vector<Project> projects_;
    Projection projection_;
    std::vector<StoreError> pending_errors_;

    // Viewport state
    int pane_width_ = 100;
    int pane_height_ = 24;
    int scroll_offset_ = 0;
    int table_height_ = ColumnLayout::kMinTableHeight;
    std::vector<VisibleColumn> columns_;
};

} // namespace plx
