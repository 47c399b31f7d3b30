#pragma once

#include "project.hpp"
#include <array>
#include <string_view>
#include <vector>

namespace plx {

struct ColumnSpec {
    ProjectField field;
    std::string_view title;
    int width;  // Nominal width in cells
};

struct VisibleColumn {
    ProjectField field;
    std::string_view title;
    int width;
};

struct LayoutResult {
    std::vector<VisibleColumn> columns;
    int scroll_offset = 0;     // Clamped offset actually used
    int available_width = 0;
    int table_height = 0;
};

// Chooses which table columns fit in the pane.
// Starting at the scroll offset, takes the longest run of columns whose
// nominal widths fit; when that run reaches the last column it is extended
// leftwards as far as it still fits. At least one column is always shown,
// and leftover width is given to the last visible column.
class ColumnLayout {
public:
    // Display order; note Category comes before Link here but not in edit order
    static constexpr std::array<ColumnSpec, kProjectFieldCount> kColumns = {{
        {ProjectField::Name, "Name", 30},
        {ProjectField::Path, "Path", 35},
        {ProjectField::Command, "Command", 35},
        {ProjectField::Category, "Category", 15},
        {ProjectField::Link, "Link", 30},
    }};

    static constexpr int kColumnCount = static_cast<int>(kColumns.size());
    static constexpr int kHorizontalChrome = 6;  // Borders and padding
    static constexpr int kVerticalChrome = 6;    // Title, header, footer lines
    static constexpr int kMinTableHeight = 5;

    [[nodiscard]] static LayoutResult compute(int pane_width, int pane_height, int scroll_offset);
};

} // namespace plx
