#include "column_layout.hpp"
#include <algorithm>

namespace plx {

LayoutResult ColumnLayout::compute(int pane_width, int pane_height, int scroll_offset) {
    LayoutResult result;
    result.available_width = std::max(1, pane_width - kHorizontalChrome);
    result.table_height = std::max(kMinTableHeight, pane_height - kVerticalChrome);

    int offset = std::clamp(scroll_offset, 0, kColumnCount - 1);

    // Longest run of columns starting at offset
    int used = 0;
    int count = 0;
    for (int i = offset; i < kColumnCount; ++i) {
        if (used + kColumns[i].width > result.available_width) break;
        used += kColumns[i].width;
        ++count;
    }

    if (count == 0) {
        // Not even one nominal column fits: show it squeezed to the pane
        const auto& first = kColumns[offset];
        result.columns.push_back({first.field, first.title, result.available_width});
        result.scroll_offset = offset;
        return result;
    }

    // Trailing window: pull in earlier columns instead of leaving space unused
    if (offset + count == kColumnCount) {
        while (offset > 0 && used + kColumns[offset - 1].width <= result.available_width) {
            --offset;
            used += kColumns[offset].width;
            ++count;
        }
    }

    result.scroll_offset = offset;
    result.columns.reserve(count);
    for (int i = offset; i < offset + count; ++i) {
        result.columns.push_back({kColumns[i].field, kColumns[i].title, kColumns[i].width});
    }
    result.columns.back().width += result.available_width - used;

    return result;
}

} // namespace plx
