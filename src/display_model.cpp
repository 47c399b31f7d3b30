#include "display_model.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cassert>
#include <cctype>
#include <numeric>
#include <tuple>
#include <utility>

namespace plx {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

struct SortKey {
    bool uncategorized;              // The "N/A" group sorts after every named category
    std::string folded_category;
    std::string category;  // Keeps "Web" and "web" apart so each stays contiguous
    std::string folded_name;
};

SortKey make_sort_key(const Project& p) {
    std::string category = display_category(p);
    std::string folded = to_lower(category);
    const bool uncategorized = folded == to_lower(std::string(kUncategorized));
    return {uncategorized, std::move(folded), std::move(category), to_lower(p.name)};
}

} // namespace

DisplayModel::DisplayModel(IProjectStore* store)
    : store_(store)
{
    assert(store_ != nullptr);
    relayout();
}

void DisplayModel::reload() {
    projects_ = store_->load();
    spdlog::info("Loaded {} projects", projects_.size());
    rebuild_projection();
}

std::vector<int> DisplayModel::sorted_order(const std::vector<Project>& projects) {
    std::vector<SortKey> keys;
    keys.reserve(projects.size());
    for (const auto& p : projects) {
        keys.push_back(make_sort_key(p));
    }

    std::vector<int> order(projects.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&keys](int a, int b) {
        return std::tie(keys[a].uncategorized, keys[a].folded_category, keys[a].category, keys[a].folded_name)
             < std::tie(keys[b].uncategorized, keys[b].folded_category, keys[b].category, keys[b].folded_name);
    });
    return order;
}

std::vector<Project> DisplayModel::sorted_copy(const std::vector<Project>& projects) {
    std::vector<Project> sorted;
    sorted.reserve(projects.size());
    for (int idx : sorted_order(projects)) {
        sorted.push_back(projects[idx]);
    }
    return sorted;
}

void DisplayModel::rebuild_projection() {
    projection_.columns = columns_;
    projection_.rows.clear();
    projection_.index_map.clear();

    const auto sorted = sorted_copy(projects_);

    std::string last_category;
    int sorted_pos = 0;  // Counts record rows only

    for (const auto& project : sorted) {
        std::string category = display_category(project);

        // Sorting keeps each category contiguous, so this emits one header per category
        if (category != last_category) {
            ProjectionRow header;
            header.is_header = true;
            header.category = category;
            header.cells.resize(columns_.size());
            projection_.rows.push_back(std::move(header));
            projection_.index_map.push_back(kHeaderRow);
            last_category = category;
        }

        ProjectionRow row;
        row.category = category;
        row.cells.reserve(columns_.size());
        for (const auto& col : columns_) {
            row.cells.push_back(col.field == ProjectField::Category ? category : project.field(col.field));
        }
        projection_.rows.push_back(std::move(row));
        projection_.index_map.push_back(sorted_pos++);
    }

    spdlog::debug("Projection rebuilt: {} rows, {} columns from offset {}",
                  projection_.rows.size(), columns_.size(), scroll_offset_);
}

int DisplayModel::sorted_position_for_display_row(int row) const {
    if (row < 0 || row >= static_cast<int>(projection_.index_map.size())) {
        return kNotFound;
    }
    return projection_.index_map[row];  // kHeaderRow for headers
}

int DisplayModel::original_index_for_display_row(int row) const {
    const int sorted_pos = sorted_position_for_display_row(row);
    if (sorted_pos == kHeaderRow || sorted_pos == kNotFound) {
        return kNotFound;
    }

    // Same comparator as rebuild_projection, so positions line up
    const auto sorted = sorted_copy(projects_);
    if (sorted_pos >= static_cast<int>(sorted.size())) {
        return kNotFound;
    }

    // Match back by value; duplicates of (name, path, command) resolve to the first
    const Project& wanted = sorted[sorted_pos];
    for (size_t i = 0; i < projects_.size(); ++i) {
        if (projects_[i].same_identity(wanted)) {
            return static_cast<int>(i);
        }
    }
    return kNotFound;
}

const Project* DisplayModel::record_for_display_row(int row) const {
    const int idx = original_index_for_display_row(row);
    if (idx == kNotFound) return nullptr;
    return &projects_[idx];
}

int DisplayModel::display_row_for_original_index(int original_index) const {
    if (!is_valid_index(original_index)) return kNotFound;

    const auto order = sorted_order(projects_);
    const auto it = std::find(order.begin(), order.end(), original_index);
    const int sorted_pos = static_cast<int>(std::distance(order.begin(), it));

    const auto& map = projection_.index_map;
    if (auto row = std::find(map.begin(), map.end(), sorted_pos); row != map.end()) {
        return static_cast<int>(std::distance(map.begin(), row));
    }
    return kNotFound;
}

bool DisplayModel::is_valid_index(int original_index) const {
    return original_index >= 0 && original_index < static_cast<int>(projects_.size());
}

void DisplayModel::add_record(Project project) {
    spdlog::info("Adding project '{}'", project.name);
    projects_.push_back(std::move(project));
    persist();
    rebuild_projection();
}

bool DisplayModel::delete_record(int original_index) {
    if (!is_valid_index(original_index)) {
        return false;
    }

    spdlog::info("Deleting project '{}'", projects_[original_index].name);
    projects_.erase(projects_.begin() + original_index);
    persist();
    rebuild_projection();
    return true;
}

bool DisplayModel::set_field(int original_index, ProjectField field, const std::string& value) {
    if (!is_valid_index(original_index)) {
        return false;
    }

    projects_[original_index].field(field) = value;
    spdlog::debug("Set {} of project #{} to '{}'", field_name(field), original_index, value);
    persist();
    rebuild_projection();
    return true;
}

void DisplayModel::persist() {
    if (store_->save(projects_)) return;

    auto errors = store_->get_recent_errors();
    store_->clear_errors();
    if (errors.empty()) {
        errors.push_back({std::chrono::steady_clock::now(), "unknown error"});
    }
    pending_errors_.insert(pending_errors_.end(), errors.begin(), errors.end());
}

std::vector<StoreError> DisplayModel::take_store_errors() {
    std::vector<StoreError> result;
    result.swap(pending_errors_);
    return result;
}

void DisplayModel::relayout() {
    auto layout = ColumnLayout::compute(pane_width_, pane_height_, scroll_offset_);
    scroll_offset_ = layout.scroll_offset;
    table_height_ = layout.table_height;
    columns_ = std::move(layout.columns);
}

void DisplayModel::set_pane_size(int width, int height) {
    pane_width_ = width;
    pane_height_ = height;
    relayout();
    rebuild_projection();
}

bool DisplayModel::can_scroll_right() const {
    return scroll_offset_ + static_cast<int>(columns_.size()) < ColumnLayout::kColumnCount;
}

bool DisplayModel::all_columns_visible() const {
    return static_cast<int>(columns_.size()) == ColumnLayout::kColumnCount;
}

void DisplayModel::scroll_left() {
    if (!can_scroll_left()) return;
    --scroll_offset_;
    relayout();
    rebuild_projection();
}

void DisplayModel::scroll_right() {
    if (!can_scroll_right()) return;
    ++scroll_offset_;
    relayout();
    rebuild_projection();
}

} // namespace plx
