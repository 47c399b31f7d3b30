#pragma once

#include "display_model.hpp"
#include "text_input.hpp"
#include <string>

namespace plx {

// In-place editing of one catalog record, one field at a time.
//
//   Idle --begin()--> Editing(original_index, field, buffer) --commit()/cancel()--> Idle
//
// Switching fields writes the buffer back first, so typed text is never lost.
class EditSession {
public:
    // Non-owning: both must outlive the session
    EditSession(DisplayModel* model, TextInput* input);

    // Start editing the record under a display row. No-op for headers,
    // stale rows or an empty catalog.
    bool begin(int display_row);
    bool begin_at(int original_index);

    void next_field();
    void previous_field();

    // Write the buffer and leave edit mode. Returns false if the write had no target.
    bool commit();
    void cancel();

    // Keys not handled by the session itself go to the text input
    bool handle_key(const std::string& key);

    [[nodiscard]] bool active() const { return active_; }
    [[nodiscard]] int original_index() const { return original_index_; }
    [[nodiscard]] ProjectField field() const { return field_; }
    [[nodiscard]] const TextInput& input() const { return *input_; }

private:
    void load_field();
    bool store_field();
    void reset();

    DisplayModel* model_ = nullptr;
    TextInput* input_ = nullptr;

    bool active_ = false;
    int original_index_ = DisplayModel::kNotFound;
    ProjectField field_ = ProjectField::Name;
};

} // namespace plx
