#include "edit_session.hpp"
#include <spdlog/spdlog.h>
#include <cassert>

namespace plx {

EditSession::EditSession(DisplayModel* model, TextInput* input)
    : model_(model)
    , input_(input)
{
    assert(model_ != nullptr);
    assert(input_ != nullptr);
}

bool EditSession::begin(int display_row) {
    if (model_->empty()) return false;
    return begin_at(model_->original_index_for_display_row(display_row));
}

bool EditSession::begin_at(int original_index) {
    if (original_index < 0 || original_index >= static_cast<int>(model_->projects().size())) {
        return false;
    }

    active_ = true;
    original_index_ = original_index;
    field_ = ProjectField::Name;
    load_field();
    input_->focus();

    spdlog::debug("Editing project #{} ('{}')", original_index_, model_->projects()[original_index_].name);
    return true;
}

void EditSession::load_field() {
    const auto& value = model_->projects()[original_index_].field(field_);
    input_->set_value(value);
    input_->cursor_end();
}

bool EditSession::store_field() {
    return model_->set_field(original_index_, field_, input_->value());
}

void EditSession::next_field() {
    if (!active_) return;
    if (!store_field()) {
        reset();
        return;
    }
    field_ = plx::next_field(field_);
    load_field();
}

void EditSession::previous_field() {
    if (!active_) return;
    if (!store_field()) {
        reset();
        return;
    }
    field_ = plx::previous_field(field_);
    load_field();
}

bool EditSession::commit() {
    if (!active_) return false;
    const bool stored = store_field();
    reset();
    return stored;
}

void EditSession::cancel() {
    reset();
}

void EditSession::reset() {
    active_ = false;
    original_index_ = DisplayModel::kNotFound;
    field_ = ProjectField::Name;
    input_->reset();
}

bool EditSession::handle_key(const std::string& key) {
    if (!active_) return false;

    if (key == "tab") {
        next_field();
    } else if (key == "shift+tab") {
        previous_field();
    } else {
        return input_->handle_key(key);
    }
    return true;
}

} // namespace plx
