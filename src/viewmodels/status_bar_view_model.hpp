#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace plx {

struct StatusBarViewModel {
    using Clock = std::chrono::steady_clock;

    std::string message;
    bool is_error = false;
    Clock::time_point expires_at{};

    void show(std::string text, bool error, Clock::time_point until) {
        message = std::move(text);
        is_error = error;
        expires_at = until;
    }

    void clear() {
        message.clear();
        is_error = false;
    }

    // Messages expire lazily; nothing needs a timer
    [[nodiscard]] bool visible(Clock::time_point now) const {
        return !message.empty() && now < expires_at;
    }
};

} // namespace plx
