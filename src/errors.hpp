#pragma once

#include <chrono>
#include <string>

namespace plx {

// Persistence failure surfaced from the project store to the status bar
struct StoreError {
    std::chrono::steady_clock::time_point timestamp;
    std::string message;
};

} // namespace plx
