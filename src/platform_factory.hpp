#pragma once

#include "interfaces/i_process_spawner.hpp"
#include <memory>

namespace plx {

// Factory for the platform-specific process spawner.
// Implemented per-platform; current build provides the Linux implementation.
std::unique_ptr<IProcessSpawner> make_process_spawner();

} // namespace plx
