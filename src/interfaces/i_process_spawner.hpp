#pragma once

#include <string>
#include <vector>

namespace plx {

struct SpawnRequest {
    std::vector<std::string> argv;   // argv[0] is looked up on PATH
    std::string working_dir;         // Empty = inherit
    bool new_process_group = true;   // Detach from the dashboard's group
};

struct SpawnResult {
    bool success = false;
    int pid = -1;
    std::string error_message;
};

// Creates detached processes. No handle to the child is kept after spawn().
class IProcessSpawner {
public:
    virtual ~IProcessSpawner() = default;

    virtual SpawnResult spawn(const SpawnRequest& request) = 0;
};

} // namespace plx
