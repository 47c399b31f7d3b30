#pragma once

#include "interfaces/i_project_store.hpp"
#include "interfaces/i_process_spawner.hpp"
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace plx::test {

// In-memory catalog. save() can be told to fail.
class MemoryProjectStore : public IProjectStore {
public:
    MemoryProjectStore() = default;
    explicit MemoryProjectStore(std::vector<Project> initial) : stored(std::move(initial)) {}

    std::vector<Project> load() override {
        ++load_count;
        return stored;
    }

    bool save(const std::vector<Project>& projects) override {
        ++save_count;
        if (fail_saves) {
            errors.push_back({std::chrono::steady_clock::now(), "disk full"});
            return false;
        }
        stored = projects;
        return true;
    }

    std::vector<StoreError> get_recent_errors() override { return errors; }
    void clear_errors() override { errors.clear(); }

    std::vector<Project> stored;
    std::vector<StoreError> errors;
    bool fail_saves = false;
    int load_count = 0;
    int save_count = 0;
};

// Records every request instead of spawning
class RecordingSpawner : public IProcessSpawner {
public:
    SpawnResult spawn(const SpawnRequest& request) override {
        requests.push_back(request);
        SpawnResult result;
        if (fail_with.empty()) {
            result.success = true;
            result.pid = next_pid++;
        } else {
            result.error_message = fail_with;
        }
        return result;
    }

    std::vector<SpawnRequest> requests;
    std::string fail_with;  // Non-empty makes every spawn fail
    int next_pid = 4242;
};

inline Project make_project(std::string name, std::string path, std::string command,
                            std::string category = {}, std::string link = {}) {
    Project p;
    p.name = std::move(name);
    p.path = std::move(path);
    p.command = std::move(command);
    p.category = std::move(category);
    p.link = std::move(link);
    return p;
}

} // namespace plx::test
