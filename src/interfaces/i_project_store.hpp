#pragma once

#include "../project.hpp"
#include "../errors.hpp"
#include <vector>

namespace plx {

class IProjectStore {
public:
    virtual ~IProjectStore() = default;

    // Missing or unreadable storage loads as an empty catalog
    virtual std::vector<Project> load() = 0;

    // Returns false on failure; the reason is queued for get_recent_errors()
    virtual bool save(const std::vector<Project>& projects) = 0;

    virtual std::vector<StoreError> get_recent_errors() = 0;
    virtual void clear_errors() = 0;
};

} // namespace plx
