#pragma once

#include "interfaces/i_project_store.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace plx {

// Catalog persisted as an indented JSON array of project objects:
//   [{"name": ..., "path": ..., "command": ..., "link": ..., "category": ...}]
// Missing or null keys read as empty strings.
class JsonProjectStore : public IProjectStore {
public:
    explicit JsonProjectStore(std::filesystem::path file);

    std::vector<Project> load() override;
    bool save(const std::vector<Project>& projects) override;

    std::vector<StoreError> get_recent_errors() override;
    void clear_errors() override;

    [[nodiscard]] const std::filesystem::path& path() const { return file_; }

    // Throws on malformed input
    static std::vector<Project> parse(const std::string& text);
    static std::string serialize(const std::vector<Project>& projects);

private:
    void add_error(const std::string& message);

    std::filesystem::path file_;
    std::vector<StoreError> recent_errors_;
    static constexpr size_t kMaxErrors = 10;
};

} // namespace plx
