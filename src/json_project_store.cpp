#include "json_project_store.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

// Keys are written in declaration order, not sorted
using json = nlohmann::ordered_json;

namespace plx {

namespace {

std::string read_string(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    return it->get<std::string>();  // Throws type_error for non-strings
}

} // namespace

void to_json(json& j, const Project& p) {
    j = json{
        {"name", p.name},
        {"path", p.path},
        {"command", p.command},
        {"link", p.link},
        {"category", p.category},
    };
}

void from_json(const json& j, Project& p) {
    if (!j.is_object()) {
        throw std::runtime_error(std::format("expected a project object, got {}", j.type_name()));
    }
    p.name = read_string(j, "name");
    p.path = read_string(j, "path");
    p.command = read_string(j, "command");
    p.link = read_string(j, "link");
    p.category = read_string(j, "category");
}

JsonProjectStore::JsonProjectStore(fs::path file)
    : file_(std::move(file))
{
}

std::vector<Project> JsonProjectStore::parse(const std::string& text) {
    const json root = json::parse(text);
    if (!root.is_array()) {
        throw std::runtime_error(std::format("catalog root must be an array, got {}", root.type_name()));
    }
    return root.get<std::vector<Project>>();
}

std::string JsonProjectStore::serialize(const std::vector<Project>& projects) {
    const json root = projects;
    // Invalid UTF-8 typed into a field is replaced rather than failing the save
    return root.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

std::vector<Project> JsonProjectStore::load() {
    std::error_code ec;
    if (!fs::exists(file_, ec)) {
        spdlog::info("No catalog at {}, starting empty", file_.string());
        return {};
    }

    std::ifstream in(file_);
    if (!in) {
        spdlog::warn("Cannot open catalog {}, starting empty", file_.string());
        return {};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();

    try {
        return parse(buffer.str());
    } catch (const std::exception& e) {
        spdlog::warn("Cannot parse catalog {}: {}; starting empty", file_.string(), e.what());
        return {};
    }
}

bool JsonProjectStore::save(const std::vector<Project>& projects) {
    std::string text;
    try {
        text = serialize(projects);
    } catch (const std::exception& e) {
        add_error(std::format("cannot serialize catalog: {}", e.what()));
        return false;
    }

    std::error_code ec;
    if (file_.has_parent_path()) {
        fs::create_directories(file_.parent_path(), ec);
        if (ec) {
            add_error(std::format("cannot create {}: {}", file_.parent_path().string(), ec.message()));
            return false;
        }
    }

    std::ofstream out(file_, std::ios::out | std::ios::trunc);
    if (!out) {
        add_error(std::format("cannot open {} for writing", file_.string()));
        return false;
    }

    out << text;
    out.flush();
    if (!out) {
        add_error(std::format("write to {} failed", file_.string()));
        return false;
    }

    spdlog::debug("Saved {} projects to {}", projects.size(), file_.string());
    return true;
}

void JsonProjectStore::add_error(const std::string& message) {
    spdlog::error("Catalog save failed: {}", message);
    recent_errors_.push_back({std::chrono::steady_clock::now(), message});
    if (recent_errors_.size() > kMaxErrors) {
        recent_errors_.erase(recent_errors_.begin());
    }
}

std::vector<StoreError> JsonProjectStore::get_recent_errors() {
    return recent_errors_;
}

void JsonProjectStore::clear_errors() {
    recent_errors_.clear();
}

} // namespace plx
