#pragma once

#include <array>
#include <string>
#include <string_view>

namespace plx {

// Editable fields, in edit order (tab cycles through these)
enum class ProjectField {
    Name = 0,
    Path = 1,
    Command = 2,
    Link = 3,
    Category = 4
};

inline constexpr int kProjectFieldCount = 5;

// One managed project.
// Identity for matching is (name, path, command); there is no stable id.
struct Project {
    std::string name;
    std::string path;
    std::string command;
    std::string link;       // Optional, empty when absent
    std::string category;   // Optional, empty shows as "N/A"

    [[nodiscard]] const std::string& field(ProjectField f) const { return field_of(*this, f); }
    [[nodiscard]] std::string& field(ProjectField f) { return field_of(*this, f); }

    [[nodiscard]] bool same_identity(const Project& other) const {
        return name == other.name && path == other.path && command == other.command;
    }

    bool operator==(const Project&) const = default;

private:
    template <typename Self>
    static auto field_of(Self& self, ProjectField f) -> decltype((self.name)) {
        switch (f) {
            case ProjectField::Name: return self.name;
            case ProjectField::Path: return self.path;
            case ProjectField::Command: return self.command;
            case ProjectField::Link: return self.link;
            case ProjectField::Category: return self.category;
        }
        return self.name;
    }
};

inline constexpr std::string_view kUncategorized = "N/A";

// Category as shown to the user; the stored value is left untouched
inline std::string display_category(const Project& p) {
    return p.category.empty() ? std::string(kUncategorized) : p.category;
}

inline ProjectField next_field(ProjectField f) {
    return static_cast<ProjectField>((static_cast<int>(f) + 1) % kProjectFieldCount);
}

inline ProjectField previous_field(ProjectField f) {
    // +4 is same as -1 mod 5
    return static_cast<ProjectField>((static_cast<int>(f) + kProjectFieldCount - 1) % kProjectFieldCount);
}

inline constexpr std::array<std::string_view, kProjectFieldCount> kFieldNames = {
    "Name", "Path", "Command", "Link", "Category"
};

inline std::string_view field_name(ProjectField f) {
    return kFieldNames[static_cast<size_t>(f)];
}

} // namespace plx
