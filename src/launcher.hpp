#pragma once

#include "project.hpp"
#include "interfaces/i_process_spawner.hpp"
#include <string>
#include <string_view>
#include <variant>

namespace plx {

enum class LaunchMethod {
    None,                 // Nothing was spawned
    NativeShell,          // bash -c on this host
    ForeignShell,         // PowerShell on the Windows host
    ForeignStartProcess,  // PowerShell Start-Process (.exe, survives the shell)
    LinkHandler           // Windows default handler via cmd.exe start
};

std::string_view to_string(LaunchMethod method);

enum class LaunchStatus {
    Launched,
    Failed,
    NoLink
};

struct LaunchOutcome {
    LaunchStatus status = LaunchStatus::Failed;
    LaunchMethod method = LaunchMethod::None;
    std::string message;  // For the status bar

    [[nodiscard]] bool ok() const { return status == LaunchStatus::Launched; }
};

struct LaunchPlan {
    SpawnRequest request;
    LaunchMethod method = LaunchMethod::None;
};

struct LauncherConfig {
    std::string mount_root = "/mnt";  // Windows drives appear as <root>/<letter>
    std::string native_shell = "bash";
    std::string foreign_shell = "powershell.exe";
    std::string link_opener = "cmd.exe";
};

// Project lives on this (POSIX) host
struct NativeHost {
    std::string path;

    [[nodiscard]] LaunchPlan plan(const Project& project, const LauncherConfig& config) const;
};

// Project lives on the Windows side of a WSL mount
struct ForeignHost {
    std::string path;  // Translated, e.g. C:\Users\x\app

    [[nodiscard]] LaunchPlan plan(const Project& project, const LauncherConfig& config) const;
};

using HostTarget = std::variant<NativeHost, ForeignHost>;

class Launcher {
public:
    // Non-owning: spawner must outlive the launcher
    explicit Launcher(IProcessSpawner* spawner, LauncherConfig config = {});

    [[nodiscard]] HostTarget classify_host(const std::string& path) const;
    [[nodiscard]] LaunchPlan plan_launch(const Project& project) const;
    [[nodiscard]] LaunchPlan plan_open_link(const Project& project) const;

    // Spawn and report; never blocks on the child and never throws
    LaunchOutcome launch(const Project& project);
    LaunchOutcome open_link(const Project& project);

    [[nodiscard]] const LauncherConfig& config() const { return config_; }

    // Shell quoting helpers
    static std::string quote_posix(const std::string& s);
    static std::string quote_powershell(const std::string& s);
    // Caret-escapes cmd.exe metacharacters (^ & | < >)
    static std::string escape_cmd(const std::string& s);

    // True if the command's first word names a Windows executable
    static bool is_foreign_executable(const std::string& command);

private:
    [[nodiscard]] bool match_drive_mount(const std::string& path, char& drive, std::string& rest) const;

    IProcessSpawner* spawner_ = nullptr;
    LauncherConfig config_;
};

} // namespace plx
