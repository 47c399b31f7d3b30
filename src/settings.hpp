#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace plx {

// Runtime configuration, resolved once at startup from the environment:
//   PLX_CATALOG     catalog file        (default ~/.local/bin/project-launcher.json)
//   PLX_LOG_FILE    log file            (default $XDG_STATE_HOME/plx/plx.log or ~/.local/state/plx/plx.log)
//   PLX_LOG_LEVEL   spdlog level name   (default info)
//   PLX_MOUNT_ROOT  Windows drive mounts (default /mnt)
struct Settings {
    std::filesystem::path home_dir;
    std::filesystem::path catalog_file;
    std::filesystem::path log_file;
    std::string log_level = "info";
    std::string mount_root = "/mnt";
    std::chrono::milliseconds status_duration{3000};

    using EnvLookup = std::function<const char*(const char*)>;

    // Throws std::runtime_error if no home directory can be found
    static Settings resolve(const EnvLookup& getenv_fn);
    static Settings from_environment();
};

// $HOME, falling back to the password database. Throws std::runtime_error.
std::filesystem::path resolve_home_directory(const Settings::EnvLookup& getenv_fn);

} // namespace plx
