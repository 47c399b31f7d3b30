#include "settings.hpp"
#include <cstdlib>
#include <pwd.h>
#include <stdexcept>
#include <unistd.h>
#include <vector>

namespace plx {

namespace {

std::string env_or(const Settings::EnvLookup& getenv_fn, const char* name, const std::string& fallback) {
    const char* value = getenv_fn(name);
    if (value && *value) return value;
    return fallback;
}

} // namespace

std::filesystem::path resolve_home_directory(const Settings::EnvLookup& getenv_fn) {
    if (const char* home = getenv_fn("HOME"); home && *home) {
        return home;
    }

    // Fallback: password database entry for this uid
    long buf_size = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (buf_size <= 0) buf_size = 16384;
    std::vector<char> buffer(static_cast<size_t>(buf_size));

    passwd pwd{};
    passwd* result = nullptr;
    if (getpwuid_r(getuid(), &pwd, buffer.data(), buffer.size(), &result) == 0 && result
        && result->pw_dir && *result->pw_dir) {
        return result->pw_dir;
    }

    throw std::runtime_error("cannot determine home directory (HOME is unset and no passwd entry)");
}

Settings Settings::resolve(const EnvLookup& getenv_fn) {
    Settings settings;
    settings.home_dir = resolve_home_directory(getenv_fn);

    const auto default_catalog = settings.home_dir / ".local" / "bin" / "project-launcher.json";
    settings.catalog_file = env_or(getenv_fn, "PLX_CATALOG", default_catalog.string());

    std::filesystem::path state_dir = settings.home_dir / ".local" / "state";
    if (const char* xdg_state = getenv_fn("XDG_STATE_HOME"); xdg_state && *xdg_state) {
        state_dir = xdg_state;
    }
    settings.log_file = env_or(getenv_fn, "PLX_LOG_FILE", (state_dir / "plx" / "plx.log").string());

    settings.log_level = env_or(getenv_fn, "PLX_LOG_LEVEL", settings.log_level);
    settings.mount_root = env_or(getenv_fn, "PLX_MOUNT_ROOT", settings.mount_root);
    return settings;
}

Settings Settings::from_environment() {
    return resolve([](const char* name) { return std::getenv(name); });
}

} // namespace plx
