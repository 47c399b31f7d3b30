#pragma once

#include <filesystem>
#include <string>

namespace plx {

// Installs a file logger as the spdlog default logger. The terminal belongs
// to ncurses, so nothing is logged to stdout/stderr. If the file cannot be
// opened, log output is discarded.
void init_logging(const std::filesystem::path& log_file, const std::string& level);

void shutdown_logging();

} // namespace plx
