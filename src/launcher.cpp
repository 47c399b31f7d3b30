#include "launcher.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cassert>
#include <cctype>
#include <exception>
#include <format>
#include <utility>

namespace plx {

namespace {

constexpr const char* kWhitespace = " \t";

// First word of a command line and the rest of it
std::pair<std::string, std::string> split_command(const std::string& command) {
    const size_t begin = command.find_first_not_of(kWhitespace);
    if (begin == std::string::npos) return {};

    const size_t end = command.find_first_of(kWhitespace, begin);
    std::string program = command.substr(begin, end == std::string::npos ? std::string::npos : end - begin);

    std::string args;
    if (end != std::string::npos) {
        const size_t args_begin = command.find_first_not_of(kWhitespace, end);
        if (args_begin != std::string::npos) {
            const size_t args_end = command.find_last_not_of(kWhitespace);
            args = command.substr(args_begin, args_end - args_begin + 1);
        }
    }
    return {std::move(program), std::move(args)};
}

std::string join_argv(const std::vector<std::string>& argv) {
    std::string result;
    for (const auto& arg : argv) {
        if (!result.empty()) result += ' ';
        result += arg;
    }
    return result;
}

} // namespace

std::string_view to_string(LaunchMethod method) {
    switch (method) {
        case LaunchMethod::None: return "none";
        case LaunchMethod::NativeShell: return "native shell";
        case LaunchMethod::ForeignShell: return "PowerShell";
        case LaunchMethod::ForeignStartProcess: return "PowerShell Start-Process";
        case LaunchMethod::LinkHandler: return "cmd.exe start";
    }
    return "unknown";
}

std::string Launcher::quote_posix(const std::string& s) {
    std::string result = "'";
    for (char c : s) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += '\'';
    return result;
}

std::string Launcher::quote_powershell(const std::string& s) {
    std::string result = "'";
    for (char c : s) {
        if (c == '\'') result += '\'';  // '' inside a single-quoted string
        result += c;
    }
    result += '\'';
    return result;
}

std::string Launcher::escape_cmd(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (c == '^' || c == '&' || c == '|' || c == '<' || c == '>') result += '^';
        result += c;
    }
    return result;
}

bool Launcher::is_foreign_executable(const std::string& command) {
    std::string program = split_command(command).first;
    std::transform(program.begin(), program.end(), program.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return program.size() > 4 && program.ends_with(".exe");
}

LaunchPlan NativeHost::plan(const Project& project, const LauncherConfig& config) const {
    LaunchPlan plan;
    plan.method = LaunchMethod::NativeShell;
    plan.request.argv = {
        config.native_shell,
        "-c",
        std::format("cd {} && {}", Launcher::quote_posix(path), project.command)
    };
    plan.request.working_dir = path;
    // Own process group: quitting or ^C in the dashboard must not take the project down
    plan.request.new_process_group = true;
    return plan;
}

LaunchPlan ForeignHost::plan(const Project& project, const LauncherConfig& config) const {
    LaunchPlan plan;
    std::string script = std::format("Set-Location {}", Launcher::quote_powershell(path));

    if (Launcher::is_foreign_executable(project.command)) {
        // Start-Process detaches the program from the shell
        auto [program, args] = split_command(project.command);
        script += std::format("; Start-Process {}", Launcher::quote_powershell(program));
        if (!args.empty()) {
            script += std::format(" -ArgumentList {}", Launcher::quote_powershell(args));
        }
        plan.method = LaunchMethod::ForeignStartProcess;
    } else {
        // Scripts (python, node, ...) run directly in the shell
        script += std::format("; {}", project.command);
        plan.method = LaunchMethod::ForeignShell;
    }

    plan.request.argv = {config.foreign_shell, "-Command", std::move(script)};
    plan.request.new_process_group = true;
    return plan;
}

Launcher::Launcher(IProcessSpawner* spawner, LauncherConfig config)
    : spawner_(spawner)
    , config_(std::move(config))
{
    assert(spawner_ != nullptr);
}

bool Launcher::match_drive_mount(const std::string& path, char& drive, std::string& rest) const {
    std::string root = config_.mount_root;
    while (!root.empty() && root.back() == '/') {
        root.pop_back();
    }

    const std::string prefix = root + "/";
    if (path.size() <= prefix.size() || !path.starts_with(prefix)) {
        return false;
    }

    const unsigned char letter = static_cast<unsigned char>(path[prefix.size()]);
    if (!std::isalpha(letter)) {
        return false;
    }

    // "/mnt/c" or "/mnt/c/...", but not "/mnt/code"
    const size_t after = prefix.size() + 1;
    if (after < path.size() && path[after] != '/') {
        return false;
    }

    drive = static_cast<char>(std::toupper(letter));
    rest = path.substr(after);
    return true;
}

HostTarget Launcher::classify_host(const std::string& path) const {
    char drive = 0;
    std::string rest;
    if (!match_drive_mount(path, drive, rest)) {
        return NativeHost{path};
    }

    std::replace(rest.begin(), rest.end(), '/', '\\');
    if (rest.empty()) rest = "\\";
    return ForeignHost{std::string(1, drive) + ":" + rest};
}

LaunchPlan Launcher::plan_launch(const Project& project) const {
    const HostTarget target = classify_host(project.path);
    return std::visit([&](const auto& host) { return host.plan(project, config_); }, target);
}

LaunchPlan Launcher::plan_open_link(const Project& project) const {
    LaunchPlan plan;
    plan.method = LaunchMethod::LinkHandler;
    // Left unquoted: a quoted first argument would become start's window title
    plan.request.argv = {config_.link_opener, "/c", "start", Launcher::escape_cmd(project.link)};
    plan.request.new_process_group = true;
    return plan;
}

LaunchOutcome Launcher::launch(const Project& project) {
    const LaunchPlan plan = plan_launch(project);
    spdlog::info("Launching '{}' via {}: {}", project.name, to_string(plan.method), join_argv(plan.request.argv));

    SpawnResult result;
    try {
        result = spawner_->spawn(plan.request);
    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = e.what();
    }

    LaunchOutcome outcome;
    outcome.method = plan.method;

    if (!result.success) {
        spdlog::warn("Launch of '{}' failed: {}", project.name, result.error_message);
        outcome.status = LaunchStatus::Failed;
        outcome.message = std::format("Failed to launch {}: {}", project.name, result.error_message);
        return outcome;
    }

    spdlog::info("Launched '{}' as pid {}", project.name, result.pid);
    outcome.status = LaunchStatus::Launched;
    switch (plan.method) {
        case LaunchMethod::ForeignShell:
        case LaunchMethod::ForeignStartProcess:
            outcome.message = std::format("Launched {} (Windows via {})", project.name, to_string(plan.method));
            break;
        default:
            outcome.message = std::format("Launched {}", project.name);
            break;
    }
    return outcome;
}

LaunchOutcome Launcher::open_link(const Project& project) {
    LaunchOutcome outcome;

    if (project.link.empty()) {
        outcome.status = LaunchStatus::NoLink;
        outcome.method = LaunchMethod::None;
        outcome.message = "No link associated";
        return outcome;
    }

    const LaunchPlan plan = plan_open_link(project);
    spdlog::info("Opening link for '{}': {}", project.name, project.link);

    SpawnResult result;
    try {
        result = spawner_->spawn(plan.request);
    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = e.what();
    }

    outcome.method = plan.method;
    if (!result.success) {
        spdlog::warn("Opening link for '{}' failed: {}", project.name, result.error_message);
        outcome.status = LaunchStatus::Failed;
        outcome.message = std::format("Failed to open link: {}", result.error_message);
        return outcome;
    }

    outcome.status = LaunchStatus::Launched;
    outcome.message = std::format("Opened {} link in browser", project.name);
    return outcome;
}

} // namespace plx
