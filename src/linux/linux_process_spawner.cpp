#include "linux_process_spawner.hpp"
#include <spdlog/spdlog.h>
#include <format>
#include <vector>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace plx {

void LinuxProcessSpawner::report_and_exit(int fd, Stage stage, int err) {
    ChildError child_error{stage, err};
    (void)!write(fd, &child_error, sizeof(child_error));
    _exit(127);
}

std::string LinuxProcessSpawner::describe_error(Stage stage, int err, const SpawnRequest& request) {
    switch (stage) {
        case Stage::ProcessGroup:
            return std::format("cannot create process group: {}", strerror(err));

        case Stage::ChangeDirectory:
            return std::format("cannot change to directory '{}': {}", request.working_dir, strerror(err));

        case Stage::Exec:
            switch (err) {
                case ENOENT:
                    return std::format("{}: command not found", request.argv[0]);
                case EACCES:
                    return std::format("{}: permission denied", request.argv[0]);
                default:
                    return std::format("{}: {} (errno {})", request.argv[0], strerror(err), err);
            }
    }
    return std::format("spawn failed: {} (errno {})", strerror(err), err);
}

SpawnResult LinuxProcessSpawner::spawn(const SpawnRequest& request) {
    SpawnResult result;

    if (request.argv.empty() || request.argv[0].empty()) {
        result.error_message = "Empty command";
        return result;
    }

    // Everything the child needs is prepared up front; after fork it only makes syscalls
    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const char* working_dir = request.working_dir.empty() ? nullptr : request.working_dir.c_str();

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) == -1) {
        result.error_message = std::format("cannot create pipe: {}", strerror(errno));
        return result;
    }

    const pid_t pid = fork();
    if (pid == -1) {
        const int err = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        result.error_message = std::format("fork failed: {}", strerror(err));
        return result;
    }

    if (pid == 0) {
        close(err_pipe[0]);

        if (request.new_process_group && setpgid(0, 0) == -1) {
            report_and_exit(err_pipe[1], Stage::ProcessGroup, errno);
        }

        // Ignored dispositions survive exec; the dashboard ignores SIGCHLD
        signal(SIGCHLD, SIG_DFL);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGQUIT, SIG_DFL);
        sigset_t empty_set;
        sigemptyset(&empty_set);
        sigprocmask(SIG_SETMASK, &empty_set, nullptr);

        if (working_dir && chdir(working_dir) == -1) {
            report_and_exit(err_pipe[1], Stage::ChangeDirectory, errno);
        }

        // Keep the child off the dashboard's terminal
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }

        execvp(argv[0], argv.data());
        report_and_exit(err_pipe[1], Stage::Exec, errno);
    }

    close(err_pipe[1]);

    // Also set from the parent so the group exists before we return.
    // EACCES here only means the child already exec'd, after doing it itself.
    if (request.new_process_group && setpgid(pid, pid) == -1 && errno != EACCES && errno != ESRCH) {
        spdlog::warn("setpgid({}) from parent failed: {}", pid, strerror(errno));
    }

    ChildError child_error{};
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_error, sizeof(child_error));
    } while (n == -1 && errno == EINTR);
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_error))) {
        // Child never exec'd; reap it (no-op when SIGCHLD is ignored)
        waitpid(pid, nullptr, 0);
        result.success = false;
        result.error_message = describe_error(child_error.stage, child_error.error, request);
        return result;
    }

    // Pipe closed by exec: the child is running on its own
    result.success = true;
    result.pid = pid;
    return result;
}

} // namespace plx
