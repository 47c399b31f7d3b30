#pragma once

#include "../interfaces/i_process_spawner.hpp"
#include <string>

namespace plx {

// fork/exec spawner. The child optionally leads a new process group,
// changes directory, gets /dev/null for stdio and execs. Failures before
// exec come back to the parent through a close-on-exec pipe.
class LinuxProcessSpawner : public IProcessSpawner {
public:
    LinuxProcessSpawner() = default;
    ~LinuxProcessSpawner() override = default;

    SpawnResult spawn(const SpawnRequest& request) override;

private:
    enum class Stage : int {
        ProcessGroup = 1,
        ChangeDirectory,
        Exec
    };

    struct ChildError {
        Stage stage;
        int error;
    };

    [[noreturn]] static void report_and_exit(int fd, Stage stage, int err);
    static std::string describe_error(Stage stage, int err, const SpawnRequest& request);
};

} // namespace plx
