#pragma once

#include <tabhost/fwd.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tabhost
{

// Program plus arguments used to start a content process. Arguments may
// contain "{width}" and "{height}", replaced by the initial pixel size.
struct LaunchCommand
{
    std::string              program;
    std::vector<std::string> args;

    // Full argv (program first) with size placeholders expanded.
    std::vector<std::string> build_argv(int width, int height) const;
};

enum class SpawnError
{
    None,
    ExecutableNotFound,
    LaunchFailed,
};

const char* spawn_error_to_string(SpawnError error);

// Looks a program up the way posix_spawnp would. Names containing '/' are
// checked directly. Returns the resolved path if it is an executable file.
std::optional<std::filesystem::path> find_in_path(const std::string& program);

// Exclusive owner of one spawned OS process. Destroying the handle kills and
// reaps the process if it is still owned, so a child can never outlive the
// tab that started it.
class ChildProcessHandle
{
   public:
    ChildProcessHandle() = default;
    ~ChildProcessHandle();

    ChildProcessHandle(const ChildProcessHandle&)            = delete;
    ChildProcessHandle& operator=(const ChildProcessHandle&) = delete;

    ChildProcessHandle(ChildProcessHandle&& other) noexcept;
    ChildProcessHandle& operator=(ChildProcessHandle&& other) noexcept;

    // Start argv[0] (searched on PATH) in working_directory, or in the
    // current directory when it is empty or does not exist. On failure the
    // returned handle holds no process and error describes why.
    static ChildProcessHandle spawn(const std::vector<std::string>& argv,
                                    const std::filesystem::path&    working_directory,
                                    SpawnError&                     error);

    // Non-blocking liveness check (waitpid WNOHANG). Reaps the child once it
    // has exited; from then on the handle holds no process.
    bool is_running();

    // SIGKILL + blocking reap. Idempotent; a process that is already gone
    // counts as success.
    bool terminate();

    bool                has_process() const { return pid_ > 0; }
    ProcessId           pid() const { return pid_; }
    ProcessId           original_pid() const { return original_pid_; }
    std::optional<int>  exit_status() const { return exit_status_; }

   private:
    explicit ChildProcessHandle(ProcessId pid) : pid_(pid), original_pid_(pid) {}

    void record_exit(int status);

    ProcessId          pid_          = 0;
    ProcessId          original_pid_ = 0;
    std::optional<int> exit_status_;
};

}   // namespace tabhost
