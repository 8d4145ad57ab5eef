#include "child_process.hpp"

#include <tabhost/logger.hpp>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

extern char** environ;

namespace tabhost
{

namespace
{

void replace_all(std::string& text, const std::string& token, const std::string& value)
{
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos)
    {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

bool is_executable_file(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return false;
    return ::access(path.c_str(), X_OK) == 0;
}

}   // namespace

std::vector<std::string> LaunchCommand::build_argv(int width, int height) const
{
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(program);
    for (std::string arg : args)
    {
        replace_all(arg, "{width}", std::to_string(width));
        replace_all(arg, "{height}", std::to_string(height));
        argv.push_back(std::move(arg));
    }
    return argv;
}

const char* spawn_error_to_string(SpawnError error)
{
    switch (error)
    {
        case SpawnError::None:
            return "none";
        case SpawnError::ExecutableNotFound:
            return "executable not found";
        case SpawnError::LaunchFailed:
            return "launch failed";
    }
    return "unknown";
}

std::optional<std::filesystem::path> find_in_path(const std::string& program)
{
    if (program.empty())
        return std::nullopt;

    if (program.find('/') != std::string::npos)
    {
        if (is_executable_file(program))
            return std::filesystem::path(program);
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string search   = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= search.size())
    {
        size_t      end = search.find(':', start);
        std::string dir = search.substr(start, end == std::string::npos ? end : end - start);
        if (dir.empty())
            dir = ".";

        std::filesystem::path candidate = std::filesystem::path(dir) / program;
        if (is_executable_file(candidate))
            return candidate;

        if (end == std::string::npos)
            break;
        start = end + 1;
    }
    return std::nullopt;
}

// ─── ChildProcessHandle ──────────────────────────────────────────────────────

ChildProcessHandle::~ChildProcessHandle()
{
    terminate();
}

ChildProcessHandle::ChildProcessHandle(ChildProcessHandle&& other) noexcept
    : pid_(std::exchange(other.pid_, 0)),
      original_pid_(other.original_pid_),
      exit_status_(other.exit_status_)
{
}

ChildProcessHandle& ChildProcessHandle::operator=(ChildProcessHandle&& other) noexcept
{
    if (this != &other)
    {
        terminate();
        pid_          = std::exchange(other.pid_, 0);
        original_pid_ = other.original_pid_;
        exit_status_  = other.exit_status_;
    }
    return *this;
}

ChildProcessHandle ChildProcessHandle::spawn(const std::vector<std::string>& argv,
                                             const std::filesystem::path&    working_directory,
                                             SpawnError&                     error)
{
    error = SpawnError::None;

    if (argv.empty() || argv.front().empty())
    {
        error = SpawnError::ExecutableNotFound;
        return {};
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv)
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    c_argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);

    if (!working_directory.empty())
    {
        std::error_code ec;
        if (std::filesystem::is_directory(working_directory, ec))
        {
            posix_spawn_file_actions_addchdir_np(&actions, working_directory.c_str());
        }
        else
        {
            TABHOST_LOG_WARN("process",
                             "Working directory {} does not exist, using the current directory",
                             working_directory.string());
        }
    }

    // Children start with a clean signal mask even if the spawning thread
    // has signals blocked.
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setsigmask(&attr, &empty_mask);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK);

    pid_t pid = 0;
    int   ret = posix_spawnp(&pid, c_argv[0], &actions, &attr, c_argv.data(), environ);

    posix_spawnattr_destroy(&attr);
    posix_spawn_file_actions_destroy(&actions);

    if (ret != 0)
    {
        error = (ret == ENOENT || ret == EACCES || ret == ENOTDIR) ? SpawnError::ExecutableNotFound
                                                                   : SpawnError::LaunchFailed;
        TABHOST_LOG_ERROR("process",
                          "posix_spawnp({}) failed: {} ({})",
                          argv.front(),
                          std::strerror(ret),
                          spawn_error_to_string(error));
        return {};
    }

    TABHOST_LOG_INFO("process", "Spawned {} pid={}", argv.front(), pid);
    return ChildProcessHandle(pid);
}

bool ChildProcessHandle::is_running()
{
    if (pid_ <= 0)
        return false;

    int   status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == 0)
        return true;

    if (result == pid_)
    {
        record_exit(status);
    }
    else
    {
        // ECHILD: reaped elsewhere. Either way it is not ours any more.
        TABHOST_LOG_DEBUG("process", "waitpid({}) failed: {}", pid_, std::strerror(errno));
    }
    pid_ = 0;
    return false;
}

bool ChildProcessHandle::terminate()
{
    if (pid_ <= 0)
        return true;

    if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH)
    {
        TABHOST_LOG_DEBUG("process", "kill({}) failed: {}", pid_, std::strerror(errno));
    }

    int   status = 0;
    pid_t result = 0;
    do
    {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == pid_)
        record_exit(status);
    else
        TABHOST_LOG_DEBUG("process", "reap of pid={} skipped: {}", pid_, std::strerror(errno));

    TABHOST_LOG_DEBUG("process", "Terminated pid={}", pid_);
    pid_ = 0;
    return true;
}

void ChildProcessHandle::record_exit(int status)
{
    if (WIFEXITED(status))
    {
        exit_status_ = WEXITSTATUS(status);
        TABHOST_LOG_INFO("process", "pid={} exited with code {}", pid_, *exit_status_);
    }
    else if (WIFSIGNALED(status))
    {
        exit_status_ = 128 + WTERMSIG(status);
        TABHOST_LOG_INFO("process", "pid={} killed by signal {}", pid_, WTERMSIG(status));
    }
}

}   // namespace tabhost
