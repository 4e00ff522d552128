// POSIX implementation of subprocess process management
// For Linux and macOS

#include "process.hpp"

#include <cstdlib>
#include <cstring>
#include <errno.h>
#include <signal.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace lise
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    bool detached = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

static std::string get_errno_message()
{
    return std::strerror(errno);
}

static void close_pipe(int (&fds)[2])
{
    for (int& fd : fds)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }
}

static int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (handle_ && !handle_->detached && is_running())
    {
        terminate();
        try
        {
            wait();
        }
        catch (const std::exception&)
        {
            // Already reaped elsewhere; nothing left to collect
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (handle_->pid != 0)
        throw std::runtime_error("Process already spawned");

    int stdout_pipe[2] = {-1, -1};
    if (options.redirect_stdout && pipe(stdout_pipe) != 0)
        throw std::runtime_error("Failed to create stdout pipe: " + get_errno_message());

    int stderr_pipe[2] = {-1, -1};
    if (options.redirect_stderr && pipe(stderr_pipe) != 0)
    {
        std::string message = "Failed to create stderr pipe: " + get_errno_message();
        close_pipe(stdout_pipe);
        throw std::runtime_error(message);
    }

    // Build argv before forking so the child only calls async-signal-safe functions
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        std::string message = "Failed to fork process: " + get_errno_message();
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        throw std::runtime_error(message);
    }

    if (pid == 0)
    {
        // Child process

        if (options.redirect_stdout)
        {
            ::close(stdout_pipe[0]);
            if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
                _exit(127);
            ::close(stdout_pipe[1]);
        }

        if (options.redirect_stderr)
        {
            ::close(stderr_pipe[0]);
            if (dup2(stderr_pipe[1], STDERR_FILENO) < 0)
                _exit(127);
            ::close(stderr_pipe[1]);
        }

        if (!options.working_directory.empty())
        {
            if (chdir(options.working_directory.c_str()) != 0)
                _exit(127);
        }

        if (!options.inherit_environment)
        {
#if defined(__linux__) && defined(_GNU_SOURCE)
            clearenv();
#else
            extern char** environ;
            if (environ)
                environ[0] = nullptr;
#endif
        }
        for (const auto& [key, value] : options.environment)
            setenv(key.c_str(), value.c_str(), 1);

        // No PATH search: the caller names the exact file to run
        execv(executable.c_str(), argv.data());

        // If execv returns, it failed
        _exit(127);
    }

    // Parent process: keep the read ends only

    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]);
        stdout_ = std::make_unique<PipeHandle>();
        stdout_->fd = stdout_pipe[0];
    }

    if (options.redirect_stderr)
    {
        ::close(stderr_pipe[1]);
        stderr_ = std::make_unique<PipeHandle>();
        stderr_->fd = stderr_pipe[0];
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->detached = false;
    handle_->exit_code = -1;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0)
        return false;

    if (!handle_->running)
        return false;

    // Check process status using kill with signal 0
    int result = ::kill(handle_->pid, 0);
    if (result == 0)
        return true;

    if (errno == ESRCH)
        return false;

    // EPERM: the process exists but belongs to someone else
    return true;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        throw std::runtime_error("Process not spawned");

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    else if (result == 0)
    {
        // Still running
        return std::nullopt;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        throw std::runtime_error("Process not spawned");

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::detach()
{
    if (handle_)
        handle_->detached = true;
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

} // namespace subprocess
} // namespace lise
