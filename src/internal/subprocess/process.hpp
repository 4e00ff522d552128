#ifndef LISE_SUBPROCESS_PROCESS_HPP
#define LISE_SUBPROCESS_PROCESS_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lise
{
namespace subprocess
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

// Process configuration
struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    // Redirected streams go to a pipe whose read end this object owns. The read
    // end closes with the Process, after which a write by the child raises SIGPIPE.
    bool redirect_stdout = true;
    bool redirect_stderr = true;
};

// Main Process class
class Process
{
  public:
    Process();
    ~Process();

    // No copy, move only
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Spawn a process. A failed exec shows up as exit code 127.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    // Process control
    bool is_running() const;
    std::optional<int> try_wait(); // Non-blocking wait, returns exit code if done
    int wait();                    // Blocking wait, returns exit code
    void terminate();              // Graceful termination (SIGTERM)

    // Give up ownership of the child: the destructor will neither terminate nor
    // wait for it.
    void detach();

    // Process ID
    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<PipeHandle> stdout_;
    std::unique_ptr<PipeHandle> stderr_;
};

} // namespace subprocess
} // namespace lise

#endif // LISE_SUBPROCESS_PROCESS_HPP
