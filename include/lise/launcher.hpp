#ifndef LISE_LAUNCHER_HPP
#define LISE_LAUNCHER_HPP

#include <filesystem>
#include <lise/types.hpp>

namespace lise
{

/// Absolute path of the running executable.
/// Throws LiseError if the platform cannot report it.
std::filesystem::path current_executable_path();

/**
 * Derive the agent path from the shell executable's location.
 *
 * Release: `<exe dir>/<executable_name>`.
 * Debug: `<exe dir>` minus `debug_parent_levels` trailing components, then
 * `debug_relative_dir`, then `<executable_name>`.
 *
 * Pure path arithmetic: nothing is checked on disk.
 */
std::filesystem::path resolve_agent_path(const std::filesystem::path& executable,
                                         BuildMode mode, const AgentLayout& layout = {});

/**
 * Starts the agent and performs the one-shot liveness check.
 *
 * launch() runs the whole sequence: resolve, verify, spawn, sleep for the startup
 * grace, poll once. Failures are thrown:
 * - AgentNotFoundError: path missing (nothing is spawned), not allowlisted, hash mismatch
 * - ProcessError: spawn failed, agent exited during the grace period, or the status
 *   poll failed
 *
 * A surviving agent is released: it keeps running after launch() returns and after
 * the shell exits.
 */
class AgentLauncher
{
  public:
    explicit AgentLauncher(LauncherOptions options = {});
    virtual ~AgentLauncher() = default;

    AgentLauncher(const AgentLauncher&) = delete;
    AgentLauncher& operator=(const AgentLauncher&) = delete;

    virtual LaunchResult launch();

    // Explicit path, then LISE_AGENT_PATH, then the layout derivation
    std::filesystem::path find_agent() const;

    const LauncherOptions& options() const
    {
        return options_;
    }

  protected:
    void log(LogLevel level, const std::string& message) const;

  private:
    LauncherOptions options_;

    void verify_agent(const std::filesystem::path& agent_path) const;
};

} // namespace lise

#endif // LISE_LAUNCHER_HPP
