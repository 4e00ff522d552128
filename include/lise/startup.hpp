#ifndef LISE_STARTUP_HPP
#define LISE_STARTUP_HPP

#include <lise/launcher.hpp>
#include <lise/types.hpp>
#include <memory>

namespace lise
{

/**
 * Work run once while the application sets itself up.
 *
 * Hooks report through logging only. on_setup() must not throw for agent
 * failures; the application reports a successful setup regardless.
 */
class StartupHook
{
  public:
    virtual ~StartupHook() = default;

    virtual void on_setup() = 0;

    virtual StartupMode mode() const = 0;
};

/// Spawns the agent and logs the outcome of the liveness check.
class LaunchingStartupHook : public StartupHook
{
  public:
    explicit LaunchingStartupHook(std::shared_ptr<AgentLauncher> launcher);

    void on_setup() override;

    StartupMode mode() const override
    {
        return StartupMode::Launch;
    }

  private:
    std::shared_ptr<AgentLauncher> launcher_;
};

/// Assumes the agent is already serving its endpoint. Never spawns anything.
class AttachingStartupHook : public StartupHook
{
  public:
    explicit AttachingStartupHook(LauncherOptions options);

    void on_setup() override;

    StartupMode mode() const override
    {
        return StartupMode::Attach;
    }

  private:
    LauncherOptions options_;
};

// Factory: picks the hook for config.startup_mode.
// `launcher` replaces the default AgentLauncher built from config.launcher.
std::unique_ptr<StartupHook> make_startup_hook(const ShellConfig& config,
                                               std::shared_ptr<AgentLauncher> launcher = nullptr);

} // namespace lise

#endif // LISE_STARTUP_HPP
