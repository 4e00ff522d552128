#include "internal/log.hpp"

#include <lise/errors.hpp>
#include <lise/startup.hpp>

namespace lise
{

LaunchingStartupHook::LaunchingStartupHook(std::shared_ptr<AgentLauncher> launcher)
    : launcher_(std::move(launcher))
{
    if (!launcher_)
        throw LiseError("LaunchingStartupHook requires a launcher");
}

void LaunchingStartupHook::on_setup()
{
    const auto& callback = launcher_->options().log_callback;

    // Agent failures are reported, never propagated: the shell runs without it
    try
    {
        launcher_->launch();
        internal::emit_log(callback, LogLevel::Info, "Agent started successfully");
        internal::emit_log(callback, LogLevel::Info,
                           "Agent available at " + launcher_->options().endpoint.url());
    }
    catch (const std::exception& e)
    {
        internal::emit_log(callback, LogLevel::Error,
                           std::string("Failed to start agent: ") + e.what());
        internal::emit_log(callback, LogLevel::Error,
                           "Please ensure the agent is built and available.");
    }
}

AttachingStartupHook::AttachingStartupHook(LauncherOptions options) : options_(std::move(options))
{
}

void AttachingStartupHook::on_setup()
{
    internal::emit_log(options_.log_callback, LogLevel::Info,
                       "Assuming agent is already running at " + options_.endpoint.url());
}

std::unique_ptr<StartupHook> make_startup_hook(const ShellConfig& config,
                                               std::shared_ptr<AgentLauncher> launcher)
{
    switch (config.startup_mode)
    {
    case StartupMode::Attach:
        return std::make_unique<AttachingStartupHook>(config.launcher);
    case StartupMode::Launch:
        break;
    }

    if (!launcher)
        launcher = std::make_shared<AgentLauncher>(config.launcher);
    return std::make_unique<LaunchingStartupHook>(std::move(launcher));
}

} // namespace lise
