#include "internal/launcher/agent_env.hpp"
#include "internal/launcher/agent_verification.hpp"
#include "internal/log.hpp"
#include "internal/subprocess/process.hpp"

#include <cstdlib>
#include <lise/errors.hpp>
#include <lise/launcher.hpp>
#include <thread>
#include <unistd.h>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

namespace lise
{

namespace fs = std::filesystem;

// exec failures surface as this exit code (see subprocess::Process::spawn)
constexpr int EXEC_FAILED_EXIT_CODE = 127;

fs::path current_executable_path()
{
#if defined(__linux__)
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec)
        throw LiseError("Cannot determine current executable: " + ec.message());
    return exe;
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::string buffer(size, '\0');
    if (_NSGetExecutablePath(buffer.data(), &size) != 0)
        throw LiseError("Cannot determine current executable");
    buffer.resize(std::char_traits<char>::length(buffer.c_str()));

    std::error_code ec;
    fs::path exe = fs::canonical(buffer, ec);
    return ec ? fs::path(buffer) : exe;
#else
    throw LiseError("Cannot determine current executable on this platform");
#endif
}

fs::path resolve_agent_path(const fs::path& executable, BuildMode mode, const AgentLayout& layout)
{
    if (layout.executable_name.empty())
        throw ConfigError("Agent executable name must not be empty");
    if (layout.debug_parent_levels < 0)
        throw ConfigError("debug_parent_levels must be non-negative, got " +
                          std::to_string(layout.debug_parent_levels));

    fs::path agent_path = executable.parent_path();

    if (mode == BuildMode::Debug)
    {
        // Undo the build output nesting, then descend into the agent's dist directory
        for (int i = 0; i < layout.debug_parent_levels; ++i)
            agent_path = agent_path.parent_path();
        for (const auto& segment : layout.debug_relative_dir)
        {
            // An absolute segment would replace the whole path
            if (fs::path(segment).has_root_path())
                throw ConfigError("debug_relative_dir segment must be relative: " + segment);
            agent_path /= segment;
        }
    }

    agent_path /= layout.executable_name;
    return agent_path;
}

// ============================================================================
// AgentLauncher
// ============================================================================

AgentLauncher::AgentLauncher(LauncherOptions options) : options_(std::move(options)) {}

void AgentLauncher::log(LogLevel level, const std::string& message) const
{
    internal::emit_log(options_.log_callback, level, message);
}

fs::path AgentLauncher::find_agent() const
{
    if (!options_.agent_path.empty())
        return fs::path(options_.agent_path);

    if (const char* env_path = std::getenv("LISE_AGENT_PATH");
        env_path != nullptr && env_path[0] != '\0')
        return fs::path(env_path);

    return resolve_agent_path(current_executable_path(), options_.build_mode, options_.layout);
}

void AgentLauncher::verify_agent(const fs::path& agent_path) const
{
    std::error_code ec;
    if (!fs::exists(agent_path, ec) || ec)
        throw AgentNotFoundError("Agent not found at: " + agent_path.string());

    if (fs::is_directory(agent_path, ec))
        throw AgentNotFoundError("Agent path is a directory: " + agent_path.string());

    // Security: Check allowlist if configured
    if (!internal::verify_agent_path_allowed(agent_path, options_.allowed_agent_paths))
        throw AgentNotFoundError("Agent path not in allowlist: " + agent_path.string());

    // Security: Verify hash if configured
    std::string error_msg;
    if (!internal::verify_agent_hash(agent_path, options_.agent_sha256, error_msg))
        throw AgentNotFoundError("Agent integrity check failed: " + error_msg);

    if (access(agent_path.c_str(), X_OK) != 0)
        throw ProcessError("Agent is not executable: " + agent_path.string(), -1);
}

LaunchResult AgentLauncher::launch()
{
    log(LogLevel::Info, "Starting agent...");

    // Anchor a bare name to the working directory so the file checked below is the
    // file that runs
    const fs::path agent_path = fs::absolute(find_agent());
    log(LogLevel::Info, "Looking for agent at: " + agent_path.string());

    verify_agent(agent_path);

    subprocess::ProcessOptions proc_opts;
    proc_opts.redirect_stdout = options_.capture_output;
    proc_opts.redirect_stderr = options_.capture_output;
    if (options_.working_directory)
        proc_opts.working_directory = *options_.working_directory;
    internal::apply_agent_environment(proc_opts, options_);

    subprocess::Process process;
    try
    {
        process.spawn(agent_path.string(), {}, proc_opts);
    }
    catch (const std::exception& e)
    {
        throw ProcessError(std::string("Failed to start agent: ") + e.what(), -1);
    }

    LaunchResult result{agent_path, process.pid()};
    log(LogLevel::Info, "Agent started with PID: " + std::to_string(result.pid));

    // Give a misconfigured agent time to fail fast
    if (options_.sleep_function && *options_.sleep_function)
        (*options_.sleep_function)(options_.startup_grace);
    else
        std::this_thread::sleep_for(options_.startup_grace);

    std::optional<int> exit_code;
    try
    {
        exit_code = process.try_wait();
    }
    catch (const std::exception& e)
    {
        // The child's state is unknown; leave it alone
        process.detach();
        throw ProcessError(std::string("Failed to check agent status: ") + e.what(), -1);
    }

    if (exit_code)
    {
        std::string message = "Agent exited early with status: " + std::to_string(*exit_code);
        if (*exit_code == EXEC_FAILED_EXIT_CODE)
            message += " (the agent could not be executed)";
        throw ProcessError(message, *exit_code);
    }

    log(LogLevel::Info, "Agent is running");

    // No further supervision: the agent outlives this handle and the shell
    process.detach();
    return result;
}

} // namespace lise
