#ifndef LISE_TYPES_HPP
#define LISE_TYPES_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lise
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// ============================================================================
// Modes
// ============================================================================

/// Selects how the agent path is derived from the shell's own location
enum class BuildMode
{
    Debug,
    Release
};

/// Selects what the shell does with the agent on setup
enum class StartupMode
{
    Launch, // Spawn the agent and check it survives the grace period
    Attach  // Assume the agent is already running
};

/// Build mode this binary was compiled in (Debug unless NDEBUG is defined)
BuildMode default_build_mode();

std::string to_string(BuildMode mode);
std::string to_string(StartupMode mode);

/// Parse "debug"/"release" (case-insensitive). Returns nullopt on anything else.
std::optional<BuildMode> parse_build_mode(const std::string& value);

/// Parse "launch"/"attach" (case-insensitive). Returns nullopt on anything else.
std::optional<StartupMode> parse_startup_mode(const std::string& value);

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel
{
    Info,
    Warning,
    Error
};

/// Receives every status line the shell produces.
/// Default sink: Info to stdout, Warning/Error to stderr.
using LogCallback = std::function<void(LogLevel level, const std::string& message)>;

/// Blocks the calling thread for the startup grace interval.
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

// ============================================================================
// Agent description
// ============================================================================

inline constexpr const char DEFAULT_AGENT_EXECUTABLE[] = "lise-agent";

/// Where the agent binary lives relative to the shell binary.
///
/// Debug builds sit in a nested build output directory (e.g. target/debug/bin), so
/// the shell walks up `debug_parent_levels` directories from its own directory and
/// descends into `debug_relative_dir`. Release builds ship the agent beside the shell.
struct AgentLayout
{
    std::string executable_name = DEFAULT_AGENT_EXECUTABLE;
    int debug_parent_levels = 3;
    std::vector<std::string> debug_relative_dir = {"agent", "dist"};
};

/// Local service the agent is expected to expose. Never contacted by the shell.
struct AgentEndpoint
{
    std::string scheme = "http";
    std::string host = "localhost";
    int port = 8000;

    std::string url() const
    {
        return scheme + "://" + host + ":" + std::to_string(port);
    }

    json to_json() const
    {
        return json{{"scheme", scheme}, {"host", host}, {"port", port}};
    }
};

// ============================================================================
// Launcher configuration
// ============================================================================

struct LauncherOptions
{
    AgentLayout layout;
    BuildMode build_mode = default_build_mode();

    // Optional explicit path to the agent executable.
    // If empty, LISE_AGENT_PATH is consulted, then the layout derivation.
    std::string agent_path;

    // How long to let the agent fail fast before the liveness poll
    std::chrono::milliseconds startup_grace{2000};

    // Pipe the agent's stdout/stderr (never read) instead of inheriting ours
    bool capture_output = true;

    std::optional<std::string> working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment =
        true; // If false, only `environment` and the shell variables reach the agent

    // Security: when non-empty, the resolved agent path must be one of these
    std::vector<std::string> allowed_agent_paths;
    // Security: expected SHA-256 of the agent binary (64 hex chars)
    std::optional<std::string> agent_sha256;

    AgentEndpoint endpoint;

    /// Callback invoked for every status line.
    /// If not set, lines go to the console.
    std::optional<LogCallback> log_callback;

    /// Override for the post-spawn wait. Defaults to std::this_thread::sleep_for.
    std::optional<SleepFunction> sleep_function;
};

/// Top-level shell configuration
struct ShellConfig
{
    StartupMode startup_mode = StartupMode::Launch;
    LauncherOptions launcher;
};

/// What a successful launch left behind
struct LaunchResult
{
    std::filesystem::path agent_path;
    int pid = 0;
};

} // namespace lise

#endif // LISE_TYPES_HPP
