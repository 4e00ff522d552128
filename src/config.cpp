#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <lise/config.hpp>
#include <lise/errors.hpp>
#include <lise/launcher.hpp>

namespace lise
{

namespace
{

template <typename T>
T get_field(const json& object, const char* key, const std::string& context)
{
    try
    {
        return object.at(key).get<T>();
    }
    catch (const json::exception& e)
    {
        throw ConfigError("Invalid value for '" + context + key + "': " + e.what());
    }
}

// Integers only: booleans and floats are rejected, and the range is checked
// before narrowing
int64_t get_integer(const json& object, const char* key, const std::string& context,
                    int64_t min_value, int64_t max_value)
{
    const json& value = object.at(key);
    if (!value.is_number_integer())
        throw ConfigError("Invalid value for '" + context + key + "': expected an integer");

    bool in_range = false;
    int64_t result = 0;
    if (value.is_number_unsigned())
    {
        const uint64_t raw = value.get<uint64_t>();
        if (raw <= static_cast<uint64_t>(max_value))
        {
            result = static_cast<int64_t>(raw);
            in_range = result >= min_value;
        }
    }
    else
    {
        result = value.get<int64_t>();
        in_range = result >= min_value && result <= max_value;
    }

    if (!in_range)
        throw ConfigError("'" + context + key + "' out of range: " + value.dump() +
                          " (expected " + std::to_string(min_value) + ".." +
                          std::to_string(max_value) + ")");
    return result;
}

const json* find_object(const json& parent, const char* key)
{
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null())
        return nullptr;
    if (!it->is_object())
        throw ConfigError(std::string("'") + key + "' must be an object");
    return &*it;
}

void read_agent_section(const json& agent, LauncherOptions& options)
{
    const std::string ctx = "agent.";

    if (agent.contains("executable_name"))
        options.layout.executable_name = get_field<std::string>(agent, "executable_name", ctx);
    if (agent.contains("path"))
        options.agent_path = get_field<std::string>(agent, "path", ctx);
    if (agent.contains("debug_parent_levels"))
        options.layout.debug_parent_levels = static_cast<int>(get_integer(
            agent, "debug_parent_levels", ctx, 0, std::numeric_limits<int>::max()));
    if (agent.contains("debug_relative_dir"))
    {
        auto segments = get_field<std::vector<std::string>>(agent, "debug_relative_dir", ctx);
        for (const auto& segment : segments)
            if (std::filesystem::path(segment).has_root_path())
                throw ConfigError("'agent.debug_relative_dir' segment must be relative: " +
                                  segment);
        options.layout.debug_relative_dir = std::move(segments);
    }
    if (agent.contains("startup_grace_ms"))
        options.startup_grace = std::chrono::milliseconds(
            get_integer(agent, "startup_grace_ms", ctx, 0,
                        std::numeric_limits<std::chrono::milliseconds::rep>::max()));
    if (agent.contains("capture_output"))
        options.capture_output = get_field<bool>(agent, "capture_output", ctx);
    if (agent.contains("inherit_environment"))
        options.inherit_environment = get_field<bool>(agent, "inherit_environment", ctx);
    if (agent.contains("working_directory"))
        options.working_directory = get_field<std::string>(agent, "working_directory", ctx);
    if (agent.contains("environment"))
        options.environment =
            get_field<std::map<std::string, std::string>>(agent, "environment", ctx);
    if (agent.contains("allowed_paths"))
        options.allowed_agent_paths =
            get_field<std::vector<std::string>>(agent, "allowed_paths", ctx);
    if (agent.contains("sha256"))
        options.agent_sha256 = get_field<std::string>(agent, "sha256", ctx);

    if (options.layout.executable_name.empty())
        throw ConfigError("'agent.executable_name' must not be empty");
}

void read_endpoint_section(const json& endpoint, AgentEndpoint& out)
{
    const std::string ctx = "endpoint.";

    if (endpoint.contains("scheme"))
        out.scheme = get_field<std::string>(endpoint, "scheme", ctx);
    if (endpoint.contains("host"))
        out.host = get_field<std::string>(endpoint, "host", ctx);
    if (endpoint.contains("port"))
        out.port = static_cast<int>(get_integer(endpoint, "port", ctx, 1, 65535));
}

} // namespace

ShellConfig config_from_json(const json& j)
{
    if (!j.is_object())
        throw ConfigError("Configuration root must be a JSON object");

    ShellConfig config;

    if (j.contains("startup_mode"))
    {
        auto value = get_field<std::string>(j, "startup_mode", "");
        auto mode = parse_startup_mode(value);
        if (!mode)
            throw ConfigError("Unknown startup_mode '" + value + "' (expected launch or attach)");
        config.startup_mode = *mode;
    }

    if (j.contains("build_mode"))
    {
        auto value = get_field<std::string>(j, "build_mode", "");
        auto mode = parse_build_mode(value);
        if (!mode)
            throw ConfigError("Unknown build_mode '" + value + "' (expected debug or release)");
        config.launcher.build_mode = *mode;
    }

    if (const json* agent = find_object(j, "agent"))
        read_agent_section(*agent, config.launcher);

    if (const json* endpoint = find_object(j, "endpoint"))
        read_endpoint_section(*endpoint, config.launcher.endpoint);

    return config;
}

json config_to_json(const ShellConfig& config)
{
    const LauncherOptions& opts = config.launcher;

    json agent = {
        {"executable_name", opts.layout.executable_name},
        {"debug_parent_levels", opts.layout.debug_parent_levels},
        {"debug_relative_dir", opts.layout.debug_relative_dir},
        {"startup_grace_ms", opts.startup_grace.count()},
        {"capture_output", opts.capture_output},
        {"inherit_environment", opts.inherit_environment},
        {"environment", opts.environment},
    };
    if (!opts.agent_path.empty())
        agent["path"] = opts.agent_path;
    if (opts.working_directory)
        agent["working_directory"] = *opts.working_directory;
    if (!opts.allowed_agent_paths.empty())
        agent["allowed_paths"] = opts.allowed_agent_paths;
    if (opts.agent_sha256)
        agent["sha256"] = *opts.agent_sha256;

    return json{{"startup_mode", to_string(config.startup_mode)},
                {"build_mode", to_string(opts.build_mode)},
                {"agent", agent},
                {"endpoint", opts.endpoint.to_json()}};
}

ShellConfig load_config_file(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file)
        throw ConfigError("Cannot open config file: " + path.string());

    json j;
    try
    {
        j = json::parse(file);
    }
    catch (const json::parse_error& e)
    {
        throw ConfigError("Malformed config file " + path.string() + ": " + e.what());
    }

    return config_from_json(j);
}

void apply_environment_overrides(ShellConfig& config)
{
    const char* value = std::getenv("LISE_STARTUP_MODE");
    if (value == nullptr || value[0] == '\0')
        return;

    auto mode = parse_startup_mode(value);
    if (!mode)
        throw ConfigError(std::string("Unknown LISE_STARTUP_MODE '") + value +
                          "' (expected launch or attach)");
    config.startup_mode = *mode;
}

ShellConfig load_config(const std::optional<std::filesystem::path>& explicit_path)
{
    ShellConfig config;

    if (explicit_path)
    {
        config = load_config_file(*explicit_path);
    }
    else
    {
        std::filesystem::path candidate =
            current_executable_path().parent_path() / DEFAULT_CONFIG_FILE;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec) && !ec)
            config = load_config_file(candidate);
    }

    apply_environment_overrides(config);
    return config;
}

} // namespace lise
