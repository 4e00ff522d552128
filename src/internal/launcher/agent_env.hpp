#ifndef LISE_INTERNAL_LAUNCHER_AGENT_ENV_HPP
#define LISE_INTERNAL_LAUNCHER_AGENT_ENV_HPP

#include "../subprocess/process.hpp"

#include <lise/types.hpp>
#include <lise/version.hpp>
#include <string>

namespace lise::internal
{

inline void apply_agent_environment(subprocess::ProcessOptions& proc_opts,
                                    const LauncherOptions& options)
{
    proc_opts.inherit_environment = options.inherit_environment;
    for (const auto& [key, value] : options.environment)
        proc_opts.environment[key] = value;

    // Shell-provided variables (always set)
    proc_opts.environment["LISE_SHELL_VERSION"] = version_string();
    proc_opts.environment["LISE_AGENT_PORT"] = std::to_string(options.endpoint.port);
}

} // namespace lise::internal

#endif // LISE_INTERNAL_LAUNCHER_AGENT_ENV_HPP
