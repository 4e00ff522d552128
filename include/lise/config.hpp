#ifndef LISE_CONFIG_HPP
#define LISE_CONFIG_HPP

#include <filesystem>
#include <lise/types.hpp>
#include <optional>

namespace lise
{

/// File looked up beside the executable when no --config is given
inline constexpr const char DEFAULT_CONFIG_FILE[] = "lise-desktop.json";

/// Build a config from a parsed JSON document. Unknown keys are ignored.
/// Throws ConfigError on wrong types or out-of-range values.
ShellConfig config_from_json(const json& j);

/// Serialize the file-representable parts of a config (callbacks are dropped)
json config_to_json(const ShellConfig& config);

/// Read and parse a config file. Throws ConfigError if unreadable or malformed.
ShellConfig load_config_file(const std::filesystem::path& path);

/**
 * Resolve the effective shell configuration.
 *
 * With `explicit_path` the file must exist. Without it, DEFAULT_CONFIG_FILE next to
 * the executable is used when present, defaults otherwise. Environment overrides
 * (LISE_STARTUP_MODE) are applied last.
 */
ShellConfig load_config(const std::optional<std::filesystem::path>& explicit_path = std::nullopt);

/// Apply LISE_STARTUP_MODE. Throws ConfigError on an unknown value.
void apply_environment_overrides(ShellConfig& config);

} // namespace lise

#endif // LISE_CONFIG_HPP
