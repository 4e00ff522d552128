#ifndef LISE_INTERNAL_LAUNCHER_AGENT_VERIFICATION_HPP
#define LISE_INTERNAL_LAUNCHER_AGENT_VERIFICATION_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lise::internal
{

/// Compute SHA256 hash of a file
/// Returns hex-encoded SHA256 hash (64 characters) or std::nullopt on error
std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path);

/// Verify agent path is in the allowlist
/// If allowlist is empty, returns true (no restriction)
bool verify_agent_path_allowed(const std::filesystem::path& agent_path,
                               const std::vector<std::string>& allowed_paths);

/// Verify agent hash matches expected SHA256
/// If expected_hash is nullopt, returns true (no hash check)
bool verify_agent_hash(const std::filesystem::path& agent_path,
                       const std::optional<std::string>& expected_hash,
                       std::string& error_message);

} // namespace lise::internal

#endif // LISE_INTERNAL_LAUNCHER_AGENT_VERIFICATION_HPP
