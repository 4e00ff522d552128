#include "agent_verification.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace lise::internal
{

namespace
{
std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_hex_digest(const std::string& value)
{
    return value.length() == 2 * SHA256_DIGEST_LENGTH &&
           std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}
} // namespace

std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file)
        return std::nullopt;

    SHA256_CTX sha256;
    if (!SHA256_Init(&sha256))
        return std::nullopt;

    const size_t BUFFER_SIZE = 8192;
    char buffer[BUFFER_SIZE];
    while (file.read(buffer, BUFFER_SIZE) || file.gcount() > 0)
        if (!SHA256_Update(&sha256, buffer, static_cast<size_t>(file.gcount())))
            return std::nullopt;

    if (file.bad())
        return std::nullopt;

    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (!SHA256_Final(hash, &sha256))
        return std::nullopt;

    std::ostringstream oss;
    for (size_t i = 0; i < SHA256_DIGEST_LENGTH; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);

    return oss.str();
}

bool verify_agent_path_allowed(const std::filesystem::path& agent_path,
                               const std::vector<std::string>& allowed_paths)
{
    if (allowed_paths.empty())
        return true;

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path normalized_agent = fs::canonical(agent_path, ec);
    if (ec)
        normalized_agent = agent_path.lexically_normal();

    for (const auto& allowed : allowed_paths)
    {
        fs::path normalized_allowed = fs::canonical(allowed, ec);
        if (ec)
            normalized_allowed = fs::path(allowed).lexically_normal();

        if (normalized_agent == normalized_allowed)
            return true;
    }

    return false;
}

bool verify_agent_hash(const std::filesystem::path& agent_path,
                       const std::optional<std::string>& expected_hash,
                       std::string& error_message)
{
    if (!expected_hash)
        return true;

    if (!is_hex_digest(*expected_hash))
    {
        error_message = "Invalid hash format: expected 64-character hex string";
        return false;
    }

    auto actual_hash = compute_file_sha256(agent_path);
    if (!actual_hash)
    {
        error_message = "Failed to compute file hash";
        return false;
    }

    std::string expected_lower = to_lower(*expected_hash);
    if (expected_lower != *actual_hash)
    {
        error_message =
            "Agent hash mismatch: expected " + expected_lower + " but got " + *actual_hash;
        return false;
    }

    return true;
}

} // namespace lise::internal
