#ifndef LISE_VERSION_HPP
#define LISE_VERSION_HPP

#include <string>

namespace lise
{

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
// Agent API version: 1.0.0 (keep shell in sync)

std::string version_string();

// e.g. "lise-desktop 1.0.0 (release)"
std::string build_description();

} // namespace lise

#endif // LISE_VERSION_HPP
