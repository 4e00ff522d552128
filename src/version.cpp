#include <lise/types.hpp>
#include <lise/version.hpp>

namespace lise
{

std::string version_string()
{
    return std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

std::string build_description()
{
    return "lise-desktop " + version_string() + " (" + to_string(default_build_mode()) + ")";
}

} // namespace lise
