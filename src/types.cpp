#include <algorithm>
#include <cctype>
#include <lise/types.hpp>

namespace lise
{

namespace
{
std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
} // namespace

BuildMode default_build_mode()
{
#ifdef NDEBUG
    return BuildMode::Release;
#else
    return BuildMode::Debug;
#endif
}

std::string to_string(BuildMode mode)
{
    return mode == BuildMode::Debug ? "debug" : "release";
}

std::string to_string(StartupMode mode)
{
    return mode == StartupMode::Launch ? "launch" : "attach";
}

std::optional<BuildMode> parse_build_mode(const std::string& value)
{
    const std::string lower = to_lower(value);
    if (lower == "debug")
        return BuildMode::Debug;
    if (lower == "release")
        return BuildMode::Release;
    return std::nullopt;
}

std::optional<StartupMode> parse_startup_mode(const std::string& value)
{
    const std::string lower = to_lower(value);
    if (lower == "launch")
        return StartupMode::Launch;
    if (lower == "attach")
        return StartupMode::Attach;
    return std::nullopt;
}

} // namespace lise
