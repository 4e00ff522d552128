#ifndef LISE_INTERNAL_LOG_HPP
#define LISE_INTERNAL_LOG_HPP

#include <iostream>
#include <lise/types.hpp>
#include <optional>
#include <string>

namespace lise::internal
{

// Route a status line to the installed callback, or to the console
inline void emit_log(const std::optional<LogCallback>& callback, LogLevel level,
                     const std::string& message)
{
    if (callback && *callback)
    {
        (*callback)(level, message);
        return;
    }

    switch (level)
    {
    case LogLevel::Info:
        std::cout << message << std::endl;
        break;
    case LogLevel::Warning:
        std::cerr << "Warning: " << message << std::endl;
        break;
    case LogLevel::Error:
        std::cerr << "Error: " << message << std::endl;
        break;
    }
}

} // namespace lise::internal

#endif // LISE_INTERNAL_LOG_HPP
