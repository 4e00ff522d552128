#ifndef LISE_ERRORS_HPP
#define LISE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace lise
{

// Base exception
class LiseError : public std::runtime_error
{
  public:
    explicit LiseError(const std::string& message) : std::runtime_error(message) {}
};

// Agent executable missing, not allowlisted, or failing its integrity check
class AgentNotFoundError : public LiseError
{
  public:
    explicit AgentNotFoundError(const std::string& message) : LiseError(message) {}
};

// Spawn failure, early exit, or failed status check
class ProcessError : public LiseError
{
  public:
    // exit_code is -1 when the process never produced an exit status
    ProcessError(const std::string& message, int exit_code)
        : LiseError(message), exit_code_(exit_code)
    {
    }

    int exit_code() const
    {
        return exit_code_;
    }

  private:
    int exit_code_;
};

// Malformed configuration file or values
class ConfigError : public LiseError
{
  public:
    explicit ConfigError(const std::string& message) : LiseError(message) {}
};

} // namespace lise

#endif // LISE_ERRORS_HPP
