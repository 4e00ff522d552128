#ifndef LISE_APPLICATION_HPP
#define LISE_APPLICATION_HPP

#include <lise/startup.hpp>
#include <lise/types.hpp>
#include <memory>

namespace lise
{

/**
 * The desktop shell.
 *
 * setup() runs the startup hook once and always succeeds; agent problems are only
 * logged. run() blocks until SIGINT or SIGTERM. The agent is not stopped on exit.
 */
class Application
{
  public:
    explicit Application(ShellConfig config);
    Application(ShellConfig config, std::unique_ptr<StartupHook> hook);

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    bool setup();

    // Returns the signal number that ended the loop
    int run();

    bool is_set_up() const
    {
        return set_up_;
    }

    const ShellConfig& config() const
    {
        return config_;
    }

  private:
    ShellConfig config_;
    std::unique_ptr<StartupHook> hook_;
    bool set_up_ = false;
};

} // namespace lise

#endif // LISE_APPLICATION_HPP
