#include "internal/log.hpp"

#include <csignal>
#include <lise/application.hpp>
#include <lise/version.hpp>
#include <pthread.h>
#include <signal.h>

namespace lise
{

namespace
{
volatile sig_atomic_t g_stop_signal = 0;

extern "C" void handle_stop_signal(int sig)
{
    g_stop_signal = sig;
}
} // namespace

Application::Application(ShellConfig config)
    : config_(std::move(config)), hook_(make_startup_hook(config_))
{
}

Application::Application(ShellConfig config, std::unique_ptr<StartupHook> hook)
    : config_(std::move(config)), hook_(std::move(hook))
{
}

bool Application::setup()
{
    const auto& callback = config_.launcher.log_callback;
    internal::emit_log(callback, LogLevel::Info, "LISE Agent Desktop starting...");
    internal::emit_log(callback, LogLevel::Info,
                       "Version " + version_string() + ", startup mode " +
                           to_string(config_.startup_mode));

    if (hook_)
        hook_->on_setup();

    // Setup succeeds whatever happened to the agent
    set_up_ = true;
    return true;
}

int Application::run()
{
    g_stop_signal = 0;

    struct sigaction sa = {};
    sa.sa_handler = handle_stop_signal;
    sigemptyset(&sa.sa_mask);
    struct sigaction old_int, old_term;
    sigaction(SIGINT, &sa, &old_int);
    sigaction(SIGTERM, &sa, &old_term);

    // Block the stop signals outside sigsuspend so none is lost between check and wait
    sigset_t stop_set, old_set;
    sigemptyset(&stop_set);
    sigaddset(&stop_set, SIGINT);
    sigaddset(&stop_set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_set, &old_set);

    sigset_t wait_set = old_set;
    sigdelset(&wait_set, SIGINT);
    sigdelset(&wait_set, SIGTERM);

    while (g_stop_signal == 0)
        sigsuspend(&wait_set);

    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGTERM, &old_term, nullptr);

    const int sig = g_stop_signal;
    internal::emit_log(config_.launcher.log_callback, LogLevel::Info,
                       "Received signal " + std::to_string(sig) + ", shutting down");
    return sig;
}

} // namespace lise
