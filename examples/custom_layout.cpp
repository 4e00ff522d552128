/**
 * @file custom_layout.cpp
 * @brief Launch an agent from a non-default build layout
 *
 * Usage: custom_layout [attach]
 *
 * The debug layout here expects the agent two levels above this binary, in
 * services/bin/. Status lines are tagged with their level instead of going
 * straight to the console.
 */

#include <iostream>
#include <lise/lise.hpp>
#include <string>

int main(int argc, char* argv[])
{
    lise::ShellConfig config;
    if (argc > 1 && std::string(argv[1]) == "attach")
        config.startup_mode = lise::StartupMode::Attach;

    config.launcher.layout.debug_parent_levels = 2;
    config.launcher.layout.debug_relative_dir = {"services", "bin"};
    config.launcher.startup_grace = std::chrono::milliseconds(500);
    config.launcher.endpoint.port = 8080;

    config.launcher.log_callback = [](lise::LogLevel level, const std::string& message)
    {
        const char* tag = "[fail] ";
        if (level == lise::LogLevel::Info)
            tag = "[info] ";
        else if (level == lise::LogLevel::Warning)
            tag = "[warn] ";
        std::cout << tag << message << "\n";
    };

    try
    {
        lise::AgentLauncher resolver(config.launcher);
        std::cout << "Agent path for this layout: " << resolver.find_agent().string() << "\n";
    }
    catch (const lise::LiseError& e)
    {
        std::cerr << "Cannot resolve agent path: " << e.what() << "\n";
        return 1;
    }

    lise::Application app(config);
    return app.setup() ? 0 : 1;
}
