/**
 * lise_desktop.cpp - LISE Agent Desktop shell
 *
 * Starts the local LISE agent (or assumes it is already running), then stays up
 * until interrupted. Agent problems are reported but never stop the shell.
 *
 * Usage:
 *   lise-desktop [--config <file>] [--launch | --attach] [--exit-after-setup]
 *                [--version] [--help]
 */

#include <iostream>
#include <lise/lise.hpp>
#include <optional>
#include <string>

namespace
{

constexpr int EXIT_USAGE = 2;

void print_usage(std::ostream& out)
{
    out << "Usage: lise-desktop [options]\n"
        << "\n"
        << "Options:\n"
        << "  --config <file>      Read settings from <file> instead of "
        << lise::DEFAULT_CONFIG_FILE << " next to the binary\n"
        << "  --launch             Start the agent and check that it stays up (default)\n"
        << "  --attach             Assume the agent is already running\n"
        << "  --exit-after-setup   Exit once setup completes instead of waiting for a signal\n"
        << "  --version            Print version and exit\n"
        << "  --help               Show this help\n"
        << "\n"
        << "Environment:\n"
        << "  LISE_AGENT_PATH      Explicit agent executable\n"
        << "  LISE_STARTUP_MODE    launch or attach\n";
}

struct CommandLine
{
    std::optional<std::string> config_path;
    std::optional<lise::StartupMode> startup_mode;
    bool exit_after_setup = false;
    bool show_version = false;
    bool show_help = false;
};

CommandLine parse_command_line(int argc, char* argv[])
{
    CommandLine cmd;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--config")
        {
            if (i + 1 >= argc)
                throw lise::ConfigError("--config requires a file argument");
            cmd.config_path = argv[++i];
        }
        else if (arg == "--launch")
            cmd.startup_mode = lise::StartupMode::Launch;
        else if (arg == "--attach")
            cmd.startup_mode = lise::StartupMode::Attach;
        else if (arg == "--exit-after-setup")
            cmd.exit_after_setup = true;
        else if (arg == "--version")
            cmd.show_version = true;
        else if (arg == "--help" || arg == "-h")
            cmd.show_help = true;
        else
            throw lise::ConfigError("Unknown option: " + arg);
    }
    return cmd;
}

} // namespace

int main(int argc, char* argv[])
{
    CommandLine cmd;
    lise::ShellConfig config;

    try
    {
        cmd = parse_command_line(argc, argv);
        if (cmd.show_help)
        {
            print_usage(std::cout);
            return 0;
        }
        if (cmd.show_version)
        {
            std::cout << lise::build_description() << std::endl;
            return 0;
        }

        std::optional<std::filesystem::path> config_path;
        if (cmd.config_path)
            config_path = *cmd.config_path;
        config = lise::load_config(config_path);

        // Command line wins over file and environment
        if (cmd.startup_mode)
            config.startup_mode = *cmd.startup_mode;
    }
    catch (const lise::LiseError& e)
    {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    lise::Application app(std::move(config));
    app.setup();

    if (cmd.exit_after_setup)
        return 0;

    app.run();
    return 0;
}
