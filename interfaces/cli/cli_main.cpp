// interfaces/cli/cli_main.cpp
#include "cli_options.hpp"
#include "sniffer_app.hpp"
#include <iostream>
#include <signal.h>

using namespace PacketSniffer::CLI;

// Global app cho signal handler
SnifferApp *g_app = nullptr;

void signalHandler(int signum)
{
    (void)signum;
    if (g_app)
    {
        // Chỉ set cờ atomic và gọi pcap_breakloop
        g_app->requestShutdown();
    }
}

int main(int argc, char *argv[])
{
    CliOptions options;
    std::string error;

    if (!CliParser::parseCommandLine(argc, argv, options, error))
    {
        std::cerr << "error: " << error << "\n\n";
        CliParser::printHelp(std::cerr);
        return 2;
    }

    SnifferApp app(options);
    g_app = &app;

    // Register signal handlers
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    int exit_code = app.run();

    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    g_app = nullptr;

    return exit_code;
}
