#include <iostream>
#include <csignal>
#include <atomic>
#include <lodestar/application.h>
#include <lodestar/cli_parser.h>

using namespace lodestar;

// Global flag for signal handling
static std::atomic<bool> g_shutdown_requested(false);

// Signal handler for Ctrl+C, SIGTERM, and SIGHUP
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        // Only set the flag here; the running command polls it and stops cleanly
        g_shutdown_requested = true;
#ifdef SIGHUP
    } else if (signal == SIGHUP) {
        // Ignore SIGHUP so `monitor` keeps running when the terminal goes away
        return;
#endif
    }
}

int main(int argc, char** argv) {
    try {
        CLIParser parser;

        parser.parse(argc, argv);

        // Check if we should continue (false for --help, --version, or errors)
        if (!parser.should_continue()) {
            return parser.get_exit_code();
        }

        auto config = parser.get_config();

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
#ifdef SIGHUP
        std::signal(SIGHUP, signal_handler);
#endif

        Application app(config, g_shutdown_requested);
        return app.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
