/**
 * HomeStream - Personal media server
 *
 * Main entry point for the daemon.
 * Serves shares to receivers and pulls recordings back off them.
 */

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "core/Application.hpp"
#include "core/Logger.hpp"

namespace {

// Set from the signal handler, polled by Application::run
std::atomic<bool> g_stopRequested{false};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int) {
    g_stopRequested = true;
}

/**
 * Setup signal handlers for graceful shutdown
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

void printUsage(const char* program) {
    std::cout << homestream::core::Application::getName() << " - personal media server\n"
              << "\nUsage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>  Use this configuration file\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << std::endl;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    using homestream::core::Application;

    bool debugMode = false;
    std::string configPath;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << arg << " needs a path" << std::endl;
                return 2;
            }
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << Application::getName() << " v" << Application::getVersion() << std::endl;
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    setupSignalHandlers();

    auto app = std::make_unique<Application>();
    if (!app->initialize(configPath, debugMode)) {
        std::cerr << "Failed to start " << Application::getName()
                  << (configPath.empty() ? "" : " with " + configPath) << std::endl;
        return 1;
    }

    app->run(g_stopRequested);

    homestream::core::Logger::instance().info("Received stop request, shutting down gracefully...");
    app->shutdown();
    return 0;
}
