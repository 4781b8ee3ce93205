// src/main.cpp
// WOL relay: nhận magic packet trên các adapter incoming và phát lại
// trên các adapter outgoing

#include <iostream>
#include <fstream>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "core/relay/relay_settings.hpp"
#include "core/relay/relay_service.hpp"

// ==================== NAMESPACE ALIASES ====================
using namespace WolRelay;
using namespace WolRelay::Common;
using namespace WolRelay::Relay;

// ==================== CONSTANTS ====================

namespace
{
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_STARTUP_FAILURE = 1;
    constexpr int EXIT_CONFIG_ERROR = 2;

    const char *DEFAULT_CONFIG_FILE = "wol_relay.json";
    const char *ENV_PREFIX = "WOLRELAY_";
}

// ==================== GLOBAL VARIABLES ====================

std::atomic<bool> g_running{true};

// ==================== SIGNAL HANDLER ====================

void signalHandler(int signum)
{
    (void)signum;
    g_running = false;
}

// ==================== COMMAND LINE ====================

struct CommandLineOptions
{
    std::string config_file;
    bool config_given = false;
    bool list_interfaces = false;
    bool show_help = false;
    std::string send_address;
};

void printUsage(const char *program)
{
    std::cout << "Usage: " << program << " [options] [--section.key=value ...]\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>        Configuration file (default: " << DEFAULT_CONFIG_FILE << ")\n"
              << "  --list-interfaces      Show discovered adapters and exit\n"
              << "  --send <hw-address>    Send one magic packet on all outgoing adapters and exit\n"
              << "  --help                 Show this help\n"
              << "\n"
              << "Any configuration key can be overridden, e.g. --listener.udp_port=4009\n"
              << "or through the environment, e.g. " << ENV_PREFIX << "LISTENER__UDP_PORT=4009\n";
}

bool parseCommandLine(int argc, char *argv[], CommandLineOptions &options)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h")
        {
            options.show_help = true;
        }
        else if (arg == "--list-interfaces")
        {
            options.list_interfaces = true;
        }
        else if (arg == "--config" || arg == "--send")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            if (arg == "--config")
            {
                options.config_file = argv[++i];
                options.config_given = true;
            }
            else
            {
                options.send_address = argv[++i];
            }
        }
        else if (arg.rfind("--config=", 0) == 0)
        {
            options.config_file = arg.substr(9);
            options.config_given = true;
        }
        else if (arg.rfind("--send=", 0) == 0)
        {
            options.send_address = arg.substr(7);
        }
    }

    if (!options.config_given)
    {
        options.config_file = DEFAULT_CONFIG_FILE;
    }

    return true;
}

// ==================== CONFIGURATION ====================

bool loadConfiguration(int argc, char *argv[], const CommandLineOptions &options)
{
    ConfigManager &config = CONFIG;

    std::ifstream probe(options.config_file);
    if (probe.good())
    {
        probe.close();
        if (!config.loadFromFile(options.config_file))
        {
            std::cerr << "Failed to load configuration file: " << options.config_file << std::endl;
            return false;
        }
    }
    else if (options.config_given)
    {
        std::cerr << "Configuration file not found: " << options.config_file << std::endl;
        return false;
    }

    config.loadFromEnvironment(ENV_PREFIX);
    config.loadFromCommandLine(argc, argv);
    return true;
}

bool initializeLogging(const ConfigManager &config)
{
    LoggerConfig logger_config;

    std::string level_name = config.getString(ConfigKeys::LOGGING_LEVEL, "info");
    if (!parseLogLevel(level_name, logger_config.level))
    {
        std::cerr << "Unknown log level '" << level_name << "', using info" << std::endl;
    }
    logger_config.log_file = config.getString(ConfigKeys::LOGGING_FILE, "");

    return setupLogger(logger_config);
}

// ==================== MAIN FUNCTION ====================

int main(int argc, char *argv[])
{
    CommandLineOptions options;
    if (!parseCommandLine(argc, argv, options))
    {
        printUsage(argv[0]);
        return EXIT_CONFIG_ERROR;
    }

    if (options.show_help)
    {
        printUsage(argv[0]);
        return EXIT_OK;
    }

    // ==================== LOAD CONFIGURATION ====================

    if (!loadConfiguration(argc, argv, options))
    {
        return EXIT_CONFIG_ERROR;
    }

    if (!initializeLogging(CONFIG))
    {
        return EXIT_CONFIG_ERROR;
    }

    RelaySettings settings = RelaySettings::fromConfig(CONFIG);

    std::vector<std::string> errors;
    if (!settings.validate(errors))
    {
        for (const auto &error : errors)
        {
            spdlog::error("Configuration error: {}", error);
        }
        return EXIT_CONFIG_ERROR;
    }

    for (const auto &warning : settings.warnings())
    {
        spdlog::warn("Configuration warning: {}", warning);
    }

    RelayService service(settings);

    // ==================== ONE-SHOT MODES ====================

    if (options.list_interfaces)
    {
        if (!service.discoverAdapters())
        {
            return EXIT_STARTUP_FAILURE;
        }
        service.printAdapters(std::cout);
        return EXIT_OK;
    }

    if (!options.send_address.empty())
    {
        if (!service.discoverAdapters())
        {
            return EXIT_STARTUP_FAILURE;
        }
        return service.sendOnce(options.send_address) ? EXIT_OK : EXIT_STARTUP_FAILURE;
    }

    // ==================== START RELAY ====================

    spdlog::info("========================================");
    spdlog::info("WOL relay");
    spdlog::info("Config file: {}", options.config_file);
    spdlog::info("========================================");
    settings.log();

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    if (!service.initialize())
    {
        spdlog::error("Failed to initialize WOL relay");
        return EXIT_STARTUP_FAILURE;
    }

    if (!service.start())
    {
        spdlog::error("Failed to start WOL relay");
        return EXIT_STARTUP_FAILURE;
    }

    spdlog::info("Press Ctrl+C to stop");

    // ==================== WAIT FOR SHUTDOWN ====================

    while (g_running)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::warn("Shutdown signal received. Shutting down gracefully...");

    // ==================== CLEANUP ====================

    service.stop();
    service.logStats();

    spdlog::info("Shutdown complete");
    spdlog::shutdown();

    return EXIT_OK;
}
