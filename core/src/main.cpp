// skysync runtime
// Config-based runtime with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::string config_path = "skysync-runtime.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: skysync-runtime [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: skysync-runtime.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Environment:\n";
            std::cerr << "  SKYSYNC_API_KEY  Cloud API key when cloud.api_key is not set\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Logger level is not configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("skysync runtime starting...");
    LOG_INFO("Loading config: " << config_path);

    skysync::runtime::RuntimeConfig config;
    std::string error;

    if (!skysync::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    skysync::logging::Logger::set_level(skysync::logging::string_to_level(config.logging.level));

    skysync::runtime::SignalHandler::install();

    skysync::runtime::Runtime runtime(config);
    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    auto ledger = runtime.get_governor().snapshot();
    LOG_INFO("Runtime Ready");
    LOG_INFO("  Devices: " << runtime.get_registry().device_count());
    LOG_INFO("  Polling: " << config.polling.interval_ms << "ms");
    LOG_INFO("  Quota: " << ledger.remaining << "/" << ledger.quota << " calls remaining");

    // Run main loop (blocking)
    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
