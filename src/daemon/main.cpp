#include "config.hpp"
#include "hotkey/key_names.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::println(stderr, "--config requires a path");
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: keyscribe [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {} (see --help)", arg);
            return 1;
        }
    }

    auto config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!config) {
        std::println(stderr, "Invalid configuration: {}", config.error());
        return 1;
    }

    if (verbose) {
        auto combo = parse_combo(config->hotkey.keys);
        std::println(stderr, "[keyscribe] Starting (recognizer: {}, hotkey: {})",
                     config->backend.url, combo ? format_combo(*combo) : "?");
    }

    // Everything that can fail at startup happens here, while the exit
    // status still reaches the caller.
    LinuxEventLoop loop(std::move(*config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize");
        return 1;
    }

    if (!foreground) {
        platform::daemonize();
    }

    if (!loop.start()) {
        std::println(stderr, "Failed to start");
        return 1;
    }

    loop.run();
    return 0;
}
