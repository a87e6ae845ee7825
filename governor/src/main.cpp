#include "config.hpp"
#include "service.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Global pointer to the service to allow signal handler to access it
std::unique_ptr<Service> service_ptr;

void signal_handler(int signum) {
    spdlog::info("Caught signal {}, shutting down...", signum);
    if (service_ptr) {
        service_ptr->stop();
    }
}

int main(int argc, char** argv) {
    try {
        // 1. Load configuration
        Config config = Config::from_env();
        config.validate();

        // 2. Setup logging
        util::setup_logging(config.log_level, config.service_name);
        spdlog::info("Log level set to '{}'", config.log_level);

        // 3. Collect URLs from the command line, or one per line on stdin
        std::vector<std::string> urls;
        for (int i = 1; i < argc; ++i) {
            urls.emplace_back(argv[i]);
        }
        if (urls.empty()) {
            std::string line;
            while (std::getline(std::cin, line)) {
                line = util::trim(line);
                if (!line.empty() && line[0] != '#') {
                    urls.push_back(line);
                }
            }
        }
        if (urls.empty()) {
            spdlog::error("No URLs given; pass them as arguments or on stdin");
            return 2;
        }

        // 4. Register signal handlers for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 5. Create and run the service
        service_ptr = std::make_unique<Service>(config);
        int fetched = service_ptr->run(urls);
        spdlog::info("Fetched {}/{} URLs", fetched, urls.size());

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("Governor probe has shut down gracefully.");
    return 0;
}
