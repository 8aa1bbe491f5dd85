#include "router_server.hpp"
#include <portmapper/config.hpp>
#include <portmapper/router_exception.hpp>
#include <glog/logging.h>
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>

std::unique_ptr<portmapper::reference::RouterServer> g_server;
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
    g_shutdown_requested.store(true);
}

int main(int argc, char* argv[]) {
    // Initialize Google logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string listen_address = "0.0.0.0:50061";
    std::string config_path;
    if (const char* env = std::getenv("PORTMAPPER_CONFIG")) {
        config_path = env;
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.find("--listen=") == 0) {
            listen_address = arg.substr(9);
        } else if (arg.find("--config=") == 0) {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --listen=ADDRESS      Listen address (default: 0.0.0.0:50061)\n"
                      << "  --config=PATH         Router configuration file\n"
                      << "  --help, -h           Show this help message\n"
                      << "Environment:\n"
                      << "  PORTMAPPER_CONFIG     Router configuration file if --config is not given\n";
            return 0;
        }
    }

    if (config_path.empty()) {
        LOG(ERROR) << "No configuration given. Use --config=PATH or set PORTMAPPER_CONFIG";
        return 1;
    }

    LOG(INFO) << "Starting Router Service on " << listen_address;

    try {
        auto config = portmapper::load_config(config_path);
        auto routers = portmapper::make_routers(config);

        for (size_t i = 0; i < routers.size(); ++i) {
            if (!config.routers[i].connect_on_start) continue;
            try {
                routers[i]->connect();
            } catch (const portmapper::RouterException& e) {
                // Clients can retry through connect_router
                LOG(WARNING) << portmapper::describe_exception(e);
            }
        }

        g_server = std::make_unique<portmapper::reference::RouterServer>(std::move(routers));
        g_server->Start(listen_address);

        LOG(INFO) << "Router service is running. Press Ctrl+C to stop.";

        while (!g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG(INFO) << "Shutdown requested, stopping server...";
        g_server->Shutdown();
        g_server.reset();

    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to start router service: " << e.what();
        return 1;
    }

    LOG(INFO) << "Router service stopped.";
    return 0;
}
