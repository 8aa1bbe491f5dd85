#include <portmapper/portmapper.hpp>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

struct Options {
    std::string config_path;
    std::string router_name;
    std::string host;
    int port = 0;
    bool connect = false;
    bool interfaces = false;
    bool json_output = false;
};

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config=PATH         Router configuration file\n"
              << "  --router=NAME         Only use the named router from the configuration\n"
              << "  --host=HOST           Gateway host of an ad-hoc router\n"
              << "  --port=PORT           Gateway control port of an ad-hoc router\n"
              << "  --connect             Connect to the router(s) before resolving\n"
              << "  --interfaces          List the non-loopback IPv4 interface addresses\n"
              << "  --json                Print results as JSON\n"
              << "  --help, -h           Show this help message\n";
}

class LocalAddressClient {
public:
    explicit LocalAddressClient(const Options& options) : options_(options) {}

    int Run() {
        if (options_.interfaces) {
            PrintInterfaces();
            return 0;
        }

        std::vector<std::unique_ptr<portmapper::Router>> routers;
        std::vector<bool> connect_flags;
        try {
            LoadRouters(routers, connect_flags);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }

        json results = json::array();
        bool all_resolved = true;

        for (size_t i = 0; i < routers.size(); ++i) {
            auto& router = *routers[i];
            json entry;
            entry["router"] = router.get_name();
            entry["description"] = router.to_string();

            try {
                if (connect_flags[i]) {
                    router.connect();
                }
                entry["connected"] = router.is_connected();
                entry["address"] = router.get_local_host_address();
            } catch (const portmapper::RouterException& e) {
                LOG(WARNING) << "Resolution via " << router << " failed: "
                             << portmapper::describe_exception(e);
                entry["connected"] = router.is_connected();
                entry["error"] = portmapper::describe_exception(e);
                all_resolved = false;
            }
            router.close();

            if (!options_.json_output) {
                PrintEntry(entry);
            }
            results.push_back(entry);
        }

        if (options_.json_output) {
            std::cout << results.dump(2) << std::endl;
        }
        return all_resolved ? 0 : 1;
    }

private:
    void LoadRouters(std::vector<std::unique_ptr<portmapper::Router>>& routers,
                     std::vector<bool>& connect_flags) {
        auto probe = portmapper::AddressProbe::create();

        if (!options_.host.empty()) {
            if (options_.port <= 0 || options_.port > 65535) {
                throw std::runtime_error("--host requires --port in range 1-65535");
            }
            portmapper::ResolverOptions resolver_options;
            if (!options_.config_path.empty()) {
                resolver_options = portmapper::load_config(options_.config_path).resolver;
            }
            auto resolver = std::make_shared<const portmapper::LocalAddressResolver>(
                probe, resolver_options);
            routers.push_back(std::make_unique<portmapper::ConfiguredRouter>(
                options_.host, options_.host, static_cast<uint16_t>(options_.port),
                probe, resolver));
            connect_flags.push_back(options_.connect);
            return;
        }

        if (options_.config_path.empty()) {
            throw std::runtime_error("Either --config=PATH or --host=HOST --port=PORT is required");
        }

        auto config = portmapper::load_config(options_.config_path);
        if (!options_.router_name.empty()) {
            std::vector<portmapper::RouterSettings> selected;
            for (const auto& settings : config.routers) {
                if (settings.name == options_.router_name) {
                    selected.push_back(settings);
                }
            }
            if (selected.empty()) {
                throw std::runtime_error("Router not found in configuration: " + options_.router_name);
            }
            config.routers = selected;
        }

        routers = portmapper::make_routers(config, probe);
        for (const auto& settings : config.routers) {
            connect_flags.push_back(options_.connect || settings.connect_on_start);
        }
    }

    void PrintInterfaces() const {
        auto addresses = portmapper::network::get_local_ip_addresses();
        if (options_.json_output) {
            std::cout << json(addresses).dump(2) << std::endl;
            return;
        }
        for (const auto& address : addresses) {
            std::cout << address << std::endl;
        }
    }

    static void PrintEntry(const json& entry) {
        std::cout << entry["description"].get<std::string>() << ": ";
        if (entry.contains("address")) {
            std::cout << entry["address"].get<std::string>() << std::endl;
        } else {
            std::cout << "error: " << entry["error"].get<std::string>() << std::endl;
        }
    }

    Options options_;
};

} // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();

    Options options;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.find("--config=") == 0) {
            options.config_path = arg.substr(9);
        } else if (arg.find("--router=") == 0) {
            options.router_name = arg.substr(9);
        } else if (arg.find("--host=") == 0) {
            options.host = arg.substr(7);
        } else if (arg.find("--port=") == 0) {
            try {
                options.port = std::stoi(arg.substr(7));
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << arg.substr(7) << std::endl;
                return 1;
            }
        } else if (arg == "--connect") {
            options.connect = true;
        } else if (arg == "--interfaces") {
            options.interfaces = true;
        } else if (arg == "--json") {
            options.json_output = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            PrintUsage(argv[0]);
            return 1;
        }
    }

    LocalAddressClient client(options);
    return client.Run();
}
