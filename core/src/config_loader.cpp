#include "portmapper/config.hpp"
#include "portmapper/configured_router.hpp"
#include <yaml-cpp/yaml.h>
#include <glog/logging.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace portmapper {

namespace {

uint16_t parse_port(const YAML::Node& node, const std::string& context, bool allow_zero) {
    int port = 0;
    try {
        port = node.as<int>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid port for " + context + ": " + std::string(e.what()));
    }
    if (port < (allow_zero ? 0 : 1) || port > 65535) {
        throw std::runtime_error("Port out of range for " + context + ": " + std::to_string(port));
    }
    return static_cast<uint16_t>(port);
}

std::string required_string(const YAML::Node& node, const char* key, const std::string& context) {
    if (!node[key] || !node[key].IsScalar() || node[key].as<std::string>().empty()) {
        throw std::runtime_error(context + " is missing '" + key + "'");
    }
    return node[key].as<std::string>();
}

ResolverOptions parse_resolver(const YAML::Node& node) {
    ResolverOptions options;
    if (!node) {
        return options;
    }
    if (!node.IsMap()) {
        throw std::runtime_error("'resolver' must be a mapping");
    }
    if (node["probe_address"]) {
        options.probe_address = node["probe_address"].as<std::string>();
    }
    if (node["probe_port"]) {
        options.probe_port = parse_port(node["probe_port"], "resolver probe", true);
    }
    return options;
}

RouterSettings parse_router(const YAML::Node& node, size_t index) {
    std::string context = "Router entry " + std::to_string(index);
    if (!node.IsMap()) {
        throw std::runtime_error(context + " must be a mapping");
    }

    RouterSettings settings;
    settings.name = required_string(node, "name", context);
    context = "Router '" + settings.name + "'";
    settings.host = required_string(node, "host", context);
    if (!node["port"]) {
        throw std::runtime_error(context + " is missing 'port'");
    }
    settings.port = parse_port(node["port"], context, false);
    if (node["connect"]) {
        settings.connect_on_start = node["connect"].as<bool>();
    }
    return settings;
}

} // namespace

PortMapperConfig parse_config(const std::string& yaml) {
    PortMapperConfig config;
    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root || root.IsNull()) {
            return config;
        }
        if (!root.IsMap()) {
            throw std::runtime_error("Configuration root must be a mapping");
        }

        config.resolver = parse_resolver(root["resolver"]);

        const YAML::Node routers = root["routers"];
        if (routers) {
            if (!routers.IsSequence()) {
                throw std::runtime_error("'routers' must be a list");
            }
            std::unordered_set<std::string> names;
            for (size_t i = 0; i < routers.size(); ++i) {
                RouterSettings settings = parse_router(routers[i], i);
                if (!names.insert(settings.name).second) {
                    throw std::runtime_error("Duplicate router name: " + settings.name);
                }
                config.routers.push_back(std::move(settings));
            }
        }
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration YAML: " << e.what();
        throw std::runtime_error("Invalid configuration YAML: " + std::string(e.what()));
    }

    LOG(INFO) << "Loaded configuration with " << config.routers.size() << " router(s)";
    return config;
}

PortMapperConfig load_config(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
}

std::vector<std::unique_ptr<Router>> make_routers(
    const PortMapperConfig& config, std::shared_ptr<const AddressProbe> probe) {

    auto resolver = std::make_shared<const LocalAddressResolver>(probe, config.resolver);

    std::vector<std::unique_ptr<Router>> routers;
    routers.reserve(config.routers.size());
    for (const auto& settings : config.routers) {
        routers.push_back(std::make_unique<ConfiguredRouter>(
            settings.name, settings.host, settings.port, probe, resolver));
    }
    return routers;
}

} // namespace portmapper
