#pragma once

#include "portmapper/address_probe.hpp"
#include "portmapper/local_address_resolver.hpp"
#include "portmapper/router.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace portmapper {

// One entry of the "routers" list
struct RouterSettings {
    std::string name;
    std::string host;
    uint16_t port = 0;
    bool connect_on_start = false;
};

struct PortMapperConfig {
    ResolverOptions resolver;
    std::vector<RouterSettings> routers;
};

// Parse configuration YAML. Throws std::runtime_error on invalid input.
PortMapperConfig parse_config(const std::string& yaml);

// Load configuration from a file. Throws std::runtime_error.
PortMapperConfig load_config(const std::string& file_path);

// Build one ConfiguredRouter per entry, sharing one resolver
std::vector<std::unique_ptr<Router>> make_routers(
    const PortMapperConfig& config,
    std::shared_ptr<const AddressProbe> probe = AddressProbe::create());

} // namespace portmapper
