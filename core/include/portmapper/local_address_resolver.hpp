#pragma once

#include "portmapper/address_probe.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace portmapper {

class Router;

struct ResolverOptions {
    // Destination of the datagram probe. It only has to be routable-looking;
    // nothing is ever sent to it.
    std::string probe_address = "255.255.255.0";
    uint16_t probe_port = 0;
};

// Finds the outward-facing, non-loopback IPv4 address of this host.
//
// Order: local end of a TCP connection to the router's control port (only
// when the router is connected), else the host name lookup, then the local
// end of a UDP association with the probe destination. Loopback results
// are never returned. Nothing is cached between calls.
class LocalAddressResolver {
public:
    explicit LocalAddressResolver(
        std::shared_ptr<const AddressProbe> probe = AddressProbe::create(),
        ResolverOptions options = {});

    // Throws RouterException when no usable address can be found
    std::string resolve(const Router& router) const;

    const ResolverOptions& options() const { return options_; }

private:
    std::string address_from_socket(const Router& router) const;
    std::string address_from_datagram_socket() const;

    std::shared_ptr<const AddressProbe> probe_;
    ResolverOptions options_;
};

} // namespace portmapper
