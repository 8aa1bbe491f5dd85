#include "portmapper/local_address_resolver.hpp"
#include "portmapper/network.hpp"
#include "portmapper/router.hpp"
#include "portmapper/router_exception.hpp"
#include <glog/logging.h>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace portmapper {

LocalAddressResolver::LocalAddressResolver(
    std::shared_ptr<const AddressProbe> probe, ResolverOptions options)
    : probe_(std::move(probe)), options_(std::move(options)) {
    if (!probe_) {
        throw std::invalid_argument("LocalAddressResolver requires an address probe");
    }
}

std::string LocalAddressResolver::resolve(const Router& router) const {
    VLOG(1) << "Get IP of localhost for router " << router.get_name();

    std::string address = address_from_socket(router);

    // An address like 127.0.0.1 is useless to the gateway
    if (network::is_loopback_address(address) || network::is_unspecified_address(address)) {
        VLOG(1) << "Address '" << address << "' is not usable, trying datagram socket";
        address = address_from_datagram_socket();

        if (network::is_loopback_address(address) || network::is_unspecified_address(address)) {
            throw RouterException(
                "Only found an address that begins with '127.' when retrieving IP of localhost");
        }
    }

    return address;
}

std::string LocalAddressResolver::address_from_socket(const Router& router) const {
    std::optional<std::string> address;

    // Only a connected router has a port we can open a socket to
    const int port = router.get_internal_port();
    VLOG(1) << "Got internal router port " << port;

    if (port > 65535) {
        throw RouterException("Invalid internal port " + std::to_string(port) +
                              " for router " + router.get_name());
    }

    if (port > 0) {
        const std::string host = router.get_internal_host_name();
        VLOG(1) << "Creating socket to router " << host << ":" << port;
        try {
            address = probe_->tcp_local_address(host, static_cast<uint16_t>(port));
        } catch (const HostLookupError&) {
            std::throw_with_nested(RouterException(
                "Could not create socket to " + host + ":" + std::to_string(port)));
        } catch (const std::exception&) {
            std::throw_with_nested(RouterException("Could not get IP of localhost."));
        }
        VLOG(1) << "Got address " << address.value_or("<none>") << " from socket";
    } else {
        VLOG(1) << "Got invalid internal router port number " << port;
    }

    if (!address) {
        VLOG(1) << "Not connected to router " << router.get_name()
                << ", falling back to the host name lookup. "
                << "Connect to the router if no address is found.";
        try {
            address = probe_->host_address();
        } catch (const std::exception&) {
            std::throw_with_nested(RouterException("Could not get IP of localhost."));
        }
        VLOG(1) << "Got address " << address.value_or("<none>") << " from host name lookup";
    }

    return address.value_or("");
}

std::string LocalAddressResolver::address_from_datagram_socket() const {
    try {
        return probe_->udp_local_address(options_.probe_address, options_.probe_port)
            .value_or("");
    } catch (const std::invalid_argument&) {
        std::throw_with_nested(RouterException(
            "Error with unknown host. Should have been impossible"));
    } catch (const std::exception&) {
        std::throw_with_nested(RouterException(
            "Socket failed when trying to get local IP address"));
    }
}

} // namespace portmapper
