#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace portmapper {

// A host name could not be resolved to an IPv4 address.
class HostLookupError : public std::runtime_error {
public:
    explicit HostLookupError(const std::string& message)
        : std::runtime_error(message) {}
};

// Operating system primitives used to find out which local address the
// kernel binds for a given destination.
//
// Implementations report socket failures as std::system_error and name
// lookup failures as HostLookupError. Loopback addresses are returned as is.
class AddressProbe {
public:
    virtual ~AddressProbe() = default;

    // Create the POSIX sockets implementation
    static std::shared_ptr<AddressProbe> create();

    // Connect a TCP socket to host:port and return the locally bound
    // address. std::nullopt when the kernel reports the unspecified address.
    virtual std::optional<std::string> tcp_local_address(
        const std::string& host, uint16_t port) const = 0;

    // Resolve this machine's own host name to an IPv4 address
    virtual std::optional<std::string> host_address() const = 0;

    // Associate a UDP socket with address:port (no datagram is sent) and
    // return the locally bound address. Throws std::invalid_argument when
    // address is not a dotted-quad literal.
    virtual std::optional<std::string> udp_local_address(
        const std::string& address, uint16_t port) const = 0;
};

} // namespace portmapper
