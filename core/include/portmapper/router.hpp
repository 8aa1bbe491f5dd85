#pragma once

#include "portmapper/local_address_resolver.hpp"
#include "portmapper/router_exception.hpp"
#include <memory>
#include <ostream>
#include <string>

namespace portmapper {

// Contract every gateway-control implementation satisfies.
//
// Subclasses supply the connection target and lifecycle; the base class
// owns the immutable name and provides close(), to_string() and local
// address resolution on top of them. get_internal_host_name() and
// get_internal_port() may be called from any thread while connect() or
// disconnect() runs, so implementations must publish those values safely.
class Router {
public:
    virtual ~Router() = default;

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    const std::string& get_name() const { return name_; }

    // Gateway address, also known (possibly stale) when not connected
    virtual std::string get_internal_host_name() const = 0;

    // Control port of the gateway, <= 0 when not connected
    virtual int get_internal_port() const = 0;

    // Throws RouterException when the gateway cannot be reached
    virtual void connect() = 0;

    // Safe to call when already disconnected
    virtual void disconnect() = 0;

    bool is_connected() const { return get_internal_port() > 0; }

    // Outward-facing IPv4 address of this host. Throws RouterException.
    std::string get_local_host_address() const;

    // disconnect() for cleanup paths; errors are logged, never thrown
    void close() noexcept;

    // "<name> (<internal host name>)"
    std::string to_string() const;

protected:
    // Throws std::invalid_argument if name is empty
    explicit Router(std::string name,
                    std::shared_ptr<const LocalAddressResolver> resolver = nullptr);

private:
    const std::string name_;
    std::shared_ptr<const LocalAddressResolver> resolver_;
};

std::ostream& operator<<(std::ostream& os, const Router& router);

} // namespace portmapper
