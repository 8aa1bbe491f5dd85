#pragma once

#include "portmapper/address_probe.hpp"
#include "portmapper/router.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace portmapper {

// Router whose gateway host and control port are known from configuration
// rather than discovered. The host name is fixed at construction, so
// get_internal_host_name() returns it even before connect().
class ConfiguredRouter final : public Router {
public:
    ConfiguredRouter(std::string name,
                     std::string host,
                     uint16_t port,
                     std::shared_ptr<const AddressProbe> probe = AddressProbe::create(),
                     std::shared_ptr<const LocalAddressResolver> resolver = nullptr);
    ~ConfiguredRouter() override;

    std::string get_internal_host_name() const override { return host_; }
    int get_internal_port() const override { return internal_port_.load(); }

    void connect() override;
    void disconnect() override;

    uint16_t configured_port() const { return port_; }

private:
    const std::string host_;
    const uint16_t port_;
    std::shared_ptr<const AddressProbe> probe_;
    std::atomic<int> internal_port_{-1};
};

} // namespace portmapper
