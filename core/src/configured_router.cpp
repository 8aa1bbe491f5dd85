#include "portmapper/configured_router.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace portmapper {

ConfiguredRouter::ConfiguredRouter(std::string name,
                                   std::string host,
                                   uint16_t port,
                                   std::shared_ptr<const AddressProbe> probe,
                                   std::shared_ptr<const LocalAddressResolver> resolver)
    : Router(std::move(name),
             resolver ? std::move(resolver)
                      : std::make_shared<const LocalAddressResolver>(probe)),
      host_(std::move(host)),
      port_(port),
      probe_(std::move(probe)) {
    if (host_.empty()) {
        throw std::invalid_argument("Router " + get_name() + " has no host");
    }
    if (port_ == 0) {
        throw std::invalid_argument("Router " + get_name() + " has no control port");
    }
    if (!probe_) {
        throw std::invalid_argument("Router " + get_name() + " requires an address probe");
    }
}

ConfiguredRouter::~ConfiguredRouter() {
    close();
}

void ConfiguredRouter::connect() {
    if (is_connected()) {
        return;
    }

    LOG(INFO) << "Connecting to router " << to_string() << " on port " << port_;
    try {
        probe_->tcp_local_address(host_, port_);
    } catch (const std::exception&) {
        std::throw_with_nested(RouterException(
            "Could not connect to router " + host_ + ":" + std::to_string(port_)));
    }

    internal_port_.store(port_);
    LOG(INFO) << "Connected to router " << get_name();
}

void ConfiguredRouter::disconnect() {
    if (internal_port_.exchange(-1) > 0) {
        LOG(INFO) << "Disconnected from router " << get_name();
    }
}

} // namespace portmapper
