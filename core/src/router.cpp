#include "portmapper/router.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include <utility>

namespace portmapper {

Router::Router(std::string name, std::shared_ptr<const LocalAddressResolver> resolver)
    : name_(std::move(name)), resolver_(std::move(resolver)) {
    if (name_.empty()) {
        throw std::invalid_argument("Router name must not be empty");
    }
    if (!resolver_) {
        resolver_ = std::make_shared<LocalAddressResolver>();
    }
}

std::string Router::get_local_host_address() const {
    return resolver_->resolve(*this);
}

void Router::close() noexcept {
    try {
        disconnect();
    } catch (const std::exception& e) {
        LOG(WARNING) << "Error while disconnecting from router " << name_ << ": "
                     << describe_exception(e);
    }
}

std::string Router::to_string() const {
    return name_ + " (" + get_internal_host_name() + ")";
}

std::ostream& operator<<(std::ostream& os, const Router& router) {
    return os << router.to_string();
}

} // namespace portmapper
