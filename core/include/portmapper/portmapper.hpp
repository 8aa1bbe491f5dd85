#pragma once

// Main header file for the portmapper core library

#include "portmapper/address_probe.hpp"
#include "portmapper/config.hpp"
#include "portmapper/configured_router.hpp"
#include "portmapper/local_address_resolver.hpp"
#include "portmapper/network.hpp"
#include "portmapper/router.hpp"
#include "portmapper/router_exception.hpp"

namespace portmapper {

// Version information
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace portmapper
