#pragma once

#include <string>
#include <vector>

namespace portmapper {
namespace network {

constexpr const char* LOOPBACK_PREFIX = "127.";

// True for addresses in 127.0.0.0/8
bool is_loopback_address(const std::string& address);

// True for "" and "0.0.0.0"
bool is_unspecified_address(const std::string& address);

// Get all non-loopback IPv4 addresses of interfaces that are up
std::vector<std::string> get_local_ip_addresses();

} // namespace network
} // namespace portmapper
