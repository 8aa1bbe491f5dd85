#include "portmapper/network.hpp"
#include <glog/logging.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <net/if.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace portmapper {
namespace network {

bool is_loopback_address(const std::string& address) {
    return address.rfind(LOOPBACK_PREFIX, 0) == 0;
}

bool is_unspecified_address(const std::string& address) {
    return address.empty() || address == "0.0.0.0";
}

std::vector<std::string> get_local_ip_addresses() {
    std::vector<std::string> addresses;
    struct ifaddrs* ifaddr = nullptr;

    if (getifaddrs(&ifaddr) == -1) {
        LOG(ERROR) << "Failed to get network interfaces: " << strerror(errno);
        return addresses;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;

        char host[INET_ADDRSTRLEN];
        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &addr->sin_addr, host, INET_ADDRSTRLEN) != nullptr) {
            addresses.emplace_back(host);
            VLOG(1) << "Found local IP: " << host << " on interface " << ifa->ifa_name;
        }
    }

    freeifaddrs(ifaddr);

    // Interfaces with aliases can report the same address twice
    std::sort(addresses.begin(), addresses.end());
    addresses.erase(std::unique(addresses.begin(), addresses.end()), addresses.end());

    return addresses;
}

} // namespace network
} // namespace portmapper
