#include "portmapper/address_probe.hpp"
#include "portmapper/network.hpp"
#include <glog/logging.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <limits.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace portmapper {

namespace {

// Closes the descriptor when leaving scope
class ScopedSocket {
public:
    ScopedSocket(int domain, int type) : fd_(::socket(domain, type, 0)) {
        if (fd_ < 0) {
            throw std::system_error(errno, std::generic_category(), "Failed to create socket");
        }
    }

    ~ScopedSocket() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

struct AddrInfoDeleter {
    void operator()(struct addrinfo* info) const {
        if (info) {
            freeaddrinfo(info);
        }
    }
};

using AddrInfoPtr = std::unique_ptr<struct addrinfo, AddrInfoDeleter>;

AddrInfoPtr lookup_ipv4(const std::string& host, const char* service, int socktype) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = socktype;

    struct addrinfo* result = nullptr;
    int rc = getaddrinfo(host.c_str(), service, &hints, &result);
    if (rc == EAI_SYSTEM) {
        throw std::system_error(errno, std::generic_category(), "Failed to resolve " + host);
    }
    if (rc != 0) {
        throw HostLookupError("Unknown host " + host + ": " + gai_strerror(rc));
    }
    return AddrInfoPtr(result);
}

std::string to_string(const struct in_addr& addr) {
    char buffer[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr) {
        throw std::system_error(errno, std::generic_category(), "Failed to format address");
    }
    return std::string(buffer);
}

std::optional<std::string> bound_address(const ScopedSocket& socket) {
    struct sockaddr_in name;
    socklen_t namelen = sizeof(name);
    std::memset(&name, 0, sizeof(name));
    if (getsockname(socket.get(), reinterpret_cast<struct sockaddr*>(&name), &namelen) < 0) {
        throw std::system_error(errno, std::generic_category(), "Failed to get socket name");
    }

    std::string address = to_string(name.sin_addr);
    if (network::is_unspecified_address(address)) {
        return std::nullopt;
    }
    return address;
}

class SystemAddressProbe : public AddressProbe {
public:
    std::optional<std::string> tcp_local_address(
        const std::string& host, uint16_t port) const override {

        std::string service = std::to_string(port);
        AddrInfoPtr candidates = lookup_ipv4(host, service.c_str(), SOCK_STREAM);

        int last_error = ECONNREFUSED;
        for (struct addrinfo* ai = candidates.get(); ai != nullptr; ai = ai->ai_next) {
            ScopedSocket socket(ai->ai_family, ai->ai_socktype);
            if (::connect(socket.get(), ai->ai_addr, ai->ai_addrlen) == 0) {
                auto address = bound_address(socket);
                VLOG(1) << "TCP socket to " << host << ":" << port
                        << " bound to " << address.value_or("<unspecified>");
                return address;
            }
            last_error = errno;
            VLOG(1) << "Connect to " << host << ":" << port << " failed: " << strerror(last_error);
        }

        throw std::system_error(last_error, std::generic_category(),
                                "Failed to connect to " + host + ":" + service);
    }

    std::optional<std::string> host_address() const override {
        char hostname[HOST_NAME_MAX + 1];
        std::memset(hostname, 0, sizeof(hostname));
        if (gethostname(hostname, HOST_NAME_MAX) < 0) {
            throw std::system_error(errno, std::generic_category(), "Failed to get host name");
        }

        AddrInfoPtr addresses = lookup_ipv4(hostname, nullptr, SOCK_STREAM);
        for (struct addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
            if (ai->ai_family != AF_INET) continue;
            auto* addr = reinterpret_cast<struct sockaddr_in*>(ai->ai_addr);
            std::string address = to_string(addr->sin_addr);
            VLOG(1) << "Host name " << hostname << " resolves to " << address;
            return address;
        }
        return std::nullopt;
    }

    std::optional<std::string> udp_local_address(
        const std::string& address, uint16_t port) const override {

        struct sockaddr_in destination;
        std::memset(&destination, 0, sizeof(destination));
        destination.sin_family = AF_INET;
        destination.sin_port = htons(port);
        if (inet_pton(AF_INET, address.c_str(), &destination.sin_addr) != 1) {
            throw std::invalid_argument("Not an IPv4 address: " + address);
        }

        ScopedSocket socket(AF_INET, SOCK_DGRAM);
        if (::connect(socket.get(), reinterpret_cast<struct sockaddr*>(&destination),
                      sizeof(destination)) < 0) {
            throw std::system_error(errno, std::generic_category(),
                                    "Failed to associate UDP socket with " + address);
        }

        auto local = bound_address(socket);
        VLOG(1) << "UDP socket to " << address << ":" << port
                << " bound to " << local.value_or("<unspecified>");
        return local;
    }
};

} // namespace

std::shared_ptr<AddressProbe> AddressProbe::create() {
    return std::make_shared<SystemAddressProbe>();
}

} // namespace portmapper
