#ifndef NETCP_NETWORK_ENDPOINT_ADDRESS_HPP
#define NETCP_NETWORK_ENDPOINT_ADDRESS_HPP

#include <cstdint>
#include <string>

namespace netcp {
namespace network {

struct EndpointAddress {
    std::string host;
    uint16_t port{0};

    // "host:port", with IPv6 hosts bracketed
    std::string to_string() const {
        if (host.find(':') != std::string::npos) {
            return "[" + host + "]:" + std::to_string(port);
        }
        return host + ":" + std::to_string(port);
    }
};

} // namespace network
} // namespace netcp

#endif // NETCP_NETWORK_ENDPOINT_ADDRESS_HPP
