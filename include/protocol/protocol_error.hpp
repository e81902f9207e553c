#ifndef NETCP_PROTOCOL_PROTOCOL_ERROR_HPP
#define NETCP_PROTOCOL_PROTOCOL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace netcp {
namespace protocol {

// Peer sent something the protocol does not allow. Fatal to the session.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace protocol
} // namespace netcp

#endif // NETCP_PROTOCOL_PROTOCOL_ERROR_HPP
