#ifndef NETCP_NETWORK_NETWORK_ERROR_HPP
#define NETCP_NETWORK_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace netcp {
namespace network {

enum class NetworkError {
    CONNECTION_FAILED,
    CONNECTION_LOST,
    BIND_FAILED,
    TIMEOUT
};

inline const char* network_error_to_string(NetworkError error) {
    switch (error) {
        case NetworkError::CONNECTION_FAILED: return "Connection failed";
        case NetworkError::CONNECTION_LOST: return "Connection lost";
        case NetworkError::BIND_FAILED: return "Bind failed";
        case NetworkError::TIMEOUT: return "Connection lost (timeout)";
    }
    return "Undefined error";
}

// I/O failure on the underlying stream. Always fatal to the session.
class TransportError : public std::runtime_error {
public:
    TransportError(NetworkError code, const std::string& detail)
        : std::runtime_error(detail.empty()
              ? std::string(network_error_to_string(code))
              : std::string(network_error_to_string(code)) + ": " + detail)
        , code_(code) {}

    NetworkError code() const { return code_; }

private:
    NetworkError code_;
};

// No byte moved within the idle window
class TimeoutError : public TransportError {
public:
    explicit TimeoutError(const std::string& detail)
        : TransportError(NetworkError::TIMEOUT, detail) {}
};

} // namespace network
} // namespace netcp

#endif // NETCP_NETWORK_NETWORK_ERROR_HPP
