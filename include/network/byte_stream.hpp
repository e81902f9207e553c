#ifndef NETCP_NETWORK_BYTE_STREAM_HPP
#define NETCP_NETWORK_BYTE_STREAM_HPP

#include <chrono>
#include <cstddef>
#include <string>

namespace netcp {
namespace network {

// Raw duplex byte stream underneath the timed I/O layer.
//
// Both operations wait at most `wait` for the transport to become ready and
// return the number of bytes moved, which is 0 when nothing happened within
// the window. A hard transport failure (reset, peer closed, socket error)
// throws TransportError.
class ByteStream {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    virtual ~ByteStream() = default;


    // ---- STREAM OPERATIONS ----
    virtual std::size_t read_some(void* data, std::size_t size, std::chrono::milliseconds wait) = 0;
    virtual std::size_t write_some(const void* data, std::size_t size, std::chrono::milliseconds wait) = 0;


    // ---- GETTERS ----
    // Peer description for diagnostics
    virtual std::string remote_address() const { return "<unknown>"; }

protected:
    ByteStream() = default;
};

} // namespace network
} // namespace netcp

#endif // NETCP_NETWORK_BYTE_STREAM_HPP
