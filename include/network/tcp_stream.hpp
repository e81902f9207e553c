#ifndef NETCP_NETWORK_TCP_STREAM_HPP
#define NETCP_NETWORK_TCP_STREAM_HPP

#include <chrono>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "network/byte_stream.hpp"
#include "network/endpoint_address.hpp"

namespace netcp {
namespace network {

class TCP_Stream : public ByteStream {
public:
    // Delete copy operations to prevent socket duplication
    TCP_Stream(const TCP_Stream&) = delete;
    TCP_Stream& operator=(const TCP_Stream&) = delete;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    TCP_Stream();
    ~TCP_Stream() override;


    // ---- CONNECTION ----
    // Resolves address and connects to the first reachable endpoint
    void connect(const EndpointAddress& address);
    void close();


    // ---- STREAM OPERATIONS ----
    std::size_t read_some(void* data, std::size_t size, std::chrono::milliseconds wait) override;
    std::size_t write_some(const void* data, std::size_t size, std::chrono::milliseconds wait) override;


    // ---- GETTERS ----
    boost::asio::ip::tcp::socket& get_socket();
    bool is_open() const;
    std::string remote_address() const override;

private:
    // ---- PARAMETERS ----
    boost::asio::io_context io_context_;
    std::unique_ptr<boost::asio::ip::tcp::socket> socket_;


    // Runs the pending operation for at most `wait`, cancelling it when the window closes
    void run_for(std::chrono::milliseconds wait);
};

} // namespace network
} // namespace netcp

#endif // NETCP_NETWORK_TCP_STREAM_HPP
