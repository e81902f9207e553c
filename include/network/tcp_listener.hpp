#ifndef NETCP_NETWORK_TCP_LISTENER_HPP
#define NETCP_NETWORK_TCP_LISTENER_HPP

#include <cstdint>
#include <memory>
#include <boost/asio.hpp>
#include "network/endpoint_address.hpp"
#include "network/tcp_stream.hpp"

namespace netcp {
namespace network {

// Accepts exactly one incoming connection per call. Binding happens in the
// constructor so that the bound port is known before accept() blocks.
class TCP_Listener {
public:
  TCP_Listener(const TCP_Listener&) = delete;
  TCP_Listener& operator=(const TCP_Listener&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TCP_Listener(const EndpointAddress& address);
  ~TCP_Listener();


  // ---- CONNECTION ACCEPTANCE ----
  // Blocks until a peer connects
  std::unique_ptr<TCP_Stream> accept();
  void shutdown();


  // ---- GETTERS ----
  uint16_t local_port() const;

private:
  // ---- PARAMETERS ----
  const EndpointAddress address_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
};

} // namespace network
} // namespace netcp

#endif // NETCP_NETWORK_TCP_LISTENER_HPP
