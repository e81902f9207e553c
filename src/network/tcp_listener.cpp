#include "network/tcp_listener.hpp"
#include "network/network_error.hpp"
#include <boost/log/trivial.hpp>

namespace netcp {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Listener::TCP_Listener(const EndpointAddress& address)
  : address_(address) {
  BOOST_LOG_TRIVIAL(info) << "TCP listener: Binding to " << address_.to_string();

  try {
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto results = resolver.resolve(address_.host, std::to_string(address_.port),
                                    boost::asio::ip::tcp::resolver::passive);
    boost::asio::ip::tcp::endpoint endpoint = results.begin()->endpoint();

    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();

    BOOST_LOG_TRIVIAL(info) << "TCP listener: Listening on port " << local_port();
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP listener: Failed to bind " << address_.to_string() << ": " << e.what();
    throw TransportError(NetworkError::BIND_FAILED, e.code().message());
  }
}

TCP_Listener::~TCP_Listener() {
  shutdown();
}


//==============================================
// CONNECTION ACCEPTANCE
//==============================================

std::unique_ptr<TCP_Stream> TCP_Listener::accept() {
  auto stream = std::make_unique<TCP_Stream>();

  BOOST_LOG_TRIVIAL(debug) << "TCP listener: Waiting for incoming connection";
  boost::system::error_code ec;
  acceptor_->accept(stream->get_socket(), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP listener: Accept error: " << ec.message();
    throw TransportError(NetworkError::CONNECTION_FAILED, ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "TCP listener: Accepted connection from " << stream->remote_address();
  return stream;
}

void TCP_Listener::shutdown() {
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP listener: Error closing acceptor: " << ec.message();
    }
    BOOST_LOG_TRIVIAL(debug) << "TCP listener: Acceptor closed";
  }
}


//==============================================
// GETTERS
//==============================================

uint16_t TCP_Listener::local_port() const {
  boost::system::error_code ec;
  auto endpoint = acceptor_->local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

} // namespace network
} // namespace netcp
