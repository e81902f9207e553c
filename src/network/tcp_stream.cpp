#include "network/tcp_stream.hpp"
#include "network/network_error.hpp"
#include <boost/log/trivial.hpp>

namespace netcp {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Stream::TCP_Stream()
  : socket_(std::make_unique<boost::asio::ip::tcp::socket>(io_context_)) {
  BOOST_LOG_TRIVIAL(debug) << "TCP stream: TCP_Stream instance created";
}

TCP_Stream::~TCP_Stream() {
  close();
}


//==============================================
// CONNECTION
//==============================================

void TCP_Stream::connect(const EndpointAddress& address) {
  try {
    BOOST_LOG_TRIVIAL(info) << "TCP stream: Resolving " << address.to_string();

    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(address.host, std::to_string(address.port));

    BOOST_LOG_TRIVIAL(info) << "TCP stream: Attempting to connect to " << address.to_string();
    boost::asio::connect(*socket_, endpoints);

    BOOST_LOG_TRIVIAL(info) << "TCP stream: Connected to " << remote_address();
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP stream: Connection to " << address.to_string() << " failed: " << e.what();
    throw TransportError(NetworkError::CONNECTION_FAILED, e.code().message());
  }
}

void TCP_Stream::close() {
  if (socket_ && socket_->is_open()) {
    boost::system::error_code ec;

    socket_->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
      BOOST_LOG_TRIVIAL(debug) << "TCP stream: Socket shutdown error: " << ec.message();
    }

    socket_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP stream: Socket close error: " << ec.message();
    }
  }
}


//==============================================
// STREAM OPERATIONS
//==============================================

std::size_t TCP_Stream::read_some(void* data, std::size_t size, std::chrono::milliseconds wait) {
  boost::system::error_code result = boost::asio::error::would_block;
  std::size_t bytes = 0;

  socket_->async_read_some(boost::asio::buffer(data, size),
    [&result, &bytes](const boost::system::error_code& ec, std::size_t bytes_transferred) {
      result = ec;
      bytes = bytes_transferred;
    });

  run_for(wait);

  if (result == boost::asio::error::operation_aborted) {
    return 0;
  }
  if (result) {
    BOOST_LOG_TRIVIAL(error) << "TCP stream: Read error: " << result.message();
    throw TransportError(NetworkError::CONNECTION_LOST, result.message());
  }

  BOOST_LOG_TRIVIAL(trace) << "TCP stream: Read " << bytes << " bytes";
  return bytes;
}

std::size_t TCP_Stream::write_some(const void* data, std::size_t size, std::chrono::milliseconds wait) {
  boost::system::error_code result = boost::asio::error::would_block;
  std::size_t bytes = 0;

  socket_->async_write_some(boost::asio::buffer(data, size),
    [&result, &bytes](const boost::system::error_code& ec, std::size_t bytes_transferred) {
      result = ec;
      bytes = bytes_transferred;
    });

  run_for(wait);

  if (result == boost::asio::error::operation_aborted) {
    return 0;
  }
  if (result) {
    BOOST_LOG_TRIVIAL(error) << "TCP stream: Write error: " << result.message();
    throw TransportError(NetworkError::CONNECTION_LOST, result.message());
  }

  BOOST_LOG_TRIVIAL(trace) << "TCP stream: Wrote " << bytes << " bytes";
  return bytes;
}

void TCP_Stream::run_for(std::chrono::milliseconds wait) {
  io_context_.restart();
  io_context_.run_for(wait);

  // Operation still pending: cancel it and let its handler run with operation_aborted
  if (!io_context_.stopped()) {
    boost::system::error_code ec;
    socket_->cancel(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP stream: Error canceling socket operation: " << ec.message();
    }
    io_context_.run();
  }
}


//==============================================
// GETTERS
//==============================================

boost::asio::ip::tcp::socket& TCP_Stream::get_socket() {
  return *socket_;
}

bool TCP_Stream::is_open() const {
  return socket_ && socket_->is_open();
}

std::string TCP_Stream::remote_address() const {
  boost::system::error_code ec;
  auto endpoint = socket_->remote_endpoint(ec);
  if (ec) {
    return "<unknown>";
  }
  EndpointAddress address{endpoint.address().to_string(), endpoint.port()};
  return address.to_string();
}

} // namespace network
} // namespace netcp
