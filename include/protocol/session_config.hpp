#ifndef NETCP_PROTOCOL_SESSION_CONFIG_HPP
#define NETCP_PROTOCOL_SESSION_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include "network/timed_stream.hpp"
#include "protocol/tokens.hpp"
#include "transfer/chunked_transfer.hpp"

namespace netcp {
namespace protocol {

struct SessionConfig {
  std::string callsign{CALLSIGN};
  std::chrono::milliseconds idle_timeout{network::TimedStream::DEFAULT_IDLE_TIMEOUT};
  std::size_t chunk_size{transfer::ChunkedTransfer::DEFAULT_CHUNK_SIZE};
};

} // namespace protocol
} // namespace netcp

#endif // NETCP_PROTOCOL_SESSION_CONFIG_HPP
