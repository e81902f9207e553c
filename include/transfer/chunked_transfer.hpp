#ifndef NETCP_TRANSFER_CHUNKED_TRANSFER_HPP
#define NETCP_TRANSFER_CHUNKED_TRANSFER_HPP

#include <cstdint>
#include <functional>
#include <istream>
#include <ostream>
#include <vector>
#include "network/timed_stream.hpp"

namespace netcp {
namespace transfer {

// Moves file payloads between a file stream and the timed stream in fixed-size
// chunks. Payload bytes go straight through the timed stream without framing.
class ChunkedTransfer {
public:
  static constexpr std::size_t DEFAULT_CHUNK_SIZE = 512;

  // Called once per chunk with the chunk length and the running total
  using ChunkCallback = std::function<void(std::size_t chunk_bytes, uint64_t transferred, uint64_t total)>;

  // ---- CONSTRUCTOR ----
  explicit ChunkedTransfer(network::TimedStream& stream, std::size_t chunk_size = DEFAULT_CHUNK_SIZE);


  // ---- PAYLOAD TRANSFER ----
  // Reads size bytes from file and sends them; returns the number of chunks sent
  std::size_t stream_out(std::istream& file, uint64_t size, const ChunkCallback& on_chunk = nullptr);
  // Receives size bytes and writes them to file; returns the number of chunks received
  std::size_t stream_in(std::ostream& file, uint64_t size, const ChunkCallback& on_chunk = nullptr);


  // ---- GETTERS ----
  std::size_t chunk_size() const { return buffer_.size(); }

private:
  // ---- PARAMETERS ----
  network::TimedStream& stream_;
  std::vector<char> buffer_;
};

} // namespace transfer
} // namespace netcp

#endif // NETCP_TRANSFER_CHUNKED_TRANSFER_HPP
