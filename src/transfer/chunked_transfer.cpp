#include "transfer/chunked_transfer.hpp"
#include "store/store.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <stdexcept>

namespace netcp {
namespace transfer {

constexpr std::size_t ChunkedTransfer::DEFAULT_CHUNK_SIZE;

ChunkedTransfer::ChunkedTransfer(network::TimedStream& stream, std::size_t chunk_size)
  : stream_(stream) {
  if (chunk_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "Chunked transfer: Chunk size must not be zero";
    throw std::invalid_argument("Chunked transfer: Chunk size must not be zero");
  }
  buffer_.resize(chunk_size);
}

std::size_t ChunkedTransfer::stream_out(std::istream& file, uint64_t size, const ChunkCallback& on_chunk) {
  BOOST_LOG_TRIVIAL(debug) << "Chunked transfer: Sending " << size << " bytes in chunks of " << buffer_.size();

  uint64_t transferred = 0;
  std::size_t chunks = 0;

  while (transferred < size) {
    std::size_t chunk_bytes = static_cast<std::size_t>(
      std::min<uint64_t>(buffer_.size(), size - transferred));

    file.read(buffer_.data(), chunk_bytes);
    if (static_cast<std::size_t>(file.gcount()) != chunk_bytes) {
      BOOST_LOG_TRIVIAL(error) << "Chunked transfer: Short read from file after " << transferred
                               << " of " << size << " bytes";
      throw store::StoreError("Couldn't read from file");
    }

    stream_.write_exact(buffer_.data(), chunk_bytes);
    transferred += chunk_bytes;
    ++chunks;

    BOOST_LOG_TRIVIAL(trace) << "Chunked transfer: Sent " << chunk_bytes << " bytes, total sent: "
                             << transferred << " / " << size;
    if (on_chunk) {
      on_chunk(chunk_bytes, transferred, size);
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunked transfer: Sent " << transferred << " bytes in " << chunks << " chunks";
  return chunks;
}

std::size_t ChunkedTransfer::stream_in(std::ostream& file, uint64_t size, const ChunkCallback& on_chunk) {
  BOOST_LOG_TRIVIAL(debug) << "Chunked transfer: Receiving " << size << " bytes in chunks of " << buffer_.size();

  uint64_t transferred = 0;
  std::size_t chunks = 0;

  while (transferred < size) {
    std::size_t chunk_bytes = static_cast<std::size_t>(
      std::min<uint64_t>(buffer_.size(), size - transferred));

    stream_.read_exact(buffer_.data(), chunk_bytes);

    if (!file.write(buffer_.data(), chunk_bytes)) {
      BOOST_LOG_TRIVIAL(error) << "Chunked transfer: Failed to write " << chunk_bytes << " bytes to file";
      throw store::StoreError("Couldn't write to file");
    }
    transferred += chunk_bytes;
    ++chunks;

    BOOST_LOG_TRIVIAL(trace) << "Chunked transfer: Received " << chunk_bytes << " bytes, total received: "
                             << transferred << " / " << size;
    if (on_chunk) {
      on_chunk(chunk_bytes, transferred, size);
    }
  }

  if (!file.flush()) {
    BOOST_LOG_TRIVIAL(error) << "Chunked transfer: Failed to flush file";
    throw store::StoreError("Couldn't write to file");
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunked transfer: Received " << transferred << " bytes in " << chunks << " chunks";
  return chunks;
}

} // namespace transfer
} // namespace netcp
