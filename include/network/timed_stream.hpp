#ifndef NETCP_NETWORK_TIMED_STREAM_HPP
#define NETCP_NETWORK_TIMED_STREAM_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include "network/byte_stream.hpp"

namespace netcp {
namespace network {

// Exact-length reads and writes over a ByteStream with idle-timeout liveness.
//
// The timeout is not a budget for the whole call: every attempt that moves at
// least one byte restarts the idle window, so a slow but steady peer never
// times out. Only a gap longer than idle_timeout without progress fails, with
// TimeoutError. Transport errors from the underlying stream propagate as-is.
class TimedStream {
public:
  static constexpr std::chrono::milliseconds DEFAULT_IDLE_TIMEOUT{800};

  // ---- CONSTRUCTOR ----
  explicit TimedStream(ByteStream& stream,
                       std::chrono::milliseconds idle_timeout = DEFAULT_IDLE_TIMEOUT);


  // ---- EXACT-LENGTH OPERATIONS ----
  void read_exact(void* data, std::size_t size);
  void write_exact(const void* data, std::size_t size);

  std::string read_exact(std::size_t size);
  void write_exact(const std::string& data);


  // ---- GETTERS ----
  std::chrono::milliseconds idle_timeout() const { return idle_timeout_; }

private:
  using Clock = std::chrono::steady_clock;

  // ---- PARAMETERS ----
  ByteStream& stream_;
  std::chrono::milliseconds idle_timeout_;


  // Time left in the idle window that started at last_progress, or zero once it has elapsed
  std::chrono::milliseconds remaining_window(Clock::time_point last_progress) const;
};

} // namespace network
} // namespace netcp

#endif // NETCP_NETWORK_TIMED_STREAM_HPP
