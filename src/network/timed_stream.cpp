#include "network/timed_stream.hpp"
#include "network/network_error.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace netcp {
namespace network {

constexpr std::chrono::milliseconds TimedStream::DEFAULT_IDLE_TIMEOUT;

TimedStream::TimedStream(ByteStream& stream, std::chrono::milliseconds idle_timeout)
  : stream_(stream)
  , idle_timeout_(idle_timeout) {
  if (idle_timeout_.count() <= 0) {
    BOOST_LOG_TRIVIAL(error) << "Timed stream: Invalid idle timeout: " << idle_timeout_.count() << " ms";
    throw std::invalid_argument("Timed stream: Idle timeout must be positive");
  }
}

void TimedStream::read_exact(void* data, std::size_t size) {
  char* target = static_cast<char*>(data);
  std::size_t received = 0;
  Clock::time_point last_progress = Clock::now();

  while (received < size) {
    std::chrono::milliseconds window = remaining_window(last_progress);
    if (window.count() == 0) {
      BOOST_LOG_TRIVIAL(error) << "Timed stream: Read stalled after " << received << " of " << size << " bytes";
      throw TimeoutError("received " + std::to_string(received) + " of " + std::to_string(size) + " bytes");
    }

    std::size_t bytes = stream_.read_some(target + received, size - received, window);
    if (bytes != 0) {
      received += bytes;
      last_progress = Clock::now();
    }
  }

  BOOST_LOG_TRIVIAL(trace) << "Timed stream: Read " << size << " bytes";
}

void TimedStream::write_exact(const void* data, std::size_t size) {
  const char* source = static_cast<const char*>(data);
  std::size_t sent = 0;
  Clock::time_point last_progress = Clock::now();

  while (sent < size) {
    std::chrono::milliseconds window = remaining_window(last_progress);
    if (window.count() == 0) {
      BOOST_LOG_TRIVIAL(error) << "Timed stream: Write stalled after " << sent << " of " << size << " bytes";
      throw TimeoutError("sent " + std::to_string(sent) + " of " + std::to_string(size) + " bytes");
    }

    std::size_t bytes = stream_.write_some(source + sent, size - sent, window);
    if (bytes != 0) {
      sent += bytes;
      last_progress = Clock::now();
    }
  }

  BOOST_LOG_TRIVIAL(trace) << "Timed stream: Wrote " << size << " bytes";
}

std::string TimedStream::read_exact(std::size_t size) {
  std::string data(size, '\0');
  read_exact(&data[0], size);
  return data;
}

void TimedStream::write_exact(const std::string& data) {
  write_exact(data.data(), data.size());
}

std::chrono::milliseconds TimedStream::remaining_window(Clock::time_point last_progress) const {
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - last_progress);
  if (elapsed >= idle_timeout_) {
    return std::chrono::milliseconds{0};
  }
  return idle_timeout_ - elapsed;
}

} // namespace network
} // namespace netcp
