#ifndef NETCP_PROTOCOL_TRANSFER_OBSERVER_HPP
#define NETCP_PROTOCOL_TRANSFER_OBSERVER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace netcp {
namespace protocol {

// Progress notifications for whoever reports to the user. Every callback is
// optional; the defaults do nothing.
class TransferObserver {
public:
  virtual ~TransferObserver() = default;

  virtual void on_connected(const std::string& /*peer*/) {}
  virtual void on_file_started(const std::string& /*name*/, uint64_t /*size*/) {}
  virtual void on_progress(const std::string& /*name*/, uint64_t /*transferred*/, uint64_t /*total*/) {}
  virtual void on_file_completed(const std::string& /*name*/, uint64_t /*bytes*/) {}
  virtual void on_file_skipped(const std::string& /*name*/) {}
};

// Outcome of a completed session
struct SessionSummary {
  std::vector<std::string> transferred;
  std::vector<std::string> skipped;
  uint64_t payload_bytes{0};
};

} // namespace protocol
} // namespace netcp

#endif // NETCP_PROTOCOL_TRANSFER_OBSERVER_HPP
