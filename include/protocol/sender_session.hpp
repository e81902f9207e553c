#ifndef NETCP_PROTOCOL_SENDER_SESSION_HPP
#define NETCP_PROTOCOL_SENDER_SESSION_HPP

#include <filesystem>
#include <vector>
#include "network/byte_stream.hpp"
#include "network/timed_stream.hpp"
#include "protocol/codec.hpp"
#include "protocol/session_config.hpp"
#include "protocol/session_state.hpp"
#include "protocol/transfer_observer.hpp"
#include "store/store.hpp"
#include "transfer/chunked_transfer.hpp"

namespace netcp {
namespace protocol {

// Offering side of a session: verifies the receiver's callsign, offers each
// file in order and streams those the receiver accepts, then sends END.
class SenderSession {
public:
  SenderSession(const SenderSession&) = delete;
  SenderSession& operator=(const SenderSession&) = delete;


  // ---- CONSTRUCTOR ----
  // stream is an accepted connection; observer may be null
  SenderSession(network::ByteStream& stream, const store::FileStore& store,
                const SessionConfig& config = SessionConfig{},
                TransferObserver* observer = nullptr);


  // ---- SESSION ----
  // Runs the whole session over already-resolved paths. Throws on any fatal error.
  SessionSummary run(const std::vector<std::filesystem::path>& files);


  // ---- GETTERS ----
  SenderState get_state() const { return state_.get_state(); }

private:
  // ---- PARAMETERS ----
  network::ByteStream& raw_stream_;
  const store::FileStore& store_;
  SessionConfig config_;
  TransferObserver* observer_;

  network::TimedStream stream_;
  Codec codec_;
  transfer::ChunkedTransfer chunked_;
  SessionState<SenderState> state_;


  // ---- PROTOCOL STEPS ----
  void handshake();
  // Offers one file and, if accepted, streams it; the outcome goes into summary
  void offer_file(const std::filesystem::path& path, SessionSummary& summary);
  void finish();

  void advance(SenderState next);
};

} // namespace protocol
} // namespace netcp

#endif // NETCP_PROTOCOL_SENDER_SESSION_HPP
