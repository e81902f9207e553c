#ifndef NETCP_PROTOCOL_RECEIVER_SESSION_HPP
#define NETCP_PROTOCOL_RECEIVER_SESSION_HPP

#include <string>
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

// Requesting side of a session: identifies itself with the callsign, then
// accepts every offered file it can create in the store and declines the rest,
// until the sender sends END.
class ReceiverSession {
public:
  ReceiverSession(const ReceiverSession&) = delete;
  ReceiverSession& operator=(const ReceiverSession&) = delete;


  // ---- CONSTRUCTOR ----
  // stream is a connected stream; observer may be null
  ReceiverSession(network::ByteStream& stream, const store::FileStore& store,
                  const SessionConfig& config = SessionConfig{},
                  TransferObserver* observer = nullptr);


  // ---- SESSION ----
  // Runs until END is received. Throws on any fatal error.
  SessionSummary run();


  // ---- GETTERS ----
  ReceiverState get_state() const { return state_.get_state(); }

private:
  // ---- PARAMETERS ----
  network::ByteStream& raw_stream_;
  const store::FileStore& store_;
  SessionConfig config_;
  TransferObserver* observer_;

  network::TimedStream stream_;
  Codec codec_;
  transfer::ChunkedTransfer chunked_;
  SessionState<ReceiverState> state_;


  // ---- PROTOCOL STEPS ----
  void handshake();
  // Handles one offer after its FILE marker, recording the outcome in summary
  void receive_file(SessionSummary& summary);

  void advance(ReceiverState next);
};

} // namespace protocol
} // namespace netcp

#endif // NETCP_PROTOCOL_RECEIVER_SESSION_HPP
