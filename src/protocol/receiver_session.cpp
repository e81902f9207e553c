#include "protocol/receiver_session.hpp"
#include "protocol/protocol_error.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <stdexcept>

namespace netcp {
namespace protocol {

//==============================================
// CONSTRUCTOR
//==============================================

ReceiverSession::ReceiverSession(network::ByteStream& stream, const store::FileStore& store,
                                 const SessionConfig& config, TransferObserver* observer)
  : raw_stream_(stream)
  , store_(store)
  , config_(config)
  , observer_(observer)
  , stream_(stream, config.idle_timeout)
  , codec_(stream_)
  , chunked_(stream_, config.chunk_size) {
  BOOST_LOG_TRIVIAL(debug) << "Receiver: Session created (idle timeout " << config_.idle_timeout.count()
                           << " ms, chunk size " << config_.chunk_size << ")";
}


//==============================================
// SESSION
//==============================================

SessionSummary ReceiverSession::run() {
  SessionSummary summary;

  try {
    handshake();

    while (true) {
      advance(ReceiverState::READ_MARKER);
      if (codec_.recv_marker() == Marker::END) {
        advance(ReceiverState::DONE);
        break;
      }
      receive_file(summary);
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Receiver: Session failed in state " << state_.get_state_string() << ": " << e.what();
    state_.transition_to(ReceiverState::FAILED);
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Receiver: Session complete, " << summary.transferred.size() << " received, "
                          << summary.skipped.size() << " skipped, " << summary.payload_bytes << " payload bytes";
  return summary;
}


//==============================================
// PROTOCOL STEPS
//==============================================

void ReceiverSession::handshake() {
  advance(ReceiverState::SEND_CALLSIGN);
  codec_.send_callsign(config_.callsign);

  advance(ReceiverState::AWAIT_AGREEMENT);
  if (codec_.recv_agreement() != Agreement::AGREE) {
    BOOST_LOG_TRIVIAL(error) << "Receiver: Sender refused the handshake";
    throw ProtocolError("No server found");
  }

  BOOST_LOG_TRIVIAL(info) << "Receiver: Handshake complete with " << raw_stream_.remote_address();
  if (observer_) {
    observer_->on_connected(raw_stream_.remote_address());
  }
}

void ReceiverSession::receive_file(SessionSummary& summary) {
  advance(ReceiverState::READ_SIZE);
  uint64_t size = codec_.recv_u64();

  advance(ReceiverState::READ_NAME);
  std::string name = codec_.recv_string();
  BOOST_LOG_TRIVIAL(info) << "Receiver: Offered " << name << " (" << size << " bytes)";

  advance(ReceiverState::TRY_CREATE);
  std::ofstream file;
  try {
    file = store_.create(name);
  }
  catch (const store::StoreError& e) {
    // Sender skips the payload on DISAGREE, so nothing is left to drain
    BOOST_LOG_TRIVIAL(warning) << "Receiver: " << e.what() << ". Skip file transmission.";
    advance(ReceiverState::SEND_DISAGREEMENT);
    codec_.send_agreement(Agreement::DISAGREE);
    summary.skipped.push_back(name);
    if (observer_) {
      observer_->on_file_skipped(name);
    }
    return;
  }

  advance(ReceiverState::SEND_AGREEMENT);
  codec_.send_agreement(Agreement::AGREE);
  if (observer_) {
    observer_->on_file_started(name, size);
  }

  advance(ReceiverState::RECEIVE_PAYLOAD);
  chunked_.stream_in(file, size,
    [this, &name](std::size_t, uint64_t transferred, uint64_t total) {
      if (observer_) {
        observer_->on_progress(name, transferred, total);
      }
    });
  file.close();

  BOOST_LOG_TRIVIAL(info) << "Receiver: Received " << name;
  summary.transferred.push_back(name);
  summary.payload_bytes += size;
  if (observer_) {
    observer_->on_file_completed(name, size);
  }
}

void ReceiverSession::advance(ReceiverState next) {
  ReceiverState previous = state_.get_state();
  if (!state_.transition_to(next)) {
    BOOST_LOG_TRIVIAL(error) << "Receiver: Invalid state transition " << previous << " -> " << next;
    throw std::logic_error(std::string("Receiver: Invalid state transition to ") + state_to_string(next));
  }
  BOOST_LOG_TRIVIAL(debug) << "Receiver: " << previous << " -> " << next;
}

} // namespace protocol
} // namespace netcp
