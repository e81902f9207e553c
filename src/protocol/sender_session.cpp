#include "protocol/sender_session.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace netcp {
namespace protocol {

//==============================================
// CONSTRUCTOR
//==============================================

SenderSession::SenderSession(network::ByteStream& stream, const store::FileStore& store,
                             const SessionConfig& config, TransferObserver* observer)
  : raw_stream_(stream)
  , store_(store)
  , config_(config)
  , observer_(observer)
  , stream_(stream, config.idle_timeout)
  , codec_(stream_)
  , chunked_(stream_, config.chunk_size) {
  BOOST_LOG_TRIVIAL(debug) << "Sender: Session created (idle timeout " << config_.idle_timeout.count()
                           << " ms, chunk size " << config_.chunk_size << ")";
}


//==============================================
// SESSION
//==============================================

SessionSummary SenderSession::run(const std::vector<std::filesystem::path>& files) {
  SessionSummary summary;

  try {
    handshake();

    for (const auto& path : files) {
      offer_file(path, summary);
    }

    finish();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Sender: Session failed in state " << state_.get_state_string() << ": " << e.what();
    state_.transition_to(SenderState::FAILED);
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Sender: Session complete, " << summary.transferred.size() << " sent, "
                          << summary.skipped.size() << " skipped, " << summary.payload_bytes << " payload bytes";
  return summary;
}


//==============================================
// PROTOCOL STEPS
//==============================================

void SenderSession::handshake() {
  advance(SenderState::VERIFY_CALLSIGN);
  codec_.expect_callsign(config_.callsign);

  // No way to refuse a client with a matching callsign
  advance(SenderState::SEND_AGREEMENT);
  codec_.send_agreement(Agreement::AGREE);

  BOOST_LOG_TRIVIAL(info) << "Sender: Handshake complete with " << raw_stream_.remote_address();
  if (observer_) {
    observer_->on_connected(raw_stream_.remote_address());
  }
}

void SenderSession::offer_file(const std::filesystem::path& path, SessionSummary& summary) {
  advance(SenderState::ANNOUNCE_FILE);

  store::SourceFile file = store_.open_for_read(path);
  BOOST_LOG_TRIVIAL(info) << "Sender: Offering " << file.name << " (" << file.size << " bytes)";

  codec_.send_marker(Marker::FILE);
  codec_.send_u64(file.size);
  codec_.send_string(file.name);
  if (observer_) {
    observer_->on_file_started(file.name, file.size);
  }

  advance(SenderState::AWAIT_AGREEMENT);
  if (codec_.recv_agreement() == Agreement::DISAGREE) {
    advance(SenderState::SKIP_FILE);
    BOOST_LOG_TRIVIAL(info) << "Sender: " << file.name << " declined by receiver";
    summary.skipped.push_back(file.name);
    if (observer_) {
      observer_->on_file_skipped(file.name);
    }
    return;
  }

  advance(SenderState::TRANSFER_FILE);
  const std::string& name = file.name;
  chunked_.stream_out(file.stream, file.size,
    [this, &name](std::size_t, uint64_t transferred, uint64_t total) {
      if (observer_) {
        observer_->on_progress(name, transferred, total);
      }
    });

  BOOST_LOG_TRIVIAL(info) << "Sender: Sent " << file.name;
  summary.transferred.push_back(file.name);
  summary.payload_bytes += file.size;
  if (observer_) {
    observer_->on_file_completed(file.name, file.size);
  }
}

void SenderSession::finish() {
  advance(SenderState::SEND_END);
  codec_.send_marker(Marker::END);
  advance(SenderState::DONE);
}

void SenderSession::advance(SenderState next) {
  SenderState previous = state_.get_state();
  if (!state_.transition_to(next)) {
    BOOST_LOG_TRIVIAL(error) << "Sender: Invalid state transition " << previous << " -> " << next;
    throw std::logic_error(std::string("Sender: Invalid state transition to ") + state_to_string(next));
  }
  BOOST_LOG_TRIVIAL(debug) << "Sender: " << previous << " -> " << next;
}

} // namespace protocol
} // namespace netcp
