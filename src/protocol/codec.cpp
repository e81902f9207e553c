#include "protocol/codec.hpp"
#include "protocol/protocol_error.hpp"
#include "utils/utf8.hpp"
#include <boost/log/trivial.hpp>

namespace netcp {
namespace protocol {

constexpr uint64_t Codec::MAX_STRING_LENGTH;

Codec::Codec(network::TimedStream& stream)
  : stream_(stream) {
}


//==============================================
// INTEGER FIELDS
//==============================================

void Codec::send_u64(uint64_t value) {
  uint64_t wire_value = to_wire_order(value);
  BOOST_LOG_TRIVIAL(trace) << "Codec: Writing u64: " << value;
  stream_.write_exact(&wire_value, sizeof(wire_value));
}

uint64_t Codec::recv_u64() {
  uint64_t wire_value = 0;
  stream_.read_exact(&wire_value, sizeof(wire_value));
  uint64_t value = from_wire_order(wire_value);
  BOOST_LOG_TRIVIAL(trace) << "Codec: Read u64: " << value;
  return value;
}


//==============================================
// STRING FIELDS
//==============================================

void Codec::send_string(std::string_view value) {
  BOOST_LOG_TRIVIAL(trace) << "Codec: Writing string of length: " << value.size();
  send_u64(value.size());
  stream_.write_exact(value.data(), value.size());
}

std::string Codec::recv_string() {
  uint64_t length = recv_u64();
  if (length > MAX_STRING_LENGTH) {
    BOOST_LOG_TRIVIAL(error) << "Codec: String length " << length << " exceeds limit of " << MAX_STRING_LENGTH;
    throw ProtocolError("String field too long (" + std::to_string(length) + " bytes)");
  }

  std::string value = stream_.read_exact(static_cast<std::size_t>(length));

  if (!utils::is_valid_utf8(value)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Received string of length " << length << " is not valid UTF-8";
    throw ProtocolError("Couldn't convert bytes to string");
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Read string: " << value;
  return value;
}


//==============================================
// TOKENS
//==============================================

void Codec::send_agreement(Agreement agreement) {
  BOOST_LOG_TRIVIAL(debug) << "Codec: Sending " << agreement;
  std::string_view bytes = encode(agreement);
  stream_.write_exact(bytes.data(), bytes.size());
}

Agreement Codec::recv_agreement() {
  Agreement agreement = decode_agreement(stream_.read_exact(AGREEMENT_SIZE));
  BOOST_LOG_TRIVIAL(debug) << "Codec: Received " << agreement;
  return agreement;
}

void Codec::send_marker(Marker marker) {
  BOOST_LOG_TRIVIAL(debug) << "Codec: Sending marker " << marker;
  std::string_view bytes = encode(marker);
  stream_.write_exact(bytes.data(), bytes.size());
}

Marker Codec::recv_marker() {
  Marker marker = decode_marker(stream_.read_exact(MARKER_SIZE));
  BOOST_LOG_TRIVIAL(debug) << "Codec: Received marker " << marker;
  return marker;
}

void Codec::send_callsign(std::string_view callsign) {
  BOOST_LOG_TRIVIAL(debug) << "Codec: Sending callsign \"" << callsign << "\"";
  stream_.write_exact(callsign.data(), callsign.size());
}

void Codec::expect_callsign(std::string_view callsign) {
  std::string received = stream_.read_exact(callsign.size());
  if (!tokens_equal(received, callsign)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Callsign mismatch, expected \"" << callsign << "\"";
    throw ProtocolError("Invalid protocol");
  }
  BOOST_LOG_TRIVIAL(debug) << "Codec: Callsign verified";
}

} // namespace protocol
} // namespace netcp
