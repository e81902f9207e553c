#ifndef NETCP_PROTOCOL_CODEC_HPP
#define NETCP_PROTOCOL_CODEC_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <boost/endian/conversion.hpp>
#include "network/timed_stream.hpp"
#include "protocol/tokens.hpp"

namespace netcp {
namespace protocol {

// Encodes and decodes wire fields over a TimedStream. Transport failures from
// the stream propagate unchanged; malformed fields raise ProtocolError.
class Codec {
public:
  // Upper bound for a string field's declared length
  static constexpr uint64_t MAX_STRING_LENGTH = 64 * 1024;

  // ---- CONSTRUCTOR ----
  explicit Codec(network::TimedStream& stream);


  // ---- INTEGER FIELDS ----
  // 8 bytes, little-endian
  void send_u64(uint64_t value);
  uint64_t recv_u64();


  // ---- STRING FIELDS ----
  // u64 byte length followed by the raw UTF-8 bytes, no terminator
  void send_string(std::string_view value);
  std::string recv_string();


  // ---- TOKENS ----
  void send_agreement(Agreement agreement);
  Agreement recv_agreement();

  void send_marker(Marker marker);
  Marker recv_marker();

  void send_callsign(std::string_view callsign);
  // Reads exactly callsign.size() bytes; any difference throws ProtocolError
  void expect_callsign(std::string_view callsign);

private:
  // ---- PARAMETERS ----
  network::TimedStream& stream_;


  // ---- BYTE ORDER CONVERSION ----
  static uint64_t to_wire_order(uint64_t host_value) {
    return boost::endian::native_to_little(host_value);
  }
  static uint64_t from_wire_order(uint64_t wire_value) {
    return boost::endian::little_to_native(wire_value);
  }
};

} // namespace protocol
} // namespace netcp

#endif // NETCP_PROTOCOL_CODEC_HPP
