#include "protocol/tokens.hpp"
#include "protocol/protocol_error.hpp"
#include <boost/log/trivial.hpp>

namespace netcp {
namespace protocol {

namespace {

// Printable form of raw bytes for diagnostics
std::string escape(std::string_view bytes) {
  static const char hex[] = "0123456789abcdef";
  std::string out;
  for (char c : bytes) {
    unsigned char byte = static_cast<unsigned char>(c);
    if (byte >= 0x20 && byte < 0x7f) {
      out.push_back(c);
    } else {
      out += "\\x";
      out.push_back(hex[byte >> 4]);
      out.push_back(hex[byte & 0x0f]);
    }
  }
  return out;
}

} // namespace

std::string_view encode(Agreement agreement) {
  return agreement == Agreement::AGREE ? AGREE_TOKEN : DISAGREE_TOKEN;
}

std::string_view encode(Marker marker) {
  return marker == Marker::FILE ? FILE_TOKEN : END_TOKEN;
}

Agreement decode_agreement(std::string_view bytes) {
  if (tokens_equal(bytes, AGREE_TOKEN)) {
    return Agreement::AGREE;
  }
  if (tokens_equal(bytes, DISAGREE_TOKEN)) {
    return Agreement::DISAGREE;
  }
  BOOST_LOG_TRIVIAL(error) << "Tokens: Unexpected agreement token \"" << escape(bytes) << "\"";
  throw ProtocolError("Invalid protocol");
}

Marker decode_marker(std::string_view bytes) {
  if (tokens_equal(bytes, FILE_TOKEN)) {
    return Marker::FILE;
  }
  if (tokens_equal(bytes, END_TOKEN)) {
    return Marker::END;
  }
  BOOST_LOG_TRIVIAL(error) << "Tokens: Unexpected marker \"" << escape(bytes) << "\"";
  throw ProtocolError("Invalid protocol");
}

bool tokens_equal(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (a[i] != b[i]) {
      return false;
    }
  }
  return true;
}

const char* to_string(Agreement agreement) {
  switch (agreement) {
    case Agreement::AGREE:    return "AGREE";
    case Agreement::DISAGREE: return "DISAGREE";
    default:                  return "UNKNOWN";
  }
}

const char* to_string(Marker marker) {
  switch (marker) {
    case Marker::FILE: return "FILE";
    case Marker::END:  return "END";
    default:           return "UNKNOWN";
  }
}

} // namespace protocol
} // namespace netcp
