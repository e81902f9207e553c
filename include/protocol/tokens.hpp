#ifndef NETCP_PROTOCOL_TOKENS_HPP
#define NETCP_PROTOCOL_TOKENS_HPP

#include <cstddef>
#include <ostream>
#include <string_view>

namespace netcp {
namespace protocol {

// ---- WIRE CONSTANTS ----
constexpr std::string_view CALLSIGN = "netcp v0.1";
constexpr std::string_view AGREE_TOKEN = "AGREE   ";
constexpr std::string_view DISAGREE_TOKEN = "DISAGREE";
constexpr std::string_view FILE_TOKEN = "FILE";
constexpr std::string_view END_TOKEN = "END ";

constexpr std::size_t AGREEMENT_SIZE = 8;
constexpr std::size_t MARKER_SIZE = 4;

static_assert(AGREE_TOKEN.size() == AGREEMENT_SIZE && DISAGREE_TOKEN.size() == AGREEMENT_SIZE,
              "Agreement tokens must be exactly 8 bytes");
static_assert(FILE_TOKEN.size() == MARKER_SIZE && END_TOKEN.size() == MARKER_SIZE,
              "Markers must be exactly 4 bytes");


// Answer to a proposal (handshake or file offer)
enum class Agreement {
    AGREE,
    DISAGREE
};

// Announces what follows on the stream
enum class Marker {
    FILE,
    END
};


// ---- ENCODING ----
std::string_view encode(Agreement agreement);
std::string_view encode(Marker marker);


// ---- DECODING ----
// Maps raw bytes to a token; any other byte pattern throws ProtocolError
Agreement decode_agreement(std::string_view bytes);
Marker decode_marker(std::string_view bytes);

// Length first, then byte by byte. Tokens of different lengths never compare equal.
bool tokens_equal(std::string_view a, std::string_view b);


// ---- LOGGING SUPPORT ----
const char* to_string(Agreement agreement);
const char* to_string(Marker marker);

inline std::ostream& operator<<(std::ostream& os, Agreement agreement) {
    return os << to_string(agreement);
}

inline std::ostream& operator<<(std::ostream& os, Marker marker) {
    return os << to_string(marker);
}

} // namespace protocol
} // namespace netcp

#endif // NETCP_PROTOCOL_TOKENS_HPP
