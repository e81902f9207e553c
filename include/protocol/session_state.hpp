#ifndef NETCP_PROTOCOL_SESSION_STATE_HPP
#define NETCP_PROTOCOL_SESSION_STATE_HPP

#include <ostream>
#include <string>

namespace netcp {
namespace protocol {

/**
 * Sender (offering peer) states:
 * AWAIT_CONNECTION - Listening, no peer yet
 * VERIFY_CALLSIGN  - Reading the receiver's callsign
 * SEND_AGREEMENT   - Acknowledging the handshake
 * ANNOUNCE_FILE    - Sending FILE marker, size and name
 * AWAIT_AGREEMENT  - Waiting for the receiver's answer to an offer
 * TRANSFER_FILE    - Streaming the payload of an accepted file
 * SKIP_FILE        - Offer declined, no payload sent
 * SEND_END         - Sending the END marker
 * DONE             - Session completed
 * FAILED           - Session aborted by a fatal error
 */
enum class SenderState {
    AWAIT_CONNECTION,
    VERIFY_CALLSIGN,
    SEND_AGREEMENT,
    ANNOUNCE_FILE,
    AWAIT_AGREEMENT,
    TRANSFER_FILE,
    SKIP_FILE,
    SEND_END,
    DONE,
    FAILED
};

/**
 * Receiver (requesting peer) states:
 * CONNECT           - Connecting to the sender
 * SEND_CALLSIGN     - Identifying the protocol
 * AWAIT_AGREEMENT   - Waiting for the handshake answer
 * READ_MARKER       - Waiting for FILE or END
 * READ_SIZE         - Reading the offered file size
 * READ_NAME         - Reading the offered file name
 * TRY_CREATE        - Creating the destination file
 * SEND_AGREEMENT    - Accepting the offer
 * SEND_DISAGREEMENT - Declining the offer
 * RECEIVE_PAYLOAD   - Receiving file content
 * DONE              - END received
 * FAILED            - Session aborted by a fatal error
 */
enum class ReceiverState {
    CONNECT,
    SEND_CALLSIGN,
    AWAIT_AGREEMENT,
    READ_MARKER,
    READ_SIZE,
    READ_NAME,
    TRY_CREATE,
    SEND_AGREEMENT,
    SEND_DISAGREEMENT,
    RECEIVE_PAYLOAD,
    DONE,
    FAILED
};

inline constexpr SenderState initial_state(SenderState) { return SenderState::AWAIT_CONNECTION; }
inline constexpr ReceiverState initial_state(ReceiverState) { return ReceiverState::CONNECT; }

inline bool is_terminal(SenderState state) {
    return state == SenderState::DONE || state == SenderState::FAILED;
}

inline bool is_terminal(ReceiverState state) {
    return state == ReceiverState::DONE || state == ReceiverState::FAILED;
}

// Check if a sender transition is valid
inline bool is_valid_transition(SenderState from, SenderState to) {
    if (to == SenderState::FAILED) {
        return !is_terminal(from);
    }

    switch (from) {
        case SenderState::AWAIT_CONNECTION:
            return to == SenderState::VERIFY_CALLSIGN;

        case SenderState::VERIFY_CALLSIGN:
            return to == SenderState::SEND_AGREEMENT;

        case SenderState::SEND_AGREEMENT:
        case SenderState::TRANSFER_FILE:
        case SenderState::SKIP_FILE:
            return to == SenderState::ANNOUNCE_FILE ||
                   to == SenderState::SEND_END;

        case SenderState::ANNOUNCE_FILE:
            return to == SenderState::AWAIT_AGREEMENT;

        case SenderState::AWAIT_AGREEMENT:
            return to == SenderState::TRANSFER_FILE ||
                   to == SenderState::SKIP_FILE;

        case SenderState::SEND_END:
            return to == SenderState::DONE;

        case SenderState::DONE:
        case SenderState::FAILED:
            return false;
    }
    return false;
}

// Check if a receiver transition is valid
inline bool is_valid_transition(ReceiverState from, ReceiverState to) {
    if (to == ReceiverState::FAILED) {
        return !is_terminal(from);
    }

    switch (from) {
        case ReceiverState::CONNECT:
            return to == ReceiverState::SEND_CALLSIGN;

        case ReceiverState::SEND_CALLSIGN:
            return to == ReceiverState::AWAIT_AGREEMENT;

        case ReceiverState::AWAIT_AGREEMENT:
        case ReceiverState::SEND_DISAGREEMENT:
        case ReceiverState::RECEIVE_PAYLOAD:
            return to == ReceiverState::READ_MARKER;

        case ReceiverState::READ_MARKER:
            return to == ReceiverState::READ_SIZE ||
                   to == ReceiverState::DONE;

        case ReceiverState::READ_SIZE:
            return to == ReceiverState::READ_NAME;

        case ReceiverState::READ_NAME:
            return to == ReceiverState::TRY_CREATE;

        case ReceiverState::TRY_CREATE:
            return to == ReceiverState::SEND_AGREEMENT ||
                   to == ReceiverState::SEND_DISAGREEMENT;

        case ReceiverState::SEND_AGREEMENT:
            return to == ReceiverState::RECEIVE_PAYLOAD;

        case ReceiverState::DONE:
        case ReceiverState::FAILED:
            return false;
    }
    return false;
}

// Convert state to string for logging
inline const char* state_to_string(SenderState state) {
    switch (state) {
        case SenderState::AWAIT_CONNECTION: return "AWAIT_CONNECTION";
        case SenderState::VERIFY_CALLSIGN:  return "VERIFY_CALLSIGN";
        case SenderState::SEND_AGREEMENT:   return "SEND_AGREEMENT";
        case SenderState::ANNOUNCE_FILE:    return "ANNOUNCE_FILE";
        case SenderState::AWAIT_AGREEMENT:  return "AWAIT_AGREEMENT";
        case SenderState::TRANSFER_FILE:    return "TRANSFER_FILE";
        case SenderState::SKIP_FILE:        return "SKIP_FILE";
        case SenderState::SEND_END:         return "SEND_END";
        case SenderState::DONE:             return "DONE";
        case SenderState::FAILED:           return "FAILED";
        default:                            return "UNKNOWN";
    }
}

inline const char* state_to_string(ReceiverState state) {
    switch (state) {
        case ReceiverState::CONNECT:           return "CONNECT";
        case ReceiverState::SEND_CALLSIGN:     return "SEND_CALLSIGN";
        case ReceiverState::AWAIT_AGREEMENT:   return "AWAIT_AGREEMENT";
        case ReceiverState::READ_MARKER:       return "READ_MARKER";
        case ReceiverState::READ_SIZE:         return "READ_SIZE";
        case ReceiverState::READ_NAME:         return "READ_NAME";
        case ReceiverState::TRY_CREATE:        return "TRY_CREATE";
        case ReceiverState::SEND_AGREEMENT:    return "SEND_AGREEMENT";
        case ReceiverState::SEND_DISAGREEMENT: return "SEND_DISAGREEMENT";
        case ReceiverState::RECEIVE_PAYLOAD:   return "RECEIVE_PAYLOAD";
        case ReceiverState::DONE:              return "DONE";
        case ReceiverState::FAILED:            return "FAILED";
        default:                               return "UNKNOWN";
    }
}

/**
 * SessionState tracks one peer's position in its role's state machine and
 * rejects transitions the protocol does not allow.
 */
template <typename State>
class SessionState {
public:
    SessionState() : current_state_(initial_state(State{})) {}

    State get_state() const { return current_state_; }

    bool is_terminal() const { return protocol::is_terminal(current_state_); }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

// Stream operators to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, SenderState state) {
    return os << state_to_string(state);
}

inline std::ostream& operator<<(std::ostream& os, ReceiverState state) {
    return os << state_to_string(state);
}

} // namespace protocol
} // namespace netcp

#endif // NETCP_PROTOCOL_SESSION_STATE_HPP
