#include <gtest/gtest.h>
#include <sstream>
#include "protocol/session_state.hpp"

using namespace netcp::protocol;

class SenderStateTest : public ::testing::Test {
protected:
    SessionState<SenderState> state;

    void reach_await_agreement() {
        ASSERT_TRUE(state.transition_to(SenderState::VERIFY_CALLSIGN));
        ASSERT_TRUE(state.transition_to(SenderState::SEND_AGREEMENT));
        ASSERT_TRUE(state.transition_to(SenderState::ANNOUNCE_FILE));
        ASSERT_TRUE(state.transition_to(SenderState::AWAIT_AGREEMENT));
    }
};

class ReceiverStateTest : public ::testing::Test {
protected:
    SessionState<ReceiverState> state;

    void reach_try_create() {
        ASSERT_TRUE(state.transition_to(ReceiverState::SEND_CALLSIGN));
        ASSERT_TRUE(state.transition_to(ReceiverState::AWAIT_AGREEMENT));
        ASSERT_TRUE(state.transition_to(ReceiverState::READ_MARKER));
        ASSERT_TRUE(state.transition_to(ReceiverState::READ_SIZE));
        ASSERT_TRUE(state.transition_to(ReceiverState::READ_NAME));
        ASSERT_TRUE(state.transition_to(ReceiverState::TRY_CREATE));
    }
};

// Test initial state
TEST_F(SenderStateTest, InitialState) {
    EXPECT_EQ(state.get_state(), SenderState::AWAIT_CONNECTION);
    EXPECT_EQ(state.get_state_string(), "AWAIT_CONNECTION");
    EXPECT_FALSE(state.is_terminal());
}

// Accept one file, decline the next, then finish
TEST_F(SenderStateTest, AcceptThenDeclineThenEnd) {
    reach_await_agreement();
    EXPECT_TRUE(state.transition_to(SenderState::TRANSFER_FILE));
    EXPECT_TRUE(state.transition_to(SenderState::ANNOUNCE_FILE));
    EXPECT_TRUE(state.transition_to(SenderState::AWAIT_AGREEMENT));
    EXPECT_TRUE(state.transition_to(SenderState::SKIP_FILE));
    EXPECT_TRUE(state.transition_to(SenderState::SEND_END));
    EXPECT_TRUE(state.transition_to(SenderState::DONE));
    EXPECT_TRUE(state.is_terminal());
}

TEST_F(SenderStateTest, EmptyFileListGoesStraightToEnd) {
    ASSERT_TRUE(state.transition_to(SenderState::VERIFY_CALLSIGN));
    ASSERT_TRUE(state.transition_to(SenderState::SEND_AGREEMENT));
    EXPECT_TRUE(state.transition_to(SenderState::SEND_END));
}

// Test invalid state transitions
TEST_F(SenderStateTest, InvalidTransitions) {
    // No payload before the handshake
    EXPECT_FALSE(state.transition_to(SenderState::TRANSFER_FILE));
    EXPECT_EQ(state.get_state(), SenderState::AWAIT_CONNECTION);

    reach_await_agreement();
    // An offer must be answered before the next one or END
    EXPECT_FALSE(state.transition_to(SenderState::ANNOUNCE_FILE));
    EXPECT_FALSE(state.transition_to(SenderState::SEND_END));
    EXPECT_EQ(state.get_state(), SenderState::AWAIT_AGREEMENT);
}

TEST_F(SenderStateTest, FailedIsTerminal) {
    reach_await_agreement();
    EXPECT_TRUE(state.transition_to(SenderState::FAILED));
    EXPECT_TRUE(state.is_terminal());

    EXPECT_FALSE(state.transition_to(SenderState::FAILED));
    EXPECT_FALSE(state.transition_to(SenderState::ANNOUNCE_FILE));
    EXPECT_EQ(state.get_state(), SenderState::FAILED);
}

TEST_F(ReceiverStateTest, InitialState) {
    EXPECT_EQ(state.get_state(), ReceiverState::CONNECT);
    EXPECT_EQ(state.get_state_string(), "CONNECT");
}

TEST_F(ReceiverStateTest, AcceptedOfferReturnsToMarker) {
    reach_try_create();
    EXPECT_TRUE(state.transition_to(ReceiverState::SEND_AGREEMENT));
    EXPECT_FALSE(state.transition_to(ReceiverState::READ_MARKER));
    EXPECT_TRUE(state.transition_to(ReceiverState::RECEIVE_PAYLOAD));
    EXPECT_TRUE(state.transition_to(ReceiverState::READ_MARKER));
    EXPECT_TRUE(state.transition_to(ReceiverState::DONE));
    EXPECT_TRUE(state.is_terminal());
}

TEST_F(ReceiverStateTest, DeclinedOfferSkipsPayload) {
    reach_try_create();
    EXPECT_TRUE(state.transition_to(ReceiverState::SEND_DISAGREEMENT));
    EXPECT_FALSE(state.transition_to(ReceiverState::RECEIVE_PAYLOAD));
    EXPECT_TRUE(state.transition_to(ReceiverState::READ_MARKER));
}

TEST_F(ReceiverStateTest, DoneAcceptsNothing) {
    ASSERT_TRUE(state.transition_to(ReceiverState::SEND_CALLSIGN));
    ASSERT_TRUE(state.transition_to(ReceiverState::AWAIT_AGREEMENT));
    ASSERT_TRUE(state.transition_to(ReceiverState::READ_MARKER));
    ASSERT_TRUE(state.transition_to(ReceiverState::DONE));

    EXPECT_FALSE(state.transition_to(ReceiverState::READ_MARKER));
    EXPECT_FALSE(state.transition_to(ReceiverState::FAILED));
}

TEST(SessionStateStringTest, StreamOperators) {
    std::ostringstream out;
    out << SenderState::SKIP_FILE << " " << ReceiverState::SEND_DISAGREEMENT;
    EXPECT_EQ(out.str(), "SKIP_FILE SEND_DISAGREEMENT");
}
