#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "protocol/protocol_error.hpp"
#include "protocol/tokens.hpp"
#include "utils/utf8.hpp"

using namespace netcp::protocol;

TEST(TokensTest, WireConstants) {
  EXPECT_EQ(CALLSIGN, "netcp v0.1");
  EXPECT_EQ(encode(Agreement::AGREE), "AGREE   ");
  EXPECT_EQ(encode(Agreement::DISAGREE), "DISAGREE");
  EXPECT_EQ(encode(Marker::FILE), "FILE");
  EXPECT_EQ(encode(Marker::END), "END ");
}

TEST(TokensTest, DecodesKnownTokens) {
  EXPECT_EQ(decode_agreement("AGREE   "), Agreement::AGREE);
  EXPECT_EQ(decode_agreement("DISAGREE"), Agreement::DISAGREE);
  EXPECT_EQ(decode_marker("FILE"), Marker::FILE);
  EXPECT_EQ(decode_marker("END "), Marker::END);
}

TEST(TokensTest, DecodingIsCaseSensitive) {
  EXPECT_THROW(decode_agreement("agree   "), ProtocolError);
  EXPECT_THROW(decode_agreement("Disagree"), ProtocolError);
  EXPECT_THROW(decode_marker("file"), ProtocolError);
}

TEST(TokensTest, DecodingIsLengthSensitive) {
  // The trailing padding is part of the token
  EXPECT_THROW(decode_agreement("AGREE"), ProtocolError);
  EXPECT_THROW(decode_marker("END"), ProtocolError);
  EXPECT_THROW(decode_marker("FILES"), ProtocolError);
}

TEST(TokensTest, UnknownBytesAreProtocolErrors) {
  try {
    decode_marker(std::string("\x00\x01\xff\x7f", 4));
    FAIL() << "Expected ProtocolError";
  } catch (const ProtocolError& e) {
    EXPECT_STREQ(e.what(), "Invalid protocol");
  }
}

TEST(TokensTest, TokensEqualComparesLengthFirst) {
  EXPECT_TRUE(tokens_equal("END ", "END "));
  EXPECT_FALSE(tokens_equal("END", "END "));
  EXPECT_FALSE(tokens_equal("", "A"));
  EXPECT_TRUE(tokens_equal("", ""));
  EXPECT_FALSE(tokens_equal("netcp v0.1", "netcp v0.2"));
}

TEST(TokensTest, StreamOperators) {
  std::ostringstream out;
  out << Agreement::DISAGREE << " " << Marker::END;
  EXPECT_EQ(out.str(), "DISAGREE END");
}

TEST(Utf8Test, AcceptsWellFormedText) {
  EXPECT_TRUE(netcp::utils::is_valid_utf8(""));
  EXPECT_TRUE(netcp::utils::is_valid_utf8("report.pdf"));
  EXPECT_TRUE(netcp::utils::is_valid_utf8("\xc3\xa9t\xc3\xa9.txt"));          // été.txt
  EXPECT_TRUE(netcp::utils::is_valid_utf8("\xe6\x97\xa5\xe6\x9c\xac"));       // 日本
  EXPECT_TRUE(netcp::utils::is_valid_utf8("\xf0\x9f\x93\x81"));               // U+1F4C1
}

TEST(Utf8Test, RejectsMalformedText) {
  EXPECT_FALSE(netcp::utils::is_valid_utf8("\xff"));
  EXPECT_FALSE(netcp::utils::is_valid_utf8("\xc3"));               // truncated
  EXPECT_FALSE(netcp::utils::is_valid_utf8("\xc0\xaf"));           // overlong '/'
  EXPECT_FALSE(netcp::utils::is_valid_utf8("\xed\xa0\x80"));       // surrogate
  EXPECT_FALSE(netcp::utils::is_valid_utf8("abc\x80"));
}
