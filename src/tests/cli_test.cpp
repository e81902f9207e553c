#include <gtest/gtest.h>
#include <chrono>
#include <sstream>
#include <string>
#include <vector>
#include "cli/cli.hpp"
#include "network/tcp_listener.hpp"
#include "test_utils.hpp"

using namespace netcp::cli;
using netcp::network::EndpointAddress;

namespace {

void expect_argument_error(const std::vector<std::string>& args, const std::string& message) {
  try {
    parse_command_line(args);
    FAIL() << "Expected ArgumentError: " << message;
  } catch (const ArgumentError& e) {
    EXPECT_EQ(std::string(e.what()), message);
  }
}

} // namespace

class CLITest : public ::testing::Test {
protected:
  void TearDown() override {
    // CLI::run replaces the sinks; put the test sink back
    netcp::test::init_test_logging();
  }

  std::ostringstream out;
  std::ostringstream err;
  CLI cli{out, err};
};

TEST(ParseCommandLineTest, Send) {
  ProgramOptions options = parse_command_line({"send", "0.0.0.0:4000", "a.bin", "b.txt"});
  EXPECT_EQ(options.command, Command::SEND);
  EXPECT_EQ(options.address.host, "0.0.0.0");
  EXPECT_EQ(options.address.port, 4000);
  EXPECT_EQ(options.files, (std::vector<std::string>{"a.bin", "b.txt"}));
}

TEST(ParseCommandLineTest, Receive) {
  ProgramOptions options = parse_command_line({"receive", "192.168.1.5:4000"});
  EXPECT_EQ(options.command, Command::RECEIVE);
  EXPECT_EQ(options.address.host, "192.168.1.5");
  EXPECT_TRUE(options.files.empty());
}

TEST(ParseCommandLineTest, Help) {
  EXPECT_EQ(parse_command_line({"help"}).command, Command::HELP);
}

TEST(ParseCommandLineTest, DefaultsMatchProtocol) {
  ProgramOptions options = parse_command_line({"receive", "localhost:1"});
  EXPECT_EQ(options.session.callsign, "netcp v0.1");
  EXPECT_EQ(options.session.idle_timeout, std::chrono::milliseconds(800));
  EXPECT_EQ(options.session.chunk_size, 512u);
  EXPECT_TRUE(options.log.log_file.empty());
  EXPECT_EQ(options.log.min_level, boost::log::trivial::fatal);
}

TEST(ParseCommandLineTest, OptionsBeforeCommand) {
  ProgramOptions options = parse_command_line({
    "--timeout", "2500", "--chunk-size", "4096", "--log-file", "netcp.log", "--log-level", "info",
    "receive", "localhost:4000"});

  EXPECT_EQ(options.session.idle_timeout, std::chrono::milliseconds(2500));
  EXPECT_EQ(options.session.chunk_size, 4096u);
  EXPECT_EQ(options.log.log_file, "netcp.log");
  EXPECT_EQ(options.log.min_level, boost::log::trivial::info);
}

TEST(ParseCommandLineTest, VerboseFlag) {
  EXPECT_EQ(parse_command_line({"-v", "help"}).log.min_level, boost::log::trivial::debug);
  EXPECT_EQ(parse_command_line({"--verbose", "help"}).log.min_level, boost::log::trivial::debug);
}

TEST(ParseCommandLineTest, ArgumentErrors) {
  expect_argument_error({}, "No arguments");
  expect_argument_error({"-v"}, "No arguments");
  expect_argument_error({"send", "localhost:4000"}, "Too few arguments");
  expect_argument_error({"send"}, "Too few arguments");
  expect_argument_error({"receive"}, "Too few or many arguments");
  expect_argument_error({"receive", "localhost:4000", "extra"}, "Too few or many arguments");
  expect_argument_error({"copy", "localhost:4000"}, "Unknown parameter");
  expect_argument_error({"--fast", "help"}, "Unknown option --fast");
  expect_argument_error({"--timeout"}, "Missing value for --timeout");
  expect_argument_error({"--timeout", "0", "help"}, "Invalid value for --timeout: 0");
  expect_argument_error({"--chunk-size", "12k", "help"}, "Invalid value for --chunk-size: 12k");
  expect_argument_error({"--chunk-size", "-4", "help"}, "Invalid value for --chunk-size: -4");
  expect_argument_error({"--log-level", "loud", "help"}, "Unknown log level: loud");
}

TEST(ParseCommandLineTest, TimeoutIsBounded) {
  EXPECT_EQ(parse_command_line({"--timeout", "86400000", "help"}).session.idle_timeout,
            std::chrono::hours(24));
  expect_argument_error({"--timeout", "86400001", "help"}, "Invalid value for --timeout: 86400001");
  expect_argument_error({"--timeout", "9223372036854775807", "help"},
                        "Invalid value for --timeout: 9223372036854775807");
  expect_argument_error({"--timeout", "99999999999999999999999", "help"},
                        "Invalid value for --timeout: 99999999999999999999999");
}

TEST(ParseCommandLineTest, NumbersMustStartWithADigit) {
  expect_argument_error({"--timeout", " 5", "help"}, "Invalid value for --timeout:  5");
  expect_argument_error({"--timeout", "+5", "help"}, "Invalid value for --timeout: +5");
  expect_argument_error({"--chunk-size", "\t64", "help"}, "Invalid value for --chunk-size: \t64");
  expect_argument_error({"--chunk-size", "", "help"}, "Invalid value for --chunk-size: ");
}

TEST(ParseEndpointAddressTest, HostAndPort) {
  EndpointAddress address = parse_endpoint_address("example.org:8080");
  EXPECT_EQ(address.host, "example.org");
  EXPECT_EQ(address.port, 8080);

  EXPECT_EQ(parse_endpoint_address("127.0.0.1:0").port, 0);
  EXPECT_EQ(parse_endpoint_address("127.0.0.1:65535").port, 65535);
}

TEST(ParseEndpointAddressTest, BracketedIPv6) {
  EndpointAddress address = parse_endpoint_address("[::1]:4000");
  EXPECT_EQ(address.host, "::1");
  EXPECT_EQ(address.port, 4000);
}

TEST(ParseEndpointAddressTest, Malformed) {
  EXPECT_THROW(parse_endpoint_address("localhost"), ArgumentError);
  EXPECT_THROW(parse_endpoint_address(":4000"), ArgumentError);
  EXPECT_THROW(parse_endpoint_address("localhost:"), ArgumentError);
  EXPECT_THROW(parse_endpoint_address("::1:4000"), ArgumentError);
  EXPECT_THROW(parse_endpoint_address("[]:4000"), ArgumentError);
  EXPECT_THROW(parse_endpoint_address("localhost:port"), ArgumentError);
  EXPECT_THROW(parse_endpoint_address("localhost:65536"), ArgumentError);
  EXPECT_THROW(parse_endpoint_address("localhost:123456"), ArgumentError);
}

TEST_F(CLITest, HelpPrintsUsageAndSucceeds) {
  EXPECT_EQ(cli.run({"help"}), 0);
  EXPECT_EQ(out.str(), CLI::usage());
  EXPECT_TRUE(err.str().empty());
}

TEST_F(CLITest, ArgumentErrorExitsWithOne) {
  EXPECT_EQ(cli.run({}), 1);
  EXPECT_EQ(err.str(), "Error: No arguments.\n");
}

TEST_F(CLITest, UnknownCommandExitsWithOne) {
  EXPECT_EQ(cli.run({"copy", "localhost:1"}), 1);
  EXPECT_EQ(err.str(), "Error: Unknown parameter.\n");
}

TEST_F(CLITest, MissingSourceFileFailsBeforeListening) {
  EXPECT_EQ(cli.run({"send", "127.0.0.1:0", "definitely-not-here.bin"}), 1);
  EXPECT_NE(err.str().find("File doesn't exist or is not accessible"), std::string::npos);
  EXPECT_EQ(out.str().find("Waiting for client"), std::string::npos);
}

TEST_F(CLITest, ReceiveWithoutSenderFails) {
  // Grab a free port, then release it so nothing is listening there
  uint16_t port = 0;
  {
    netcp::network::TCP_Listener listener(EndpointAddress{"127.0.0.1", 0});
    port = listener.local_port();
  }
  EXPECT_EQ(cli.run({"receive", "127.0.0.1:" + std::to_string(port)}), 1);
  EXPECT_EQ(err.str().rfind("Error: Connection failed", 0), 0u);
}

TEST(ConsoleProgressTest, SenderMessages) {
  std::ostringstream out;
  ConsoleProgress progress(ConsoleProgress::Role::SENDER, out);

  progress.on_connected("10.0.0.2:51234");
  progress.on_file_started("a.bin", 1300);
  progress.on_file_completed("a.bin", 1300);
  progress.on_file_started("b.txt", 8);
  progress.on_file_skipped("b.txt");

  EXPECT_EQ(out.str(),
    "connected with 10.0.0.2:51234.\n"
    "Send a.bin...done.\n"
    "Send b.txt...cancelled by client.\n");
}

TEST(ConsoleProgressTest, ReceiverMessages) {
  std::ostringstream out;
  ConsoleProgress progress(ConsoleProgress::Role::RECEIVER, out);

  progress.on_connected("10.0.0.1:4000");
  progress.on_file_started("a.bin", 1300);
  progress.on_file_completed("a.bin", 1300);
  progress.on_file_skipped("b.txt");

  EXPECT_EQ(out.str(),
    "Receive a.bin...done.\n"
    "Couldn't create file b.txt. Skip file transmission.\n");
}
