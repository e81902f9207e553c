#ifndef NETCP_CLI_CLI_HPP
#define NETCP_CLI_CLI_HPP

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "logger/logger.hpp"
#include "network/endpoint_address.hpp"
#include "protocol/session_config.hpp"
#include "protocol/transfer_observer.hpp"

namespace netcp {
namespace cli {

// Malformed command line
class ArgumentError : public std::runtime_error {
public:
  explicit ArgumentError(const std::string& message) : std::runtime_error(message) {}
};

enum class Command {
  HELP,
  SEND,
  RECEIVE
};

struct ProgramOptions {
  Command command{Command::HELP};
  network::EndpointAddress address;
  std::vector<std::string> files;
  protocol::SessionConfig session;
  logger::LogOptions log;
};

// Parses the arguments after the program name. Throws ArgumentError.
ProgramOptions parse_command_line(const std::vector<std::string>& args);
// Parses "host:port" or "[v6-host]:port". Throws ArgumentError.
network::EndpointAddress parse_endpoint_address(const std::string& text);


// Prints per-file progress lines for one side of a session
class ConsoleProgress : public protocol::TransferObserver {
public:
  enum class Role { SENDER, RECEIVER };

  ConsoleProgress(Role role, std::ostream& out);

  void on_connected(const std::string& peer) override;
  void on_file_started(const std::string& name, uint64_t size) override;
  void on_file_completed(const std::string& name, uint64_t bytes) override;
  void on_file_skipped(const std::string& name) override;

private:
  Role role_;
  std::ostream& out_;
};


class CLI {
public:
  // ---- CONSTRUCTOR ----
  explicit CLI(std::ostream& out = std::cout, std::ostream& err = std::cerr);


  // ---- STARTUP ----
  // Returns the process exit code: 0 on success, 1 on any fatal error
  int run(const std::vector<std::string>& args);

  static const char* usage();

private:
  // ---- PARAMETERS ----
  std::ostream& out_;
  std::ostream& err_;


  // ---- COMMAND PROCESSING ----
  void handle_send_command(const ProgramOptions& options);
  void handle_receive_command(const ProgramOptions& options);
  void handle_help_command();
  void log_and_display_error(const std::string& message);
};

} // namespace cli
} // namespace netcp

#endif // NETCP_CLI_CLI_HPP
