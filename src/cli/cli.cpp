#include "cli/cli.hpp"
#include "network/tcp_listener.hpp"
#include "network/tcp_stream.hpp"
#include "protocol/receiver_session.hpp"
#include "protocol/sender_session.hpp"
#include "store/store.hpp"
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <limits>

namespace netcp {
namespace cli {

namespace {

// One day, in milliseconds
const unsigned long MAX_IDLE_TIMEOUT_MS = 24UL * 60 * 60 * 1000;

// Parses a decimal option value in [1, max]
unsigned long parse_positive(const std::string& flag, const std::string& value,
                             unsigned long max = std::numeric_limits<unsigned long>::max()) {
  // stoul would skip leading whitespace and accept a sign
  if (value.empty() || value[0] < '0' || value[0] > '9') {
    throw ArgumentError("Invalid value for " + flag + ": " + value);
  }
  std::size_t consumed = 0;
  unsigned long number = 0;
  try {
    number = std::stoul(value, &consumed);
  } catch (const std::exception&) {
    throw ArgumentError("Invalid value for " + flag + ": " + value);
  }
  if (consumed != value.size() || number == 0 || number > max) {
    throw ArgumentError("Invalid value for " + flag + ": " + value);
  }
  return number;
}

std::filesystem::path working_directory() {
  std::error_code ec;
  std::filesystem::path work_dir = std::filesystem::current_path(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "CLI: Couldn't find working directory: " << ec.message();
    throw std::runtime_error("Couldn't find working directory");
  }
  return work_dir;
}

} // namespace


//==============================================
// ARGUMENT PARSING
//==============================================

ProgramOptions parse_command_line(const std::vector<std::string>& args) {
  if (args.empty()) {
    throw ArgumentError("No arguments");
  }

  ProgramOptions options;
  std::size_t i = 0;

  // Options precede the command
  for (; i < args.size() && args[i].size() > 1 && args[i][0] == '-'; ++i) {
    const std::string& flag = args[i];

    if (flag == "-v" || flag == "--verbose") {
      options.log.min_level = boost::log::trivial::debug;
      continue;
    }

    if (i + 1 >= args.size()) {
      throw ArgumentError("Missing value for " + flag);
    }
    const std::string& value = args[++i];

    if (flag == "--timeout") {
      options.session.idle_timeout =
        std::chrono::milliseconds(parse_positive(flag, value, MAX_IDLE_TIMEOUT_MS));
    } else if (flag == "--chunk-size") {
      options.session.chunk_size = parse_positive(flag, value);
    } else if (flag == "--log-file") {
      options.log.log_file = value;
    } else if (flag == "--log-level") {
      try {
        options.log.min_level = logger::parse_severity(value);
      } catch (const std::invalid_argument& e) {
        throw ArgumentError(e.what());
      }
    } else {
      throw ArgumentError("Unknown option " + flag);
    }
  }

  if (i >= args.size()) {
    throw ArgumentError("No arguments");
  }

  const std::string& command = args[i];
  std::vector<std::string> operands(args.begin() + i + 1, args.end());

  if (command == "help") {
    options.command = Command::HELP;
  } else if (command == "send") {
    // address and at least one file
    if (operands.size() < 2) {
      throw ArgumentError("Too few arguments");
    }
    options.command = Command::SEND;
    options.address = parse_endpoint_address(operands[0]);
    options.files.assign(operands.begin() + 1, operands.end());
  } else if (command == "receive") {
    if (operands.size() != 1) {
      throw ArgumentError("Too few or many arguments");
    }
    options.command = Command::RECEIVE;
    options.address = parse_endpoint_address(operands[0]);
  } else {
    throw ArgumentError("Unknown parameter");
  }

  return options;
}

network::EndpointAddress parse_endpoint_address(const std::string& text) {
  size_t colon_pos = text.rfind(':');
  if (colon_pos == std::string::npos || colon_pos == 0 || colon_pos + 1 == text.size()) {
    throw ArgumentError("Invalid address " + text + " (expected host:port)");
  }

  std::string host = text.substr(0, colon_pos);
  std::string port_str = text.substr(colon_pos + 1);

  if (host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  } else if (host.find(':') != std::string::npos) {
    throw ArgumentError("Invalid address " + text + " (IPv6 hosts must be bracketed)");
  }
  if (host.empty()) {
    throw ArgumentError("Invalid address " + text + " (empty host)");
  }

  if (port_str.find_first_not_of("0123456789") != std::string::npos || port_str.size() > 5) {
    throw ArgumentError("Invalid port number: " + port_str);
  }
  unsigned long port = std::stoul(port_str);
  if (port > std::numeric_limits<uint16_t>::max()) {
    throw ArgumentError("Invalid port number: " + port_str);
  }

  return network::EndpointAddress{host, static_cast<uint16_t>(port)};
}


//==============================================
// CONSOLE PROGRESS
//==============================================

ConsoleProgress::ConsoleProgress(Role role, std::ostream& out)
  : role_(role)
  , out_(out) {
}

void ConsoleProgress::on_connected(const std::string& peer) {
  if (role_ == Role::SENDER) {
    out_ << "connected with " << peer << "." << std::endl;
  }
}

void ConsoleProgress::on_file_started(const std::string& name, uint64_t /*size*/) {
  out_ << (role_ == Role::SENDER ? "Send " : "Receive ") << name << "..." << std::flush;
}

void ConsoleProgress::on_file_completed(const std::string& /*name*/, uint64_t /*bytes*/) {
  out_ << "done." << std::endl;
}

void ConsoleProgress::on_file_skipped(const std::string& name) {
  if (role_ == Role::SENDER) {
    out_ << "cancelled by client." << std::endl;
  } else {
    out_ << "Couldn't create file " << name << ". Skip file transmission." << std::endl;
  }
}


//==============================================
// STARTUP
//==============================================

CLI::CLI(std::ostream& out, std::ostream& err)
  : out_(out)
  , err_(err) {
}

int CLI::run(const std::vector<std::string>& args) {
  try {
    logger::init_logging();
    ProgramOptions options = parse_command_line(args);
    logger::init_logging(options.log);
    BOOST_LOG_TRIVIAL(debug) << "CLI: Parsed command line with " << args.size() << " arguments";

    switch (options.command) {
      case Command::HELP:
        handle_help_command();
        break;
      case Command::SEND:
        handle_send_command(options);
        break;
      case Command::RECEIVE:
        handle_receive_command(options);
        break;
    }
    return 0;
  }
  catch (const std::exception& e) {
    log_and_display_error(e.what());
    return 1;
  }
}

const char* CLI::usage() {
  return
    "Usage: netcp [options] send <host:port> <file>...\n"
    "       netcp [options] receive <host:port>\n"
    "       netcp help\n"
    "Options:\n"
    "  --timeout <ms>        Idle timeout before a stalled transfer fails (default 800, max 86400000)\n"
    "  --chunk-size <bytes>  Payload chunk size (default 512)\n"
    "  --log-file <path>     Write the diagnostic log to <path>\n"
    "  --log-level <level>   trace|debug|info|warning|error|fatal (default fatal)\n"
    "  -v, --verbose         Same as --log-level debug\n";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::handle_send_command(const ProgramOptions& options) {
  std::filesystem::path work_dir = working_directory();
  store::FileStore store(work_dir);

  // Resolve every file and check it can be opened before accepting a client
  std::vector<std::filesystem::path> paths;
  for (const auto& file_name : options.files) {
    std::filesystem::path path = work_dir / file_name;
    store.open_for_read(path);
    paths.push_back(path);
  }

  network::TCP_Listener listener(options.address);
  out_ << "Waiting for client..." << std::flush;
  std::unique_ptr<network::TCP_Stream> stream = listener.accept();
  // Exactly one client per invocation
  listener.shutdown();

  ConsoleProgress progress(ConsoleProgress::Role::SENDER, out_);
  protocol::SenderSession session(*stream, store, options.session, &progress);
  session.run(paths);
}

void CLI::handle_receive_command(const ProgramOptions& options) {
  store::FileStore store(working_directory());

  network::TCP_Stream stream;
  stream.connect(options.address);

  ConsoleProgress progress(ConsoleProgress::Role::RECEIVER, out_);
  protocol::ReceiverSession session(stream, store, options.session, &progress);
  session.run();
}

void CLI::handle_help_command() {
  out_ << usage();
}

void CLI::log_and_display_error(const std::string& message) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message;
  err_ << "Error: " << message << "." << std::endl;
}

} // namespace cli
} // namespace netcp
