#include "cli/cli.hpp"
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  netcp::cli::CLI cli;
  return cli.run(args);
}
