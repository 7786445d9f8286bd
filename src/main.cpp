#include "feedrank/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  std::signal(SIGPIPE, SIG_IGN);
  return feedrank::cli::run_cli(argc, argv);
}
