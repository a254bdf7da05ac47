#include "llmws/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  // SSL_write on a peer-closed socket raises SIGPIPE.
  std::signal(SIGPIPE, SIG_IGN);
  return llmws::cli::run_cli(argc, argv);
}
