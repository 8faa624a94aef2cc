#include "schedctl/cli/router.hpp"

#include <csignal>

int main(int argc, char** argv) {
  // A scheduler that hangs up mid-request must surface as a write error, not
  // kill the process before an exit code is chosen.
  std::signal(SIGPIPE, SIG_IGN);
  return schedctl::cli::Dispatch(argc, argv);
}
