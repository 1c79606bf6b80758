#include "fourree/cli/router.hpp"

int main(int argc, char** argv) {
  // Argument parsing and the exit-code contract live in the router.
  return fourree::cli::Dispatch(argc, argv);
}
