#include "camlight/cli/router.hpp"

int main(int argc, char** argv) {
  // Option parsing, signal handling and the exit-code contract live in the
  // CLI router.
  return camlight::cli::Dispatch(argc, argv);
}
