#include "picamd/cli/router.hpp"

int main(int argc, char** argv) {
  // Keep the process entrypoint thin. Command parsing and the exit-code
  // contract live in the CLI router.
  return picamd::cli::Dispatch(argc, argv);
}
