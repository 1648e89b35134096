#include "detplan/cli/router.hpp"

int main(int argc, char** argv) {
  // All parsing, output and exit-code contracts live in the CLI router.
  return detplan::cli::Dispatch(argc, argv);
}
