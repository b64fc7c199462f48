#include "cli/registry.hpp"

#include <iostream>

int main(int argc, char **argv) {
  return gitwire::cli::builtin_commands().dispatch(argc, argv, std::cerr);
}
