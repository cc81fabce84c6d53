#include "commands/categories.h"
#include "commands/complete.h"
#include "commands/lookup.h"
#include "commands/validate.h"

#include "nifpt/core/version.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "nif-pt " << nifpt::core::kBuildVersion << "\n"
            << "Usage:\n"
            << "  nif_cli validate <candidate>... [--json] [--normalize]\n"
            << "  nif_cli lookup <candidate> [--registry-file <path>] [--json] [--normalize]\n"
            << "  nif_cli complete <first-eight-digits>\n"
            << "  nif_cli categories [--json]\n"
            << "  nif_cli --version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "validate") {
    return cmd_validate(argc, argv);
  }
  if (subcommand == "lookup") {
    return cmd_lookup(argc, argv);
  }
  if (subcommand == "complete") {
    return cmd_complete(argc, argv);
  }
  if (subcommand == "categories") {
    return cmd_categories(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << "nif-pt " << nifpt::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "--help" || subcommand == "-h") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
