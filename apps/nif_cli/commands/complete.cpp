#include "complete.h"

#include "nifpt/validation/category.h"
#include "nifpt/validation/check_digit.h"

#include <iostream>
#include <string>

int cmd_complete(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc != 3) {
    std::cerr << "Usage: nif_cli complete <first-eight-digits>\n";
    return 1;
  }

  const std::string prefix = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto nif = nifpt::validation::complete_nif(prefix);
  if (!nif.has_value()) {
    std::cerr << "Error: expected exactly 8 digits, got '" << prefix << "'\n";
    return 1;
  }

  if (!nifpt::validation::lookup_category(prefix).has_value()) {
    std::cerr << "Warning: leading digits of " << nif.value()
              << " are not an admitted taxpayer category\n";
  }

  std::cout << nif.value() << "\n";
  return 0;
}
