#include "validate.h"

#include "validate_logic.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct ValidateCliConfig {
  bool json{false};       // NOLINT(readability-identifier-naming)
  bool normalize{false};  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<nifpt::apps::Option<ValidateCliConfig>> options = {
      {"--json", false, "Print results as a JSON array",
       [](ValidateCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
      {"--normalize", false, "Strip spaces, dots, hyphens and a PT prefix before validating",
       [](ValidateCliConfig& c, const std::string&) {
         c.normalize = true;
         return true;
       }},
  };
  const auto parsed = nifpt::apps::parse_options(argc, argv, options);

  if (!parsed.ok) {
    return 1;
  }
  if (parsed.positionals.empty()) {
    std::cerr << "Usage: nif_cli validate <candidate>... [--json] [--normalize]\n";
    nifpt::apps::print_options(std::cerr, options);
    return 1;
  }

  return execute_validate(parsed.positionals, parsed.config.normalize, parsed.config.json);
}
