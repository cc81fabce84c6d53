#include "categories.h"

#include "nifpt/validation/category.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct CategoriesCliConfig {
  bool json{false};  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_categories(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<nifpt::apps::Option<CategoriesCliConfig>> options = {
      {"--json", false, "Print the table as JSON",
       [](CategoriesCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };
  const auto parsed = nifpt::apps::parse_options(argc, argv, options);
  if (!parsed.ok) {
    return 1;
  }

  const auto table = nifpt::validation::category_table();

  if (parsed.config.json) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& row : table) {
      out.push_back({{"prefix", std::string{row.prefix}},
                     {"category", std::string{nifpt::validation::to_string(row.category)}},
                     {"description", std::string{row.description}}});
    }
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  for (const auto& row : table) {
    std::cout << row.prefix << (row.prefix.size() == 1 ? "   " : "  ")
              << nifpt::validation::to_string(row.category) << "  " << row.description << "\n";
  }
  return 0;
}
