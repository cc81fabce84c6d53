#include "lookup.h"

#include "lookup_logic.h"

#include "nifpt/core/clock.h"
#include "nifpt/core/id_generator.h"
#include "nifpt/lookup/inmemory_nif_registry.h"
#include "nifpt/lookup/nif_registry.h"
#include "nifpt/lookup/registry_response.h"
#include "nifpt/storage/audit_log.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct LookupCliConfig {
  std::optional<std::string> registry_file;  // NOLINT(readability-identifier-naming)
  bool json{false};                          // NOLINT(readability-identifier-naming)
  bool normalize{false};                     // NOLINT(readability-identifier-naming)
};

// load_registry_file seeds `registry` from a file of saved registry payloads.
bool load_registry_file(const std::string& path, nifpt::lookup::InMemoryNifRegistry& registry) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "Error: cannot open registry file '" << path << "'\n";
    return false;
  }

  const auto snapshot = nlohmann::json::parse(in, nullptr, false);
  if (snapshot.is_discarded()) {
    std::cerr << "Error: registry file '" << path << "' is not valid JSON\n";
    return false;
  }

  const auto loaded = nifpt::lookup::load_registry_snapshot(snapshot, registry);
  if (!loaded.has_value()) {
    std::cerr << "Error: registry file '" << path << "': " << loaded.error().message << "\n";
    return false;
  }
  return true;
}

}  // namespace

int cmd_lookup(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<nifpt::apps::Option<LookupCliConfig>> options = {
      {"--registry-file", true, "JSON file of saved nif.pt payloads to answer lookups from",
       [](LookupCliConfig& c, const std::string& v) {
         c.registry_file = v;
         return true;
       }},
      {"--json", false, "Print the outcome as JSON",
       [](LookupCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
      {"--normalize", false, "Strip spaces, dots, hyphens and a PT prefix before validating",
       [](LookupCliConfig& c, const std::string&) {
         c.normalize = true;
         return true;
       }},
  };
  const auto parsed = nifpt::apps::parse_options(argc, argv, options);

  if (!parsed.ok) {
    return 1;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: nif_cli lookup <candidate> [--registry-file <path>] [--json] "
                 "[--normalize]\n";
    nifpt::apps::print_options(std::cerr, options);
    return 1;
  }

  nifpt::core::SystemIdGenerator id_gen;
  nifpt::core::SystemClock clock;
  nifpt::storage::InMemoryAuditLog audit_log;
  const auto& candidate = parsed.positionals.front();

  if (parsed.config.registry_file.has_value()) {
    nifpt::lookup::InMemoryNifRegistry registry;
    if (!load_registry_file(parsed.config.registry_file.value(), registry)) {
      return 1;
    }
    return execute_lookup(candidate, parsed.config.normalize, parsed.config.json, registry,
                          audit_log, id_gen, clock);
  }

  nifpt::lookup::NullNifRegistry registry;
  return execute_lookup(candidate, parsed.config.normalize, parsed.config.json, registry,
                        audit_log, id_gen, clock);
}
