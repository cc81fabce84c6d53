#pragma once

#include <string>

namespace nifpt::core {

// Nif is the vocabulary type for a tax identification number that already passed
// local validation. Obtain one through validation::parse_nif(); the registry
// collaborator only accepts this type, never a raw candidate string.
struct Nif {
  std::string value;
  auto operator<=>(const Nif&) const = default;
};

}  // namespace nifpt::core
