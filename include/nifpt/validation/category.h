#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace nifpt::validation {

// Class of taxpayer encoded by the leading digit(s) of a NIF.
enum class TaxpayerCategory {
  kIndividual,
  kNonResidentIndividual,
  kLegalPerson,
  kPublicAdministration,
  kOtherEntity,
  kSoleProprietor,
  kIrregularEntity,
};

// One row of the admitted-prefix table.
struct CategoryInfo {
  std::string_view prefix;
  TaxpayerCategory category;
  std::string_view description;
};

// category_table is the complete set of admitted leading values, as published by
// the Portuguese tax authority. Single-digit prefixes apply to the first digit only;
// "45" is the one two-digit entry and takes precedence over the first digit.
[[nodiscard]] std::span<const CategoryInfo> category_table();

// lookup_category returns the row admitting the candidate's leading digits, or
// nullopt if none does. The longest matching prefix wins.
// Only the first two characters are inspected; the rest of the candidate is ignored.
[[nodiscard]] std::optional<CategoryInfo> lookup_category(std::string_view candidate);

// describe_prefix returns a human-readable description of what the leading digits
// denote. Two-digit sub-ranges inside the 7 and 9 categories (70, 71, 72, ...)
// get their specific description; otherwise the category description is used.
// Returns an empty string when the prefix is not admitted.
//
// Informational only: sub-ranges never change what validate() accepts.
[[nodiscard]] std::string describe_prefix(std::string_view candidate);

[[nodiscard]] std::string_view to_string(TaxpayerCategory category);

}  // namespace nifpt::validation
