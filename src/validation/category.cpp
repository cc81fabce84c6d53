#include "nifpt/validation/category.h"

#include <array>

namespace nifpt::validation {

namespace {

// Admitted leading values. Keep in sync with the tax authority's published
// ranges; this table is the only place categories are decided.
constexpr std::array<CategoryInfo, 9> kCategoryTable{{
    {"1", TaxpayerCategory::kIndividual, "Resident individual"},
    {"2", TaxpayerCategory::kIndividual, "Resident individual"},
    {"3", TaxpayerCategory::kIndividual, "Resident individual"},
    {"45", TaxpayerCategory::kNonResidentIndividual, "Non-resident individual"},
    {"5", TaxpayerCategory::kLegalPerson, "Legal person"},
    {"6", TaxpayerCategory::kPublicAdministration, "Public administration body"},
    {"7", TaxpayerCategory::kOtherEntity,
     "Undivided inheritance, investment fund, non-resident collective or officially assigned "
     "number"},
    {"8", TaxpayerCategory::kSoleProprietor, "Sole proprietor (legacy range)"},
    {"9", TaxpayerCategory::kIrregularEntity,
     "Condominium, irregular company or non-resident without permanent establishment"},
}};

struct PrefixDescription {
  std::string_view prefix;
  std::string_view description;
};

// Descriptive sub-ranges of the 7 and 9 categories.
constexpr std::array<PrefixDescription, 12> kSubRangeTable{{
    {"70", "Undivided inheritance"},
    {"71", "Non-resident collective person subject to final withholding"},
    {"72", "Investment fund"},
    {"74", "Undivided inheritance"},
    {"75", "Undivided inheritance"},
    {"77", "Officially assigned taxpayer number"},
    {"78", "Officially assigned number for non-residents under the VAT refund scheme"},
    {"79", "Exceptional regime (Expo 98)"},
    {"90", "Condominium, irregular company or undivided inheritance of a sole proprietor"},
    {"91", "Condominium, irregular company or undivided inheritance of a sole proprietor"},
    {"98", "Non-resident without permanent establishment"},
    {"99", "Civil company without legal personality"},
}};

}  // namespace

std::span<const CategoryInfo> category_table() {
  return kCategoryTable;
}

std::optional<CategoryInfo> lookup_category(const std::string_view candidate) {
  if (candidate.size() < 2) {
    return std::nullopt;
  }

  const CategoryInfo* best = nullptr;
  for (const auto& row : kCategoryTable) {
    if (!candidate.starts_with(row.prefix)) {
      continue;
    }
    if (best == nullptr || row.prefix.size() > best->prefix.size()) {
      best = &row;
    }
  }

  if (best == nullptr) {
    return std::nullopt;
  }
  return *best;
}

std::string describe_prefix(const std::string_view candidate) {
  const auto category = lookup_category(candidate);
  if (!category.has_value()) {
    return {};
  }

  for (const auto& row : kSubRangeTable) {
    if (candidate.starts_with(row.prefix)) {
      return std::string{row.description};
    }
  }
  return std::string{category->description};
}

std::string_view to_string(const TaxpayerCategory category) {
  switch (category) {
    case TaxpayerCategory::kIndividual:
      return "individual";
    case TaxpayerCategory::kNonResidentIndividual:
      return "non_resident_individual";
    case TaxpayerCategory::kLegalPerson:
      return "legal_person";
    case TaxpayerCategory::kPublicAdministration:
      return "public_administration";
    case TaxpayerCategory::kOtherEntity:
      return "other_entity";
    case TaxpayerCategory::kSoleProprietor:
      return "sole_proprietor";
    case TaxpayerCategory::kIrregularEntity:
      return "irregular_entity";
  }
  return "unknown";
}

}  // namespace nifpt::validation
