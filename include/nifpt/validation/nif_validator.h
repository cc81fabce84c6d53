#pragma once

#include "nifpt/core/nif.h"
#include "nifpt/core/result.h"
#include "nifpt/validation/category.h"
#include "nifpt/validation/validation_result.h"

#include <optional>
#include <string>
#include <string_view>

namespace nifpt::validation {

// validate decides whether candidate is a well-formed Portuguese NIF.
//
// Checks run in order and the first failure is reported:
//   1. exactly 9 ASCII digits                    -> else kInvalidLength
//   2. leading digit(s) in category_table()      -> else kInvalidCategory
//   3. digit 9 == compute_check_digit(digits 1-8) -> else kInvalidCheckDigit
//
// Pure and total: any byte sequence is accepted as input, nothing is thrown,
// and no normalization is applied (see core::strip_nif_formatting).
[[nodiscard]] ValidationResult validate(std::string_view candidate) noexcept;

[[nodiscard]] inline bool is_valid(std::string_view candidate) noexcept {
  return validate(candidate) == ValidationResult::kValid;
}

// parse_nif wraps a candidate into the core::Nif vocabulary type iff it is valid.
[[nodiscard]] core::Result<core::Nif, ValidationResult> parse_nif(std::string_view candidate);

// NifInspection is the detailed form of validate(): the verdict plus the pieces
// that led to it. Optional fields are absent when the check that would fill them
// could not run (e.g. no check digits for a candidate of the wrong length).
struct NifInspection {
  std::string candidate;                                      // NOLINT(readability-identifier-naming)
  ValidationResult result{ValidationResult::kInvalidLength};  // NOLINT(readability-identifier-naming)
  std::optional<CategoryInfo> category;                       // NOLINT(readability-identifier-naming)
  std::string prefix_description;                             // describe_prefix() of the candidate
  std::optional<int> expected_check_digit;                    // NOLINT(readability-identifier-naming)
  std::optional<int> actual_check_digit;                      // NOLINT(readability-identifier-naming)
};

// inspect_nif never disagrees with validate(): inspect_nif(c).result == validate(c).
[[nodiscard]] NifInspection inspect_nif(std::string_view candidate);

}  // namespace nifpt::validation
