#include "nifpt/validation/nif_validator.h"

#include "nifpt/core/normalization.h"
#include "nifpt/validation/check_digit.h"

#include <algorithm>

namespace nifpt::validation {

namespace {

bool is_nine_ascii_digits(const std::string_view candidate) {
  return candidate.size() == kNifLength &&
         std::all_of(candidate.begin(), candidate.end(), core::is_ascii_digit);
}

}  // namespace

ValidationResult validate(const std::string_view candidate) noexcept {
  if (!is_nine_ascii_digits(candidate)) {
    return ValidationResult::kInvalidLength;
  }

  if (!lookup_category(candidate).has_value()) {
    return ValidationResult::kInvalidCategory;
  }

  const auto expected = compute_check_digit(candidate.substr(0, kNifLength - 1));
  const int actual = candidate[kNifLength - 1] - '0';
  if (!expected.has_value() || expected.value() != actual) {
    return ValidationResult::kInvalidCheckDigit;
  }

  return ValidationResult::kValid;
}

core::Result<core::Nif, ValidationResult> parse_nif(const std::string_view candidate) {
  const auto result = validate(candidate);
  if (result != ValidationResult::kValid) {
    return core::Result<core::Nif, ValidationResult>::err(result);
  }
  return core::Result<core::Nif, ValidationResult>::ok(core::Nif{std::string{candidate}});
}

NifInspection inspect_nif(const std::string_view candidate) {
  NifInspection inspection;
  inspection.candidate = std::string{candidate};
  inspection.result = validate(candidate);

  if (!is_nine_ascii_digits(candidate)) {
    return inspection;
  }

  inspection.category = lookup_category(candidate);
  inspection.prefix_description = describe_prefix(candidate);
  inspection.expected_check_digit = compute_check_digit(candidate.substr(0, kNifLength - 1));
  inspection.actual_check_digit = candidate[kNifLength - 1] - '0';
  return inspection;
}

}  // namespace nifpt::validation
