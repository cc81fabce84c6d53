#include "nifpt/validation/validation_result.h"

namespace nifpt::validation {

std::string_view to_string(const ValidationResult result) {
  switch (result) {
    case ValidationResult::kValid:
      return "valid";
    case ValidationResult::kInvalidLength:
      return "invalid_length";
    case ValidationResult::kInvalidCategory:
      return "invalid_category";
    case ValidationResult::kInvalidCheckDigit:
      return "invalid_check_digit";
  }
  return "unknown";
}

}  // namespace nifpt::validation
