#pragma once

#include <string_view>

namespace nifpt::validation {

// Outcome of local NIF validation. Every value other than kValid is an ordinary
// negative answer, not a fault.
enum class ValidationResult {
  kValid,
  kInvalidLength,      // not exactly 9 characters, or a character outside '0'..'9'
  kInvalidCategory,    // leading digit(s) not an admitted taxpayer category
  kInvalidCheckDigit,  // well-formed, but digit 9 disagrees with the modulo-11 rule
};

// Stable snake_case name, used in JSON output and audit payloads.
[[nodiscard]] std::string_view to_string(ValidationResult result);

}  // namespace nifpt::validation
