#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace nifpt::validation {

// Number of digits in a NIF, check digit included.
constexpr std::size_t kNifLength = 9;

// compute_check_digit applies the modulo-11 rule to the first eight digits:
//   sum       = d1*9 + d2*8 + ... + d8*2
//   remainder = sum % 11
//   check     = remainder < 2 ? 0 : 11 - remainder
//
// Returns nullopt unless first_eight is exactly 8 ASCII digits.
[[nodiscard]] std::optional<int> compute_check_digit(std::string_view first_eight);

// complete_nif appends the computed check digit to eight leading digits.
// Returns nullopt under the same conditions as compute_check_digit().
// The result is checksum-correct; whether its category is admitted is up to the prefix.
[[nodiscard]] std::optional<std::string> complete_nif(std::string_view first_eight);

}  // namespace nifpt::validation
