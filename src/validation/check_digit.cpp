#include "nifpt/validation/check_digit.h"

#include "nifpt/core/normalization.h"

namespace nifpt::validation {

std::optional<int> compute_check_digit(const std::string_view first_eight) {
  if (first_eight.size() != kNifLength - 1) {
    return std::nullopt;
  }

  int sum = 0;
  int weight = static_cast<int>(kNifLength);
  for (const char ch : first_eight) {
    if (!core::is_ascii_digit(ch)) {
      return std::nullopt;
    }
    sum += (ch - '0') * weight;
    --weight;
  }

  const int remainder = sum % 11;
  return remainder < 2 ? 0 : 11 - remainder;
}

std::optional<std::string> complete_nif(const std::string_view first_eight) {
  const auto check = compute_check_digit(first_eight);
  if (!check.has_value()) {
    return std::nullopt;
  }

  std::string nif{first_eight};
  nif.push_back(static_cast<char>('0' + check.value()));
  return nif;
}

}  // namespace nifpt::validation
