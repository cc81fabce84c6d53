#pragma once

#include <string>
#include <string_view>

namespace nifpt::core {

// ASCII-only character helpers. Locale-independent: bytes outside the ASCII
// range (including every byte of a UTF-8 multibyte sequence) are never digits
// and never whitespace.

constexpr bool is_ascii_digit(const char ch) {
  return ch >= '0' && ch <= '9';
}

constexpr bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// strip_nif_formatting undoes the common ways a NIF is written for humans:
// - surrounding whitespace is trimmed
// - a leading "PT" VAT country prefix (any case) is dropped
// - inner spaces, tabs, dots and hyphens are removed
//
// Every other character is kept so that validation still rejects it.
// Opt-in only: validation::validate() itself never normalizes.
inline std::string strip_nif_formatting(const std::string_view input) {
  std::string trimmed = trim(input);
  std::string_view view{trimmed};

  if (view.size() >= 2 && (view[0] == 'P' || view[0] == 'p') &&
      (view[1] == 'T' || view[1] == 't')) {
    view.remove_prefix(2);
  }

  std::string result;
  result.reserve(view.size());
  for (const char ch : view) {
    if (ch == '.' || ch == '-' || is_ascii_space(ch)) {
      continue;
    }
    result.push_back(ch);
  }
  return result;
}

}  // namespace nifpt::core
