#include "nifpt/validation/check_digit.h"
#include "nifpt/validation/nif_validator.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace nifpt::validation;

TEST_CASE("compute_check_digit: weighted sum modulo 11", "[validation][check_digit]") {
  // 5*9 + 9*6 + 6*5 + 4*2 = 137, 137 % 11 = 5, 11 - 5 = 6
  CHECK(compute_check_digit("50096004") == 6);
  // 184 % 11 = 8 -> 3
  CHECK(compute_check_digit("50082999") == 3);
  // 1*9 = 9 -> 2
  CHECK(compute_check_digit("10000000") == 2);
}

TEST_CASE("compute_check_digit: remainder 0 or 1 yields 0", "[validation][check_digit]") {
  // 1*9 + 1*2 = 11, remainder 0
  CHECK(compute_check_digit("10000001") == 0);
  // 1*9 + 1*3 = 12, remainder 1
  CHECK(compute_check_digit("10000010") == 0);
  // 5*9 = 45, remainder 1
  CHECK(compute_check_digit("50000000") == 0);
  // 9 * (9+8+...+2) = 396, remainder 0
  CHECK(compute_check_digit("99999999") == 0);
}

TEST_CASE("compute_check_digit: rejects anything but 8 ASCII digits", "[validation][check_digit]") {
  CHECK_FALSE(compute_check_digit("").has_value());
  CHECK_FALSE(compute_check_digit("1234567").has_value());
  CHECK_FALSE(compute_check_digit("123456789").has_value());
  CHECK_FALSE(compute_check_digit("1234567A").has_value());
  CHECK_FALSE(compute_check_digit("1234 567").has_value());
}

TEST_CASE("complete_nif appends the computed check digit", "[validation][check_digit]") {
  CHECK(complete_nif("50096004") == std::optional<std::string>{"500960046"});
  CHECK(complete_nif("45000000") == std::optional<std::string>{"450000001"});
  CHECK_FALSE(complete_nif("5009600").has_value());
}

TEST_CASE("complete_nif output validates for every admitted leading digit",
          "[validation][check_digit]") {
  for (const char lead : std::string{"12356789"}) {
    for (int n = 0; n < 1000; n += 7) {
      std::string prefix(1, lead);
      const std::string tail = std::to_string(n * 7919 % 10000000);
      prefix += std::string(7 - tail.size(), '0') + tail;

      const auto nif = complete_nif(prefix);
      REQUIRE(nif.has_value());
      CHECK(validate(nif.value()) == ValidationResult::kValid);
    }
  }
}

TEST_CASE("exactly one check digit is accepted per prefix", "[validation][check_digit]") {
  const std::string prefix = "50096004";
  int accepted = 0;
  for (char d = '0'; d <= '9'; ++d) {
    const auto result = validate(prefix + d);
    if (result == ValidationResult::kValid) {
      ++accepted;
      CHECK(d == '6');
    } else {
      CHECK(result == ValidationResult::kInvalidCheckDigit);
    }
  }
  CHECK(accepted == 1);
}
