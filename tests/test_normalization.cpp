#include "nifpt/core/normalization.h"
#include "nifpt/validation/nif_validator.h"

#include <catch2/catch_test_macros.hpp>

using namespace nifpt::core;

TEST_CASE("trim removes surrounding ASCII whitespace", "[core][normalization]") {
  CHECK(trim("  500960046\t\n") == "500960046");
  CHECK(trim("500 960 046") == "500 960 046");
  CHECK(trim("   ").empty());
  CHECK(trim("").empty());
}

TEST_CASE("strip_nif_formatting removes separators", "[core][normalization]") {
  CHECK(strip_nif_formatting("500 960 046") == "500960046");
  CHECK(strip_nif_formatting("500.960.046") == "500960046");
  CHECK(strip_nif_formatting("500-960-046") == "500960046");
  CHECK(strip_nif_formatting("  500960046\r\n") == "500960046");
}

TEST_CASE("strip_nif_formatting drops a PT prefix in any case", "[core][normalization]") {
  CHECK(strip_nif_formatting("PT500960046") == "500960046");
  CHECK(strip_nif_formatting("pt 500 960 046") == "500960046");
  CHECK(strip_nif_formatting("Pt-500.960.046") == "500960046");
  // Only a leading prefix counts.
  CHECK(strip_nif_formatting("500960046PT") == "500960046PT");
}

TEST_CASE("strip_nif_formatting keeps other characters", "[core][normalization]") {
  CHECK(strip_nif_formatting("50096004A") == "50096004A");
  CHECK(strip_nif_formatting("500/960/046") == "500/960/046");
}

TEST_CASE("formatted input validates only after stripping", "[core][normalization]") {
  using nifpt::validation::ValidationResult;
  const char* formatted = "PT 500.960.046";
  CHECK(nifpt::validation::validate(formatted) == ValidationResult::kInvalidLength);
  CHECK(nifpt::validation::validate(strip_nif_formatting(formatted)) == ValidationResult::kValid);
}
