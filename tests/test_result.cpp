#include "nifpt/core/result.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using nifpt::core::Result;

TEST_CASE("Result keeps ok and err apart when T and E are the same type", "[core][result]") {
  using R = Result<std::string, std::string>;

  const auto ok = R::ok("500960046");
  REQUIRE(ok.has_value());
  CHECK(ok.value() == "500960046");

  const auto err = R::err("invalid_length");
  REQUIRE_FALSE(err.has_value());
  CHECK(err.error() == "invalid_length");
}

TEST_CASE("Result with distinct types", "[core][result]") {
  const auto r = Result<int, std::string>::err("boom");
  CHECK_FALSE(r.has_value());
  CHECK(r.error() == "boom");
  CHECK(Result<int, std::string>::ok(9).value() == 9);
}
