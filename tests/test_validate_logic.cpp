#include "nif_cli/commands/validate_logic.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace {

class CoutCapture {
 public:
  CoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
  ~CoutCapture() { std::cout.rdbuf(previous_); }

  CoutCapture(const CoutCapture&) = delete;
  CoutCapture& operator=(const CoutCapture&) = delete;
  CoutCapture(CoutCapture&&) = delete;
  CoutCapture& operator=(CoutCapture&&) = delete;

  [[nodiscard]] std::string str() const { return buffer_.str(); }

 private:
  std::ostringstream buffer_;
  std::streambuf* previous_;
};

}  // namespace

TEST_CASE("validate_logic: exits 0 only when every candidate is valid", "[cli][validate]") {
  {
    CoutCapture capture;
    CHECK(execute_validate({"500960046", "123456789"}, false, false) == 0);
    CHECK(capture.str() ==
          "500960046: valid (Legal person)\n123456789: valid (Resident individual)\n");
  }
  {
    CoutCapture capture;
    CHECK(execute_validate({"500960046", "987654321"}, false, false) == 1);
    CHECK(capture.str().find("987654321: invalid_check_digit") != std::string::npos);
  }
}

TEST_CASE("validate_logic: reports byte length for malformed input", "[cli][validate]") {
  CoutCapture capture;
  CHECK(execute_validate({"12345"}, false, false) == 1);
  CHECK(capture.str() == "12345: invalid_length (expected 9 digits, got 5 bytes)\n");
}

TEST_CASE("validate_logic: normalize applies before validating", "[cli][validate]") {
  CoutCapture capture;
  CHECK(execute_validate({"PT 500.960.046"}, true, false) == 0);
  CHECK(capture.str() == "500960046: valid (Legal person)\n");
}

TEST_CASE("validate_logic: JSON array survives invalid UTF-8", "[cli][validate]") {
  CoutCapture capture;
  int rc = 0;
  CHECK_NOTHROW(rc = execute_validate({"500960046", "\xff"}, false, true));

  CHECK(rc == 1);
  const auto j = nlohmann::json::parse(capture.str());
  REQUIRE(j.size() == 2);
  CHECK(j[0].at("valid") == true);
  CHECK(j[1].at("result") == "invalid_length");
  CHECK(j[1].at("candidate") == "\xEF\xBF\xBD");
}
