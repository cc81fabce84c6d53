#include "validate_logic.h"

#include "nifpt/app/app_service.h"
#include "nifpt/core/normalization.h"
#include "nifpt/validation/nif_validator.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace {

void print_inspection(const nifpt::validation::NifInspection& inspection) {
  using nifpt::validation::ValidationResult;

  std::cout << inspection.candidate << ": "
            << nifpt::validation::to_string(inspection.result);

  switch (inspection.result) {
    case ValidationResult::kValid:
    case ValidationResult::kInvalidCategory:
      if (!inspection.prefix_description.empty()) {
        std::cout << " (" << inspection.prefix_description << ")";
      }
      break;
    case ValidationResult::kInvalidCheckDigit:
      std::cout << " (expected check digit " << inspection.expected_check_digit.value_or(-1)
                << ", found " << inspection.actual_check_digit.value_or(-1) << ")";
      break;
    case ValidationResult::kInvalidLength:
      std::cout << " (expected 9 digits, got " << inspection.candidate.size() << " bytes)";
      break;
  }
  std::cout << "\n";
}

}  // namespace

int execute_validate(const std::vector<std::string>& candidates, bool normalize, bool json) {
  bool all_valid = true;
  nlohmann::json out = nlohmann::json::array();

  for (const auto& raw : candidates) {
    const std::string candidate = normalize ? nifpt::core::strip_nif_formatting(raw) : raw;
    const auto inspection = nifpt::validation::inspect_nif(candidate);
    all_valid = all_valid && inspection.result == nifpt::validation::ValidationResult::kValid;

    if (json) {
      out.push_back(nifpt::app::inspection_to_json(inspection));
    } else {
      print_inspection(inspection);
    }
  }

  if (json) {
    std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  }
  return all_valid ? 0 : 1;
}
