#include "nifpt/lookup/lookup_record.h"

#include <catch2/catch_test_macros.hpp>

using namespace nifpt;
using namespace nifpt::lookup;

TEST_CASE("lookup_record_to_json: known entity", "[lookup][json]") {
  EntityRecord entity;
  entity.title = "Example Lda";
  entity.postal_code = "1000-001";
  entity.status = "active";
  entity.active = true;

  const LookupRecord record{core::Nif{"500960046"}, RegistryStatus::kValidKnown, entity,
                            "2026-01-01T00:00:00Z"};
  const auto j = lookup_record_to_json(record);

  CHECK(j["nif"] == "500960046");
  CHECK(j["status"] == "valid_known");
  CHECK(j["checked_at"] == "2026-01-01T00:00:00Z");
  CHECK(j["entity"]["title"] == "Example Lda");
  CHECK(j["entity"]["postal_code"] == "1000-001");
  CHECK(j["entity"]["active"] == true);
}

TEST_CASE("lookup_record_to_json: absent optionals are null", "[lookup][json]") {
  const LookupRecord record{core::Nif{"500960046"}, RegistryStatus::kValidUnknown, std::nullopt,
                            std::nullopt};
  const auto j = lookup_record_to_json(record);
  CHECK(j["entity"].is_null());
  CHECK(j["checked_at"].is_null());
  CHECK(j["status"] == "valid_unknown");
}

TEST_CASE("lookup_record_to_json is deterministic", "[lookup][json]") {
  const LookupRecord record{core::Nif{"500960046"}, RegistryStatus::kValidKnown, EntityRecord{},
                            std::nullopt};
  CHECK(lookup_record_to_json(record).dump() == lookup_record_to_json(record).dump());
}

TEST_CASE("lookup_failure_to_json keeps the fault apart from the local verdict",
          "[lookup][json]") {
  const LookupFailure failure{LookupError::kUnreachable, "timeout",
                              validation::ValidationResult::kValid};
  const auto j = lookup_failure_to_json(failure);
  CHECK(j["error"] == "unreachable");
  CHECK(j["local_result"] == "valid");
  CHECK(j["message"] == "timeout");
}

TEST_CASE("to_string(RegistryStatus) and to_string(LookupError) are stable", "[lookup][json]") {
  CHECK(to_string(RegistryStatus::kMultipleResults) == "multiple_results");
  CHECK(to_string(RegistryStatus::kUndetermined) == "undetermined");
  CHECK(to_string(RegistryStatus::kRejected) == "rejected");
  CHECK(to_string(LookupError::kLocallyInvalid) == "locally_invalid");
  CHECK(to_string(LookupError::kServiceError) == "service_error");
  CHECK(to_string(LookupError::kMalformedResponse) == "malformed_response");
}
