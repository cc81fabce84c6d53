#pragma once

#include "nifpt/core/nif.h"
#include "nifpt/lookup/registry_status.h"
#include "nifpt/validation/validation_result.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace nifpt::lookup {

// Entity metadata as published by the registry. Fields the registry leaves out
// are empty strings.
struct EntityRecord {
  std::string title;        // NOLINT(readability-identifier-naming)
  std::string address;      // NOLINT(readability-identifier-naming)
  std::string postal_code;  // "pc4-pc3", e.g. "1000-001"
  std::string city;         // NOLINT(readability-identifier-naming)
  std::string activity;     // NOLINT(readability-identifier-naming)
  std::string cae;          // activity classification code(s), comma-separated
  std::string status;       // registry status text, e.g. "active"
  bool active{false};       // status == "active"
  std::string email;        // NOLINT(readability-identifier-naming)
  std::string phone;        // NOLINT(readability-identifier-naming)
  std::string website;      // NOLINT(readability-identifier-naming)
};

struct LookupRecord {
  core::Nif nif;                                            // NOLINT(readability-identifier-naming)
  RegistryStatus status{RegistryStatus::kUndetermined};     // NOLINT(readability-identifier-naming)
  std::optional<EntityRecord> entity;                       // present for kValidKnown only
  std::optional<std::string> checked_at;                    // set by the lookup pipeline
};

struct LookupFailure {
  LookupError error{LookupError::kUnreachable};             // NOLINT(readability-identifier-naming)
  std::string message;                                      // NOLINT(readability-identifier-naming)
  std::optional<validation::ValidationResult> local_result;  // set when local validation ran
};

// Deterministic JSON serialization.
// Keys are sorted alphabetically (nlohmann::json uses std::map internally);
// absent optionals serialize as null.
[[nodiscard]] nlohmann::json entity_record_to_json(const EntityRecord& entity);
[[nodiscard]] nlohmann::json lookup_record_to_json(const LookupRecord& record);
[[nodiscard]] nlohmann::json lookup_failure_to_json(const LookupFailure& failure);

}  // namespace nifpt::lookup
