#pragma once

#include "nifpt/core/clock.h"
#include "nifpt/core/id_generator.h"
#include "nifpt/lookup/lookup_record.h"
#include "nifpt/lookup/nif_registry.h"
#include "nifpt/storage/audit_log.h"
#include "nifpt/validation/nif_validator.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace nifpt::app {

// ────────────────────────────────────────────────────────────────
// Lookup Pipeline
// ────────────────────────────────────────────────────────────────

struct LookupPipelineRequest {
  std::string candidate;  // NOLINT(readability-identifier-naming)
  // Apply core::strip_nif_formatting() before validating.
  bool normalize{false};  // NOLINT(readability-identifier-naming)
  // Optional trace_id (if not provided, will be generated)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

// Exactly one of record / failure is set.
struct LookupPipelineResponse {
  std::string trace_id;                          // NOLINT(readability-identifier-naming)
  validation::NifInspection inspection;          // always present, registry-independent
  std::optional<lookup::LookupRecord> record;    // NOLINT(readability-identifier-naming)
  std::optional<lookup::LookupFailure> failure;  // NOLINT(readability-identifier-naming)
};

// Validate locally, then ask the registry only if the candidate is valid.
// Emits audit events: LookupRequested, LocalValidationCompleted, then one of
// RegistryLookupSkipped, RegistryLookupCompleted, RegistryLookupFailed.
[[nodiscard]] LookupPipelineResponse run_lookup_pipeline(const LookupPipelineRequest& req,
                                                         lookup::INifRegistry& registry,
                                                         storage::IAuditLog& audit_log,
                                                         core::IIdGenerator& id_gen,
                                                         core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// JSON views (CLI output)
// ────────────────────────────────────────────────────────────────

[[nodiscard]] nlohmann::json inspection_to_json(const validation::NifInspection& inspection);
[[nodiscard]] nlohmann::json lookup_response_to_json(const LookupPipelineResponse& response);

}  // namespace nifpt::app
