#include "nifpt/app/app_service.h"

#include "nifpt/core/normalization.h"

#include <utility>

namespace nifpt::app {

namespace {

void emit(storage::IAuditLog& audit_log, core::IIdGenerator& id_gen, core::IClock& clock,
          const std::string& trace_id, const char* event_type, const nlohmann::json& payload,
          const std::string& ref) {
  // Candidates are arbitrary bytes; invalid UTF-8 is replaced with U+FFFD rather than thrown.
  audit_log.append({id_gen.next("evt"), trace_id, event_type,
                    payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    clock.now_iso8601(), {ref}});
}

}  // namespace

LookupPipelineResponse run_lookup_pipeline(const LookupPipelineRequest& req,
                                           lookup::INifRegistry& registry,
                                           storage::IAuditLog& audit_log,
                                           core::IIdGenerator& id_gen, core::IClock& clock) {
  LookupPipelineResponse response;
  response.trace_id = req.trace_id.has_value() ? req.trace_id.value() : id_gen.next("trace");

  const std::string candidate =
      req.normalize ? core::strip_nif_formatting(req.candidate) : req.candidate;

  emit(audit_log, id_gen, clock, response.trace_id, "LookupRequested",
       {{"candidate", candidate}, {"normalized", req.normalize}}, candidate);

  response.inspection = validation::inspect_nif(candidate);
  const auto local_result = response.inspection.result;

  emit(audit_log, id_gen, clock, response.trace_id, "LocalValidationCompleted",
       {{"result", std::string{validation::to_string(local_result)}}}, candidate);

  const auto nif = validation::parse_nif(candidate);
  if (!nif.has_value()) {
    response.failure = lookup::LookupFailure{lookup::LookupError::kLocallyInvalid,
                                             "candidate failed local validation", local_result};
    emit(audit_log, id_gen, clock, response.trace_id, "RegistryLookupSkipped",
         {{"reason", std::string{validation::to_string(local_result)}}}, candidate);
    return response;
  }

  auto outcome = registry.lookup(nif.value());
  if (!outcome.has_value()) {
    lookup::LookupFailure failure = outcome.error();
    failure.local_result = local_result;
    emit(audit_log, id_gen, clock, response.trace_id, "RegistryLookupFailed",
         {{"error", std::string{lookup::to_string(failure.error)}}, {"message", failure.message}},
         nif.value().value);
    response.failure = std::move(failure);
    return response;
  }

  lookup::LookupRecord record = outcome.value();
  record.checked_at = clock.now_iso8601();
  emit(audit_log, id_gen, clock, response.trace_id, "RegistryLookupCompleted",
       {{"status", std::string{lookup::to_string(record.status)}}}, nif.value().value);
  response.record = std::move(record);
  return response;
}

nlohmann::json inspection_to_json(const validation::NifInspection& inspection) {
  nlohmann::json j;
  j["candidate"] = inspection.candidate;
  if (inspection.category.has_value()) {
    j["category"] = std::string{validation::to_string(inspection.category->category)};
    j["category_prefix"] = std::string{inspection.category->prefix};
  } else {
    j["category"] = nullptr;
    j["category_prefix"] = nullptr;
  }
  j["description"] = inspection.prefix_description;
  if (inspection.expected_check_digit.has_value()) {
    j["expected_check_digit"] = inspection.expected_check_digit.value();
  } else {
    j["expected_check_digit"] = nullptr;
  }
  if (inspection.actual_check_digit.has_value()) {
    j["actual_check_digit"] = inspection.actual_check_digit.value();
  } else {
    j["actual_check_digit"] = nullptr;
  }
  j["result"] = std::string{validation::to_string(inspection.result)};
  j["valid"] = inspection.result == validation::ValidationResult::kValid;
  return j;
}

nlohmann::json lookup_response_to_json(const LookupPipelineResponse& response) {
  nlohmann::json j;
  j["trace_id"] = response.trace_id;
  j["local"] = inspection_to_json(response.inspection);
  if (response.record.has_value()) {
    j["registry"] = lookup::lookup_record_to_json(response.record.value());
  } else {
    j["registry"] = nullptr;
  }
  if (response.failure.has_value()) {
    j["failure"] = lookup::lookup_failure_to_json(response.failure.value());
  } else {
    j["failure"] = nullptr;
  }
  return j;
}

}  // namespace nifpt::app
