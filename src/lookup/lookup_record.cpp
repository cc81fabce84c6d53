#include "nifpt/lookup/lookup_record.h"

namespace nifpt::lookup {

nlohmann::json entity_record_to_json(const EntityRecord& entity) {
  nlohmann::json j;
  j["active"] = entity.active;
  j["activity"] = entity.activity;
  j["address"] = entity.address;
  j["cae"] = entity.cae;
  j["city"] = entity.city;
  j["email"] = entity.email;
  j["phone"] = entity.phone;
  j["postal_code"] = entity.postal_code;
  j["status"] = entity.status;
  j["title"] = entity.title;
  j["website"] = entity.website;
  return j;
}

nlohmann::json lookup_record_to_json(const LookupRecord& record) {
  nlohmann::json j;
  if (record.checked_at.has_value()) {
    j["checked_at"] = record.checked_at.value();
  } else {
    j["checked_at"] = nullptr;
  }
  if (record.entity.has_value()) {
    j["entity"] = entity_record_to_json(record.entity.value());
  } else {
    j["entity"] = nullptr;
  }
  j["nif"] = record.nif.value;
  j["status"] = std::string{to_string(record.status)};
  return j;
}

nlohmann::json lookup_failure_to_json(const LookupFailure& failure) {
  nlohmann::json j;
  j["error"] = std::string{to_string(failure.error)};
  if (failure.local_result.has_value()) {
    j["local_result"] = std::string{validation::to_string(failure.local_result.value())};
  } else {
    j["local_result"] = nullptr;
  }
  j["message"] = failure.message;
  return j;
}

}  // namespace nifpt::lookup
