#include "nifpt/lookup/registry_response.h"

#include "nifpt/validation/nif_validator.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nifpt::lookup {

namespace {

using RecordResult = core::Result<LookupRecord, LookupFailure>;
using RecordEntry = std::pair<std::string, const nlohmann::json*>;

LookupFailure malformed(std::string message) {
  return LookupFailure{LookupError::kMalformedResponse, std::move(message), std::nullopt};
}

// text_of reads a scalar registry field: null -> "", integers -> decimal,
// arrays -> comma-joined elements. Any other non-string type throws
// nlohmann::json::type_error, which the public entry points convert.
std::string text_of(const nlohmann::json& value) {
  if (value.is_null()) {
    return {};
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<long long>());
  }
  if (value.is_array()) {
    std::string joined;
    for (const auto& element : value) {
      if (!joined.empty()) {
        joined += ',';
      }
      joined += text_of(element);
    }
    return joined;
  }
  return value.get<std::string>();
}

std::string read_text(const nlohmann::json& object, const char* key) {
  if (!object.is_object()) {
    return {};
  }
  const auto it = object.find(key);
  if (it == object.end()) {
    return {};
  }
  return text_of(*it);
}

std::optional<EntityRecord> decode_entity(const nlohmann::json& record) {
  if (!record.is_object()) {
    return std::nullopt;
  }

  EntityRecord entity;
  entity.title = read_text(record, "title");
  entity.address = read_text(record, "address");
  entity.city = read_text(record, "city");
  entity.activity = read_text(record, "activity");
  entity.cae = read_text(record, "cae");
  entity.status = read_text(record, "status");
  entity.active = entity.status == "active";

  const std::string pc4 = read_text(record, "pc4");
  const std::string pc3 = read_text(record, "pc3");
  entity.postal_code = pc3.empty() ? pc4 : pc4 + "-" + pc3;

  const auto contacts = record.find("contacts");
  if (contacts != record.end()) {
    entity.email = read_text(*contacts, "email");
    entity.phone = read_text(*contacts, "phone");
    entity.website = read_text(*contacts, "website");
  }

  return entity;
}

// check_result_field returns the failure a non-"success" payload stands for.
std::optional<LookupFailure> check_result_field(const nlohmann::json& payload) {
  if (!payload.is_object()) {
    return malformed("registry payload is not a JSON object");
  }

  const auto it = payload.find("result");
  if (it == payload.end() || !it->is_string()) {
    return malformed("registry payload has no result field");
  }

  const auto& result = it->get_ref<const std::string&>();
  if (result == "success") {
    return std::nullopt;
  }
  if (result == "error") {
    std::string message = read_text(payload, "message");
    if (message.empty()) {
      message = "registry reported an error";
    }
    return LookupFailure{LookupError::kServiceError, std::move(message), std::nullopt};
  }
  return malformed("unexpected registry result: " + result);
}

// collect_records lists (key, record) pairs. nullopt when "records" has a
// shape the registry never produces.
std::optional<std::vector<RecordEntry>> collect_records(const nlohmann::json& payload) {
  std::vector<RecordEntry> entries;

  const auto it = payload.find("records");
  if (it == payload.end() || it->is_null()) {
    return entries;
  }

  if (it->is_object()) {
    for (const auto& [key, record] : it->items()) {
      entries.emplace_back(key, &record);
    }
    return entries;
  }

  if (it->is_array()) {
    for (const auto& record : *it) {
      if (!record.is_object()) {
        return std::nullopt;
      }
      entries.emplace_back(read_text(record, "nif"), &record);
    }
    return entries;
  }

  return std::nullopt;
}

RecordResult decode_payload(const nlohmann::json& payload, const core::Nif& nif) {
  if (auto failure = check_result_field(payload); failure.has_value()) {
    return RecordResult::err(std::move(failure.value()));
  }

  LookupRecord record{nif, RegistryStatus::kUndetermined, std::nullopt, std::nullopt};

  if (!payload.value("nif_validation", true) || !payload.value("is_nif", true)) {
    record.status = RegistryStatus::kRejected;
    return RecordResult::ok(std::move(record));
  }

  const auto entries = collect_records(payload);
  if (!entries.has_value()) {
    return RecordResult::err(malformed("registry records field has an unexpected shape"));
  }

  if (entries->empty()) {
    record.status = RegistryStatus::kValidUnknown;
    return RecordResult::ok(std::move(record));
  }

  if (entries->size() > 1) {
    record.status = RegistryStatus::kMultipleResults;
    return RecordResult::ok(std::move(record));
  }

  const auto& [key, raw] = entries->front();
  if (key != nif.value) {
    return RecordResult::ok(std::move(record));
  }

  auto entity = decode_entity(*raw);
  if (!entity.has_value()) {
    return RecordResult::err(malformed("registry record for " + key + " is not an object"));
  }
  record.status = RegistryStatus::kValidKnown;
  record.entity = std::move(entity);
  return RecordResult::ok(std::move(record));
}

}  // namespace

core::Result<LookupRecord, LookupFailure> parse_registry_response(const nlohmann::json& payload,
                                                                  const core::Nif& nif) {
  try {
    return decode_payload(payload, nif);
  } catch (const nlohmann::json::exception& e) {
    return RecordResult::err(malformed(std::string{"undecodable registry payload: "} + e.what()));
  }
}

core::Result<LookupRecord, LookupFailure> parse_registry_response_text(const std::string_view body,
                                                                       const core::Nif& nif) {
  const auto payload = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
  if (payload.is_discarded()) {
    return RecordResult::err(malformed("registry response body is not valid JSON"));
  }
  return parse_registry_response(payload, nif);
}

core::Result<std::size_t, LookupFailure> load_registry_snapshot(const nlohmann::json& snapshot,
                                                                InMemoryNifRegistry& registry) {
  using R = core::Result<std::size_t, LookupFailure>;

  std::vector<const nlohmann::json*> payloads;
  if (snapshot.is_array()) {
    for (const auto& payload : snapshot) {
      payloads.push_back(&payload);
    }
  } else {
    payloads.push_back(&snapshot);
  }

  std::vector<LookupRecord> staged;
  try {
    for (const auto* payload : payloads) {
      if (auto failure = check_result_field(*payload); failure.has_value()) {
        return R::err(std::move(failure.value()));
      }

      const auto entries = collect_records(*payload);
      if (!entries.has_value()) {
        return R::err(malformed("registry records field has an unexpected shape"));
      }

      for (const auto& [key, raw] : entries.value()) {
        const auto nif = validation::parse_nif(key);
        if (!nif.has_value()) {
          return R::err(malformed("record key '" + key + "' is not a valid NIF (" +
                                  std::string{validation::to_string(nif.error())} + ")"));
        }

        auto entity = decode_entity(*raw);
        if (!entity.has_value()) {
          return R::err(malformed("registry record for " + key + " is not an object"));
        }
        staged.push_back(LookupRecord{nif.value(), RegistryStatus::kValidKnown, std::move(entity),
                                      std::nullopt});
      }
    }
  } catch (const nlohmann::json::exception& e) {
    return R::err(malformed(std::string{"undecodable registry snapshot: "} + e.what()));
  }

  for (const auto& record : staged) {
    registry.upsert(record);
  }
  return R::ok(staged.size());
}

}  // namespace nifpt::lookup
