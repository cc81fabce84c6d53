#include "lookup_logic.h"

#include "nifpt/app/app_service.h"

#include <iostream>

namespace {

void print_entity(const nifpt::lookup::EntityRecord& entity) {
  const auto line = [](const char* label, const std::string& value) {
    if (!value.empty()) {
      std::cout << "  " << label << value << "\n";
    }
  };
  line("Title:       ", entity.title);
  line("Address:     ", entity.address);
  line("Postal code: ", entity.postal_code);
  line("City:        ", entity.city);
  line("Activity:    ", entity.activity);
  line("CAE:         ", entity.cae);
  line("Status:      ", entity.status);
  line("Email:       ", entity.email);
  line("Phone:       ", entity.phone);
  line("Website:     ", entity.website);
}

}  // namespace

int execute_lookup(const std::string& candidate, bool normalize, bool json,
                   nifpt::lookup::INifRegistry& registry, nifpt::storage::IAuditLog& audit_log,
                   nifpt::core::IIdGenerator& id_gen, nifpt::core::IClock& clock) {
  nifpt::app::LookupPipelineRequest request;
  request.candidate = candidate;
  request.normalize = normalize;

  const auto response = nifpt::app::run_lookup_pipeline(request, registry, audit_log, id_gen, clock);

  if (json) {
    std::cout << nifpt::app::lookup_response_to_json(response).dump(
                     2, ' ', false, nlohmann::json::error_handler_t::replace)
              << "\n";
    return response.record.has_value() ? 0 : 1;
  }

  std::cout << "Local:    " << response.inspection.candidate << " "
            << nifpt::validation::to_string(response.inspection.result) << "\n";

  if (response.failure.has_value()) {
    const auto& failure = response.failure.value();
    if (failure.error == nifpt::lookup::LookupError::kLocallyInvalid) {
      std::cout << "Registry: not contacted (candidate is not a valid NIF)\n";
    } else {
      std::cerr << "Registry: unavailable (" << nifpt::lookup::to_string(failure.error) << ": "
                << failure.message << ")\n";
    }
    return 1;
  }

  const auto& record = response.record.value();
  std::cout << "Registry: " << nifpt::lookup::to_string(record.status) << "\n";
  if (record.entity.has_value()) {
    print_entity(record.entity.value());
  }
  return 0;
}
