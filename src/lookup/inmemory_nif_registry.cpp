#include "nifpt/lookup/inmemory_nif_registry.h"

#include <utility>

namespace nifpt::lookup {

void InMemoryNifRegistry::upsert(const LookupRecord& record) {
  records_[record.nif] = record;
}

void InMemoryNifRegistry::set_outage(const LookupError error, std::string message) {
  outage_ = LookupFailure{error, std::move(message), std::nullopt};
}

core::Result<LookupRecord, LookupFailure> InMemoryNifRegistry::lookup(const core::Nif& nif) {
  using R = core::Result<LookupRecord, LookupFailure>;

  if (outage_.has_value()) {
    return R::err(outage_.value());
  }

  auto it = records_.find(nif);
  if (it != records_.end()) {
    return R::ok(it->second);
  }
  return R::ok(LookupRecord{nif, RegistryStatus::kValidUnknown, std::nullopt, std::nullopt});
}

}  // namespace nifpt::lookup
