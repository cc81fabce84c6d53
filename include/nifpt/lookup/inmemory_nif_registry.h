#pragma once

#include "nifpt/lookup/nif_registry.h"

#include <map>
#include <optional>
#include <string>

namespace nifpt::lookup {

// InMemoryNifRegistry answers lookups from records held in a std::map.
// Seed it with upsert() or load_registry_snapshot() (registry_response.h).
//
// A NIF with no stored record resolves to kValidUnknown: the caller only asks
// about locally-valid NIFs, and the registry simply has nothing on it.
// Not synchronised; one instance per thread or external locking.
class InMemoryNifRegistry final : public INifRegistry {
 public:
  void upsert(const LookupRecord& record);
  [[nodiscard]] size_t size() const { return records_.size(); }

  // set_outage makes every subsequent lookup fail with the given error until
  // clear_outage() is called.
  void set_outage(LookupError error, std::string message);
  void clear_outage() { outage_.reset(); }

  [[nodiscard]] core::Result<LookupRecord, LookupFailure> lookup(const core::Nif& nif) override;

 private:
  std::map<core::Nif, LookupRecord> records_;
  std::optional<LookupFailure> outage_;
};

}  // namespace nifpt::lookup
