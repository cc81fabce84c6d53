#include "nifpt/lookup/nif_registry.h"

namespace nifpt::lookup {

core::Result<LookupRecord, LookupFailure> NullNifRegistry::lookup(const core::Nif& /* nif */) {
  return core::Result<LookupRecord, LookupFailure>::err(
      LookupFailure{LookupError::kUnreachable, "no registry configured", std::nullopt});
}

}  // namespace nifpt::lookup
