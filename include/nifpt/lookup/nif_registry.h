#pragma once

#include "nifpt/core/nif.h"
#include "nifpt/core/result.h"
#include "nifpt/lookup/lookup_record.h"

namespace nifpt::lookup {

// INifRegistry is the boundary to a remote NIF registry (e.g. nif.pt).
// The transport lives outside this library; implementations adapt whatever
// client they wrap to this contract.
//
// Contract:
// - Input is a NIF that already passed local validation (core::Nif).
// - A registry answer, whatever it says about the NIF, is ok(LookupRecord).
// - err(LookupFailure) is reserved for service faults (kUnreachable,
//   kServiceError, kMalformedResponse). Implementations never report
//   kLocallyInvalid.
class INifRegistry {
 public:
  virtual ~INifRegistry() = default;

  [[nodiscard]] virtual core::Result<LookupRecord, LookupFailure> lookup(
      const core::Nif& nif) = 0;
};

// NullNifRegistry stands in when no registry is configured: every lookup fails
// with kUnreachable. Local validation keeps working without it.
class NullNifRegistry final : public INifRegistry {
 public:
  [[nodiscard]] core::Result<LookupRecord, LookupFailure> lookup(const core::Nif& nif) override;
};

}  // namespace nifpt::lookup
