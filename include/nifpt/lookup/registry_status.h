#pragma once

#include <string_view>

namespace nifpt::lookup {

// What the registry said about a NIF it was asked about.
enum class RegistryStatus {
  kValidKnown,       // registry confirms the NIF and returns the entity
  kValidUnknown,     // registry accepts the NIF but has no entity for it
  kRejected,         // registry reports the NIF as invalid
  kMultipleResults,  // registry answered with several entities, none attributable
  kUndetermined,     // registry answered, but not in a way that settles the question
};

// Why a lookup produced no registry answer.
// Only kLocallyInvalid says anything about the NIF itself; the others are
// service faults and must not be read as "the NIF is invalid".
enum class LookupError {
  kLocallyInvalid,     // candidate failed local validation; registry not contacted
  kUnreachable,        // no registry configured or it could not be reached
  kServiceError,       // registry answered with an explicit error
  kMalformedResponse,  // registry answer could not be decoded
};

[[nodiscard]] std::string_view to_string(RegistryStatus status);
[[nodiscard]] std::string_view to_string(LookupError error);

}  // namespace nifpt::lookup
