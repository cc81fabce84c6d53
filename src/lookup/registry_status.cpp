#include "nifpt/lookup/registry_status.h"

namespace nifpt::lookup {

std::string_view to_string(const RegistryStatus status) {
  switch (status) {
    case RegistryStatus::kValidKnown:
      return "valid_known";
    case RegistryStatus::kValidUnknown:
      return "valid_unknown";
    case RegistryStatus::kRejected:
      return "rejected";
    case RegistryStatus::kMultipleResults:
      return "multiple_results";
    case RegistryStatus::kUndetermined:
      return "undetermined";
  }
  return "unknown";
}

std::string_view to_string(const LookupError error) {
  switch (error) {
    case LookupError::kLocallyInvalid:
      return "locally_invalid";
    case LookupError::kUnreachable:
      return "unreachable";
    case LookupError::kServiceError:
      return "service_error";
    case LookupError::kMalformedResponse:
      return "malformed_response";
  }
  return "unknown";
}

}  // namespace nifpt::lookup
