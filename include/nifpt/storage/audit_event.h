#pragma once

#include <string>
#include <vector>

namespace nifpt::storage {

// AuditEvent is one entry of the lookup trail. payload is a compact JSON object
// whose shape depends on event_type.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;  // NIFs or candidates the event is about
};

}  // namespace nifpt::storage
