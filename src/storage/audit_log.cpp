#include "nifpt/storage/audit_log.h"

#include <algorithm>
#include <iterator>

namespace nifpt::storage {

void InMemoryAuditLog::append(const AuditEvent& event) {
  events_.push_back(event);
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  if (trace_id.empty()) {
    return events_;
  }

  std::vector<AuditEvent> filtered;
  std::copy_if(events_.begin(), events_.end(), std::back_inserter(filtered),
               [&trace_id](const AuditEvent& event) { return event.trace_id == trace_id; });
  return filtered;
}

}  // namespace nifpt::storage
