#pragma once

#include "nifpt/storage/audit_event.h"

#include <string>
#include <vector>

namespace nifpt::storage {

class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  // query returns the events of one trace in append order; an empty trace_id
  // returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
};

// InMemoryAuditLog keeps events for the lifetime of the process only.
class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

  [[nodiscard]] size_t size() const { return events_.size(); }

 private:
  std::vector<AuditEvent> events_;
};

}  // namespace nifpt::storage
