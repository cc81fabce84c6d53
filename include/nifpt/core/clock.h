#pragma once

#include <string>
#include <utility>

namespace nifpt::core {

// IClock supplies the timestamps stamped on lookup records and audit events.
// Contract: now_iso8601() returns a non-empty UTC timestamp, e.g. "2026-01-01T00:00:00Z".
class IClock {
 public:
  virtual ~IClock() = default;
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// SystemClock reads the wall clock, second precision.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::string now_iso8601() override;
};

// FixedClock always answers the same instant (tests, reproducible CLI output).
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::string now_iso8601() override;

 private:
  std::string fixed_time_;
};

}  // namespace nifpt::core
