#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace nifpt::core {

// IIdGenerator hands out trace and event identifiers for the audit trail.
// Contract: next(prefix) is non-empty, starts with prefix, and never repeats
// within one generator instance.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// SystemIdGenerator: "<prefix>-<epoch micros>-<counter>". Thread-safe.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;
  ~SystemIdGenerator() override = default;

  // Holds an atomic counter: neither copyable nor movable.
  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

// DeterministicIdGenerator: "<prefix>-<counter>", counter starting at 0. Thread-safe.
// Same call sequence, same ids.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;
  ~DeterministicIdGenerator() override = default;

  // Holds an atomic counter: neither copyable nor movable.
  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace nifpt::core
