#include "nifpt/core/id_generator.h"

#include <chrono>

namespace nifpt::core {

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count();
  const auto seq = counter_.fetch_add(1, std::memory_order_relaxed);

  std::string id(prefix);
  id += '-';
  id += std::to_string(micros);
  id += '-';
  id += std::to_string(seq);
  return id;
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  const auto seq = counter_.fetch_add(1, std::memory_order_relaxed);

  std::string id(prefix);
  id += '-';
  id += std::to_string(seq);
  return id;
}

}  // namespace nifpt::core
